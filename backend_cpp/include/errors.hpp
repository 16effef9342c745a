#pragma once
#include <stdexcept>
#include <string>

namespace shopping_assistance {

// Bad or missing configuration. Only raised while the service starts up.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A collaborator (catalog, web search, price lookup, LLM) failed or timed out.
// Retrieval turns it into a degradation note; it never fails a whole query.
class SourceUnavailableError : public std::runtime_error {
public:
    SourceUnavailableError(const std::string& source, const std::string& msg)
        : std::runtime_error(source + ": " + msg), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

// Internal failure of Router, Planner or Answerer. Caught at the pipeline boundary.
class TerminalPipelineError : public std::runtime_error {
public:
    TerminalPipelineError(const std::string& stage, const std::string& msg)
        : std::runtime_error(stage + " failed: " + msg), stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

} // namespace shopping_assistance
