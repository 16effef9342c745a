#pragma once
#include <memory>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

// Query embeddings from the OpenAI embeddings endpoint, cached per text.
class EmbeddingService {
public:
    EmbeddingService(std::shared_ptr<KeyManager> key_manager,
                     std::shared_ptr<CacheManager> cache_manager,
                     std::string model = "text-embedding-3-small",
                     int timeout_ms = 8000);

    std::vector<float> generate_embedding(const std::string& text);

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    std::string model_;
    int timeout_ms_;
    const std::string endpoint_ = "https://api.openai.com/v1/embeddings";
};

// Anthropic Messages API behind the ITextGenerator seam.
class AnthropicTextGenerator : public ITextGenerator {
public:
    AnthropicTextGenerator(std::shared_ptr<KeyManager> key_manager, std::string model, int timeout_ms = 20000);

    std::string generate(const std::string& prompt) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string model_;
    int timeout_ms_;
    const std::string endpoint_ = "https://api.anthropic.com/v1/messages";
};

} // namespace shopping_assistance
