#pragma once

#include <docent/ml/http_client.h>
#include <docent/ml/provider.h>

#include <memory>
#include <string>
#include <vector>

namespace docent::ml {

/**
 * @brief Embeddings from an Ollama-compatible server (POST /api/embeddings)
 */
class OllamaEmbeddingProvider final : public IEmbeddingProvider {
public:
    OllamaEmbeddingProvider(ProviderConfig config, std::shared_ptr<IHttpClient> http);

    Result<Embedding> embed(const std::string& text) override;
    size_t dimension() const override { return config_.dimension; }
    std::string name() const override { return "ollama:" + config_.model; }

private:
    ProviderConfig config_;
    std::shared_ptr<IHttpClient> http_;
};

/**
 * @brief Chat completion from an Ollama-compatible server (POST /api/chat, non-streaming)
 */
class OllamaGenerationProvider final : public IGenerationProvider {
public:
    OllamaGenerationProvider(ProviderConfig config, std::shared_ptr<IHttpClient> http);

    Result<std::string> generate(const std::string& prompt,
                                 const std::vector<memory::Turn>& history) override;
    std::string name() const override { return "ollama:" + config_.model; }

private:
    ProviderConfig config_;
    std::shared_ptr<IHttpClient> http_;
};

/**
 * @brief Embeddings from an OpenAI-compatible API (POST /embeddings)
 *
 * Used for both hosted and gateway kinds; gateways additionally receive the
 * HTTP-Referer and X-Title headers.
 */
class OpenAICompatibleEmbeddingProvider final : public IEmbeddingProvider {
public:
    OpenAICompatibleEmbeddingProvider(ProviderConfig config, std::shared_ptr<IHttpClient> http);

    Result<Embedding> embed(const std::string& text) override;
    size_t dimension() const override { return config_.dimension; }
    std::string name() const override;

private:
    ProviderConfig config_;
    std::shared_ptr<IHttpClient> http_;
    std::string apiKey_;
};

/**
 * @brief Chat completion from an OpenAI-compatible API (POST /chat/completions)
 */
class OpenAICompatibleGenerationProvider final : public IGenerationProvider {
public:
    OpenAICompatibleGenerationProvider(ProviderConfig config, std::shared_ptr<IHttpClient> http);

    Result<std::string> generate(const std::string& prompt,
                                 const std::vector<memory::Turn>& history) override;
    std::string name() const override;

private:
    ProviderConfig config_;
    std::shared_ptr<IHttpClient> http_;
    std::string apiKey_;
};

/**
 * @brief Headers for an OpenAI-compatible request (authorization plus gateway attribution)
 */
std::vector<HttpHeader> openAICompatibleHeaders(const ProviderConfig& config,
                                                const std::string& apiKey);

/**
 * @brief Join a base URL and a path with exactly one slash
 */
std::string joinUrl(const std::string& base, const std::string& path);

} // namespace docent::ml
