#include <docent/ml/http_providers.h>

#include <spdlog/spdlog.h>

namespace docent::ml {

namespace {

enum class Role { Embedding, Generation };

// Fills an empty base URL and model with the defaults of the provider kind
ProviderConfig withDefaults(ProviderConfig config, Role role) {
    const bool embedding = role == Role::Embedding;
    switch (config.kind) {
        case ProviderKind::Local:
            if (config.base_url.empty())
                config.base_url = "http://localhost:11434";
            if (config.model.empty())
                config.model = embedding ? "nomic-embed-text" : "llama3.1";
            break;
        case ProviderKind::Hosted:
            if (config.base_url.empty())
                config.base_url = "https://api.openai.com/v1";
            if (config.model.empty())
                config.model = embedding ? "text-embedding-3-small" : "gpt-4o";
            break;
        case ProviderKind::Gateway:
            if (config.base_url.empty())
                config.base_url = "https://openrouter.ai/api/v1";
            if (config.model.empty())
                config.model = embedding ? "openai/text-embedding-3-small" : "openai/gpt-4o";
            break;
    }
    return config;
}

} // namespace

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const ProviderConfig& config) {
    auto resolved = withDefaults(config, Role::Embedding);
    std::shared_ptr<IHttpClient> http = makeCurlHttpClient();
    spdlog::info("[Providers] embedding provider {} model '{}' at {} (dim {})",
                 toString(resolved.kind), resolved.model, resolved.base_url, resolved.dimension);
    switch (resolved.kind) {
        case ProviderKind::Local:
            return std::make_unique<OllamaEmbeddingProvider>(std::move(resolved), std::move(http));
        case ProviderKind::Hosted:
        case ProviderKind::Gateway:
            return std::make_unique<OpenAICompatibleEmbeddingProvider>(std::move(resolved),
                                                                       std::move(http));
    }
    return nullptr;
}

std::unique_ptr<IGenerationProvider> createGenerationProvider(const ProviderConfig& config) {
    auto resolved = withDefaults(config, Role::Generation);
    std::shared_ptr<IHttpClient> http = makeCurlHttpClient();
    spdlog::info("[Providers] generation provider {} model '{}' at {}", toString(resolved.kind),
                 resolved.model, resolved.base_url);
    switch (resolved.kind) {
        case ProviderKind::Local:
            return std::make_unique<OllamaGenerationProvider>(std::move(resolved),
                                                              std::move(http));
        case ProviderKind::Hosted:
        case ProviderKind::Gateway:
            return std::make_unique<OpenAICompatibleGenerationProvider>(std::move(resolved),
                                                                        std::move(http));
    }
    return nullptr;
}

} // namespace docent::ml
