#pragma once

#include <docent/core/types.h>
#include <docent/memory/conversation_memory.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docent::ml {

/**
 * @brief Where a provider runs
 */
enum class ProviderKind {
    Local,  ///< Ollama-compatible server, usually on localhost
    Hosted, ///< OpenAI-compatible hosted API
    Gateway ///< OpenAI-compatible routing gateway (OpenRouter style headers)
};

struct ProviderConfig {
    ProviderKind kind = ProviderKind::Local;
    std::string base_url;                         // Empty selects the default for `kind`
    std::string model;
    std::string api_key_env;                      // Name of the env var holding the key
    std::chrono::milliseconds timeout{60000};     // Per HTTP request
    size_t dimension = 768;                       // Embedding providers only
    double temperature = 0.2;                     // Generation providers only
    int max_tokens = 1024;                        // Generation providers only
    std::string app_name = "docent";              // Gateway X-Title
    std::string referer;                          // Gateway HTTP-Referer
};

/**
 * @brief Turns text into fixed-dimension vectors
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<Embedding> embed(const std::string& text) = 0;
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Produces an answer for a prompt given prior conversation turns
 */
class IGenerationProvider {
public:
    virtual ~IGenerationProvider() = default;

    virtual Result<std::string> generate(const std::string& prompt,
                                         const std::vector<memory::Turn>& history) = 0;
    virtual std::string name() const = 0;
};

inline const char* toString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Local: return "local";
        case ProviderKind::Hosted: return "hosted";
        case ProviderKind::Gateway: return "gateway";
    }
    return "local";
}

inline std::optional<ProviderKind> providerKindFromString(std::string_view s) {
    if (s == "local" || s == "ollama")
        return ProviderKind::Local;
    if (s == "hosted" || s == "openai")
        return ProviderKind::Hosted;
    if (s == "gateway" || s == "openrouter")
        return ProviderKind::Gateway;
    return std::nullopt;
}

// Implemented by the HTTP providers library
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const ProviderConfig& config);
std::unique_ptr<IGenerationProvider> createGenerationProvider(const ProviderConfig& config);

} // namespace docent::ml
