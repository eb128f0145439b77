#include <docent/ml/http_providers.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace docent::ml {

using json = nlohmann::json;

namespace {

json chatMessages(const std::string& prompt, const std::vector<memory::Turn>& history) {
    json messages = json::array();
    for (const auto& turn : history) {
        messages.push_back({{"role", metadata::StatusUtils::toString(turn.role)},
                            {"content", turn.content}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});
    return messages;
}

std::string resolveApiKey(const ProviderConfig& config) {
    if (config.api_key_env.empty()) {
        return {};
    }
    const char* value = std::getenv(config.api_key_env.c_str());
    return value ? std::string(value) : std::string();
}

Result<json> parseBody(const HttpResponse& response) {
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Malformed provider response: ") + e.what()};
    }
}

Result<Embedding> toEmbedding(const json& values, size_t expected) {
    if (!values.is_array() || values.empty()) {
        return Error{ErrorCode::InvalidData, "Provider response has no embedding"};
    }
    Embedding out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "Embedding contains a non-numeric value"};
        }
        out.push_back(v.get<float>());
    }
    if (expected != 0 && out.size() != expected) {
        return Error{ErrorCode::InvalidData, "Embedding has dimension " +
                                                 std::to_string(out.size()) + ", expected " +
                                                 std::to_string(expected)};
    }
    return out;
}

Result<std::string> requireApiKey(const ProviderConfig& config, const std::string& apiKey) {
    if (!apiKey.empty() || config.kind == ProviderKind::Local) {
        return apiKey;
    }
    return Error{ErrorCode::InvalidState,
                 "API key not set; export " +
                     (config.api_key_env.empty() ? std::string("an API key variable")
                                                 : config.api_key_env)};
}

} // namespace

std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) {
        return path;
    }
    std::string out = base;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        out.push_back('/');
    }
    return out + path;
}

std::vector<HttpHeader> openAICompatibleHeaders(const ProviderConfig& config,
                                                const std::string& apiKey) {
    std::vector<HttpHeader> headers;
    if (!apiKey.empty()) {
        headers.push_back({"Authorization", "Bearer " + apiKey});
    }
    if (config.kind == ProviderKind::Gateway) {
        if (!config.referer.empty()) {
            headers.push_back({"HTTP-Referer", config.referer});
        }
        if (!config.app_name.empty()) {
            headers.push_back({"X-Title", config.app_name});
        }
    }
    return headers;
}

// =============================================================================
// Ollama
// =============================================================================

OllamaEmbeddingProvider::OllamaEmbeddingProvider(ProviderConfig config,
                                                 std::shared_ptr<IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

Result<Embedding> OllamaEmbeddingProvider::embed(const std::string& text) {
    json request = {{"model", config_.model}, {"prompt", text}};
    auto response =
        http_->postJson(joinUrl(config_.base_url, "/api/embeddings"), {}, request.dump(),
                        config_.timeout);
    if (!response)
        return response.error();
    if (response.value().status < 200 || response.value().status >= 300) {
        return errorForStatus(response.value().status, response.value().body,
                              ErrorCode::InvalidArgument);
    }

    auto body = parseBody(response.value());
    if (!body)
        return body.error();
    const auto& doc = body.value();
    if (!doc.contains("embedding")) {
        return Error{ErrorCode::InvalidData, "Ollama response missing 'embedding'"};
    }
    return toEmbedding(doc["embedding"], config_.dimension);
}

OllamaGenerationProvider::OllamaGenerationProvider(ProviderConfig config,
                                                   std::shared_ptr<IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

Result<std::string> OllamaGenerationProvider::generate(const std::string& prompt,
                                                       const std::vector<memory::Turn>& history) {
    json request = {{"model", config_.model},
                    {"messages", chatMessages(prompt, history)},
                    {"stream", false},
                    {"options",
                     {{"temperature", config_.temperature}, {"num_predict", config_.max_tokens}}}};
    auto response = http_->postJson(joinUrl(config_.base_url, "/api/chat"), {}, request.dump(),
                                    config_.timeout);
    if (!response)
        return response.error();
    if (response.value().status < 200 || response.value().status >= 300) {
        return errorForStatus(response.value().status, response.value().body,
                              ErrorCode::GenerationError);
    }

    auto body = parseBody(response.value());
    if (!body)
        return body.error();
    const auto& doc = body.value();
    if (!doc.contains("message") || !doc["message"].contains("content") ||
        !doc["message"]["content"].is_string()) {
        return Error{ErrorCode::GenerationError, "Ollama response missing message content"};
    }
    return doc["message"]["content"].get<std::string>();
}

// =============================================================================
// OpenAI-compatible (hosted and gateway)
// =============================================================================

OpenAICompatibleEmbeddingProvider::OpenAICompatibleEmbeddingProvider(
    ProviderConfig config, std::shared_ptr<IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)), apiKey_(resolveApiKey(config_)) {}

std::string OpenAICompatibleEmbeddingProvider::name() const {
    return std::string(toString(config_.kind)) + ":" + config_.model;
}

Result<Embedding> OpenAICompatibleEmbeddingProvider::embed(const std::string& text) {
    auto key = requireApiKey(config_, apiKey_);
    if (!key)
        return key.error();

    json request = {{"model", config_.model}, {"input", text}};
    auto response = http_->postJson(joinUrl(config_.base_url, "/embeddings"),
                                    openAICompatibleHeaders(config_, apiKey_), request.dump(),
                                    config_.timeout);
    if (!response)
        return response.error();
    if (response.value().status < 200 || response.value().status >= 300) {
        return errorForStatus(response.value().status, response.value().body,
                              ErrorCode::InvalidArgument);
    }

    auto body = parseBody(response.value());
    if (!body)
        return body.error();
    const auto& doc = body.value();
    if (!doc.contains("data") || !doc["data"].is_array() || doc["data"].empty() ||
        !doc["data"][0].contains("embedding")) {
        return Error{ErrorCode::InvalidData, "Embedding response missing data[0].embedding"};
    }
    return toEmbedding(doc["data"][0]["embedding"], config_.dimension);
}

OpenAICompatibleGenerationProvider::OpenAICompatibleGenerationProvider(
    ProviderConfig config, std::shared_ptr<IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)), apiKey_(resolveApiKey(config_)) {}

std::string OpenAICompatibleGenerationProvider::name() const {
    return std::string(toString(config_.kind)) + ":" + config_.model;
}

Result<std::string>
OpenAICompatibleGenerationProvider::generate(const std::string& prompt,
                                             const std::vector<memory::Turn>& history) {
    auto key = requireApiKey(config_, apiKey_);
    if (!key)
        return key.error();

    json request = {{"model", config_.model},
                    {"messages", chatMessages(prompt, history)},
                    {"temperature", config_.temperature},
                    {"max_tokens", config_.max_tokens}};
    auto response = http_->postJson(joinUrl(config_.base_url, "/chat/completions"),
                                    openAICompatibleHeaders(config_, apiKey_), request.dump(),
                                    config_.timeout);
    if (!response)
        return response.error();
    if (response.value().status < 200 || response.value().status >= 300) {
        return errorForStatus(response.value().status, response.value().body,
                              ErrorCode::GenerationError);
    }

    auto body = parseBody(response.value());
    if (!body)
        return body.error();
    const auto& doc = body.value();
    if (!doc.contains("choices") || !doc["choices"].is_array() || doc["choices"].empty()) {
        return Error{ErrorCode::GenerationError, "Completion response has no choices"};
    }
    const auto& message = doc["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        return Error{ErrorCode::GenerationError, "Completion response has no message content"};
    }
    return message["content"].get<std::string>();
}

} // namespace docent::ml
