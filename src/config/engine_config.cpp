#include <docent/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace docent::config {

namespace {

Error badValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": '" + value + "'"};
}

// Assigns the value of `key` to `out` when present
template <typename T>
Result<void> readUnsigned(const ConfigMap& values, const std::string& key, T& out) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return {};
    }
    const auto& text = it->second;
    unsigned long long parsed = 0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
        return badValue(key, text);
    }
    out = static_cast<T>(parsed);
    return {};
}

Result<void> readDouble(const ConfigMap& values, const std::string& key, double& out) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return {};
    }
    const auto& text = it->second;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return badValue(key, text);
    }
    out = parsed;
    return {};
}

Result<void> readMillis(const ConfigMap& values, const std::string& key,
                        std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    auto r = readUnsigned(values, key, ms);
    if (r) {
        out = std::chrono::milliseconds(ms);
    }
    return r;
}

void readString(const ConfigMap& values, const std::string& key, std::string& out) {
    auto it = values.find(key);
    if (it != values.end() && !it->second.empty()) {
        out = it->second;
    }
}

Result<void> readProvider(const ConfigMap& values, const std::string& section,
                          ml::ProviderConfig& out) {
    auto kindIt = values.find(section + ".kind");
    if (kindIt != values.end() && !kindIt->second.empty()) {
        auto kind = ml::providerKindFromString(kindIt->second);
        if (!kind) {
            return badValue(section + ".kind", kindIt->second);
        }
        out.kind = *kind;
    }
    readString(values, section + ".base_url", out.base_url);
    readString(values, section + ".model", out.model);
    readString(values, section + ".api_key_env", out.api_key_env);
    readString(values, section + ".app_name", out.app_name);
    readString(values, section + ".referer", out.referer);

    if (auto r = readMillis(values, section + ".timeout_ms", out.timeout); !r)
        return r;
    if (auto r = readUnsigned(values, section + ".dimension", out.dimension); !r)
        return r;
    if (auto r = readDouble(values, section + ".temperature", out.temperature); !r)
        return r;
    return readUnsigned(values, section + ".max_tokens", out.max_tokens);
}

} // namespace

std::string EngineConfig::resolvedDatabasePath() const {
    if (!database_path.empty()) {
        return database_path;
    }
    auto dir = data_dir.empty() ? get_data_dir() : data_dir;
    return (dir / "docent.db").string();
}

Result<EngineConfig> engineConfigFromMap(const ConfigMap& values) {
    EngineConfig config;

    auto dataDir = values.find("core.data_dir");
    if (dataDir != values.end() && !dataDir->second.empty()) {
        config.data_dir = expand_tilde(dataDir->second);
    }
    auto dbPath = values.find("core.database_path");
    if (dbPath != values.end() && !dbPath->second.empty()) {
        config.database_path = dbPath->second == ":memory:"
                                   ? dbPath->second
                                   : expand_tilde(dbPath->second).string();
    }
    if (auto r = readUnsigned(values, "core.worker_threads", config.worker_threads); !r)
        return r.error();

    auto strategy = values.find("chunking.strategy");
    if (strategy != values.end() && !strategy->second.empty()) {
        if (strategy->second == "fixed") {
            config.chunking.strategy = vector::ChunkingStrategy::Fixed;
        } else if (strategy->second == "boundary" || strategy->second == "recursive") {
            config.chunking.strategy = vector::ChunkingStrategy::Boundary;
        } else {
            return badValue("chunking.strategy", strategy->second);
        }
    }
    if (auto r = readUnsigned(values, "chunking.chunk_size", config.chunking.target_chunk_size);
        !r)
        return r.error();
    if (auto r = readUnsigned(values, "chunking.overlap", config.chunking.overlap_size); !r)
        return r.error();

    if (auto r = readUnsigned(values, "retrieval.top_k", config.qa.top_k); !r)
        return r.error();
    if (auto r = readUnsigned(values, "retrieval.max_k", config.index.max_k); !r)
        return r.error();
    if (auto r = readDouble(values, "retrieval.min_relevance", config.qa.min_relevance); !r)
        return r.error();
    if (auto r = readUnsigned(values, "retrieval.max_context_chars", config.qa.max_context_chars);
        !r)
        return r.error();
    if (auto r = readUnsigned(values, "retrieval.history_turns", config.qa.history_turns); !r)
        return r.error();
    if (auto r = readUnsigned(values, "retrieval.snippet_chars", config.qa.snippet_chars); !r)
        return r.error();

    if (auto r = readUnsigned(values, "memory.max_turns", config.memory.max_turns); !r)
        return r.error();
    if (auto r = readUnsigned(values, "memory.max_chars", config.memory.max_chars); !r)
        return r.error();

    if (auto r = readUnsigned(values, "retry.max_attempts", config.retry.max_attempts); !r)
        return r.error();
    if (auto r = readMillis(values, "retry.initial_backoff_ms", config.retry.initial_backoff); !r)
        return r.error();
    if (auto r = readMillis(values, "retry.max_backoff_ms", config.retry.max_backoff); !r)
        return r.error();
    if (auto r = readDouble(values, "retry.multiplier", config.retry.multiplier); !r)
        return r.error();
    config.qa.retry = config.retry;

    if (auto r = readProvider(values, "embedding", config.embedding); !r)
        return r.error();
    if (auto r = readProvider(values, "generation", config.generation); !r)
        return r.error();

    return config;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    auto configPath = path.empty() ? get_config_path() : path;
    ConfigMap values;
    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        values = parse_config_file(configPath);
        spdlog::info("[Config] loaded {} key(s) from {}", values.size(), configPath.string());
    } else {
        spdlog::debug("[Config] no config file at '{}', using defaults", configPath.string());
    }

    auto config = engineConfigFromMap(values);
    if (!config) {
        return config.error();
    }
    applyEnvironmentOverrides(config.value());
    if (auto valid = validateEngineConfig(config.value()); !valid) {
        return valid.error();
    }
    return config;
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (const char* env = std::getenv("DOCENT_DB_PATH"); env && *env) {
        spdlog::info("[Config] Using DOCENT_DB_PATH={}", env);
        config.database_path = env;
    }
    if (const char* env = std::getenv("DOCENT_EMBED_URL"); env && *env) {
        spdlog::info("[Config] Using DOCENT_EMBED_URL={}", env);
        config.embedding.base_url = env;
    }
    if (const char* env = std::getenv("DOCENT_GEN_URL"); env && *env) {
        spdlog::info("[Config] Using DOCENT_GEN_URL={}", env);
        config.generation.base_url = env;
    }
}

Result<void> validateEngineConfig(const EngineConfig& config) {
    if (config.worker_threads == 0) {
        return Error{ErrorCode::InvalidArgument, "core.worker_threads must be at least 1"};
    }
    if (config.chunking.target_chunk_size == 0) {
        return Error{ErrorCode::InvalidArgument, "chunking.chunk_size must be positive"};
    }
    if (config.chunking.overlap_size >= config.chunking.target_chunk_size) {
        return Error{ErrorCode::InvalidArgument,
                     "chunking.overlap must be smaller than chunking.chunk_size"};
    }
    if (config.index.max_k == 0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.max_k must be positive"};
    }
    if (config.qa.min_relevance < 0.0 || config.qa.min_relevance > 1.0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.min_relevance must be within [0, 1]"};
    }
    if (config.memory.max_turns == 0) {
        return Error{ErrorCode::InvalidArgument, "memory.max_turns must be positive"};
    }
    if (config.retry.max_attempts < 1) {
        return Error{ErrorCode::InvalidArgument, "retry.max_attempts must be at least 1"};
    }
    if (config.embedding.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "embedding.dimension must be positive"};
    }
    return {};
}

} // namespace docent::config
