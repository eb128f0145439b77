#pragma once

#include <docent/config/config_helpers.h>
#include <docent/core/retry.h>
#include <docent/core/types.h>
#include <docent/memory/conversation_memory.h>
#include <docent/ml/provider.h>
#include <docent/qa/qa_orchestrator.h>
#include <docent/vector/document_chunker.h>
#include <docent/vector/vector_index.h>

#include <filesystem>
#include <string>

namespace docent::config {

/**
 * @brief Everything needed to stand up a DocentEngine
 */
struct EngineConfig {
    std::filesystem::path data_dir;   // Empty selects get_data_dir()
    std::string database_path;        // Empty selects <data_dir>/docent.db; ":memory:" allowed
    size_t worker_threads = 4;

    vector::ChunkingConfig chunking;
    vector::VectorIndexConfig index;
    qa::QaConfig qa;
    memory::MemoryConfig memory;
    RetryPolicy retry;

    ml::ProviderConfig embedding;
    ml::ProviderConfig generation;

    /// Database location after defaults are applied
    [[nodiscard]] std::string resolvedDatabasePath() const;
};

/**
 * @brief Build a config from a flattened "section.key" map
 *
 * Unknown keys are ignored; malformed values are InvalidArgument.
 */
Result<EngineConfig> engineConfigFromMap(const ConfigMap& values);

/**
 * @brief Load a config file, falling back to defaults when it does not exist
 *
 * An empty path resolves through get_config_path(). Environment overrides are applied.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {});

/**
 * @brief Apply DOCENT_DB_PATH, DOCENT_EMBED_URL and DOCENT_GEN_URL
 */
void applyEnvironmentOverrides(EngineConfig& config);

/**
 * @brief Reject configurations the engine cannot run with
 */
Result<void> validateEngineConfig(const EngineConfig& config);

} // namespace docent::config
