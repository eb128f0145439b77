#pragma once

#include <docent/metadata/database.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace docent::metadata {

/// One forward-only schema change. Either sql or apply is set.
struct SchemaStep {
    int version = 0;
    std::string name;
    std::string sql;
    std::function<Result<void>(Database&)> apply;
};

struct AppliedStep {
    int version = 0;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds took{0};
};

/**
 * @brief Brings a database up to the newest registered schema version.
 *
 * Each step runs in its own transaction together with its schema_history row, so a failed step
 * leaves the database at the previous version. Databases newer than the newest step are
 * rejected with InvalidState.
 */
class SchemaMigrator {
public:
    explicit SchemaMigrator(Database& db, std::vector<SchemaStep> steps);

    Result<int> currentVersion();
    [[nodiscard]] int latestVersion() const;

    /// Applies pending steps up to target (0 means latest); returns how many ran.
    Result<int> upgrade(int target = 0);

    Result<std::vector<AppliedStep>> history();

private:
    Result<void> ensureHistoryTable();
    Result<void> runStep(const SchemaStep& step);

    Database& db_;
    std::vector<SchemaStep> steps_;
};

/// Conversations, documents, chunks, messages and document matches.
std::vector<SchemaStep> docentSchema();

/// Migrates an already open database to the latest docent schema.
Result<void> ensureDocentSchema(Database& db);

} // namespace docent::metadata
