#include <docent/metadata/migration.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace docent::metadata {

namespace {

int64_t unixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

SchemaMigrator::SchemaMigrator(Database& db, std::vector<SchemaStep> steps)
    : db_(db), steps_(std::move(steps)) {
    std::sort(steps_.begin(), steps_.end(),
              [](const SchemaStep& a, const SchemaStep& b) { return a.version < b.version; });
}

int SchemaMigrator::latestVersion() const {
    return steps_.empty() ? 0 : steps_.back().version;
}

Result<void> SchemaMigrator::ensureHistoryTable() {
    return db_.execute("CREATE TABLE IF NOT EXISTS schema_history ("
                       " version INTEGER PRIMARY KEY,"
                       " name TEXT NOT NULL,"
                       " applied_at INTEGER NOT NULL,"
                       " took_ms INTEGER NOT NULL)");
}

Result<int> SchemaMigrator::currentVersion() {
    auto guard = db_.lock();
    if (auto table = ensureHistoryTable(); !table)
        return table.error();

    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_history");
    if (!stmt)
        return stmt.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    return row.value() ? stmt.value().getInt(0) : 0;
}

Result<int> SchemaMigrator::upgrade(int target) {
    if (target <= 0)
        target = latestVersion();

    auto guard = db_.lock();
    auto current = currentVersion();
    if (!current)
        return current.error();
    if (current.value() > target) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("database schema is at version {}, this build supports up to {}",
                                 current.value(), target)};
    }

    int ran = 0;
    for (const auto& step : steps_) {
        if (step.version <= current.value() || step.version > target)
            continue;
        if (auto applied = runStep(step); !applied) {
            spdlog::error("[Migration] step {} '{}' failed: {}", step.version, step.name,
                          applied.error().message);
            return applied.error();
        }
        ++ran;
    }
    if (ran > 0)
        spdlog::info("[Migration] applied {} step(s); schema at version {}", ran, target);
    return ran;
}

Result<void> SchemaMigrator::runStep(const SchemaStep& step) {
    const auto started = std::chrono::steady_clock::now();
    return db_.transaction([&]() -> Result<void> {
        Result<void> changed;
        if (step.apply) {
            changed = step.apply(db_);
        } else if (!step.sql.empty()) {
            changed = db_.execute(step.sql);
        } else {
            changed = Error{ErrorCode::InvalidData, "schema step has no body"};
        }
        if (!changed)
            return changed;

        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto stmt = db_.prepare(
            "INSERT INTO schema_history (version, name, applied_at, took_ms) VALUES (?, ?, ?, ?)");
        if (!stmt)
            return stmt.error();
        if (auto bound = stmt.value().bindAll(step.version, step.name,
                                              unixSeconds(std::chrono::system_clock::now()),
                                              static_cast<int64_t>(took.count()));
            !bound)
            return bound;
        spdlog::debug("[Migration] step {} '{}' took {}ms", step.version, step.name, took.count());
        return stmt.value().execute();
    });
}

Result<std::vector<AppliedStep>> SchemaMigrator::history() {
    auto guard = db_.lock();
    if (auto table = ensureHistoryTable(); !table)
        return table.error();

    auto stmt = db_.prepare(
        "SELECT version, name, applied_at, took_ms FROM schema_history ORDER BY version");
    if (!stmt)
        return stmt.error();

    std::vector<AppliedStep> steps;
    for (;;) {
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        const auto& s = stmt.value();
        steps.push_back(AppliedStep{
            s.getInt(0), s.getString(1),
            std::chrono::system_clock::time_point(std::chrono::seconds(s.getInt64(2))),
            std::chrono::milliseconds(s.getInt64(3))});
    }
    return steps;
}

std::vector<SchemaStep> docentSchema() {
    std::vector<SchemaStep> steps;

    steps.push_back({1, "conversation tables", R"(
        CREATE TABLE conversations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            title TEXT NOT NULL DEFAULT 'New Conversation',
            thread_id TEXT NOT NULL UNIQUE,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE documents (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            conversation_id INTEGER NOT NULL
                REFERENCES conversations(id) ON DELETE CASCADE,
            owner_id INTEGER NOT NULL,
            filename TEXT,
            content TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'pending'
                CHECK (status IN ('pending', 'ready', 'failed')),
            error TEXT,
            chunk_count INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        -- conversation_id duplicates the owning document's so retrieval can filter on one table
        CREATE TABLE chunks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
            conversation_id INTEGER NOT NULL REFERENCES conversations(id) ON DELETE CASCADE,
            ordinal INTEGER NOT NULL,
            content TEXT NOT NULL,
            start_offset INTEGER NOT NULL DEFAULT 0,
            end_offset INTEGER NOT NULL DEFAULT 0,
            dimension INTEGER NOT NULL,
            embedding BLOB NOT NULL,
            UNIQUE (document_id, ordinal)
        );

        CREATE TABLE messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            conversation_id INTEGER NOT NULL REFERENCES conversations(id) ON DELETE CASCADE,
            role TEXT NOT NULL CHECK (role IN ('user', 'assistant')),
            content TEXT NOT NULL,
            ordinal INTEGER NOT NULL,
            mode TEXT CHECK (mode IS NULL OR mode IN ('rag', 'agent')),
            num_sources INTEGER,
            context_length INTEGER,
            created_at INTEGER NOT NULL,
            UNIQUE (conversation_id, ordinal)
        );

        CREATE TABLE document_matches (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            message_id INTEGER NOT NULL REFERENCES messages(id) ON DELETE CASCADE,
            document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
            passage TEXT NOT NULL,
            score REAL NOT NULL CHECK (score >= 0.0 AND score <= 1.0),
            created_at INTEGER NOT NULL,
            UNIQUE (message_id, document_id)
        );
    )", {}});

    steps.push_back({2, "lookup indexes", R"(
        CREATE INDEX IF NOT EXISTS idx_conversations_owner ON conversations(owner_id);
        CREATE INDEX IF NOT EXISTS idx_documents_conversation ON documents(conversation_id);
        CREATE INDEX IF NOT EXISTS idx_chunks_conversation ON chunks(conversation_id);
        CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id, ordinal);
        CREATE INDEX IF NOT EXISTS idx_matches_document ON document_matches(document_id, created_at);
    )", {}});

    return steps;
}

Result<void> ensureDocentSchema(Database& db) {
    SchemaMigrator migrator(db, docentSchema());
    auto ran = migrator.upgrade();
    if (!ran)
        return ran.error();
    return {};
}

} // namespace docent::metadata
