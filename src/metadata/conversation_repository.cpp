#include <docent/common/utf8_utils.h>
#include <docent/metadata/conversation_repository.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <random>

namespace docent::metadata {

namespace {

int64_t nowUnix() {
    return detail::toUnixSeconds(std::chrono::system_clock::now());
}

std::string generateThreadId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[40];
    std::snprintf(buf, sizeof(buf), "thread-%016llx%08llx",
                  static_cast<unsigned long long>(rng()),
                  static_cast<unsigned long long>(rng() & 0xffffffffULL));
    return buf;
}

constexpr const char* kConversationColumns =
    "id, owner_id, title, thread_id, created_at, updated_at";
constexpr const char* kDocumentColumns =
    "id, conversation_id, owner_id, filename, content, status, error, chunk_count, created_at, "
    "updated_at";
constexpr const char* kMessageColumns = "id, conversation_id, role, content, ordinal, mode, "
                                        "num_sources, context_length, created_at";

} // namespace

ConversationRepository::ConversationRepository(Database& db) : db_(db) {}

std::string ConversationRepository::titleFromQuestion(const std::string& question) {
    if (question.size() <= kTitleLength) {
        return question;
    }
    return common::truncateUtf8(question, kTitleLength) + "...";
}

// Conversations

Result<Conversation> ConversationRepository::createConversation(UserId ownerId,
                                                                const std::string& title) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("INSERT INTO conversations (owner_id, title, thread_id, "
                                  "created_at, updated_at) VALUES (?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Conversation conv;
    conv.ownerId = ownerId;
    conv.title = title.empty() ? kDefaultTitle : title;
    conv.threadId = generateThreadId();
    int64_t now = nowUnix();
    conv.createdAt = conv.updatedAt = detail::fromUnixSeconds(now);

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(ownerId, conv.title, conv.threadId, now, now);
    if (!bindResult)
        return bindResult.error();
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    conv.id = db_.lastInsertRowId();
    spdlog::debug("[Conversations] created {} for owner {}", conv.id, ownerId);
    return conv;
}

Result<std::optional<Conversation>> ConversationRepository::getConversation(ConversationId id) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(std::string("SELECT ") + kConversationColumns +
                                  " FROM conversations WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<Conversation>{};
    return std::optional<Conversation>{mapConversationRow(stmt)};
}

Result<std::vector<Conversation>> ConversationRepository::listConversations(UserId ownerId) {
    auto guard = db_.lock();
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kConversationColumns +
                    " FROM conversations WHERE owner_id = ? ORDER BY updated_at DESC, id DESC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, ownerId);
    if (!bindResult)
        return bindResult.error();

    std::vector<Conversation> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        out.push_back(mapConversationRow(stmt));
    }
    return out;
}

Result<void> ConversationRepository::deleteConversation(ConversationId id) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("DELETE FROM conversations WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult;
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Conversation not found: " + std::to_string(id)};
    }
    return {};
}

Result<void> ConversationRepository::touchConversation(ConversationId id) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("UPDATE conversations SET updated_at = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(nowUnix(), id);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> ConversationRepository::maybeSetTitleFromQuestion(ConversationId id,
                                                               const std::string& question) {
    if (question.empty()) {
        return {};
    }
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("UPDATE conversations SET title = ? "
                                  "WHERE id = ? AND (title = '' OR title = ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(titleFromQuestion(question), id, kDefaultTitle);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

// Documents

Result<DocumentId> ConversationRepository::insertDocument(const Document& doc) {
    auto guard = db_.lock();
    auto stmtResult =
        db_.prepare("INSERT INTO documents (conversation_id, owner_id, filename, content, status, "
                    "error, chunk_count, created_at, updated_at) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int64_t now = nowUnix();
    auto bindResult = stmt.bindAll(doc.conversationId, doc.ownerId, doc.filename, doc.content,
                                   StatusUtils::toString(doc.status), doc.error, doc.chunkCount,
                                   now, now);
    if (!bindResult)
        return bindResult.error();
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    return db_.lastInsertRowId();
}

Result<std::optional<Document>> ConversationRepository::getDocument(DocumentId id) {
    auto guard = db_.lock();
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<Document>{};
    return std::optional<Document>{mapDocumentRow(stmt)};
}

Result<std::vector<Document>> ConversationRepository::listDocuments(ConversationId conversationId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(std::string("SELECT ") + kDocumentColumns +
                                  " FROM documents WHERE conversation_id = ? ORDER BY id ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, conversationId);
    if (!bindResult)
        return bindResult.error();

    std::vector<Document> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        out.push_back(mapDocumentRow(stmt));
    }
    return out;
}

Result<void> ConversationRepository::updateDocumentStatus(DocumentId id, DocumentStatus status,
                                                          const std::string& error,
                                                          int64_t chunkCount) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("UPDATE documents SET status = ?, error = ?, chunk_count = ?, "
                                  "updated_at = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult =
        stmt.bindAll(StatusUtils::toString(status), error, chunkCount, nowUnix(), id);
    if (!bindResult)
        return bindResult;
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id)};
    }
    return {};
}

// Messages

Result<Message> ConversationRepository::insertMessage(const Message& message) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "INSERT INTO messages (conversation_id, role, content, ordinal, mode, num_sources, "
        "context_length, created_at) "
        "SELECT ?, ?, ?, COALESCE(MAX(ordinal), 0) + 1, ?, ?, ?, ? "
        "FROM messages WHERE conversation_id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int64_t now = nowUnix();
    Result<void> bindResult = stmt.bindAll(message.conversationId,
                                           StatusUtils::toString(message.role), message.content);
    if (!bindResult)
        return bindResult.error();

    bindResult = message.mode ? stmt.bind(4, StatusUtils::toString(*message.mode))
                              : stmt.bind(4, nullptr);
    if (!bindResult)
        return bindResult.error();
    bindResult = message.numSources ? stmt.bind(5, *message.numSources) : stmt.bind(5, nullptr);
    if (!bindResult)
        return bindResult.error();
    bindResult =
        message.contextLength ? stmt.bind(6, *message.contextLength) : stmt.bind(6, nullptr);
    if (!bindResult)
        return bindResult.error();
    bindResult = stmt.bind(7, now);
    if (!bindResult)
        return bindResult.error();
    bindResult = stmt.bind(8, message.conversationId);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    auto stored = getMessage(db_.lastInsertRowId());
    if (!stored)
        return stored.error();
    if (!stored.value()) {
        return Error{ErrorCode::DatabaseError, "Inserted message could not be read back"};
    }
    return *stored.value();
}

Result<std::optional<Message>> ConversationRepository::getMessage(MessageId id) {
    auto guard = db_.lock();
    auto stmtResult =
        db_.prepare(std::string("SELECT ") + kMessageColumns + " FROM messages WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<Message>{};
    return std::optional<Message>{mapMessageRow(stmt)};
}

Result<std::vector<Message>> ConversationRepository::listMessages(ConversationId conversationId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(std::string("SELECT ") + kMessageColumns +
                                  " FROM messages WHERE conversation_id = ? ORDER BY ordinal ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, conversationId);
    if (!bindResult)
        return bindResult.error();

    std::vector<Message> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        out.push_back(mapMessageRow(stmt));
    }
    return out;
}

// Row mapping

Conversation ConversationRepository::mapConversationRow(const Statement& stmt) {
    Conversation conv;
    conv.id = stmt.getInt64(0);
    conv.ownerId = stmt.getInt64(1);
    conv.title = stmt.getString(2);
    conv.threadId = stmt.getString(3);
    conv.createdAt = detail::fromUnixSeconds(stmt.getInt64(4));
    conv.updatedAt = detail::fromUnixSeconds(stmt.getInt64(5));
    return conv;
}

Document ConversationRepository::mapDocumentRow(const Statement& stmt) {
    Document doc;
    doc.id = stmt.getInt64(0);
    doc.conversationId = stmt.getInt64(1);
    doc.ownerId = stmt.getInt64(2);
    doc.filename = stmt.getString(3);
    doc.content = stmt.getString(4);
    doc.status = StatusUtils::documentStatusFromString(stmt.getString(5));
    doc.error = stmt.getString(6);
    doc.chunkCount = stmt.getInt64(7);
    doc.createdAt = detail::fromUnixSeconds(stmt.getInt64(8));
    doc.updatedAt = detail::fromUnixSeconds(stmt.getInt64(9));
    return doc;
}

Message ConversationRepository::mapMessageRow(const Statement& stmt) {
    Message msg;
    msg.id = stmt.getInt64(0);
    msg.conversationId = stmt.getInt64(1);
    msg.role = StatusUtils::roleFromString(stmt.getString(2));
    msg.content = stmt.getString(3);
    msg.ordinal = stmt.getInt64(4);
    if (!stmt.isNull(5))
        msg.mode = StatusUtils::modeFromString(stmt.getString(5));
    if (!stmt.isNull(6))
        msg.numSources = stmt.getInt64(6);
    if (!stmt.isNull(7))
        msg.contextLength = stmt.getInt64(7);
    msg.createdAt = detail::fromUnixSeconds(stmt.getInt64(8));
    return msg;
}

} // namespace docent::metadata
