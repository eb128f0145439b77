#include <docent/common/utf8_utils.h>
#include <docent/metadata/match_recorder.h>

#include <spdlog/spdlog.h>

#include <cmath>

namespace docent::metadata {

MatchRecorder::MatchRecorder(Database& db) : db_(db) {}

Result<void> MatchRecorder::recordMatch(MessageId messageId, DocumentId documentId,
                                        const std::string& passage, double score) {
    if (!std::isfinite(score) || score < 0.0 || score > 1.0) {
        return Error{ErrorCode::InvalidArgument,
                     "Match score out of range [0,1]: " + std::to_string(score)};
    }

    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "INSERT INTO document_matches (message_id, document_id, passage, score, created_at) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(message_id, document_id) DO UPDATE SET "
        "passage = excluded.passage, score = excluded.score, created_at = excluded.created_at");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = detail::toUnixSeconds(std::chrono::system_clock::now());
    auto bindResult = stmt.bindAll(messageId, documentId,
                                   common::truncateUtf8(passage, kMaxPassageLength), score, now);
    if (!bindResult)
        return bindResult;

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    spdlog::debug("[Matches] message {} <- document {} (score {:.3f})", messageId, documentId,
                  score);
    return {};
}

Result<int64_t> MatchRecorder::usageCount(DocumentId documentId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "SELECT COUNT(DISTINCT message_id) FROM document_matches WHERE document_id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, documentId);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stepResult.value() ? stmt.getInt64(0) : int64_t{0};
}

Result<std::vector<DocumentMatch>> MatchRecorder::recentMatches(DocumentId documentId, int limit) {
    if (limit <= 0) {
        return std::vector<DocumentMatch>{};
    }

    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "SELECT dm.message_id, dm.document_id, COALESCE(d.filename, ''), dm.passage, dm.score, "
        "dm.created_at, CASE WHEN length(m.content) > ?1 "
        "THEN substr(m.content, 1, ?1) || '...' ELSE m.content END "
        "FROM document_matches dm "
        "JOIN documents d ON d.id = dm.document_id "
        "JOIN messages m ON m.id = dm.message_id "
        "WHERE dm.document_id = ?2 "
        "ORDER BY dm.created_at DESC, dm.id DESC LIMIT ?3");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(kPreviewLength, documentId, limit);
    if (!bindResult)
        return bindResult.error();

    std::vector<DocumentMatch> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        DocumentMatch match;
        match.messageId = stmt.getInt64(0);
        match.documentId = stmt.getInt64(1);
        match.documentName = stmt.getString(2);
        match.passage = stmt.getString(3);
        match.score = stmt.getDouble(4);
        match.createdAt = detail::fromUnixSeconds(stmt.getInt64(5));
        match.messagePreview = stmt.getString(6);
        if (match.documentName.empty()) {
            match.documentName = "document-" + std::to_string(match.documentId);
        }
        out.push_back(std::move(match));
    }
    return out;
}

Result<std::vector<DocumentMatch>> MatchRecorder::matchesForMessage(MessageId messageId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "SELECT dm.message_id, dm.document_id, COALESCE(d.filename, ''), dm.passage, dm.score, "
        "dm.created_at "
        "FROM document_matches dm "
        "JOIN documents d ON d.id = dm.document_id "
        "WHERE dm.message_id = ? "
        "ORDER BY dm.score DESC, dm.document_id ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, messageId);
    if (!bindResult)
        return bindResult.error();

    std::vector<DocumentMatch> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        DocumentMatch match;
        match.messageId = stmt.getInt64(0);
        match.documentId = stmt.getInt64(1);
        match.documentName = stmt.getString(2);
        match.passage = stmt.getString(3);
        match.score = stmt.getDouble(4);
        match.createdAt = detail::fromUnixSeconds(stmt.getInt64(5));
        if (match.documentName.empty()) {
            match.documentName = "document-" + std::to_string(match.documentId);
        }
        out.push_back(std::move(match));
    }
    return out;
}

} // namespace docent::metadata
