#include <docent/vector/chunk_store.h>
#include <docent/vector/vector_utils.h>

#include <spdlog/spdlog.h>

namespace docent::vector {

using metadata::ChunkRecord;
using metadata::Statement;

ChunkStore::ChunkStore(metadata::Database& db, size_t dimension) : db_(db), dimension_(dimension) {}

Result<ChunkId> ChunkStore::insertChunk(DocumentId documentId, const DocumentChunk& chunk,
                                        const Embedding& embedding) {
    if (!utils::isValidEmbedding(embedding, dimension_)) {
        return Error{ErrorCode::IngestionError,
                     "Embedding has dimension " + std::to_string(embedding.size()) +
                         ", expected " + std::to_string(dimension_)};
    }

    auto guard = db_.lock();
    auto stmtResult = db_.prepare(
        "INSERT INTO chunks (document_id, conversation_id, ordinal, content, start_offset, "
        "end_offset, dimension, embedding) "
        "SELECT id, conversation_id, ?, ?, ?, ?, ?, ? FROM documents WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto blob = utils::vectorToBlob(embedding);
    auto bindResult = stmt.bindAll(
        static_cast<int64_t>(chunk.chunk_index), chunk.content,
        static_cast<int64_t>(chunk.start_offset), static_cast<int64_t>(chunk.end_offset),
        static_cast<int64_t>(dimension_), std::span<const std::byte>(blob), documentId);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(documentId)};
    }
    ChunkId chunkId = db_.lastInsertRowId();

    auto convResult = conversationOf(documentId);
    if (!convResult)
        return convResult.error();

    spdlog::debug("[ChunkStore] stored chunk {} (ordinal {}) for document {}", chunkId,
                  chunk.chunk_index, documentId);
    notify(convResult.value());
    return chunkId;
}

Result<void> ChunkStore::deleteChunks(DocumentId documentId) {
    auto guard = db_.lock();
    auto convResult = conversationOf(documentId);
    if (!convResult)
        return convResult.error();

    auto stmtResult = db_.prepare("DELETE FROM chunks WHERE document_id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, documentId);
    if (!bindResult)
        return bindResult;
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    notify(convResult.value());
    return {};
}

Result<std::vector<ChunkRecord>> ChunkStore::loadConversation(ConversationId conversationId) {
    auto guard = db_.lock();
    auto stmtResult =
        db_.prepare("SELECT id, document_id, conversation_id, ordinal, content, start_offset, "
                    "end_offset, embedding FROM chunks WHERE conversation_id = ? "
                    "ORDER BY document_id ASC, ordinal ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, conversationId);
    if (!bindResult)
        return bindResult.error();

    std::vector<ChunkRecord> out;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        ChunkRecord rec;
        rec.id = stmt.getInt64(0);
        rec.documentId = stmt.getInt64(1);
        rec.conversationId = stmt.getInt64(2);
        rec.ordinal = stmt.getInt64(3);
        rec.content = stmt.getString(4);
        rec.startOffset = stmt.getInt64(5);
        rec.endOffset = stmt.getInt64(6);
        auto blob = stmt.getBlob(7);
        rec.embedding = utils::blobToVector(blob);
        out.push_back(std::move(rec));
    }
    return out;
}

Result<int64_t> ChunkStore::countChunks(ConversationId conversationId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM chunks WHERE conversation_id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, conversationId);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stepResult.value() ? stmt.getInt64(0) : int64_t{0};
}

Result<int64_t> ChunkStore::countDocumentChunks(DocumentId documentId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM chunks WHERE document_id = ?");
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

void ChunkStore::addInvalidationListener(InvalidationListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

Result<ConversationId> ChunkStore::conversationOf(DocumentId documentId) {
    auto guard = db_.lock();
    auto stmtResult = db_.prepare("SELECT conversation_id FROM documents WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, documentId);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(documentId)};
    }
    return stmt.getInt64(0);
}

void ChunkStore::notify(ConversationId conversationId) {
    std::vector<InvalidationListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(conversationId);
    }
}

} // namespace docent::vector
