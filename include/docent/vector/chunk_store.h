#pragma once

#include <docent/metadata/database.h>
#include <docent/metadata/records.h>
#include <docent/vector/document_chunker.h>

#include <functional>
#include <mutex>
#include <vector>

namespace docent::vector {

/**
 * @brief Persists embedded passages
 *
 * A chunk's conversation is always copied from its owning document inside the
 * insert statement; callers never supply it.
 */
class ChunkStore {
public:
    using InvalidationListener = std::function<void(ConversationId)>;

    ChunkStore(metadata::Database& db, size_t dimension);

    /**
     * @brief Store one passage and its embedding for a document
     * @return NotFound if the document does not exist, IngestionError on a dimension mismatch
     */
    Result<ChunkId> insertChunk(DocumentId documentId, const DocumentChunk& chunk,
                                const Embedding& embedding);

    /**
     * @brief Remove all passages of a document
     */
    Result<void> deleteChunks(DocumentId documentId);

    /**
     * @brief All passages of one conversation, in (document, ordinal) order
     */
    Result<std::vector<metadata::ChunkRecord>> loadConversation(ConversationId conversationId);

    Result<int64_t> countChunks(ConversationId conversationId);
    Result<int64_t> countDocumentChunks(DocumentId documentId);

    /**
     * @brief Called with the conversation id after every write
     */
    void addInvalidationListener(InvalidationListener listener);

    [[nodiscard]] size_t dimension() const { return dimension_; }

private:
    Result<ConversationId> conversationOf(DocumentId documentId);
    void notify(ConversationId conversationId);

    metadata::Database& db_;
    size_t dimension_;
    std::mutex listenersMutex_;
    std::vector<InvalidationListener> listeners_;
};

} // namespace docent::vector
