#pragma once

#include <docent/metadata/records.h>
#include <docent/vector/chunk_store.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace docent::vector {

struct VectorIndexConfig {
    size_t max_k = 10; // Upper bound on hits per search
};

struct SearchHit {
    metadata::ChunkRecord chunk;
    double score = 0.0; // (cosine + 1) / 2
};

struct SearchResult {
    std::vector<SearchHit> hits;
    size_t distinct_documents = 0;
};

/**
 * @brief Similarity search over the passages of a single conversation
 *
 * Each search names its conversation; candidates from any other conversation are
 * never considered. Vectors of a conversation are cached as an immutable snapshot
 * that is dropped whenever the chunk store writes to that conversation.
 */
class VectorIndex {
public:
    explicit VectorIndex(ChunkStore& store, VectorIndexConfig config = {});

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * @brief Top passages of a conversation for a query vector
     *
     * Returns min(k, max_k, chunks in conversation) hits ordered by score descending,
     * then chunk ordinal, document id and chunk id ascending.
     */
    Result<SearchResult> search(ConversationId conversationId, const Embedding& query, size_t k);

    /**
     * @brief Drop the cached snapshot of one conversation
     */
    void invalidate(ConversationId conversationId);

    void clear();

    [[nodiscard]] size_t cachedConversations() const;
    [[nodiscard]] const VectorIndexConfig& config() const { return config_; }

private:
    struct Snapshot {
        std::vector<metadata::ChunkRecord> chunks;
    };

    Result<std::shared_ptr<const Snapshot>> snapshotFor(ConversationId conversationId);

    ChunkStore& store_;
    VectorIndexConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ConversationId, std::shared_ptr<const Snapshot>> snapshots_;
    std::unordered_map<ConversationId, uint64_t> generations_;
};

} // namespace docent::vector
