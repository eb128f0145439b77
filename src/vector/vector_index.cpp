#include <docent/vector/vector_index.h>
#include <docent/vector/vector_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace docent::vector {

VectorIndex::VectorIndex(ChunkStore& store, VectorIndexConfig config)
    : store_(store), config_(config) {
    if (config_.max_k == 0) {
        config_.max_k = VectorIndexConfig{}.max_k;
    }
    store_.addInvalidationListener([this](ConversationId id) { invalidate(id); });
}

Result<SearchResult> VectorIndex::search(ConversationId conversationId, const Embedding& query,
                                         size_t k) {
    SearchResult result;
    if (k == 0) {
        return result;
    }
    if (!utils::isValidEmbedding(query, store_.dimension())) {
        return Error{ErrorCode::RetrievalError,
                     "Query vector has dimension " + std::to_string(query.size()) +
                         ", expected " + std::to_string(store_.dimension())};
    }

    auto snapshotResult = snapshotFor(conversationId);
    if (!snapshotResult) {
        return Error{ErrorCode::RetrievalError,
                     "Failed to load passages: " + snapshotResult.error().message};
    }
    const auto& chunks = snapshotResult.value()->chunks;

    std::vector<SearchHit> scored;
    scored.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        double cosine = utils::computeCosineSimilarity(query, chunk.embedding);
        scored.push_back(SearchHit{chunk, utils::similarityToScore(cosine)});
    }

    const size_t effectiveK = std::min({k, config_.max_k, scored.size()});
    auto better = [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score)
            return a.score > b.score;
        if (a.chunk.ordinal != b.chunk.ordinal)
            return a.chunk.ordinal < b.chunk.ordinal;
        if (a.chunk.documentId != b.chunk.documentId)
            return a.chunk.documentId < b.chunk.documentId;
        return a.chunk.id < b.chunk.id;
    };
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(effectiveK),
                      scored.end(), better);
    scored.resize(effectiveK);

    std::unordered_set<DocumentId> documents;
    for (const auto& hit : scored) {
        documents.insert(hit.chunk.documentId);
    }

    result.hits = std::move(scored);
    result.distinct_documents = documents.size();
    spdlog::debug("[VectorIndex] conversation {}: {} hit(s) from {} document(s) of {} passages",
                  conversationId, result.hits.size(), result.distinct_documents, chunks.size());
    return result;
}

void VectorIndex::invalidate(ConversationId conversationId) {
    std::unique_lock lock(mutex_);
    snapshots_.erase(conversationId);
    ++generations_[conversationId];
}

void VectorIndex::clear() {
    std::unique_lock lock(mutex_);
    snapshots_.clear();
    for (auto& [id, generation] : generations_) {
        ++generation;
    }
}

size_t VectorIndex::cachedConversations() const {
    std::shared_lock lock(mutex_);
    return snapshots_.size();
}

Result<std::shared_ptr<const VectorIndex::Snapshot>>
VectorIndex::snapshotFor(ConversationId conversationId) {
    uint64_t generation = 0;
    {
        std::shared_lock lock(mutex_);
        auto it = snapshots_.find(conversationId);
        if (it != snapshots_.end()) {
            return it->second;
        }
        auto gen = generations_.find(conversationId);
        generation = gen == generations_.end() ? 0 : gen->second;
    }

    auto loaded = store_.loadConversation(conversationId);
    if (!loaded)
        return loaded.error();

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->chunks = std::move(loaded).value();
    std::shared_ptr<const Snapshot> frozen = snapshot;

    {
        std::unique_lock lock(mutex_);
        // Skip caching when a write landed while loading
        auto gen = generations_.find(conversationId);
        uint64_t current = gen == generations_.end() ? 0 : gen->second;
        if (current == generation) {
            snapshots_[conversationId] = frozen;
        }
    }
    return frozen;
}

} // namespace docent::vector
