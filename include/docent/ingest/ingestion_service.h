#pragma once

#include <docent/core/retry.h>
#include <docent/metadata/conversation_repository.h>
#include <docent/ml/provider.h>
#include <docent/vector/chunk_store.h>
#include <docent/vector/document_chunker.h>

#include <memory>
#include <stop_token>
#include <string>

namespace docent::ingest {

struct IngestionConfig {
    vector::ChunkingConfig chunking;
    RetryPolicy retry;
};

struct UploadResult {
    DocumentId document_id = 0;
    metadata::DocumentStatus status = metadata::DocumentStatus::Pending;
    size_t chunk_count = 0;
    std::string error; // Set when status is Failed
};

/**
 * @brief Turns document text into embedded, searchable passages
 */
class IngestionService {
public:
    IngestionService(metadata::ConversationRepository& repository, vector::ChunkStore& store,
                     std::shared_ptr<ml::IEmbeddingProvider> embedder, IngestionConfig config = {});

    /**
     * @brief Split, embed and store the passages of an existing document
     *
     * Existing passages of the document are replaced. Each passage is stored as soon as
     * it is embedded, so a failure part way leaves the earlier passages searchable.
     * The document ends Ready, or Failed with IngestionError returned. A stop request
     * returns OperationCancelled and leaves the document Pending without passages.
     *
     * @return number of passages stored
     */
    Result<size_t> ingest(DocumentId documentId, const std::string& text,
                          std::stop_token stop = {});

    /**
     * @brief Create a document in a conversation and ingest it
     *
     * Ingestion failures are reported through UploadResult::status; only storage
     * failures, cancellation and unknown conversations are returned as errors.
     */
    Result<UploadResult> upload(ConversationId conversationId, const std::string& text,
                                const std::string& filename = "", std::stop_token stop = {});

    [[nodiscard]] const IngestionConfig& config() const { return config_; }

private:
    Result<size_t> cancel(DocumentId documentId, size_t stored, const Error& error);
    Result<size_t> fail(DocumentId documentId, size_t stored, const std::string& message);

    metadata::ConversationRepository& repository_;
    vector::ChunkStore& store_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    IngestionConfig config_;
    std::unique_ptr<vector::DocumentChunker> chunker_;
};

} // namespace docent::ingest
