#include <docent/ingest/ingestion_service.h>

#include <spdlog/spdlog.h>

namespace docent::ingest {

using metadata::DocumentStatus;

IngestionService::IngestionService(metadata::ConversationRepository& repository,
                                   vector::ChunkStore& store,
                                   std::shared_ptr<ml::IEmbeddingProvider> embedder,
                                   IngestionConfig config)
    : repository_(repository),
      store_(store),
      embedder_(std::move(embedder)),
      config_(std::move(config)),
      chunker_(vector::createChunker(config_.chunking)) {}

Result<size_t> IngestionService::ingest(DocumentId documentId, const std::string& text,
                                        std::stop_token stop) {
    auto docResult = repository_.getDocument(documentId);
    if (!docResult)
        return docResult.error();
    if (!docResult.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(documentId)};
    }

    // Re-ingesting replaces whatever an earlier run stored
    auto clearResult = store_.deleteChunks(documentId);
    if (!clearResult)
        return clearResult.error();

    auto passages = chunker_->chunkDocument(text);
    spdlog::debug("[Ingest] document {}: {} passage(s)", documentId, passages.size());

    size_t stored = 0;
    for (const auto& passage : passages) {
        auto embedding = retryWithBackoff(
            config_.retry, "embed passage", [&] { return embedder_->embed(passage.content); },
            stop);
        if (!embedding) {
            if (embedding.error().code == ErrorCode::OperationCancelled) {
                return cancel(documentId, stored, embedding.error());
            }
            return fail(documentId, stored,
                        "Embedding passage " + std::to_string(passage.chunk_index) +
                            " failed: " + embedding.error().message);
        }

        auto inserted = store_.insertChunk(documentId, passage, embedding.value());
        if (!inserted) {
            return fail(documentId, stored,
                        "Storing passage " + std::to_string(passage.chunk_index) +
                            " failed: " + inserted.error().message);
        }
        ++stored;
    }

    auto statusResult =
        repository_.updateDocumentStatus(documentId, DocumentStatus::Ready, "",
                                         static_cast<int64_t>(stored));
    if (!statusResult)
        return statusResult.error();

    spdlog::info("[Ingest] document {} ready with {} passage(s)", documentId, stored);
    return stored;
}

Result<UploadResult> IngestionService::upload(ConversationId conversationId,
                                              const std::string& text,
                                              const std::string& filename, std::stop_token stop) {
    auto convResult = repository_.getConversation(conversationId);
    if (!convResult)
        return convResult.error();
    if (!convResult.value()) {
        return Error{ErrorCode::NotFound,
                     "Conversation not found: " + std::to_string(conversationId)};
    }

    metadata::Document doc;
    doc.conversationId = conversationId;
    doc.ownerId = convResult.value()->ownerId;
    doc.filename = filename;
    doc.content = text;
    doc.status = DocumentStatus::Pending;

    auto inserted = repository_.insertDocument(doc);
    if (!inserted)
        return inserted.error();

    UploadResult result;
    result.document_id = inserted.value();

    auto ingested = ingest(result.document_id, text, stop);
    if (ingested) {
        result.status = DocumentStatus::Ready;
        result.chunk_count = ingested.value();
        return result;
    }
    if (ingested.error().code != ErrorCode::IngestionError) {
        return ingested.error();
    }

    result.status = DocumentStatus::Failed;
    result.error = ingested.error().message;
    auto count = store_.countDocumentChunks(result.document_id);
    result.chunk_count = count ? static_cast<size_t>(count.value()) : 0;
    return result;
}

Result<size_t> IngestionService::cancel(DocumentId documentId, size_t stored,
                                        const Error& error) {
    spdlog::info("[Ingest] document {} cancelled after {} passage(s)", documentId, stored);
    // The document stays Pending with no passages; ingest() can run it again
    if (auto cleared = store_.deleteChunks(documentId); !cleared) {
        spdlog::error("[Ingest] could not clear passages of document {}: {}", documentId,
                      cleared.error().message);
    }
    return error;
}

Result<size_t> IngestionService::fail(DocumentId documentId, size_t stored,
                                      const std::string& message) {
    spdlog::warn("[Ingest] document {} failed after {} passage(s): {}", documentId, stored,
                 message);
    auto statusResult = repository_.updateDocumentStatus(documentId, DocumentStatus::Failed,
                                                         message, static_cast<int64_t>(stored));
    if (!statusResult) {
        spdlog::error("[Ingest] could not mark document {} failed: {}", documentId,
                      statusResult.error().message);
    }
    return Error{ErrorCode::IngestionError, message};
}

} // namespace docent::ingest
