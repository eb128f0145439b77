#pragma once

#include <docent/app/conversation_scheduler.h>
#include <docent/config/engine_config.h>
#include <docent/ingest/ingestion_service.h>
#include <docent/memory/conversation_memory.h>
#include <docent/metadata/conversation_repository.h>
#include <docent/metadata/database.h>
#include <docent/metadata/match_recorder.h>
#include <docent/ml/provider.h>
#include <docent/qa/qa_orchestrator.h>
#include <docent/vector/chunk_store.h>
#include <docent/vector/vector_index.h>

#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace docent::app {

struct DocumentPreview {
    metadata::Document document;
    int64_t usage_count = 0;
    std::vector<metadata::DocumentMatch> recent_matches;
};

struct EngineStats {
    size_t scheduled_keys = 0;
    size_t memory_entries = 0;
};

/**
 * @brief Entry point tying storage, retrieval, memory and the QA state machine together
 *
 * Work for one conversation (uploads, questions, deletion) runs in submission order on
 * that conversation's strand; different conversations proceed in parallel.
 */
class DocentEngine {
public:
    static Result<std::unique_ptr<DocentEngine>>
    create(config::EngineConfig config, std::shared_ptr<ml::IEmbeddingProvider> embedder,
           std::shared_ptr<ml::IGenerationProvider> generator);

    ~DocentEngine();

    DocentEngine(const DocentEngine&) = delete;
    DocentEngine& operator=(const DocentEngine&) = delete;

    // Conversations
    Result<metadata::Conversation> createConversation(UserId ownerId,
                                                      const std::string& title = "");
    Result<void> deleteConversation(ConversationId conversationId);
    Result<std::vector<metadata::Conversation>> listConversations(UserId ownerId);
    Result<std::vector<metadata::Document>> listDocuments(ConversationId conversationId);
    Result<std::vector<metadata::Message>> listMessages(ConversationId conversationId);

    /**
     * @brief Store a document in a conversation and make it searchable
     *
     * A document whose ingestion fails is kept with status Failed; that is not an error.
     */
    Result<ingest::UploadResult> uploadDocument(ConversationId conversationId,
                                                const std::string& text,
                                                const std::string& filename = "");

    Result<qa::AskResult> ask(ConversationId conversationId, const std::string& question);

    /**
     * @brief Queue a question; a stop requested before the answer is committed cancels it
     */
    std::future<Result<qa::AskResult>> askAsync(ConversationId conversationId,
                                                std::string question, std::stop_token stop = {});

    /**
     * @brief Answer from general knowledge and session memory only; nothing is stored
     */
    Result<qa::AskResult> askAdHoc(const std::string& sessionKey, const std::string& question);

    /**
     * @brief Forget an ad-hoc session: its memory and its strand are released
     *
     * Ending a session that was never used is not an error.
     */
    Result<void> endSession(const std::string& sessionKey);

    Result<DocumentPreview> previewDocument(DocumentId documentId);
    Result<std::vector<metadata::DocumentMatch>> matchesForMessage(MessageId messageId);

    /**
     * @brief Cancel pending work and wait for running work to finish
     */
    void shutdown();

    [[nodiscard]] const config::EngineConfig& config() const { return config_; }
    [[nodiscard]] EngineStats stats() const;

    static constexpr int kRecentMatchLimit = 10;

private:
    DocentEngine(config::EngineConfig config, std::shared_ptr<ml::IEmbeddingProvider> embedder,
                 std::shared_ptr<ml::IGenerationProvider> generator);

    Result<void> initialize();

    static std::string conversationKey(ConversationId conversationId);
    static std::string sessionKey(const std::string& key);

    config::EngineConfig config_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<ml::IGenerationProvider> generator_;
    std::stop_source stopSource_;

    metadata::Database database_;
    std::unique_ptr<metadata::ConversationRepository> repository_;
    std::unique_ptr<metadata::MatchRecorder> recorder_;
    std::unique_ptr<vector::ChunkStore> chunkStore_;
    std::unique_ptr<vector::VectorIndex> index_;
    std::unique_ptr<memory::ConversationMemory> memory_;
    std::unique_ptr<ingest::IngestionService> ingestion_;
    std::unique_ptr<qa::QaOrchestrator> orchestrator_;
    std::unique_ptr<ConversationScheduler> scheduler_;
};

} // namespace docent::app
