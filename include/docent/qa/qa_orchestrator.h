#pragma once

#include <docent/core/retry.h>
#include <docent/memory/conversation_memory.h>
#include <docent/metadata/conversation_repository.h>
#include <docent/metadata/database.h>
#include <docent/metadata/match_recorder.h>
#include <docent/ml/provider.h>
#include <docent/qa/prompt_builder.h>
#include <docent/vector/vector_index.h>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace docent::qa {

enum class QaState {
    Init,
    LoadDocuments,
    NoDocuments,
    HasDocuments,
    AgentMode,
    Retrieve,
    BuildContext,
    Generate,
    PersistMatches,
    Complete,
    Failed
};

const char* toString(QaState state);

struct QaConfig {
    size_t top_k = 10;               // Passages requested from the index
    double min_relevance = 0.55;     // Passages scoring below are ignored
    size_t max_context_chars = 8000; // Budget for passage text in the prompt
    size_t history_turns = 6;        // Memory turns sent to the generator
    size_t snippet_chars = 200;      // Length of source snippets returned to callers
    RetryPolicy retry;
};

struct SourceAttribution {
    DocumentId document_id = 0;
    std::string document_name;
    std::string snippet;
    double score = 0.0;
};

struct AnswerMetadata {
    metadata::GenerationMode mode = metadata::GenerationMode::Agent;
    size_t num_sources = 0;
    size_t context_length = 0;
};

struct AskRequest {
    std::optional<ConversationId> conversation_id; // Empty for ad-hoc sessions
    std::string session_key;                       // Memory key for ad-hoc sessions
    std::string question;
};

struct AskResult {
    std::string answer;
    std::vector<SourceAttribution> sources;
    AnswerMetadata metadata;
    std::optional<MessageId> message_id; // Assistant message, when persisted
    QaState final_state = QaState::Init;
    std::string degraded_note;           // Why retrieval was skipped, if it was
    std::optional<Error> error;          // Set for failed turns
    std::vector<QaState> trace;          // States visited, in order

    [[nodiscard]] bool failed() const { return final_state == QaState::Failed; }
};

/**
 * @brief Answers one question in one conversation
 *
 * Runs Init -> LoadDocuments -> (AgentMode | Retrieve -> BuildContext) -> Generate ->
 * PersistMatches -> Complete. Retrieval is always scoped to the request's conversation.
 * A failed turn is returned as an AskResult in state Failed with a labeled answer;
 * nothing is committed for it. Hard errors (unknown conversation, isolation breach,
 * cancellation) are returned as errors.
 */
class QaOrchestrator {
public:
    QaOrchestrator(metadata::Database& db, metadata::ConversationRepository& repository,
                   metadata::MatchRecorder& recorder, vector::VectorIndex& index,
                   memory::ConversationMemory& memory,
                   std::shared_ptr<ml::IEmbeddingProvider> embedder,
                   std::shared_ptr<ml::IGenerationProvider> generator, QaConfig config = {});

    Result<AskResult> ask(const AskRequest& request, std::stop_token stop = {});

    [[nodiscard]] const QaConfig& config() const { return config_; }

private:
    struct Run;

    Result<void> loadDocuments(Run& run);
    Result<void> retrieve(Run& run, std::stop_token stop);
    void buildContext(Run& run);
    Result<void> generate(Run& run, std::stop_token stop);
    Result<void> persist(Run& run);
    void switchToAgentMode(Run& run, std::string note);
    AskResult failTurn(Run& run, const Error& error);
    void enter(Run& run, QaState state);

    metadata::Database& db_;
    metadata::ConversationRepository& repository_;
    metadata::MatchRecorder& recorder_;
    vector::VectorIndex& index_;
    memory::ConversationMemory& memory_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<ml::IGenerationProvider> generator_;
    QaConfig config_;
};

} // namespace docent::qa
