#include <docent/common/utf8_utils.h>
#include <docent/qa/qa_orchestrator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace docent::qa {

using metadata::GenerationMode;
using metadata::MessageRole;

namespace {

bool isBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* toString(QaState state) {
    switch (state) {
        case QaState::Init: return "Init";
        case QaState::LoadDocuments: return "LoadDocuments";
        case QaState::NoDocuments: return "NoDocuments";
        case QaState::HasDocuments: return "HasDocuments";
        case QaState::AgentMode: return "AgentMode";
        case QaState::Retrieve: return "Retrieve";
        case QaState::BuildContext: return "BuildContext";
        case QaState::Generate: return "Generate";
        case QaState::PersistMatches: return "PersistMatches";
        case QaState::Complete: return "Complete";
        case QaState::Failed: return "Failed";
    }
    return "Unknown";
}

struct QaOrchestrator::Run {
    const AskRequest& request;
    AskResult result;
    std::optional<metadata::Conversation> conversation;
    std::string memoryKey;
    std::unordered_map<DocumentId, std::string> documentNames;
    std::vector<vector::SearchHit> hits;
    std::vector<ContextPassage> bestPerDocument;
    std::string prompt;
    bool agent = false;

    explicit Run(const AskRequest& req) : request(req) {}
};

QaOrchestrator::QaOrchestrator(metadata::Database& db,
                               metadata::ConversationRepository& repository,
                               metadata::MatchRecorder& recorder, vector::VectorIndex& index,
                               memory::ConversationMemory& memory,
                               std::shared_ptr<ml::IEmbeddingProvider> embedder,
                               std::shared_ptr<ml::IGenerationProvider> generator,
                               QaConfig config)
    : db_(db),
      repository_(repository),
      recorder_(recorder),
      index_(index),
      memory_(memory),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      config_(std::move(config)) {}

Result<AskResult> QaOrchestrator::ask(const AskRequest& request, std::stop_token stop) {
    Run run(request);
    enter(run, QaState::Init);

    if (isBlank(request.question)) {
        return Error{ErrorCode::InvalidArgument, "Question is empty"};
    }
    if (!request.conversation_id && request.session_key.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Either a conversation or a session key is required"};
    }

    enter(run, QaState::LoadDocuments);
    auto loaded = loadDocuments(run);
    if (!loaded) {
        if (loaded.error().code == ErrorCode::NotFound) {
            return loaded.error();
        }
        return failTurn(run, loaded.error());
    }

    if (run.documentNames.empty()) {
        enter(run, QaState::NoDocuments);
        switchToAgentMode(run, "");
    } else {
        enter(run, QaState::HasDocuments);
        enter(run, QaState::Retrieve);
        auto retrieved = retrieve(run, stop);
        if (!retrieved) {
            return retrieved.error();
        }
        if (!run.agent) {
            enter(run, QaState::BuildContext);
            buildContext(run);
        }
    }

    enter(run, QaState::Generate);
    auto generated = generate(run, stop);
    if (!generated) {
        if (generated.error().code == ErrorCode::OperationCancelled) {
            return generated.error();
        }
        return failTurn(run, generated.error());
    }

    // Nothing is committed once a stop has been requested
    if (stop.stop_requested()) {
        spdlog::info("[QA] request cancelled before persisting");
        return Error{ErrorCode::OperationCancelled, "Request cancelled before commit"};
    }

    enter(run, QaState::PersistMatches);
    auto persisted = persist(run);
    if (!persisted) {
        return failTurn(run, persisted.error());
    }

    memory_.append(run.memoryKey, MessageRole::User, request.question);
    memory_.append(run.memoryKey, MessageRole::Assistant, run.result.answer);

    enter(run, QaState::Complete);
    spdlog::info("[QA] answered in {} mode with {} source(s)",
                 metadata::StatusUtils::toString(run.result.metadata.mode),
                 run.result.metadata.num_sources);
    return std::move(run.result);
}

Result<void> QaOrchestrator::loadDocuments(Run& run) {
    const auto& request = run.request;
    if (!request.conversation_id) {
        // Ad-hoc sessions never see documents
        run.memoryKey = "session:" + request.session_key;
        return {};
    }

    auto conv = repository_.getConversation(*request.conversation_id);
    if (!conv)
        return conv.error();
    if (!conv.value()) {
        return Error{ErrorCode::NotFound,
                     "Conversation not found: " + std::to_string(*request.conversation_id)};
    }
    run.conversation = *conv.value();
    run.memoryKey = run.conversation->threadId;

    auto docs = repository_.listDocuments(run.conversation->id);
    if (!docs)
        return docs.error();
    for (const auto& doc : docs.value()) {
        run.documentNames.emplace(doc.id, doc.displayName());
    }

    // Rebuild memory from stored messages the first time a conversation is seen
    if (!memory_.contains(run.memoryKey)) {
        auto messages = repository_.listMessages(run.conversation->id);
        if (!messages)
            return messages.error();
        std::vector<memory::Turn> turns;
        turns.reserve(messages.value().size());
        for (const auto& msg : messages.value()) {
            turns.push_back(memory::Turn{msg.role, msg.content});
        }
        memory_.seedIfAbsent(run.memoryKey, turns);
    }

    spdlog::debug("[QA] conversation {}: {} document(s)", run.conversation->id,
                  run.documentNames.size());
    return {};
}

Result<void> QaOrchestrator::retrieve(Run& run, std::stop_token stop) {
    const ConversationId conversationId = run.conversation->id;

    auto queryVector = retryWithBackoff(
        config_.retry, "embed question",
        [&] { return embedder_->embed(run.request.question); }, stop);
    if (!queryVector) {
        if (queryVector.error().code == ErrorCode::OperationCancelled) {
            return queryVector.error();
        }
        switchToAgentMode(run, "Document search is unavailable (" +
                                   queryVector.error().message +
                                   "); this answer uses general knowledge only.");
        return {};
    }

    auto search = index_.search(conversationId, queryVector.value(), config_.top_k);
    if (!search) {
        switchToAgentMode(run, "Document search is unavailable (" + search.error().message +
                                   "); this answer uses general knowledge only.");
        return {};
    }

    for (const auto& hit : search.value().hits) {
        if (hit.chunk.conversationId != conversationId ||
            run.documentNames.find(hit.chunk.documentId) == run.documentNames.end()) {
            spdlog::critical("[QA] isolation violation: chunk {} of document {} (conversation {}) "
                             "returned for conversation {}",
                             hit.chunk.id, hit.chunk.documentId, hit.chunk.conversationId,
                             conversationId);
            return Error{ErrorCode::IsolationViolation,
                         "Retrieved passage does not belong to conversation " +
                             std::to_string(conversationId)};
        }
    }

    for (auto& hit : search.value().hits) {
        if (hit.score >= config_.min_relevance) {
            run.hits.push_back(std::move(hit));
        } else {
            spdlog::debug("[QA] dropping chunk {} (score {:.3f} below {:.2f})", hit.chunk.id,
                          hit.score, config_.min_relevance);
        }
    }

    if (run.hits.empty()) {
        switchToAgentMode(run, "No passage in this conversation's documents was relevant to the "
                               "question; this answer uses general knowledge only.");
    }
    return {};
}

void QaOrchestrator::buildContext(Run& run) {
    std::vector<ContextPassage> passages;
    passages.reserve(run.hits.size());
    for (const auto& hit : run.hits) {
        auto name = run.documentNames.find(hit.chunk.documentId);
        passages.push_back(ContextPassage{hit.chunk.documentId, name->second, hit.chunk.content,
                                          hit.score});
    }

    auto context = PromptBuilder::buildContext(std::move(passages), config_.max_context_chars);

    // Passages come best first, so the first one seen per document is its best
    std::unordered_set<DocumentId> seen;
    for (const auto& passage : context.passages) {
        if (!seen.insert(passage.document_id).second) {
            continue;
        }
        run.bestPerDocument.push_back(passage);
        run.result.sources.push_back(SourceAttribution{
            passage.document_id, passage.document_name,
            common::truncateUtf8(passage.content, config_.snippet_chars) + "...", passage.score});
    }

    run.result.metadata.mode = GenerationMode::Rag;
    run.result.metadata.num_sources = run.result.sources.size();
    run.result.metadata.context_length = context.text.size();
    run.prompt = PromptBuilder::ragPrompt(run.request.question, context);

    spdlog::info("[QA] context from {} passage(s) across {} document(s), {} chars",
                 context.passages.size(), run.result.sources.size(), context.text.size());
}

Result<void> QaOrchestrator::generate(Run& run, std::stop_token stop) {
    if (run.agent) {
        run.prompt = PromptBuilder::agentPrompt(run.request.question);
    }
    auto history = memory_.recent(run.memoryKey, config_.history_turns);

    auto answer = retryWithBackoff(
        config_.retry, "generate answer",
        [&] { return generator_->generate(run.prompt, history); }, stop);
    if (!answer) {
        if (answer.error().code == ErrorCode::OperationCancelled) {
            return answer.error();
        }
        return Error{ErrorCode::GenerationError, "Generation failed: " + answer.error().message};
    }

    std::string text = std::move(answer).value();
    if (PromptBuilder::asksForUpload(text)) {
        spdlog::info("[QA] answer asked for document content; re-prompting from general knowledge");
        const auto strict = PromptBuilder::strictFallbackPrompt(run.request.question);
        auto fallback = generator_->generate(strict, history);
        if (fallback && !isBlank(fallback.value())) {
            text = std::move(fallback).value();
        } else if (!fallback) {
            spdlog::warn("[QA] general-knowledge re-prompt failed: {}", fallback.error().message);
        }
    }

    run.result.answer = std::move(text);
    return {};
}

Result<void> QaOrchestrator::persist(Run& run) {
    if (!run.conversation) {
        return {};
    }
    const ConversationId conversationId = run.conversation->id;
    MessageId assistantId = 0;

    auto committed = db_.transaction([&]() -> Result<void> {
        metadata::Message user;
        user.conversationId = conversationId;
        user.role = MessageRole::User;
        user.content = run.request.question;
        auto userResult = repository_.insertMessage(user);
        if (!userResult)
            return userResult.error();

        metadata::Message assistant;
        assistant.conversationId = conversationId;
        assistant.role = MessageRole::Assistant;
        assistant.content = run.result.answer;
        assistant.mode = run.result.metadata.mode;
        assistant.numSources = static_cast<int64_t>(run.result.metadata.num_sources);
        assistant.contextLength = static_cast<int64_t>(run.result.metadata.context_length);
        auto assistantResult = repository_.insertMessage(assistant);
        if (!assistantResult)
            return assistantResult.error();
        assistantId = assistantResult.value().id;

        for (const auto& best : run.bestPerDocument) {
            auto recorded =
                recorder_.recordMatch(assistantId, best.document_id, best.content, best.score);
            if (!recorded)
                return recorded;
        }

        auto titled = repository_.maybeSetTitleFromQuestion(conversationId, run.request.question);
        if (!titled)
            return titled;
        return repository_.touchConversation(conversationId);
    });
    if (!committed) {
        return committed;
    }

    run.result.message_id = assistantId;
    spdlog::debug("[QA] persisted message {} with {} match(es)", assistantId,
                  run.bestPerDocument.size());
    return {};
}

void QaOrchestrator::switchToAgentMode(Run& run, std::string note) {
    run.agent = true;
    run.hits.clear();
    run.result.sources.clear();
    run.result.metadata = AnswerMetadata{GenerationMode::Agent, 0, 0};
    if (!note.empty()) {
        spdlog::warn("[QA] degraded to general knowledge: {}", note);
        run.result.degraded_note = std::move(note);
    }
    enter(run, QaState::AgentMode);
}

AskResult QaOrchestrator::failTurn(Run& run, const Error& error) {
    enter(run, QaState::Failed);
    spdlog::error("[QA] turn failed: {}", error.message);
    run.result.error = error;
    run.result.answer = std::string("[Error] Unable to answer this question: ") + error.message;
    run.result.sources.clear();
    run.result.message_id.reset();
    return std::move(run.result);
}

void QaOrchestrator::enter(Run& run, QaState state) {
    run.result.trace.push_back(state);
    run.result.final_state = state;
    spdlog::debug("[QA] -> {}", toString(state));
}

} // namespace docent::qa
