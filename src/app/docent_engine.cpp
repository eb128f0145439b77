#include <docent/app/docent_engine.h>
#include <docent/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <filesystem>

namespace docent::app {

namespace {

bool isInMemoryPath(const std::string& path) {
    return path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

Error shutDownError() {
    return Error{ErrorCode::InvalidState, "Engine is shut down"};
}

} // namespace

Result<std::unique_ptr<DocentEngine>>
DocentEngine::create(config::EngineConfig config, std::shared_ptr<ml::IEmbeddingProvider> embedder,
                     std::shared_ptr<ml::IGenerationProvider> generator) {
    if (!embedder || !generator) {
        return Error{ErrorCode::InvalidArgument, "Embedding and generation providers are required"};
    }
    if (auto valid = config::validateEngineConfig(config); !valid) {
        return valid.error();
    }

    std::unique_ptr<DocentEngine> engine(
        new DocentEngine(std::move(config), std::move(embedder), std::move(generator)));
    if (auto init = engine->initialize(); !init) {
        return init.error();
    }
    return engine;
}

DocentEngine::DocentEngine(config::EngineConfig config,
                           std::shared_ptr<ml::IEmbeddingProvider> embedder,
                           std::shared_ptr<ml::IGenerationProvider> generator)
    : config_(std::move(config)), embedder_(std::move(embedder)),
      generator_(std::move(generator)) {}

DocentEngine::~DocentEngine() {
    shutdown();
}

Result<void> DocentEngine::initialize() {
    const std::string dbPath = config_.resolvedDatabasePath();
    const bool inMemory = isInMemoryPath(dbPath);

    if (!inMemory) {
        auto parent = std::filesystem::path(dbPath).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::DatabaseError,
                             "Cannot create " + parent.string() + ": " + ec.message()};
            }
        }
    }

    if (auto opened = database_.open(dbPath); !opened) {
        return opened.error();
    }
    if (!inMemory) {
        if (auto wal = database_.enableWAL(); !wal) {
            spdlog::warn("[Engine] WAL unavailable for {}: {}", dbPath, wal.error().message);
        }
    }

    if (auto schema = metadata::ensureDocentSchema(database_); !schema) {
        return schema.error();
    }

    const size_t dimension = embedder_->dimension();
    if (dimension != config_.embedding.dimension) {
        spdlog::info("[Engine] embedder '{}' reports dimension {} (configured {}); using {}",
                     embedder_->name(), dimension, config_.embedding.dimension, dimension);
    }

    repository_ = std::make_unique<metadata::ConversationRepository>(database_);
    recorder_ = std::make_unique<metadata::MatchRecorder>(database_);
    chunkStore_ = std::make_unique<vector::ChunkStore>(database_, dimension);
    index_ = std::make_unique<vector::VectorIndex>(*chunkStore_, config_.index);
    memory_ = std::make_unique<memory::ConversationMemory>(config_.memory);

    ingest::IngestionConfig ingestConfig;
    ingestConfig.chunking = config_.chunking;
    ingestConfig.retry = config_.retry;
    ingestion_ = std::make_unique<ingest::IngestionService>(*repository_, *chunkStore_, embedder_,
                                                            std::move(ingestConfig));

    orchestrator_ = std::make_unique<qa::QaOrchestrator>(database_, *repository_, *recorder_,
                                                         *index_, *memory_, embedder_, generator_,
                                                         config_.qa);
    scheduler_ = std::make_unique<ConversationScheduler>(config_.worker_threads);

    spdlog::info("[Engine] ready (database {}, embedder {}, generator {}, {} worker(s))", dbPath,
                 embedder_->name(), generator_->name(), scheduler_->threads());
    return {};
}

void DocentEngine::shutdown() {
    if (!scheduler_) {
        return;
    }
    stopSource_.request_stop();
    scheduler_->shutdown();
}

std::string DocentEngine::conversationKey(ConversationId conversationId) {
    return "conversation:" + std::to_string(conversationId);
}

std::string DocentEngine::sessionKey(const std::string& key) {
    return "session:" + key;
}

Result<metadata::Conversation> DocentEngine::createConversation(UserId ownerId,
                                                                const std::string& title) {
    return repository_->createConversation(ownerId, title);
}

Result<void> DocentEngine::deleteConversation(ConversationId conversationId) {
    if (stopSource_.stop_requested()) {
        return shutDownError();
    }
    const auto key = conversationKey(conversationId);
    auto done = scheduler_->submit(key, [this, conversationId]() -> Result<void> {
        auto conv = repository_->getConversation(conversationId);
        if (!conv)
            return conv.error();
        if (!conv.value()) {
            return Error{ErrorCode::NotFound,
                         "Conversation not found: " + std::to_string(conversationId)};
        }

        if (auto deleted = repository_->deleteConversation(conversationId); !deleted) {
            return deleted;
        }
        memory_->destroy(conv.value()->threadId);
        index_->invalidate(conversationId);
        spdlog::info("[Engine] deleted conversation {}", conversationId);
        return {};
    });
    auto result = done.get();
    scheduler_->forget(key);
    return result;
}

Result<std::vector<metadata::Conversation>> DocentEngine::listConversations(UserId ownerId) {
    return repository_->listConversations(ownerId);
}

Result<std::vector<metadata::Document>> DocentEngine::listDocuments(ConversationId conversationId) {
    return repository_->listDocuments(conversationId);
}

Result<std::vector<metadata::Message>> DocentEngine::listMessages(ConversationId conversationId) {
    return repository_->listMessages(conversationId);
}

Result<ingest::UploadResult> DocentEngine::uploadDocument(ConversationId conversationId,
                                                          const std::string& text,
                                                          const std::string& filename) {
    if (stopSource_.stop_requested()) {
        return shutDownError();
    }
    auto stop = stopSource_.get_token();
    return scheduler_
        ->submit(conversationKey(conversationId),
                 [this, conversationId, &text, &filename, stop] {
                     return ingestion_->upload(conversationId, text, filename, stop);
                 })
        .get();
}

Result<qa::AskResult> DocentEngine::ask(ConversationId conversationId,
                                        const std::string& question) {
    return askAsync(conversationId, question).get();
}

std::future<Result<qa::AskResult>>
DocentEngine::askAsync(ConversationId conversationId, std::string question, std::stop_token stop) {
    if (stopSource_.stop_requested()) {
        std::promise<Result<qa::AskResult>> rejected;
        rejected.set_value(shutDownError());
        return rejected.get_future();
    }
    if (!stop.stop_possible()) {
        stop = stopSource_.get_token();
    }
    return scheduler_->submit(conversationKey(conversationId),
                              [this, conversationId, question = std::move(question), stop] {
                                  qa::AskRequest request;
                                  request.conversation_id = conversationId;
                                  request.question = question;
                                  return orchestrator_->ask(request, stop);
                              });
}

Result<qa::AskResult> DocentEngine::askAdHoc(const std::string& key, const std::string& question) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Session key is empty"};
    }
    if (stopSource_.stop_requested()) {
        return shutDownError();
    }
    auto stop = stopSource_.get_token();
    return scheduler_
        ->submit(sessionKey(key),
                 [this, &key, &question, stop] {
                     qa::AskRequest request;
                     request.session_key = key;
                     request.question = question;
                     return orchestrator_->ask(request, stop);
                 })
        .get();
}

Result<void> DocentEngine::endSession(const std::string& key) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Session key is empty"};
    }
    if (stopSource_.stop_requested()) {
        return shutDownError();
    }
    const auto strand = sessionKey(key);
    auto result = scheduler_
                      ->submit(strand,
                               [this, &strand]() -> Result<void> {
                                   if (memory_->destroy(strand))
                                       spdlog::debug("[Engine] ended session {}", strand);
                                   return {};
                               })
                      .get();
    scheduler_->forget(strand);
    return result;
}

EngineStats DocentEngine::stats() const {
    EngineStats stats;
    if (scheduler_)
        stats.scheduled_keys = scheduler_->activeKeys();
    if (memory_)
        stats.memory_entries = memory_->size();
    return stats;
}

Result<DocumentPreview> DocentEngine::previewDocument(DocumentId documentId) {
    auto doc = repository_->getDocument(documentId);
    if (!doc)
        return doc.error();
    if (!doc.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(documentId)};
    }

    DocumentPreview preview;
    preview.document = *doc.value();

    auto usage = recorder_->usageCount(documentId);
    if (!usage)
        return usage.error();
    preview.usage_count = usage.value();

    auto recent = recorder_->recentMatches(documentId, kRecentMatchLimit);
    if (!recent)
        return recent.error();
    preview.recent_matches = std::move(recent).value();
    return preview;
}

Result<std::vector<metadata::DocumentMatch>>
DocentEngine::matchesForMessage(MessageId messageId) {
    auto message = repository_->getMessage(messageId);
    if (!message)
        return message.error();
    if (!message.value()) {
        return Error{ErrorCode::NotFound, "Message not found: " + std::to_string(messageId)};
    }
    return recorder_->matchesForMessage(messageId);
}

} // namespace docent::app
