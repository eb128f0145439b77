#include <gtest/gtest.h>
#include <docent/ingest/ingestion_service.h>
#include <docent/qa/qa_orchestrator.h>

#include "../../common/test_helpers.h"

using namespace docent;
using namespace docent::qa;
using namespace docent::metadata;

namespace {

RetryPolicy fastRetry() {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_backoff = std::chrono::milliseconds(1);
    policy.max_backoff = std::chrono::milliseconds(2);
    return policy;
}

} // namespace

class QaOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        database_ = std::make_unique<tests::TempDatabase>();
        repo_ = std::make_unique<ConversationRepository>(database_->db());
        recorder_ = std::make_unique<MatchRecorder>(database_->db());
        embedder_ = std::make_shared<tests::FakeEmbeddingProvider>();
        generator_ = std::make_shared<tests::ScriptedGenerationProvider>();
        store_ = std::make_unique<vector::ChunkStore>(database_->db(), embedder_->dimension());
        index_ = std::make_unique<vector::VectorIndex>(*store_);
        memory_ = std::make_unique<memory::ConversationMemory>();

        ingest::IngestionConfig ingestConfig;
        ingestConfig.retry = fastRetry();
        ingestion_ = std::make_unique<ingest::IngestionService>(*repo_, *store_, embedder_,
                                                                ingestConfig);

        QaConfig config;
        config.retry = fastRetry();
        orchestrator_ = std::make_unique<QaOrchestrator>(database_->db(), *repo_, *recorder_,
                                                         *index_, *memory_, embedder_,
                                                         generator_, config);
        conv_ = repo_->createConversation(1).value().id;
    }

    DocumentId upload(ConversationId conv, const std::string& text, const std::string& name) {
        auto up = ingestion_->upload(conv, text, name);
        EXPECT_TRUE(up.has_value());
        EXPECT_EQ(up.value().status, DocumentStatus::Ready);
        return up.value().document_id;
    }

    Result<AskResult> ask(ConversationId conv, const std::string& question,
                          std::stop_token stop = {}) {
        AskRequest request;
        request.conversation_id = conv;
        request.question = question;
        return orchestrator_->ask(request, stop);
    }

    std::string threadOf(ConversationId conv) {
        return repo_->getConversation(conv).value()->threadId;
    }

    std::unique_ptr<tests::TempDatabase> database_;
    std::unique_ptr<ConversationRepository> repo_;
    std::unique_ptr<MatchRecorder> recorder_;
    std::shared_ptr<tests::FakeEmbeddingProvider> embedder_;
    std::shared_ptr<tests::ScriptedGenerationProvider> generator_;
    std::unique_ptr<vector::ChunkStore> store_;
    std::unique_ptr<vector::VectorIndex> index_;
    std::unique_ptr<memory::ConversationMemory> memory_;
    std::unique_ptr<ingest::IngestionService> ingestion_;
    std::unique_ptr<QaOrchestrator> orchestrator_;
    ConversationId conv_ = 0;
};

TEST_F(QaOrchestratorTest, AnswersFromSingleDocument) {
    auto doc = upload(conv_, "Paris is the capital of France.", "france.txt");

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& r = result.value();

    EXPECT_EQ(r.final_state, QaState::Complete);
    EXPECT_EQ(r.metadata.mode, GenerationMode::Rag);
    EXPECT_EQ(r.metadata.num_sources, 1u);
    EXPECT_GT(r.metadata.context_length, 0u);
    EXPECT_NE(r.answer.find("Paris"), std::string::npos);
    ASSERT_EQ(r.sources.size(), 1u);
    EXPECT_EQ(r.sources[0].document_id, doc);
    EXPECT_EQ(r.sources[0].document_name, "france.txt");
    EXPECT_NEAR(r.sources[0].score, 0.908, 0.01);
    EXPECT_TRUE(r.degraded_note.empty());
    ASSERT_TRUE(r.message_id.has_value());

    EXPECT_EQ(r.trace, (std::vector<QaState>{QaState::Init, QaState::LoadDocuments,
                                             QaState::HasDocuments, QaState::Retrieve,
                                             QaState::BuildContext, QaState::Generate,
                                             QaState::PersistMatches, QaState::Complete}));
}

TEST_F(QaOrchestratorTest, NoDocumentsUsesGeneralKnowledge) {
    auto result = ask(conv_, "What is 2+2?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();

    EXPECT_EQ(r.final_state, QaState::Complete);
    EXPECT_EQ(r.metadata.mode, GenerationMode::Agent);
    EXPECT_EQ(r.metadata.num_sources, 0u);
    EXPECT_EQ(r.metadata.context_length, 0u);
    EXPECT_TRUE(r.sources.empty());
    EXPECT_EQ(r.answer, tests::ScriptedGenerationProvider::kGeneralAnswer);
    EXPECT_TRUE(r.degraded_note.empty());
    EXPECT_EQ(embedder_->calls(), 0);

    EXPECT_EQ(r.trace, (std::vector<QaState>{QaState::Init, QaState::LoadDocuments,
                                             QaState::NoDocuments, QaState::AgentMode,
                                             QaState::Generate, QaState::PersistMatches,
                                             QaState::Complete}));
    auto prompts = generator_->prompts();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_NE(prompts[0].find("DO NOT ask the user to upload"), std::string::npos);
}

TEST_F(QaOrchestratorTest, SynthesizesAcrossRelevantDocuments) {
    auto photo = upload(conv_, "Photosynthesis converts sunlight into chemical energy in plant "
                               "leaves.",
                        "plants.txt");
    auto mito = upload(conv_, "Mitochondria produce chemical energy for animal cells.",
                       "animals.txt");
    upload(conv_, "The Roman Empire built aqueducts and roads across Europe.", "rome.txt");

    auto result = ask(conv_, "How do plant leaves and animal cells get chemical energy?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();

    EXPECT_EQ(r.metadata.mode, GenerationMode::Rag);
    ASSERT_EQ(r.sources.size(), 2u);
    EXPECT_EQ(r.sources[0].document_id, mito);
    EXPECT_EQ(r.sources[1].document_id, photo);
    EXPECT_GE(r.sources[0].score, r.sources[1].score);
    EXPECT_EQ(r.metadata.num_sources, 2u);

    EXPECT_NE(r.answer.find("Photosynthesis"), std::string::npos);
    EXPECT_NE(r.answer.find("Mitochondria"), std::string::npos);
    EXPECT_EQ(r.answer.find("Roman"), std::string::npos);

    auto prompt = generator_->prompts().back();
    EXPECT_NE(prompt.find("2 document(s)"), std::string::npos);
    EXPECT_NE(prompt.find("animals.txt"), std::string::npos);
    EXPECT_NE(prompt.find("plants.txt"), std::string::npos);
    EXPECT_EQ(prompt.find("rome.txt"), std::string::npos);

    auto matches = recorder_->matchesForMessage(*r.message_id).value();
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].documentId, mito);
    EXPECT_EQ(matches[1].documentId, photo);
}

TEST_F(QaOrchestratorTest, IrrelevantDocumentsFallBackWithNote) {
    upload(conv_, "Paris is the capital of France.", "france.txt");

    auto result = ask(conv_, "Who painted the Mona Lisa?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();
    EXPECT_EQ(r.final_state, QaState::Complete);
    EXPECT_EQ(r.metadata.mode, GenerationMode::Agent);
    EXPECT_TRUE(r.sources.empty());
    EXPECT_FALSE(r.degraded_note.empty());
    EXPECT_EQ(r.answer, tests::ScriptedGenerationProvider::kGeneralAnswer);
    EXPECT_TRUE(recorder_->matchesForMessage(*r.message_id).value().empty());
}

TEST_F(QaOrchestratorTest, EmbeddingOutageDegradesToGeneralKnowledge) {
    upload(conv_, "Paris is the capital of France.", "france.txt");
    embedder_->failNext(3, ErrorCode::NetworkError);

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();
    EXPECT_EQ(r.final_state, QaState::Complete);
    EXPECT_EQ(r.metadata.mode, GenerationMode::Agent);
    EXPECT_NE(r.degraded_note.find("injected embedding failure"), std::string::npos);
    EXPECT_TRUE(r.message_id.has_value());
}

TEST_F(QaOrchestratorTest, TransientEmbeddingFailureIsRetried) {
    upload(conv_, "Paris is the capital of France.", "france.txt");
    embedder_->failNext(1, ErrorCode::Timeout);

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().metadata.mode, GenerationMode::Rag);
    EXPECT_TRUE(result.value().degraded_note.empty());
}

TEST_F(QaOrchestratorTest, GenerationFailureCommitsNothing) {
    generator_->script(Error{ErrorCode::InvalidData, "model refused"});

    auto result = ask(conv_, "What is 2+2?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();
    EXPECT_TRUE(r.failed());
    EXPECT_EQ(r.final_state, QaState::Failed);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, ErrorCode::GenerationError);
    EXPECT_EQ(r.answer.rfind("[Error]", 0), 0u);
    EXPECT_FALSE(r.message_id.has_value());

    EXPECT_TRUE(repo_->listMessages(conv_).value().empty());
    EXPECT_TRUE(memory_->read(threadOf(conv_)).empty());
    EXPECT_EQ(repo_->getConversation(conv_).value()->title,
              ConversationRepository::kDefaultTitle);
}

TEST_F(QaOrchestratorTest, TransientGenerationFailureIsRetried) {
    generator_->script(Error{ErrorCode::RateLimited, "slow down"});

    auto result = ask(conv_, "What is 2+2?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().final_state, QaState::Complete);
    EXPECT_EQ(result.value().answer, tests::ScriptedGenerationProvider::kGeneralAnswer);
    EXPECT_EQ(generator_->prompts().size(), 2u);
}

TEST_F(QaOrchestratorTest, UploadRequestIsReplacedByGeneralAnswer) {
    generator_->script(std::string("Please upload the document so I can answer."));
    generator_->script(std::string("Four."));

    auto result = ask(conv_, "What is 2+2?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().answer, "Four.");

    auto prompts = generator_->prompts();
    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_NE(prompts[1].find("Do NOT ask the user to upload"), std::string::npos);
    EXPECT_NE(prompts[1].find("What is 2+2?"), std::string::npos);
}

TEST_F(QaOrchestratorTest, FailedRepromptKeepsFirstAnswer) {
    generator_->script(std::string("Please paste the text here."));
    generator_->script(Error{ErrorCode::NetworkError, "gone"});

    auto result = ask(conv_, "What is 2+2?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().final_state, QaState::Complete);
    EXPECT_EQ(result.value().answer, "Please paste the text here.");
}

TEST_F(QaOrchestratorTest, RetrievalStaysInsideConversation) {
    auto other = repo_->createConversation(2).value().id;
    upload(conv_, "Berlin is the capital of Germany.", "germany.txt");
    upload(other, "Paris is the capital of France.", "france.txt");

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_TRUE(result.has_value());
    const auto& r = result.value();
    for (const auto& source : r.sources) {
        EXPECT_EQ(source.document_name, "germany.txt");
    }
    EXPECT_EQ(r.answer.find("Paris"), std::string::npos);
    EXPECT_EQ(generator_->prompts().back().find("france.txt"), std::string::npos);
}

TEST_F(QaOrchestratorTest, ForeignPassageAbortsTurn) {
    auto other = repo_->createConversation(2).value().id;
    auto own = upload(conv_, "Berlin is the capital of Germany.", "germany.txt");
    auto foreign = upload(other, "Paris is the capital of France.", "france.txt");

    // A chunk row that claims this conversation while its document belongs to another
    auto& db = database_->db();
    auto stmt = db.prepare("UPDATE chunks SET conversation_id = ? WHERE document_id = ?");
    ASSERT_TRUE(stmt.has_value());
    ASSERT_TRUE(stmt.value().bindAll(conv_, foreign).has_value());
    ASSERT_TRUE(stmt.value().execute().has_value());
    ASSERT_GT(db.changes(), 0);
    index_->invalidate(conv_);

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IsolationViolation);

    EXPECT_TRUE(generator_->prompts().empty());
    EXPECT_TRUE(repo_->listMessages(conv_).value().empty());
    EXPECT_EQ(recorder_->usageCount(own).value(), 0);
    EXPECT_EQ(recorder_->usageCount(foreign).value(), 0);
    EXPECT_TRUE(memory_->read(threadOf(conv_)).empty());
}

TEST_F(QaOrchestratorTest, StopBeforeCommitPersistsNothing) {
    std::stop_source source;
    generator_->onGenerate([&source](const std::string&) { source.request_stop(); });

    auto result = ask(conv_, "What is 2+2?", source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_TRUE(repo_->listMessages(conv_).value().empty());
    EXPECT_TRUE(memory_->read(threadOf(conv_)).empty());
}

TEST_F(QaOrchestratorTest, StopBeforeStartSkipsGeneration) {
    upload(conv_, "Paris is the capital of France.", "france.txt");
    std::stop_source source;
    source.request_stop();

    auto result = ask(conv_, "What is the capital of France?", source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_TRUE(generator_->prompts().empty());
}

TEST_F(QaOrchestratorTest, HistoryIsPassedToGenerator) {
    ASSERT_TRUE(ask(conv_, "My name is Ada.").has_value());
    ASSERT_TRUE(ask(conv_, "What is my name?").has_value());

    auto histories = generator_->histories();
    ASSERT_EQ(histories.size(), 2u);
    EXPECT_TRUE(histories[0].empty());
    ASSERT_EQ(histories[1].size(), 2u);
    EXPECT_EQ(histories[1][0].role, MessageRole::User);
    EXPECT_EQ(histories[1][0].content, "My name is Ada.");
    EXPECT_EQ(histories[1][1].role, MessageRole::Assistant);
}

TEST_F(QaOrchestratorTest, MemoryIsRebuiltFromStoredMessages) {
    ASSERT_TRUE(ask(conv_, "My name is Ada.").has_value());
    memory_->destroy(threadOf(conv_));

    ASSERT_TRUE(ask(conv_, "What is my name?").has_value());
    auto histories = generator_->histories();
    ASSERT_EQ(histories.size(), 2u);
    ASSERT_EQ(histories[1].size(), 2u);
    EXPECT_EQ(histories[1][0].content, "My name is Ada.");
}

TEST_F(QaOrchestratorTest, TurnIsPersistedWithMetadata) {
    auto doc = upload(conv_, "Paris is the capital of France.", "france.txt");

    auto result = ask(conv_, "What is the capital of France?");
    ASSERT_TRUE(result.has_value());

    auto messages = repo_->listMessages(conv_).value();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role, MessageRole::User);
    EXPECT_EQ(messages[0].content, "What is the capital of France?");
    EXPECT_EQ(messages[1].role, MessageRole::Assistant);
    EXPECT_EQ(messages[1].id, *result.value().message_id);
    EXPECT_EQ(messages[1].content, result.value().answer);
    ASSERT_TRUE(messages[1].mode.has_value());
    EXPECT_EQ(*messages[1].mode, GenerationMode::Rag);
    EXPECT_EQ(messages[1].numSources.value_or(0), 1);
    EXPECT_EQ(messages[1].contextLength.value_or(0),
              static_cast<int64_t>(result.value().metadata.context_length));

    auto matches = recorder_->matchesForMessage(messages[1].id).value();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].documentId, doc);
    EXPECT_EQ(matches[0].passage, "Paris is the capital of France.");
    EXPECT_NEAR(matches[0].score, 0.908, 0.01);
    EXPECT_EQ(recorder_->usageCount(doc).value(), 1);

    EXPECT_EQ(memory_->read(threadOf(conv_)).size(), 2u);
}

TEST_F(QaOrchestratorTest, FirstQuestionNamesConversation) {
    ASSERT_TRUE(ask(conv_, "What is 2+2?").has_value());
    ASSERT_TRUE(ask(conv_, "And 3+3?").has_value());
    EXPECT_EQ(repo_->getConversation(conv_).value()->title, "What is 2+2?");
}

TEST_F(QaOrchestratorTest, AdHocSessionIsNotPersisted) {
    AskRequest request;
    request.session_key = "cli";
    request.question = "What is 2+2?";

    auto result = orchestrator_->ask(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().metadata.mode, GenerationMode::Agent);
    EXPECT_FALSE(result.value().message_id.has_value());
    EXPECT_EQ(memory_->read("session:cli").size(), 2u);
    EXPECT_TRUE(repo_->listMessages(conv_).value().empty());
}

TEST_F(QaOrchestratorTest, UnknownConversationIsNotFound) {
    auto result = ask(conv_ + 1000, "What is 2+2?");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(QaOrchestratorTest, BlankQuestionIsRejected) {
    auto result = ask(conv_, "   \n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

    AskRequest request;
    request.question = "Hello?";
    auto missingTarget = orchestrator_->ask(request);
    ASSERT_FALSE(missingTarget.has_value());
    EXPECT_EQ(missingTarget.error().code, ErrorCode::InvalidArgument);
}

TEST(QaStateTest, NamesEveryState) {
    EXPECT_STREQ(toString(QaState::Init), "Init");
    EXPECT_STREQ(toString(QaState::AgentMode), "AgentMode");
    EXPECT_STREQ(toString(QaState::PersistMatches), "PersistMatches");
    EXPECT_STREQ(toString(QaState::Failed), "Failed");
}
