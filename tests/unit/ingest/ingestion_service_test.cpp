#include <gtest/gtest.h>
#include <docent/ingest/ingestion_service.h>
#include <docent/metadata/conversation_repository.h>
#include <docent/vector/chunk_store.h>

#include "../../common/test_helpers.h"

#include <stop_token>

using namespace docent;
using namespace docent::ingest;
using namespace docent::metadata;

class IngestionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        database_ = std::make_unique<tests::TempDatabase>();
        repo_ = std::make_unique<ConversationRepository>(database_->db());
        embedder_ = std::make_shared<tests::FakeEmbeddingProvider>(64);
        store_ = std::make_unique<vector::ChunkStore>(database_->db(), embedder_->dimension());

        IngestionConfig config;
        config.chunking.target_chunk_size = 100;
        config.chunking.overlap_size = 10;
        config.retry.initial_backoff = std::chrono::milliseconds(1);
        config.retry.max_backoff = std::chrono::milliseconds(2);
        service_ = std::make_unique<IngestionService>(*repo_, *store_, embedder_, config);

        conv_ = repo_->createConversation(5).value().id;
    }

    static std::string longText() {
        std::string text;
        for (int i = 0; i < 30; ++i) {
            text += "Sentence number " + std::to_string(i) + " talks about topic " +
                    std::to_string(i) + ". ";
        }
        return text;
    }

    std::unique_ptr<tests::TempDatabase> database_;
    std::unique_ptr<ConversationRepository> repo_;
    std::shared_ptr<tests::FakeEmbeddingProvider> embedder_;
    std::unique_ptr<vector::ChunkStore> store_;
    std::unique_ptr<IngestionService> service_;
    ConversationId conv_ = 0;
};

TEST_F(IngestionServiceTest, UploadMakesDocumentReady) {
    auto result = service_->upload(conv_, "Paris is the capital of France.", "facts.txt");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& up = result.value();
    EXPECT_GT(up.document_id, 0);
    EXPECT_EQ(up.status, DocumentStatus::Ready);
    EXPECT_EQ(up.chunk_count, 1u);
    EXPECT_TRUE(up.error.empty());

    auto doc = repo_->getDocument(up.document_id).value().value();
    EXPECT_EQ(doc.status, DocumentStatus::Ready);
    EXPECT_EQ(doc.chunkCount, 1);
    EXPECT_EQ(doc.conversationId, conv_);
    EXPECT_EQ(doc.ownerId, 5);
    EXPECT_EQ(doc.filename, "facts.txt");
    EXPECT_EQ(store_->countChunks(conv_).value(), 1);
}

TEST_F(IngestionServiceTest, LongDocumentIsSplitAndEmbedded) {
    const auto text = longText();
    auto result = service_->upload(conv_, text);
    ASSERT_TRUE(result.has_value());
    EXPECT_GT(result.value().chunk_count, 5u);
    EXPECT_EQ(static_cast<size_t>(embedder_->calls()), result.value().chunk_count);
    EXPECT_EQ(store_->countDocumentChunks(result.value().document_id).value(),
              static_cast<int64_t>(result.value().chunk_count));
}

TEST_F(IngestionServiceTest, UnknownConversationIsNotFound) {
    auto result = service_->upload(conv_ + 99, "text");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(repo_->listDocuments(conv_ + 99).value().empty());
}

TEST_F(IngestionServiceTest, TransientEmbeddingFailuresAreRetried) {
    embedder_->failNext(2, ErrorCode::NetworkError);
    auto result = service_->upload(conv_, "Short document about retries.");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().status, DocumentStatus::Ready);
    EXPECT_EQ(embedder_->calls(), 3);
}

TEST_F(IngestionServiceTest, PermanentFailureMarksDocumentFailed) {
    embedder_->failWhenContains("topic 20", ErrorCode::InvalidData);
    auto result = service_->upload(conv_, longText(), "broken.txt");
    ASSERT_TRUE(result.has_value()) << "ingestion failure is reported through the status";

    const auto& up = result.value();
    EXPECT_EQ(up.status, DocumentStatus::Failed);
    EXPECT_FALSE(up.error.empty());

    auto doc = repo_->getDocument(up.document_id).value().value();
    EXPECT_EQ(doc.status, DocumentStatus::Failed);
    EXPECT_EQ(doc.error, up.error);
    EXPECT_EQ(doc.chunkCount, static_cast<int64_t>(up.chunk_count));
    // Passages stored before the failure stay searchable
    EXPECT_GT(up.chunk_count, 0u);
    EXPECT_EQ(store_->countDocumentChunks(up.document_id).value(),
              static_cast<int64_t>(up.chunk_count));
}

TEST_F(IngestionServiceTest, StopRequestCancelsWithoutFailingDocument) {
    std::stop_source source;
    source.request_stop();
    const auto text = longText();

    auto result = service_->upload(conv_, text, "halted.txt", source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(embedder_->calls(), 0);

    auto docs = repo_->listDocuments(conv_).value();
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0].status, DocumentStatus::Pending);
    EXPECT_TRUE(docs[0].error.empty());
    EXPECT_EQ(store_->countDocumentChunks(docs[0].id).value(), 0);

    // The document can be ingested again once work resumes
    auto again = service_->ingest(docs[0].id, text);
    ASSERT_TRUE(again.has_value());
    EXPECT_GT(again.value(), 0u);
    EXPECT_EQ(repo_->getDocument(docs[0].id).value()->status, DocumentStatus::Ready);
}

TEST_F(IngestionServiceTest, FailureInOneDocumentLeavesOthersReady) {
    auto good = service_->upload(conv_, "A healthy document.");
    embedder_->failNext(1, ErrorCode::InvalidData);
    auto bad = service_->upload(conv_, "An unlucky document.");

    ASSERT_TRUE(good.has_value());
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(good.value().status, DocumentStatus::Ready);
    EXPECT_EQ(bad.value().status, DocumentStatus::Failed);
    EXPECT_EQ(bad.value().chunk_count, 0u);
    EXPECT_EQ(repo_->getDocument(good.value().document_id).value()->status,
              DocumentStatus::Ready);
}

TEST_F(IngestionServiceTest, ReingestReplacesPassages) {
    auto up = service_->upload(conv_, longText()).value();
    ASSERT_GT(up.chunk_count, 1u);

    auto again = service_->ingest(up.document_id, "Now a single short passage.");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), 1u);
    EXPECT_EQ(store_->countDocumentChunks(up.document_id).value(), 1);
    EXPECT_EQ(repo_->getDocument(up.document_id).value()->chunkCount, 1);
}

TEST_F(IngestionServiceTest, IngestUnknownDocumentIsNotFound) {
    auto result = service_->ingest(424242, "text");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(IngestionServiceTest, EmptyDocumentIsReadyWithoutPassages) {
    auto result = service_->upload(conv_, "   ");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().status, DocumentStatus::Ready);
    EXPECT_EQ(result.value().chunk_count, 0u);
    EXPECT_EQ(embedder_->calls(), 0);
}
