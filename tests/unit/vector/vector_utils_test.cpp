#include <gtest/gtest.h>
#include <docent/vector/vector_utils.h>

#include <limits>

using namespace docent;
using namespace docent::vector::utils;

TEST(VectorUtilsTest, CosineSimilarity) {
    EXPECT_NEAR(computeCosineSimilarity({1, 2, 3}, {2, 4, 6}), 1.0, 1e-9);
    EXPECT_NEAR(computeCosineSimilarity({1, 0}, {0, 1}), 0.0, 1e-9);
    EXPECT_NEAR(computeCosineSimilarity({1, 0}, {-1, 0}), -1.0, 1e-9);
}

TEST(VectorUtilsTest, DegenerateInputsScoreZero) {
    EXPECT_EQ(computeCosineSimilarity({1, 2}, {1, 2, 3}), 0.0);
    EXPECT_EQ(computeCosineSimilarity({}, {}), 0.0);
    EXPECT_EQ(computeCosineSimilarity({0, 0}, {1, 1}), 0.0);
}

TEST(VectorUtilsTest, ScoreIsBoundedToUnitInterval) {
    EXPECT_DOUBLE_EQ(similarityToScore(1.0), 1.0);
    EXPECT_DOUBLE_EQ(similarityToScore(0.0), 0.5);
    EXPECT_DOUBLE_EQ(similarityToScore(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(similarityToScore(1.0000001), 1.0);
    EXPECT_DOUBLE_EQ(similarityToScore(-1.0000001), 0.0);
}

TEST(VectorUtilsTest, ValidEmbedding) {
    EXPECT_TRUE(isValidEmbedding({0.1f, 0.2f}, 2));
    EXPECT_FALSE(isValidEmbedding({0.1f, 0.2f}, 3));
    EXPECT_FALSE(isValidEmbedding({}, 0));
    EXPECT_FALSE(isValidEmbedding({std::numeric_limits<float>::quiet_NaN(), 0.0f}, 2));
}

TEST(VectorUtilsTest, BlobPreservesValues) {
    Embedding vec = {0.25f, -1.5f, 3.0f};
    auto blob = vectorToBlob(vec);
    EXPECT_EQ(blob.size(), vec.size() * sizeof(float));
    EXPECT_EQ(blobToVector(blob), vec);
}
