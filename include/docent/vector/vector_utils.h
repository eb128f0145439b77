#pragma once

#include <docent/core/types.h>

#include <cstddef>
#include <span>
#include <vector>

namespace docent::vector::utils {

/**
 * @brief Cosine similarity in [-1, 1]; 0 for mismatched sizes or zero vectors
 */
double computeCosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief Map cosine similarity to a relevance score in [0, 1]
 */
double similarityToScore(double cosine);

bool isValidEmbedding(const Embedding& embedding, size_t expected_dim);

std::vector<std::byte> vectorToBlob(const Embedding& vec);
Embedding blobToVector(std::span<const std::byte> blob);

} // namespace docent::vector::utils
