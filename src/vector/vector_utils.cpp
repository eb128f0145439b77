#include <docent/vector/vector_utils.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace docent::vector::utils {

double computeCosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

double similarityToScore(double cosine) {
    if (!std::isfinite(cosine)) {
        return 0.0;
    }
    return std::clamp((cosine + 1.0) / 2.0, 0.0, 1.0);
}

bool isValidEmbedding(const Embedding& embedding, size_t expected_dim) {
    if (embedding.empty() || embedding.size() != expected_dim) {
        return false;
    }
    return std::all_of(embedding.begin(), embedding.end(),
                       [](float v) { return std::isfinite(v); });
}

std::vector<std::byte> vectorToBlob(const Embedding& vec) {
    std::vector<std::byte> blob(vec.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), vec.data(), blob.size());
    }
    return blob;
}

Embedding blobToVector(std::span<const std::byte> blob) {
    Embedding vec(blob.size() / sizeof(float));
    if (!vec.empty()) {
        std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
    }
    return vec;
}

} // namespace docent::vector::utils
