#include <docent/common/utf8_utils.h>
#include <docent/vector/document_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace docent::vector {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

DocumentChunker::DocumentChunker(const ChunkingConfig& config) : config_(config) {
    if (config_.target_chunk_size == 0) {
        config_.target_chunk_size = ChunkingConfig{}.target_chunk_size;
    }
    // Overlap above half the target would stall progress between passages
    if (config_.overlap_size > config_.target_chunk_size / 2) {
        spdlog::warn("[Chunker] overlap {} exceeds half of target {}, clamping",
                     config_.overlap_size, config_.target_chunk_size);
        config_.overlap_size = config_.target_chunk_size / 2;
    }
}

std::vector<DocumentChunk> DocumentChunker::chunkDocument(std::string_view text) const {
    std::vector<DocumentChunk> chunks;
    const size_t n = text.size();

    size_t start = 0;
    while (start < n && isSpace(text[start])) {
        ++start;
    }

    while (start < n) {
        size_t end = (n - start <= config_.target_chunk_size) ? n : windowEnd(text, start);
        if (end <= start) {
            end = start + 1;
            while (end < n && common::isUtf8Continuation(text[end])) {
                ++end;
            }
        }

        size_t s = start;
        size_t e = end;
        while (s < e && isSpace(text[s])) {
            ++s;
        }
        while (e > s && isSpace(text[e - 1])) {
            --e;
        }
        if (e > s) {
            DocumentChunk chunk;
            chunk.content = std::string(text.substr(s, e - s));
            chunk.chunk_index = chunks.size();
            chunk.start_offset = s;
            chunk.end_offset = e;
            chunks.push_back(std::move(chunk));
        }

        if (end >= n) {
            break;
        }
        start = overlapStart(text, start, end);
    }

    spdlog::debug("[Chunker] split {} bytes into {} passage(s)", n, chunks.size());
    return chunks;
}

size_t DocumentChunker::overlapStart(std::string_view text, size_t start, size_t end) const {
    if (config_.overlap_size == 0 || end <= config_.overlap_size) {
        return end;
    }

    size_t candidate = std::max(end - config_.overlap_size, start + 1);
    // Begin the overlap on a word so passages don't open mid-token
    size_t wordStart = candidate;
    while (wordStart < end && !isSpace(text[wordStart - 1])) {
        ++wordStart;
    }
    if (wordStart < end) {
        candidate = wordStart;
    }

    while (candidate < end && common::isUtf8Continuation(text[candidate])) {
        ++candidate;
    }
    return candidate;
}

size_t DocumentChunker::codepointStart(std::string_view text, size_t pos) {
    while (pos > 0 && pos < text.size() && common::isUtf8Continuation(text[pos])) {
        --pos;
    }
    return pos;
}

FixedWindowChunker::FixedWindowChunker(const ChunkingConfig& config) : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::Fixed;
}

size_t FixedWindowChunker::windowEnd(std::string_view text, size_t start) const {
    size_t end = std::min(text.size(), start + config_.target_chunk_size);
    return codepointStart(text, end);
}

BoundaryChunker::BoundaryChunker(const ChunkingConfig& config)
    : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::Boundary;
}

size_t BoundaryChunker::windowEnd(std::string_view text, size_t start) const {
    const size_t limit = std::min(text.size(), start + config_.target_chunk_size);
    // A break earlier than half the target would produce undersized passages
    const size_t minEnd = start + config_.target_chunk_size / 2;

    for (const auto& separator : config_.separators) {
        if (separator.empty() || separator.size() > limit - start) {
            continue;
        }
        size_t pos = text.rfind(separator, limit - separator.size());
        if (pos != std::string_view::npos && pos >= start && pos + separator.size() > minEnd) {
            return pos + separator.size();
        }
    }

    // Last resort: hard cut at the bound
    return codepointStart(text, limit);
}

std::unique_ptr<DocumentChunker> createChunker(const ChunkingConfig& config) {
    switch (config.strategy) {
        case ChunkingStrategy::Fixed:
            return std::make_unique<FixedWindowChunker>(config);
        case ChunkingStrategy::Boundary:
            return std::make_unique<BoundaryChunker>(config);
    }
    return std::make_unique<BoundaryChunker>(config);
}

} // namespace docent::vector
