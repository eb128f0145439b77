#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docent::vector {

enum class ChunkingStrategy {
    Fixed,   // hard cuts every target_chunk_size bytes
    Boundary // latest paragraph, line, sentence or word break within the window
};

/// Sizes count bytes of UTF-8 text; cuts never split a code point.
struct ChunkingConfig {
    ChunkingStrategy strategy = ChunkingStrategy::Boundary;
    size_t target_chunk_size = 1000;
    size_t overlap_size = 200;
    std::vector<std::string> separators = {"\n\n", "\n", ". ", "! ", "? ", "; ", " "};
};

struct DocumentChunk {
    std::string content;
    size_t chunk_index = 0;
    size_t start_offset = 0; // into the source text
    size_t end_offset = 0;   // exclusive
};

/**
 * @brief Splits a document into ordered passages for embedding.
 *
 * Passages are trimmed of surrounding whitespace, never empty, and at most target_chunk_size
 * bytes. Consecutive passages share roughly overlap_size bytes, starting on a word where one
 * is available. Subclasses only decide where a window ends.
 */
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkingConfig& config = {});
    virtual ~DocumentChunker() = default;

    DocumentChunker(const DocumentChunker&) = delete;
    DocumentChunker& operator=(const DocumentChunker&) = delete;

    std::vector<DocumentChunk> chunkDocument(std::string_view content) const;

    const ChunkingConfig& config() const { return config_; }

protected:
    virtual size_t windowEnd(std::string_view text, size_t start) const = 0;

    static size_t codepointStart(std::string_view text, size_t pos);

    ChunkingConfig config_;

private:
    size_t overlapStart(std::string_view text, size_t start, size_t end) const;
};

class FixedWindowChunker : public DocumentChunker {
public:
    explicit FixedWindowChunker(const ChunkingConfig& config = {});

protected:
    size_t windowEnd(std::string_view text, size_t start) const override;
};

class BoundaryChunker : public DocumentChunker {
public:
    explicit BoundaryChunker(const ChunkingConfig& config = {});

protected:
    size_t windowEnd(std::string_view text, size_t start) const override;
};

std::unique_ptr<DocumentChunker> createChunker(const ChunkingConfig& config = {});

} // namespace docent::vector
