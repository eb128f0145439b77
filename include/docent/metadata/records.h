#pragma once

#include <docent/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace docent::metadata {

/**
 * @brief Ingestion status of an uploaded document
 */
enum class DocumentStatus {
    Pending, ///< Uploaded, passages not yet stored
    Ready,   ///< All passages embedded and stored
    Failed   ///< Ingestion gave up; see Document::error
};

enum class MessageRole { User, Assistant };

/**
 * @brief How an assistant answer was produced
 */
enum class GenerationMode {
    Rag,  ///< Grounded in retrieved passages
    Agent ///< General knowledge only
};

namespace detail {
inline int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}
inline TimePoint fromUnixSeconds(int64_t s) {
    return TimePoint(std::chrono::seconds(s));
}
} // namespace detail

/**
 * @brief A chat session owning documents and messages
 */
struct Conversation {
    ConversationId id = 0;
    UserId ownerId = 0;
    std::string title;
    std::string threadId; ///< Key of the conversation memory entry
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief An uploaded document, bound to exactly one conversation
 */
struct Document {
    DocumentId id = 0;
    ConversationId conversationId = 0;
    UserId ownerId = 0;
    std::string filename;
    std::string content;
    DocumentStatus status = DocumentStatus::Pending;
    std::string error;
    int64_t chunkCount = 0;
    TimePoint createdAt;
    TimePoint updatedAt;

    /**
     * @brief Name shown in source attributions
     */
    [[nodiscard]] std::string displayName() const {
        return filename.empty() ? "document-" + std::to_string(id) : filename;
    }
};

struct Message {
    MessageId id = 0;
    ConversationId conversationId = 0;
    MessageRole role = MessageRole::User;
    std::string content;
    int64_t ordinal = 0;
    std::optional<GenerationMode> mode; ///< Assistant messages only
    std::optional<int64_t> numSources;
    std::optional<int64_t> contextLength;
    TimePoint createdAt;
};

/**
 * @brief Record that a document contributed to an answer
 */
struct DocumentMatch {
    MessageId messageId = 0;
    DocumentId documentId = 0;
    std::string documentName; ///< Filled by joined queries
    std::string passage;
    double score = 0.0;
    TimePoint createdAt;
    std::string messagePreview; ///< First characters of the answering message, when joined
};

/**
 * @brief A stored passage with its embedding
 */
struct ChunkRecord {
    ChunkId id = 0;
    DocumentId documentId = 0;
    ConversationId conversationId = 0;
    int64_t ordinal = 0;
    std::string content;
    int64_t startOffset = 0;
    int64_t endOffset = 0;
    Embedding embedding;
};

namespace StatusUtils {

inline const char* toString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "pending";
        case DocumentStatus::Ready: return "ready";
        case DocumentStatus::Failed: return "failed";
    }
    return "pending";
}

inline DocumentStatus documentStatusFromString(std::string_view s) {
    if (s == "ready")
        return DocumentStatus::Ready;
    if (s == "failed")
        return DocumentStatus::Failed;
    return DocumentStatus::Pending;
}

inline const char* toString(MessageRole role) {
    return role == MessageRole::Assistant ? "assistant" : "user";
}

inline MessageRole roleFromString(std::string_view s) {
    return s == "assistant" ? MessageRole::Assistant : MessageRole::User;
}

inline const char* toString(GenerationMode mode) {
    return mode == GenerationMode::Rag ? "rag" : "agent";
}

inline GenerationMode modeFromString(std::string_view s) {
    return s == "rag" ? GenerationMode::Rag : GenerationMode::Agent;
}

} // namespace StatusUtils

} // namespace docent::metadata
