#pragma once

#include <docent/metadata/database.h>
#include <docent/metadata/records.h>

#include <string>
#include <vector>

namespace docent::metadata {

/**
 * @brief Records which document answered which message and reports usage
 *
 * At most one match exists per (message, document); recording again keeps the
 * latest passage and score.
 */
class MatchRecorder {
public:
    explicit MatchRecorder(Database& db);

    /**
     * @brief Insert or update the match for (messageId, documentId)
     * @return InvalidArgument if score is outside [0,1]
     */
    Result<void> recordMatch(MessageId messageId, DocumentId documentId,
                             const std::string& passage, double score);

    /**
     * @brief Number of distinct messages that used the document
     */
    Result<int64_t> usageCount(DocumentId documentId);

    /**
     * @brief Matches of a document, newest first, with a preview of the answering message
     */
    Result<std::vector<DocumentMatch>> recentMatches(DocumentId documentId, int limit = 10);

    /**
     * @brief Matches recorded for one message, best score first
     */
    Result<std::vector<DocumentMatch>> matchesForMessage(MessageId messageId);

    static constexpr size_t kMaxPassageLength = 1000;
    static constexpr int kPreviewLength = 100;

private:
    Database& db_;
};

} // namespace docent::metadata
