#pragma once

#include <docent/metadata/database.h>
#include <docent/metadata/records.h>

#include <optional>
#include <string>
#include <vector>

namespace docent::metadata {

/**
 * @brief Durable storage for conversations, their documents and their messages
 *
 * All methods take the connection lock, so they can be composed inside
 * Database::transaction() by the caller.
 */
class ConversationRepository {
public:
    explicit ConversationRepository(Database& db);

    // Conversations
    Result<Conversation> createConversation(UserId ownerId, const std::string& title = "");
    Result<std::optional<Conversation>> getConversation(ConversationId id);
    Result<std::vector<Conversation>> listConversations(UserId ownerId);
    /// Deletes the conversation and, through cascading keys, everything it owns
    Result<void> deleteConversation(ConversationId id);
    Result<void> touchConversation(ConversationId id);
    /// Derives a title from the first question while the title is still the default
    Result<void> maybeSetTitleFromQuestion(ConversationId id, const std::string& question);

    // Documents
    Result<DocumentId> insertDocument(const Document& doc);
    Result<std::optional<Document>> getDocument(DocumentId id);
    Result<std::vector<Document>> listDocuments(ConversationId conversationId);
    Result<void> updateDocumentStatus(DocumentId id, DocumentStatus status,
                                      const std::string& error, int64_t chunkCount);

    // Messages
    /// Appends a message; the ordinal is assigned as the next one in the conversation
    Result<Message> insertMessage(const Message& message);
    Result<std::optional<Message>> getMessage(MessageId id);
    Result<std::vector<Message>> listMessages(ConversationId conversationId);

    static constexpr const char* kDefaultTitle = "New Conversation";
    static constexpr size_t kTitleLength = 50;

    /**
     * @brief Title derived from a question: first characters, "..." appended when cut
     */
    static std::string titleFromQuestion(const std::string& question);

private:
    Database& db_;

    static Conversation mapConversationRow(const Statement& stmt);
    static Document mapDocumentRow(const Statement& stmt);
    static Message mapMessageRow(const Statement& stmt);
};

} // namespace docent::metadata
