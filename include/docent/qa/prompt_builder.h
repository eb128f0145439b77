#pragma once

#include <docent/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace docent::qa {

struct ContextPassage {
    DocumentId document_id = 0;
    std::string document_name;
    std::string content;
    double score = 0.0;
};

struct BuiltContext {
    std::string text;                    // Passages with source headers, as sent to the model
    std::vector<ContextPassage> passages; // Passages that fit, best first
    std::vector<std::string> document_names; // Distinct documents in first-seen order
};

/**
 * @brief Prompt construction for grounded and general-knowledge answers
 */
class PromptBuilder {
public:
    /**
     * @brief Assemble passages under a character budget
     *
     * Passages are taken best score first until one would overflow the budget; it and every
     * lower-scoring passage are dropped. The best passage is truncated when it alone exceeds it.
     */
    static BuiltContext buildContext(std::vector<ContextPassage> passages, size_t maxChars);

    static std::string ragPrompt(const std::string& question, const BuiltContext& context);

    static std::string agentPrompt(const std::string& question);

    /// Re-prompt used when an answer asks the user to supply content
    static std::string strictFallbackPrompt(const std::string& question);

    /// True if the answer asks the user to upload, paste or send content
    static bool asksForUpload(std::string_view answer);

    /// Source header placed above each passage
    static std::string sourceHeader(const ContextPassage& passage);
};

} // namespace docent::qa
