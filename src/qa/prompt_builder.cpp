#include <docent/common/utf8_utils.h>
#include <docent/qa/prompt_builder.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace docent::qa {

namespace {

constexpr const char* kSeparator = "\n\n";

constexpr std::array<std::string_view, 9> kUploadRequestSignals = {
    "please provide",     "please paste",       "i need the text",
    "provide the content", "upload the",         "send the",
    "paste the",          "can't access files", "i don't have access to",
};

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

std::string PromptBuilder::sourceHeader(const ContextPassage& passage) {
    return "[Source: " + passage.document_name + " (document " +
           std::to_string(passage.document_id) + ")]\n";
}

BuiltContext PromptBuilder::buildContext(std::vector<ContextPassage> passages, size_t maxChars) {
    std::stable_sort(passages.begin(), passages.end(),
                     [](const ContextPassage& a, const ContextPassage& b) {
                         return a.score > b.score;
                     });

    BuiltContext built;
    for (auto& passage : passages) {
        std::string header = sourceHeader(passage);
        size_t separator = built.text.empty() ? 0 : std::char_traits<char>::length(kSeparator);
        size_t needed = separator + header.size() + passage.content.size();

        if (built.text.size() + needed > maxChars) {
            // Stop at the first passage that does not fit so only the top scores are kept
            if (!built.passages.empty() || header.size() >= maxChars) {
                break;
            }
            // The best passage alone is over budget: keep its head
            passage.content = common::truncateUtf8(passage.content, maxChars - header.size());
        }

        if (separator > 0) {
            built.text += kSeparator;
        }
        built.text += header;
        built.text += passage.content;

        if (std::find(built.document_names.begin(), built.document_names.end(),
                      passage.document_name) == built.document_names.end()) {
            built.document_names.push_back(passage.document_name);
        }
        built.passages.push_back(std::move(passage));
    }
    return built;
}

std::string PromptBuilder::ragPrompt(const std::string& question, const BuiltContext& context) {
    std::ostringstream oss;
    oss << "You are an AI assistant helping the user with their question based on the uploaded "
           "documents.\n\n";
    oss << "I have provided context from " << context.document_names.size() << " document(s): ";
    for (size_t i = 0; i < context.document_names.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << context.document_names[i];
    }
    oss << "\n\n";
    oss << "Please analyze ALL the provided context carefully and answer the question. "
           "Synthesize information from multiple documents if relevant. If the information is "
           "spread across different documents, combine them in your answer.\n\n";
    oss << "Context from uploaded documents:\n" << context.text << "\n\n";
    oss << "Question: " << question << "\n\n";
    oss << "Instructions:\n"
           "- Use the context above to answer the question thoroughly\n"
           "- If information is found in the documents, cite which document(s) you're "
           "referencing\n"
           "- If the context doesn't fully answer the question, use your general knowledge to "
           "supplement\n"
           "- DO NOT ask the user to upload additional documents\n"
           "- Provide a clear, comprehensive answer\n\n";
    oss << "Answer:";
    return oss.str();
}

std::string PromptBuilder::agentPrompt(const std::string& question) {
    return "You are a helpful AI assistant. Answer the user's question directly using your "
           "general knowledge and the conversation history if available.\n\n"
           "DO NOT ask the user to upload or paste any documents or files. If the user "
           "references a specific file that is not available, say that you don't have access "
           "to the file and answer from your general knowledge instead.\n\n"
           "Question: " +
           question + "\n\nAnswer:";
}

std::string PromptBuilder::strictFallbackPrompt(const std::string& question) {
    return "You are a helpful AI assistant. The user asked: " + question +
           "\n\nAnswer directly using your general knowledge. Do NOT ask the user to upload or "
           "paste any documents or files. If you don't know, give the best possible general "
           "answer.";
}

bool PromptBuilder::asksForUpload(std::string_view answer) {
    const std::string lower = toLower(answer);
    return std::any_of(kUploadRequestSignals.begin(), kUploadRequestSignals.end(),
                       [&](std::string_view signal) {
                           return lower.find(signal) != std::string::npos;
                       });
}

} // namespace docent::qa
