#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <docent/app/docent_engine.h>
#include <docent/config/engine_config.h>
#include <docent/ml/provider.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

using docent::app::DocentEngine;

struct GlobalOptions {
    std::string configPath;
    std::string dbPath;
    std::string logLevel = "warn";
    std::string logFile;
};

void configureLogging(const GlobalOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!opts.logFile.empty()) {
        const size_t max_size = 10 * 1024 * 1024; // 10MB per file
        const size_t max_files = 3;
        try {
            std::filesystem::create_directories(
                std::filesystem::path(opts.logFile).parent_path());
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.logFile, max_size, max_files));
        } catch (const std::exception& e) {
            fmt::print(stderr, "warning: cannot log to {}: {}\n", opts.logFile, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("docent", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    if (opts.logLevel == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (opts.logLevel == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.logLevel == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (opts.logLevel == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

docent::Result<std::unique_ptr<DocentEngine>> openEngine(const GlobalOptions& opts) {
    auto config = docent::config::loadEngineConfig(opts.configPath);
    if (!config) {
        return config.error();
    }
    if (!opts.dbPath.empty()) {
        config.value().database_path = opts.dbPath;
    }

    std::shared_ptr<docent::ml::IEmbeddingProvider> embedder =
        docent::ml::createEmbeddingProvider(config.value().embedding);
    std::shared_ptr<docent::ml::IGenerationProvider> generator =
        docent::ml::createGenerationProvider(config.value().generation);
    return DocentEngine::create(std::move(config).value(), std::move(embedder),
                                std::move(generator));
}

int fail(const docent::Error& error) {
    fmt::print(stderr, "error: {} ({})\n", error.message, docent::errorToString(error.code));
    return 1;
}

docent::Result<std::string> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return docent::Error{docent::ErrorCode::NotFound, "Cannot open " + path};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void printAnswer(const docent::qa::AskResult& result) {
    fmt::print("{}\n", result.answer);
    if (!result.degraded_note.empty()) {
        fmt::print("\nnote: {}\n", result.degraded_note);
    }
    fmt::print("\nmode: {}  sources: {}  context: {} chars\n",
               docent::metadata::StatusUtils::toString(result.metadata.mode),
               result.metadata.num_sources, result.metadata.context_length);
    for (const auto& source : result.sources) {
        fmt::print("  [{:.3f}] {} (document {}): {}\n", source.score, source.document_name,
                   source.document_id, source.snippet);
    }
    if (result.message_id) {
        fmt::print("message: {}\n", *result.message_id);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"docent - ask questions about the documents of a conversation"};
    app.require_subcommand(1);

    GlobalOptions opts;
    app.add_option("--config", opts.configPath, "Configuration file path");
    app.add_option("--db", opts.dbPath, "Database path (overrides config)");
    app.add_option("--log-level", opts.logLevel, "Log level (trace/debug/info/warn/error)")
        ->default_val("warn");
    app.add_option("--log-file", opts.logFile, "Also log to a rotating file");

    int64_t ownerId = 1;
    int64_t conversationId = 0;
    int64_t documentId = 0;
    int64_t messageId = 0;
    std::string title;
    std::string filePath;
    std::string fileName;
    std::string question;
    std::string session;

    auto* newCmd = app.add_subcommand("new", "Create a conversation");
    newCmd->add_option("--owner", ownerId, "Owner id")->default_val(1);
    newCmd->add_option("--title", title, "Conversation title");

    auto* uploadCmd = app.add_subcommand("upload", "Add a plain-text document to a conversation");
    uploadCmd->add_option("-c,--conversation", conversationId, "Conversation id")->required();
    uploadCmd->add_option("file", filePath, "Text file to upload")
        ->required()
        ->check(CLI::ExistingFile);
    uploadCmd->add_option("--name", fileName, "Display name (defaults to the file name)");

    auto* askCmd = app.add_subcommand("ask", "Ask a question");
    auto* askConv = askCmd->add_option("-c,--conversation", conversationId, "Conversation id");
    auto* askSession =
        askCmd->add_option("--session", session, "Ad-hoc session key (no documents, not stored)");
    askConv->excludes(askSession);
    askCmd->add_option("question", question, "Question text")->required();

    auto* previewCmd = app.add_subcommand("preview", "Show a document and how it was used");
    previewCmd->add_option("-d,--document", documentId, "Document id")->required();

    auto* matchesCmd = app.add_subcommand("matches", "Show the documents behind an answer");
    matchesCmd->add_option("-m,--message", messageId, "Assistant message id")->required();

    auto* conversationsCmd = app.add_subcommand("conversations", "List conversations");
    conversationsCmd->add_option("--owner", ownerId, "Owner id")->default_val(1);

    auto* documentsCmd = app.add_subcommand("documents", "List documents of a conversation");
    documentsCmd->add_option("-c,--conversation", conversationId, "Conversation id")->required();

    auto* messagesCmd = app.add_subcommand("messages", "List messages of a conversation");
    messagesCmd->add_option("-c,--conversation", conversationId, "Conversation id")->required();

    auto* deleteCmd = app.add_subcommand("delete", "Delete a conversation and its documents");
    deleteCmd->add_option("-c,--conversation", conversationId, "Conversation id")->required();

    CLI11_PARSE(app, argc, argv);
    configureLogging(opts);

    auto engineResult = openEngine(opts);
    if (!engineResult) {
        return fail(engineResult.error());
    }
    auto engine = std::move(engineResult).value();

    if (*newCmd) {
        auto conv = engine->createConversation(ownerId, title);
        if (!conv)
            return fail(conv.error());
        fmt::print("conversation {} ({})\n", conv.value().id, conv.value().title);
    } else if (*uploadCmd) {
        auto text = readFile(filePath);
        if (!text)
            return fail(text.error());
        if (fileName.empty()) {
            fileName = std::filesystem::path(filePath).filename().string();
        }
        auto uploaded = engine->uploadDocument(conversationId, text.value(), fileName);
        if (!uploaded)
            return fail(uploaded.error());
        const auto& up = uploaded.value();
        fmt::print("document {}: {} ({} chunks)\n", up.document_id,
                   docent::metadata::StatusUtils::toString(up.status), up.chunk_count);
        if (!up.error.empty()) {
            fmt::print(stderr, "ingestion failed: {}\n", up.error);
            return 2;
        }
    } else if (*askCmd) {
        if (!*askConv && !*askSession) {
            return fail(docent::Error{docent::ErrorCode::InvalidArgument,
                                      "ask needs --conversation or --session"});
        }
        auto answer = *askSession ? engine->askAdHoc(session, question)
                                  : engine->ask(conversationId, question);
        if (!answer)
            return fail(answer.error());
        printAnswer(answer.value());
        if (answer.value().failed())
            return 2;
    } else if (*previewCmd) {
        auto preview = engine->previewDocument(documentId);
        if (!preview)
            return fail(preview.error());
        const auto& p = preview.value();
        fmt::print("{} [{}] used by {} message(s)\n\n{}\n", p.document.displayName(),
                   docent::metadata::StatusUtils::toString(p.document.status), p.usage_count,
                   p.document.content);
        if (!p.recent_matches.empty()) {
            fmt::print("\nrecent matches:\n");
        }
        for (const auto& m : p.recent_matches) {
            fmt::print("  message {} [{:.3f}]: {}\n", m.messageId, m.score, m.messagePreview);
        }
    } else if (*matchesCmd) {
        auto matches = engine->matchesForMessage(messageId);
        if (!matches)
            return fail(matches.error());
        for (const auto& m : matches.value()) {
            fmt::print("[{:.3f}] {} (document {})\n  {}\n", m.score, m.documentName, m.documentId,
                       m.passage);
        }
    } else if (*conversationsCmd) {
        auto convs = engine->listConversations(ownerId);
        if (!convs)
            return fail(convs.error());
        for (const auto& c : convs.value()) {
            fmt::print("{}\t{}\t{}\n", c.id, c.threadId, c.title);
        }
    } else if (*documentsCmd) {
        auto docs = engine->listDocuments(conversationId);
        if (!docs)
            return fail(docs.error());
        for (const auto& d : docs.value()) {
            fmt::print("{}\t{}\t{} chunks\t{}\n", d.id,
                       docent::metadata::StatusUtils::toString(d.status), d.chunkCount,
                       d.displayName());
        }
    } else if (*messagesCmd) {
        auto messages = engine->listMessages(conversationId);
        if (!messages)
            return fail(messages.error());
        for (const auto& m : messages.value()) {
            fmt::print("#{} {} ({}):\n{}\n\n", m.ordinal,
                       docent::metadata::StatusUtils::toString(m.role), m.id, m.content);
        }
    } else if (*deleteCmd) {
        if (auto deleted = engine->deleteConversation(conversationId); !deleted)
            return fail(deleted.error());
        fmt::print("deleted conversation {}\n", conversationId);
    }

    engine->shutdown();
    return 0;
}
