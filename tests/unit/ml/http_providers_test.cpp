#include <gtest/gtest.h>
#include <docent/ml/http_providers.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <deque>

using namespace docent;
using namespace docent::ml;
using json = nlohmann::json;

namespace {

class RecordingHttpClient : public IHttpClient {
public:
    struct Call {
        std::string url;
        std::vector<HttpHeader> headers;
        json body;
    };

    Result<HttpResponse> postJson(std::string_view url, const std::vector<HttpHeader>& headers,
                                  const std::string& body,
                                  std::chrono::milliseconds /*timeout*/) override {
        calls.push_back(Call{std::string(url), headers, json::parse(body)});
        if (responses.empty()) {
            return Error{ErrorCode::NetworkError, "no response queued"};
        }
        auto next = responses.front();
        responses.pop_front();
        return next;
    }

    void reply(long status, std::string body) {
        responses.push_back(HttpResponse{status, std::move(body)});
    }

    std::optional<std::string> header(size_t call, const std::string& name) const {
        for (const auto& h : calls.at(call).headers) {
            if (h.name == name)
                return h.value;
        }
        return std::nullopt;
    }

    std::vector<Call> calls;
    std::deque<Result<HttpResponse>> responses;
};

ProviderConfig localConfig() {
    ProviderConfig config;
    config.kind = ProviderKind::Local;
    config.base_url = "http://localhost:11434/";
    config.model = "nomic-embed-text";
    config.dimension = 3;
    return config;
}

ProviderConfig remoteConfig(ProviderKind kind) {
    ProviderConfig config;
    config.kind = kind;
    config.base_url = "https://gateway.test/api/v1";
    config.model = "test-model";
    config.api_key_env = "DOCENT_TEST_API_KEY";
    config.dimension = 2;
    config.referer = "https://docent.test";
    config.app_name = "docent-tests";
    return config;
}

} // namespace

class HttpProvidersTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<RecordingHttpClient>();
        ::setenv("DOCENT_TEST_API_KEY", "sk-test", 1);
    }

    void TearDown() override { ::unsetenv("DOCENT_TEST_API_KEY"); }

    std::shared_ptr<RecordingHttpClient> http_;
};

TEST_F(HttpProvidersTest, JoinUrlUsesSingleSlash) {
    EXPECT_EQ(joinUrl("http://h:1/", "/api/chat"), "http://h:1/api/chat");
    EXPECT_EQ(joinUrl("http://h:1", "api/chat"), "http://h:1/api/chat");
    EXPECT_EQ(joinUrl("", "/x"), "/x");
}

TEST_F(HttpProvidersTest, OllamaEmbeddingRequestAndResponse) {
    OllamaEmbeddingProvider provider(localConfig(), http_);
    http_->reply(200, R"({"embedding": [0.5, -1, 2]})");

    auto vec = provider.embed("hello");
    ASSERT_TRUE(vec.has_value()) << vec.error().message;
    EXPECT_EQ(vec.value(), (Embedding{0.5f, -1.0f, 2.0f}));

    ASSERT_EQ(http_->calls.size(), 1u);
    EXPECT_EQ(http_->calls[0].url, "http://localhost:11434/api/embeddings");
    EXPECT_EQ(http_->calls[0].body["model"], "nomic-embed-text");
    EXPECT_EQ(http_->calls[0].body["prompt"], "hello");
    EXPECT_TRUE(http_->calls[0].headers.empty());
}

TEST_F(HttpProvidersTest, EmbeddingDimensionMismatchIsInvalidData) {
    OllamaEmbeddingProvider provider(localConfig(), http_);
    http_->reply(200, R"({"embedding": [1, 2]})");
    auto vec = provider.embed("hello");
    ASSERT_FALSE(vec.has_value());
    EXPECT_EQ(vec.error().code, ErrorCode::InvalidData);
}

TEST_F(HttpProvidersTest, MalformedBodyIsInvalidData) {
    OllamaEmbeddingProvider provider(localConfig(), http_);
    http_->reply(200, "not json");
    auto vec = provider.embed("hello");
    ASSERT_FALSE(vec.has_value());
    EXPECT_EQ(vec.error().code, ErrorCode::InvalidData);
}

TEST_F(HttpProvidersTest, OllamaChatSendsHistoryThenPrompt) {
    auto config = localConfig();
    config.model = "llama3.1";
    config.temperature = 0.5;
    config.max_tokens = 64;
    OllamaGenerationProvider provider(config, http_);
    http_->reply(200, R"({"message": {"role": "assistant", "content": "Hi Ada."}})");

    std::vector<memory::Turn> history = {{metadata::MessageRole::User, "My name is Ada."},
                                         {metadata::MessageRole::Assistant, "Hello!"}};
    auto answer = provider.generate("Who am I?", history);
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer.value(), "Hi Ada.");

    const auto& body = http_->calls.at(0).body;
    EXPECT_EQ(http_->calls[0].url, "http://localhost:11434/api/chat");
    EXPECT_EQ(body["stream"], false);
    EXPECT_EQ(body["options"]["num_predict"], 64);
    ASSERT_EQ(body["messages"].size(), 3u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["messages"][1]["role"], "assistant");
    EXPECT_EQ(body["messages"][2]["content"], "Who am I?");
}

TEST_F(HttpProvidersTest, HostedRequestsCarryBearerToken) {
    OpenAICompatibleGenerationProvider provider(remoteConfig(ProviderKind::Hosted), http_);
    http_->reply(200, R"({"choices": [{"message": {"content": "Four."}}]})");

    auto answer = provider.generate("What is 2+2?", {});
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer.value(), "Four.");
    EXPECT_EQ(http_->calls[0].url, "https://gateway.test/api/v1/chat/completions");
    EXPECT_EQ(http_->header(0, "Authorization"), std::optional<std::string>("Bearer sk-test"));
    EXPECT_FALSE(http_->header(0, "X-Title").has_value());
    EXPECT_EQ(http_->calls[0].body["model"], "test-model");
}

TEST_F(HttpProvidersTest, GatewayRequestsCarryAttributionHeaders) {
    OpenAICompatibleEmbeddingProvider provider(remoteConfig(ProviderKind::Gateway), http_);
    http_->reply(200, R"({"data": [{"embedding": [0.1, 0.2]}]})");

    auto vec = provider.embed("hello");
    ASSERT_TRUE(vec.has_value()) << vec.error().message;
    EXPECT_EQ(vec.value().size(), 2u);
    EXPECT_EQ(http_->calls[0].url, "https://gateway.test/api/v1/embeddings");
    EXPECT_EQ(http_->calls[0].body["input"], "hello");
    EXPECT_EQ(http_->header(0, "HTTP-Referer"), std::optional<std::string>("https://docent.test"));
    EXPECT_EQ(http_->header(0, "X-Title"), std::optional<std::string>("docent-tests"));
    EXPECT_EQ(provider.name(), "gateway:test-model");
}

TEST_F(HttpProvidersTest, MissingApiKeyIsInvalidState) {
    ::unsetenv("DOCENT_TEST_API_KEY");
    OpenAICompatibleGenerationProvider provider(remoteConfig(ProviderKind::Hosted), http_);
    auto answer = provider.generate("hi", {});
    ASSERT_FALSE(answer.has_value());
    EXPECT_EQ(answer.error().code, ErrorCode::InvalidState);
    EXPECT_NE(answer.error().message.find("DOCENT_TEST_API_KEY"), std::string::npos);
    EXPECT_TRUE(http_->calls.empty());
}

TEST_F(HttpProvidersTest, HttpStatusIsClassified) {
    OpenAICompatibleGenerationProvider provider(remoteConfig(ProviderKind::Hosted), http_);
    http_->reply(429, "slow down");
    http_->reply(503, "busy");
    http_->reply(400, "bad request");

    EXPECT_EQ(provider.generate("q", {}).error().code, ErrorCode::RateLimited);
    EXPECT_EQ(provider.generate("q", {}).error().code, ErrorCode::ResourceExhausted);
    EXPECT_EQ(provider.generate("q", {}).error().code, ErrorCode::GenerationError);
}

TEST_F(HttpProvidersTest, CompletionWithoutChoicesIsGenerationError) {
    OpenAICompatibleGenerationProvider provider(remoteConfig(ProviderKind::Hosted), http_);
    http_->reply(200, R"({"choices": []})");
    auto answer = provider.generate("q", {});
    ASSERT_FALSE(answer.has_value());
    EXPECT_EQ(answer.error().code, ErrorCode::GenerationError);
}

TEST(ErrorForStatusTest, TransientStatusesMapToRetryableCodes) {
    EXPECT_EQ(errorForStatus(429, "", ErrorCode::InvalidArgument).code, ErrorCode::RateLimited);
    EXPECT_EQ(errorForStatus(504, "", ErrorCode::InvalidArgument).code, ErrorCode::Timeout);
    EXPECT_EQ(errorForStatus(500, "", ErrorCode::InvalidArgument).code, ErrorCode::NetworkError);
    EXPECT_EQ(errorForStatus(401, "denied", ErrorCode::InvalidArgument).code,
              ErrorCode::InvalidArgument);
    EXPECT_TRUE(isTransient(errorForStatus(503, "", ErrorCode::InvalidArgument).code));
    EXPECT_NE(errorForStatus(404, "missing", ErrorCode::GenerationError).message.find("404"),
              std::string::npos);
}

TEST(ProviderKindTest, ParsesAliases) {
    EXPECT_EQ(providerKindFromString("ollama"), ProviderKind::Local);
    EXPECT_EQ(providerKindFromString("openai"), ProviderKind::Hosted);
    EXPECT_EQ(providerKindFromString("openrouter"), ProviderKind::Gateway);
    EXPECT_FALSE(providerKindFromString("carrier-pigeon").has_value());
}
