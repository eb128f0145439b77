#include <docent/ml/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace docent::ml {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

curl_slist* build_header_list(const std::vector<HttpHeader>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
    list = curl_slist_append(list, "Accept: application/json");
    for (const auto& h : headers) {
        std::string line = h.name + ": " + h.value;
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void ensureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandleDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient() { ensureGlobalInit(); }

    Result<HttpResponse> postJson(std::string_view url, const std::vector<HttpHeader>& headers,
                                  const std::string& body,
                                  std::chrono::milliseconds timeout) override {
        std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        std::unique_ptr<curl_slist, SlistDeleter> list(build_header_list(headers));

        HttpResponse response;
        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long long>(timeout.count(), 10000)));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPALIVE, 1L);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "POST " + urlStr);
            spdlog::debug("[Http] {}", err.message);
            return err;
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }
};

} // namespace

std::unique_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_unique<CurlHttpClient>();
}

Error errorForStatus(long status, std::string_view body, ErrorCode permanent) {
    std::string snippet(body.substr(0, 300));
    std::string message = "HTTP " + std::to_string(status) + ": " + snippet;
    if (status == 429) {
        return Error{ErrorCode::RateLimited, message};
    }
    if (status == 408 || status == 504) {
        return Error{ErrorCode::Timeout, message};
    }
    if (status == 503) {
        return Error{ErrorCode::ResourceExhausted, message};
    }
    if (status >= 500) {
        return Error{ErrorCode::NetworkError, message};
    }
    return Error{permanent, message};
}

} // namespace docent::ml
