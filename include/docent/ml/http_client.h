#pragma once

#include <docent/core/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docent::ml {

struct HttpHeader {
    std::string name;
    std::string value;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Minimal HTTP transport used by the providers
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief POST a JSON body
     *
     * Transport failures map to NetworkError or Timeout. Any HTTP status is returned
     * as a response; see errorForStatus() to classify it.
     */
    virtual Result<HttpResponse> postJson(std::string_view url,
                                          const std::vector<HttpHeader>& headers,
                                          const std::string& body,
                                          std::chrono::milliseconds timeout) = 0;
};

std::unique_ptr<IHttpClient> makeCurlHttpClient();

/**
 * @brief Classify a non-2xx HTTP status; 429 and 5xx are transient
 */
Error errorForStatus(long status, std::string_view body, ErrorCode permanent);

} // namespace docent::ml
