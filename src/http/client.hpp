#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

typedef void CURL;

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_encoding;
};

// Blocking HTTP client over one reusable libcurl easy handle.
// Any HTTP status is a successful exchange; only transport failures
// (resolve, connect, TLS, timeout) come back as errors.
class HttpClient {
public:
    explicit HttpClient(long timeout_secs);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers);

    // Body is sent as-is (application/octet-stream), never copied by curl.
    Result<HttpResponse> post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body);

private:
    CURL* curl_;
    long timeout_secs_;

    bool reset();
    Result<HttpResponse> perform(const std::string& url,
                                 const std::vector<std::string>& headers,
                                 const std::string* body);
};
