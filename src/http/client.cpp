#include "client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <cctype>
#include <fcntl.h>

namespace {

std::once_flag curl_global_once;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<HttpResponse*>(userdata);
    resp->body.append(ptr, size * nmemb);
    return size * nmemb;
}

size_t read_header(char* buf, size_t size, size_t nitems, void* userdata) {
    auto* resp = static_cast<HttpResponse*>(userdata);
    std::string line(buf, size * nitems);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (name == "content-encoding") {
            std::string value = line.substr(colon + 1);
            trim(value);
            resp->content_encoding = value;
        }
    }
    return size * nitems;
}

std::string describe_curl_error(CURLcode res) {
    switch (res) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
            return fmt::format("unable to connect, is the server up? ({})", curl_easy_strerror(res));
        case CURLE_OPERATION_TIMEDOUT:
            return "request timed out";
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
            return fmt::format("TLS failure: {}", curl_easy_strerror(res));
        default:
            return curl_easy_strerror(res);
    }
}

} // namespace

HttpClient::HttpClient(long timeout_secs) : curl_(nullptr), timeout_secs_(timeout_secs) {
    std::call_once(curl_global_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("Failed to initialize libcurl");
}

HttpClient::~HttpClient() {
    curl_easy_cleanup(curl_);
}

bool HttpClient::reset() {
    curl_easy_reset(curl_);

    bool success = true;
    success &= !curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    success &= !curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    success &= !curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    success &= !curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, HTTP_CONNECT_TIMEOUT_MS);
    success &= !curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_secs_);

    // The wrapped build is forked from this process; keep our sockets out of it.
    // curl_easy_setopt is variadic, the + forces a plain function pointer.
    success &= !curl_easy_setopt(curl_, CURLOPT_SOCKOPTFUNCTION, +[](void*, curl_socket_t fd, curlsocktype) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
        return static_cast<int>(CURL_SOCKOPT_OK);
    });

    if (!success) {
        volt_log(LogLevel::Error, "Failed to set libcurl options");
        return false;
    }
    return true;
}

Result<HttpResponse> HttpClient::perform(const std::string& url,
                                         const std::vector<std::string>& headers,
                                         const std::string* body) {
    if (!reset()) return Result<HttpResponse>::Err("failed to configure HTTP client");

    HttpResponse resp;

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers) raw_list = curl_slist_append(raw_list, h.c_str());
    if (body) {
        raw_list = curl_slist_append(raw_list, "Content-Type: application/octet-stream");
        raw_list = curl_slist_append(raw_list, "Expect:");
    }
    std::unique_ptr<curl_slist, SlistDeleter> list(raw_list);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, list.get());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, read_header);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &resp);

    if (body) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->data());
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        volt_logf(LogLevel::Warn, "{} {} failed: {}", body ? "POST" : "GET", url, curl_easy_strerror(res));
        return Result<HttpResponse>::Err(describe_curl_error(res));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    volt_logf(LogLevel::Info, "{} {} -> {} ({} bytes)", body ? "POST" : "GET", url, resp.status, resp.body.size());
    return Result<HttpResponse>::Ok(std::move(resp));
}

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     const std::vector<std::string>& headers) {
    return perform(url, headers, nullptr);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::vector<std::string>& headers,
                                      const std::string& body) {
    return perform(url, headers, &body);
}
