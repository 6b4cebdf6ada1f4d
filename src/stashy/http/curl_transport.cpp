#include <stashy/http/curl_transport.hpp>

#include <curl/curl.h>

#include <mutex>

namespace stashy::http {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

CurlTransport::CurlTransport(std::string user_agent, Logger* logger)
    : user_agent_(std::move(user_agent))
    , logger_(logger ? logger : null_logger()) {
    init_curl();
}

CurlTransport::~CurlTransport() {
    cleanup_curl();
}

CurlTransport::CurlTransport(CurlTransport&& other) noexcept
    : curl_handle_(other.curl_handle_)
    , user_agent_(std::move(other.user_agent_))
    , logger_(other.logger_) {
    other.curl_handle_ = nullptr;
}

CurlTransport& CurlTransport::operator=(CurlTransport&& other) noexcept {
    if (this != &other) {
        cleanup_curl();
        curl_handle_ = other.curl_handle_;
        user_agent_ = std::move(other.user_agent_);
        logger_ = other.logger_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CurlTransport::init_curl() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    curl_handle_ = curl_easy_init();
}

void CurlTransport::cleanup_curl() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
        curl_handle_ = nullptr;
    }
}

size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<Response*>(userdata);
    size_t total_size = size * nmemb;
    response->body.append(ptr, total_size);
    return total_size;
}

size_t CurlTransport::header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<Response*>(userdata);
    size_t total_size = size * nmemb;
    std::string line(ptr, total_size);

    // A new status line (e.g. after "100 Continue") starts a fresh header set
    if (line.rfind("HTTP/", 0) == 0) {
        response->headers.clear();
        return total_size;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        response->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total_size;
}

Result<Response> CurlTransport::perform(const Request& request) {
    if (!curl_handle_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    if (request.timeout_ms <= 0) {
        return Error(ErrorCode::VALIDATION_ERROR,
            "Request timeout must be positive, got " + std::to_string(request.timeout_ms) + " ms");
    }

    CURL* curl = static_cast<CURL*>(curl_handle_);
    curl_easy_reset(curl);

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, (h.first + ": " + h.second).c_str());
    }
    // Suppress "Expect: 100-continue" on large uploads
    headers = curl_slist_append(headers, "Expect:");

    Response response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    switch (request.method) {
        case Method::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::PUT:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Error(ErrorCode::TIMEOUT,
                "Request timed out after " + std::to_string(request.timeout_ms) + " ms");
        }
        return Error(ErrorCode::NETWORK_ERROR,
            std::string("Network error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    logger_->debug(std::string("curl: ") + method_name(request.method) + " completed with HTTP " +
                   std::to_string(response.status));
    return response;
}

}  // namespace stashy::http
