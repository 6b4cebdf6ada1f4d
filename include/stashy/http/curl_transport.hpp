#pragma once

#include <stashy/http/transport.hpp>
#include <stashy/util/logger.hpp>

#include <string>

namespace stashy::http {

/**
 * Transport over a reused libcurl easy handle.
 *
 * Thread safety: NOT thread-safe. Each thread should have its own transport.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(std::string user_agent = "stashy", Logger* logger = nullptr);
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    // Movable
    CurlTransport(CurlTransport&& other) noexcept;
    CurlTransport& operator=(CurlTransport&& other) noexcept;

    Result<Response> perform(const Request& request) override;

private:
    void* curl_handle_ = nullptr;
    std::string user_agent_;
    Logger* logger_;

    void init_curl();
    void cleanup_curl();

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

}  // namespace stashy::http
