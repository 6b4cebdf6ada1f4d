#pragma once

#include <stashy/result.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stashy::http {

enum class Method { GET, POST, PUT, DELETE };

const char* method_name(Method method);

struct Request {
    Method method = Method::GET;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    long timeout_ms = 30000;

    // First header with this name (case-insensitive), or nullptr
    const std::string* header(const std::string& name) const;
};

struct Response {
    long status = 0;
    std::map<std::string, std::string> headers;  // Names lowercased
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }

    // Header value by case-insensitive name, or nullptr
    const std::string* header(const std::string& name) const;
};

/**
 * One synchronous HTTP exchange.
 *
 * perform() fails only for transport-level problems (NETWORK_ERROR, TIMEOUT);
 * any HTTP status, including 4xx/5xx, is a successful Response.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<Response> perform(const Request& request) = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

std::string to_lower(std::string s);

// RFC 3986 percent-encoding of a query component
std::string url_encode(const std::string& value);

}  // namespace stashy::http
