#include <stashy/http/transport.hpp>

#include <algorithm>
#include <cctype>

namespace stashy::http {

const char* method_name(Method method) {
    switch (method) {
        case Method::GET: return "GET";
        case Method::POST: return "POST";
        case Method::PUT: return "PUT";
        case Method::DELETE: return "DELETE";
    }
    return "GET";
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

const std::string* Request::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& h : headers) {
        if (to_lower(h.first) == wanted) {
            return &h.second;
        }
    }
    return nullptr;
}

const std::string* Response::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? &it->second : nullptr;
}

std::string url_encode(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

}  // namespace stashy::http
