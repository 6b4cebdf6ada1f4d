#pragma once

#include <stashy/credential_vault.hpp>
#include <stashy/http/transport.hpp>
#include <stashy/util/logger.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace stashy::test {

namespace fs = std::filesystem;
using json = nlohmann::json;

// ============================================================================
// Temp directory
// ============================================================================

inline fs::path make_temp_dir(const std::string& prefix) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() /
                   (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

// ============================================================================
// In-memory vault
// ============================================================================

class MemoryVault : public CredentialVault {
public:
    Result<void> store(const std::string& server_url, const std::string& secret) override {
        if (fail_store) {
            return Error(ErrorCode::CREDENTIAL_ERROR, "store refused");
        }
        entries[server_url] = secret;
        return Ok();
    }

    Result<std::string> retrieve(const std::string& server_url) override {
        auto it = entries.find(server_url);
        if (it == entries.end()) {
            return Error(ErrorCode::NOT_FOUND, "No credential for " + server_url);
        }
        return it->second;
    }

    Result<void> remove(const std::string& server_url) override {
        entries.erase(server_url);
        return Ok();
    }

    bool is_available() const override { return true; }

    std::map<std::string, std::string> entries;
    bool fail_store = false;
};

// ============================================================================
// Logger that keeps every line
// ============================================================================

class CaptureLogger : public Logger {
public:
    CaptureLogger() { set_min_level(LogLevel::DEBUG); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        lines.push_back(message);
    }

    bool contains(const std::string& needle) const {
        for (const auto& line : lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines;
};

// ============================================================================
// Scripted transport
// ============================================================================

inline http::Response make_response(long status, std::string body,
                                    std::map<std::string, std::string> headers = {}) {
    http::Response response;
    response.status = status;
    response.body = std::move(body);
    for (auto& h : headers) {
        response.headers[http::to_lower(h.first)] = h.second;
    }
    return response;
}

/**
 * Records every request and answers from a queue. An empty queue answers
 * with a NETWORK_ERROR so unexpected calls show up as failures.
 */
class FakeTransport : public http::Transport {
public:
    Result<http::Response> perform(const http::Request& request) override {
        requests.push_back(request);
        if (replies.empty()) {
            return Error(ErrorCode::NETWORK_ERROR, "no scripted reply");
        }
        auto reply = std::move(replies.front());
        replies.pop_front();
        return reply;
    }

    void reply(long status, std::string body = "",
               std::map<std::string, std::string> headers = {}) {
        replies.emplace_back(make_response(status, std::move(body), std::move(headers)));
    }

    void fail(ErrorCode code, const std::string& message) {
        replies.emplace_back(Error(code, message));
    }

    std::vector<http::Request> requests;
    std::deque<Result<http::Response>> replies;
};

// ============================================================================
// multipart/form-data decoding
// ============================================================================

struct FormPart {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;
    std::string data;
};

inline std::string header_param(const std::string& header, const std::string& param) {
    std::string key = param + "=\"";
    size_t start = header.find(key);
    if (start == std::string::npos) return "";
    start += key.size();
    size_t end = header.find('"', start);
    return header.substr(start, end - start);
}

inline std::vector<FormPart> parse_multipart(const std::string& content_type,
                                             const std::string& body) {
    std::vector<FormPart> parts;
    std::string marker = "boundary=";
    size_t at = content_type.find(marker);
    if (at == std::string::npos) return parts;
    std::string delimiter = "--" + content_type.substr(at + marker.size());

    size_t pos = body.find(delimiter);
    while (pos != std::string::npos) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) break;
        pos += 2;  // CRLF after the delimiter

        size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) break;
        std::string headers = body.substr(pos, headers_end - pos);

        size_t data_start = headers_end + 4;
        size_t next = body.find("\r\n" + delimiter, data_start);
        if (next == std::string::npos) break;

        FormPart part;
        part.name = header_param(headers, "name");
        if (headers.find("filename=\"") != std::string::npos) {
            part.filename = header_param(headers, "filename");
        }
        size_t ct = headers.find("Content-Type: ");
        if (ct != std::string::npos) {
            size_t ct_end = headers.find("\r\n", ct);
            part.content_type = headers.substr(ct + 14, ct_end == std::string::npos
                                                            ? std::string::npos
                                                            : ct_end - ct - 14);
        }
        part.data = body.substr(data_start, next - data_start);
        parts.push_back(std::move(part));

        pos = next + 2;
    }
    return parts;
}

// ============================================================================
// In-memory snippet server
// ============================================================================

inline std::string url_decode(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

/**
 * Transport that behaves like a small snippet server rooted at base_url.
 * Requests must carry "Bearer <token>" for a token in `tokens`.
 */
class FakeSnippetServer : public http::Transport {
public:
    explicit FakeSnippetServer(std::string base_url) : base_url_(std::move(base_url)) {}

    struct StoredFile {
        std::string filename;
        std::string content;
    };

    struct StoredSnippet {
        uint64_t id = 0;
        std::string title;
        std::string description;
        std::string visibility = "private";
        std::vector<std::string> categories;
        std::vector<StoredFile> files;
        int minute = 0;
    };

    Result<http::Response> perform(const http::Request& request) override {
        requests.push_back(request);

        if (request.url.compare(0, base_url_.size(), base_url_) != 0) {
            return Error(ErrorCode::NETWORK_ERROR, "Could not resolve host");
        }
        std::string rest = request.url.substr(base_url_.size());
        std::string path = rest;
        std::map<std::string, std::string> query;
        size_t q = rest.find('?');
        if (q != std::string::npos) {
            path = rest.substr(0, q);
            std::string qs = rest.substr(q + 1);
            size_t start = 0;
            while (start <= qs.size()) {
                size_t amp = qs.find('&', start);
                std::string pair = qs.substr(start, amp == std::string::npos ? std::string::npos
                                                                              : amp - start);
                size_t eq = pair.find('=');
                if (eq != std::string::npos) {
                    query[pair.substr(0, eq)] = url_decode(pair.substr(eq + 1));
                }
                if (amp == std::string::npos) break;
                start = amp + 1;
            }
        }

        const std::string* auth = request.header("Authorization");
        bool authorized = false;
        for (const auto& t : tokens) {
            if (auth && *auth == "Bearer " + t) authorized = true;
        }
        if (!authorized) {
            return make_response(401, R"({"error":"Invalid API key"})");
        }

        if (path == "/snippets" && request.method == http::Method::GET) {
            return list(std::stoul(query["page"]), std::stoul(query["page_size"]));
        }
        if (path == "/snippets" && request.method == http::Method::POST) {
            StoredSnippet s;
            s.id = next_id_++;
            if (!fill(s, request)) return make_response(422, R"({"error":"bad form"})");
            snippets[s.id] = s;
            return make_response(201, to_json(s).dump());
        }
        if (path == "/snippets/search" && request.method == http::Method::GET) {
            return search(query["q"], query["search_code"] == "true");
        }
        if (path.rfind("/snippets/", 0) == 0) {
            uint64_t id = std::stoull(path.substr(10));
            auto it = snippets.find(id);
            if (it == snippets.end()) {
                return make_response(404, R"({"error":"Snippet not found"})");
            }
            switch (request.method) {
                case http::Method::GET:
                    return make_response(200, to_json(it->second).dump());
                case http::Method::PUT: {
                    StoredSnippet replaced;
                    replaced.id = id;
                    if (!fill(replaced, request)) return make_response(422, R"({"error":"bad form"})");
                    it->second = replaced;
                    return make_response(200, to_json(replaced).dump());
                }
                case http::Method::DELETE:
                    snippets.erase(it);
                    return make_response(204, "");
                default:
                    break;
            }
        }
        return make_response(405, R"({"error":"Method not allowed"})");
    }

    // Count of requests whose URL contains `fragment`
    size_t count_requests(const std::string& fragment) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.url.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

    std::vector<std::string> tokens;
    std::map<uint64_t, StoredSnippet> snippets;
    std::vector<http::Request> requests;
    std::optional<uint32_t> fail_page;  // Listing page answered with 500

private:
    std::string base_url_;
    uint64_t next_id_ = 1;
    int clock_ = 0;

    bool fill(StoredSnippet& s, const http::Request& request) {
        const std::string* ct = request.header("Content-Type");
        if (!ct) return false;
        for (const auto& part : parse_multipart(*ct, request.body)) {
            if (part.name == "title") s.title = part.data;
            else if (part.name == "description") s.description = part.data;
            else if (part.name == "visibility") s.visibility = part.data;
            else if (part.name == "categories[]") s.categories.push_back(part.data);
            else if (part.name == "files[]" && part.filename) {
                s.files.push_back({*part.filename, part.data});
            }
        }
        s.minute = ++clock_;
        return !s.title.empty() && !s.files.empty();
    }

    json to_json(const StoredSnippet& s) const {
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "2024-03-01T10:%02d:00Z", s.minute % 60);
        json files = json::array();
        for (const auto& f : s.files) {
            files.push_back({{"filename", f.filename}, {"content", f.content}});
        }
        return {
            {"id", s.id},
            {"title", s.title},
            {"description", s.description},
            {"visibility", s.visibility},
            {"categories", s.categories},
            {"files", files},
            {"created_at", stamp},
            {"updated_at", stamp},
        };
    }

    http::Response list(uint32_t page, uint32_t page_size) {
        if (fail_page && *fail_page == page) {
            return make_response(500, "database unavailable");
        }
        json items = json::array();
        size_t skip = static_cast<size_t>(page - 1) * page_size;
        size_t index = 0;
        for (const auto& entry : snippets) {
            if (index >= skip && items.size() < page_size) {
                items.push_back(to_json(entry.second));
            }
            ++index;
        }
        json body = {{"items", items}, {"page", page}, {"page_size", page_size},
                     {"total", snippets.size()}};
        return make_response(200, body.dump());
    }

    // Results come back newest id first, whatever order was asked for
    http::Response search(const std::string& text, bool search_code) {
        json items = json::array();
        for (auto it = snippets.rbegin(); it != snippets.rend(); ++it) {
            const auto& s = it->second;
            bool hit = s.title.find(text) != std::string::npos ||
                       s.description.find(text) != std::string::npos;
            if (!hit && search_code) {
                for (const auto& f : s.files) {
                    if (f.content.find(text) != std::string::npos) hit = true;
                }
            }
            if (hit) items.push_back(to_json(s));
        }
        return make_response(200, items.dump());
    }
};

}  // namespace stashy::test
