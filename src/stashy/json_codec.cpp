#include <stashy/json_codec.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace stashy {

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

Timestamp timestamp_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) return Timestamp{};
    auto parsed = parse_timestamp(it->get<std::string>());
    return parsed.value_or(Timestamp{});
}

SnippetFile file_from_json(const json& j) {
    SnippetFile file;
    file.filename = j.contains("filename") ? string_field(j, "filename")
                                           : string_field(j, "file_name");
    file.content = j.contains("content") ? string_field(j, "content")
                                         : string_field(j, "code");
    auto lang = j.find("language");
    if (lang != j.end() && lang->is_string() && !lang->get<std::string>().empty()) {
        file.language = lang->get<std::string>();
    }
    return file;
}

// Throws json::exception when "id" is missing or j is not an object
Snippet snippet_from_json(const json& j) {
    Snippet s;
    s.id = j.at("id").get<SnippetId>();
    s.title = string_field(j, "title");
    s.description = string_field(j, "description");

    if (j.contains("visibility") && j["visibility"].is_string()) {
        s.visibility = parse_visibility(j["visibility"].get<std::string>())
                           .value_or(Visibility::PRIVATE);
    } else if (j.contains("is_public")) {
        const auto& flag = j["is_public"];
        bool is_public = flag.is_boolean() ? flag.get<bool>()
                                           : (flag.is_number() && flag.get<int>() != 0);
        s.visibility = is_public ? Visibility::PUBLIC : Visibility::PRIVATE;
    }

    if (j.contains("categories") && j["categories"].is_array()) {
        for (const auto& c : j["categories"]) {
            if (c.is_string()) s.categories.insert(c.get<std::string>());
        }
    }

    const char* files_key = j.contains("files") ? "files" : "fragments";
    if (j.contains(files_key) && j[files_key].is_array()) {
        std::vector<std::pair<int64_t, SnippetFile>> ordered;
        int64_t index = 0;
        for (const auto& f : j[files_key]) {
            int64_t position = f.value("position", index);
            ordered.emplace_back(position, file_from_json(f));
            ++index;
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (auto& entry : ordered) {
            s.files.push_back(std::move(entry.second));
        }
    }

    s.created_at = timestamp_field(j, "created_at");
    s.updated_at = timestamp_field(j, "updated_at");
    s.share_count = j.value("share_count", uint64_t{0});
    return s;
}

const json* find_items(const json& j) {
    if (j.is_array()) return &j;
    for (const char* key : {"items", "snippets", "data"}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_array()) return &*it;
    }
    return nullptr;
}

}  // namespace

Result<Snippet> parse_snippet(const std::string& body) {
    try {
        auto j = json::parse(body);
        // Some servers wrap the object: {"snippet": {...}}
        if (j.is_object() && !j.contains("id") && j.contains("snippet")) {
            return snippet_from_json(j["snippet"]);
        }
        return snippet_from_json(j);
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_RESPONSE,
            std::string("Failed to parse snippet: ") + e.what());
    }
}

Result<Page> parse_page(const std::string& body, uint32_t requested_page,
                        uint32_t requested_size) {
    try {
        auto j = json::parse(body);
        const json* items = find_items(j);
        if (!items) {
            return Error(ErrorCode::INVALID_RESPONSE, "Listing response has no items array");
        }

        Page page;
        for (const auto& item : *items) {
            page.items.push_back(snippet_from_json(item));
        }

        if (j.is_object()) {
            page.page_number = j.value("page", requested_page);
            page.page_size = j.value("page_size", requested_size);
            page.total = j.value("total", static_cast<uint64_t>(page.items.size()));
        } else {
            page.page_number = requested_page;
            page.page_size = requested_size;
            page.total = page.items.size();
        }
        return page;
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_RESPONSE,
            std::string("Failed to parse listing: ") + e.what());
    }
}

Result<std::vector<Snippet>> parse_snippet_list(const std::string& body) {
    try {
        auto j = json::parse(body);
        const json* items = find_items(j);
        if (!items) {
            return Error(ErrorCode::INVALID_RESPONSE, "Search response has no result array");
        }
        std::vector<Snippet> snippets;
        snippets.reserve(items->size());
        for (const auto& item : *items) {
            snippets.push_back(snippet_from_json(item));
        }
        return snippets;
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_RESPONSE,
            std::string("Failed to parse search results: ") + e.what());
    }
}

std::string error_detail(const std::string& body) {
    if (body.empty()) return "";
    json j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        for (const char* key : {"error", "message", "detail"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    constexpr size_t MAX_DETAIL = 200;
    return body.size() > MAX_DETAIL ? body.substr(0, MAX_DETAIL) + "..." : body;
}

}  // namespace stashy
