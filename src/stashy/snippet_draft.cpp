#include <stashy/snippet_draft.hpp>
#include <stashy/language_detector.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace stashy {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool has_parent_component(const fs::path& path) {
    for (const auto& part : path) {
        if (part == "..") return true;
    }
    return false;
}

// Server-supplied names must stay inside the output directory
bool is_safe_filename(const std::string& name) {
    return !name.empty() && name != "." &&
           name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find("..") == std::string::npos;
}

}  // namespace

Result<void> validate_draft(const SnippetDraft& draft) {
    if (trim(draft.title).empty()) {
        return Error(ErrorCode::VALIDATION_ERROR, "Title is required");
    }
    if (draft.files.empty()) {
        return Error(ErrorCode::VALIDATION_ERROR, "Provide at least one file");
    }
    for (size_t i = 0; i < draft.files.size(); ++i) {
        if (trim(draft.files[i].filename).empty()) {
            return Error(ErrorCode::VALIDATION_ERROR,
                "File #" + std::to_string(i + 1) + " has no filename");
        }
    }
    return Ok();
}

Result<SnippetFile> load_snippet_file(const fs::path& path) {
    if (has_parent_component(path)) {
        return Error(ErrorCode::VALIDATION_ERROR,
            "Refusing path containing '..': " + path.string());
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorCode::VALIDATION_ERROR, "File does not exist: " + path.string());
    }
    if (!fs::is_regular_file(path, ec)) {
        return Error(ErrorCode::VALIDATION_ERROR, "Not a regular file: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error(ErrorCode::VALIDATION_ERROR, "Cannot read file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::VALIDATION_ERROR, "Read error: " + path.string());
    }

    SnippetFile file;
    file.filename = path.filename().string();
    file.content = ss.str();
    file.language = LanguageDetector::detect(file.content, file.filename);
    return file;
}

Result<std::vector<SnippetFile>> load_snippet_files(const std::vector<std::string>& paths) {
    std::vector<SnippetFile> files;
    files.reserve(paths.size());
    for (const auto& p : paths) {
        auto file = load_snippet_file(p);
        if (!file.ok()) {
            return file.error();
        }
        files.push_back(std::move(file.value()));
    }
    return files;
}

Result<std::vector<fs::path>> write_snippet_files(const Snippet& snippet, const fs::path& dir) {
    for (const auto& file : snippet.files) {
        if (!is_safe_filename(file.filename)) {
            return Error(ErrorCode::INVALID_RESPONSE,
                "Refusing to write file with unsafe name: " + file.filename);
        }
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Cannot create " + dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> written;
    written.reserve(snippet.files.size());
    for (const auto& file : snippet.files) {
        fs::path target = dir / file.filename;
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::IO_ERROR, "Cannot write " + target.string());
        }
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        if (!out) {
            return Error(ErrorCode::IO_ERROR, "Write failed for " + target.string());
        }
        written.push_back(target);
    }
    return written;
}

std::set<std::string> parse_categories(const std::string& comma_separated) {
    std::set<std::string> categories;
    std::istringstream ss(comma_separated);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            categories.insert(item);
        }
    }
    return categories;
}

}  // namespace stashy
