#include <stashy/language_detector.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace stashy {

namespace {

const std::unordered_map<std::string, std::string> EXTENSION_MAP = {
    {".sh", "bash"},
    {".bash", "bash"},
    {".zsh", "zsh"},
    {".fish", "fish"},
    {".py", "python"},
    {".c", "c"},
    {".h", "c"},
    {".cpp", "cpp"},
    {".cc", "cpp"},
    {".cxx", "cpp"},
    {".hpp", "cpp"},
    {".js", "javascript"},
    {".mjs", "javascript"},
    {".jsx", "javascript"},
    {".ts", "typescript"},
    {".tsx", "typescript"},
    {".go", "go"},
    {".rs", "rust"},
    {".rb", "ruby"},
    {".java", "java"},
    {".kt", "kotlin"},
    {".cs", "csharp"},
    {".php", "php"},
    {".swift", "swift"},
    {".lua", "lua"},
    {".pl", "perl"},
    {".sql", "sql"},
    {".json", "json"},
    {".yml", "yaml"},
    {".yaml", "yaml"},
    {".toml", "toml"},
    {".xml", "xml"},
    {".html", "html"},
    {".htm", "html"},
    {".css", "css"},
    {".scss", "scss"},
    {".md", "markdown"},
    {".markdown", "markdown"},
    {".txt", "plaintext"},
};

const std::unordered_map<std::string, std::string> SHEBANG_MAP = {
    {"bash", "bash"},
    {"sh", "bash"},
    {"zsh", "zsh"},
    {"fish", "fish"},
    {"python", "python"},
    {"python3", "python"},
    {"node", "javascript"},
    {"ruby", "ruby"},
    {"perl", "perl"},
    {"php", "php"},
    {"lua", "lua"},
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string basename_of(const std::string& filename) {
    size_t slash = filename.find_last_of("/\\");
    return slash == std::string::npos ? filename : filename.substr(slash + 1);
}

std::string map_interpreter(const std::string& interpreter) {
    auto it = SHEBANG_MAP.find(interpreter);
    return it != SHEBANG_MAP.end() ? it->second : interpreter;
}

}  // namespace

std::optional<std::string> LanguageDetector::detect(const std::string& content,
                                                    const std::string& filename) {
    std::string lang = from_shebang(content);
    if (!lang.empty()) {
        return lang;
    }

    lang = from_extension(filename);
    if (!lang.empty()) {
        return lang;
    }

    std::string base = to_lower(basename_of(filename));
    if (base == "dockerfile" || base.rfind("dockerfile.", 0) == 0) {
        return std::string("dockerfile");
    }
    if (base == "makefile" || base == "gnumakefile") {
        return std::string("makefile");
    }
    if (base == ".bashrc" || base == ".bash_profile" || base == ".profile") {
        return std::string("bash");
    }

    return std::nullopt;
}

std::string LanguageDetector::content_type(const std::string& content,
                                           const std::string& filename) {
    if (content.find('\0') != std::string::npos) {
        return "application/octet-stream";
    }
    std::string ext = to_lower(from_extension(filename));
    if (ext == "json") return "application/json";
    return "text/plain; charset=utf-8";
}

std::string LanguageDetector::from_extension(const std::string& filename) {
    std::string base = basename_of(filename);
    size_t dot_pos = base.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == base.length() - 1) {
        return "";
    }

    auto it = EXTENSION_MAP.find(to_lower(base.substr(dot_pos)));
    if (it != EXTENSION_MAP.end()) {
        return it->second;
    }
    return "";
}

std::string LanguageDetector::from_shebang(const std::string& content) {
    if (content.size() < 2 || content[0] != '#' || content[1] != '!') {
        return "";
    }

    size_t line_end = content.find('\n');
    if (line_end == std::string::npos) {
        line_end = content.length();
    }
    std::string shebang = content.substr(2, line_end - 2);

    // #!/usr/bin/env <interpreter>
    size_t env_pos = shebang.find("env ");
    size_t interp_start;
    if (env_pos != std::string::npos) {
        interp_start = shebang.find_first_not_of(' ', env_pos + 4);
    } else {
        size_t last_slash = shebang.rfind('/');
        if (last_slash == std::string::npos) {
            return "";
        }
        interp_start = last_slash + 1;
    }
    if (interp_start == std::string::npos || interp_start >= shebang.length()) {
        return "";
    }

    size_t interp_end = shebang.find_first_of(" \t\r", interp_start);
    if (interp_end == std::string::npos) {
        interp_end = shebang.length();
    }
    return map_interpreter(shebang.substr(interp_start, interp_end - interp_start));
}

}  // namespace stashy
