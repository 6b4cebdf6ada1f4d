#pragma once

#include <optional>
#include <string>

namespace stashy {

/**
 * Guesses the language tag and MIME type of an uploaded file.
 *
 * Detection priority:
 * 1. Shebang line (#!/bin/bash, #!/usr/bin/env python)
 * 2. File extension mapping
 * 3. Well-known filenames (Dockerfile, Makefile)
 */
class LanguageDetector {
public:
    /**
     * Detect language from content and filename.
     *
     * @return Lowercase language name, or nullopt if unknown
     */
    static std::optional<std::string> detect(const std::string& content,
                                             const std::string& filename);

    /**
     * Content type for a multipart file part.
     * Text files get "text/plain; charset=utf-8", anything containing a NUL
     * byte is sent as "application/octet-stream".
     */
    static std::string content_type(const std::string& content,
                                    const std::string& filename);

private:
    static std::string from_extension(const std::string& filename);
    static std::string from_shebang(const std::string& content);
};

}  // namespace stashy
