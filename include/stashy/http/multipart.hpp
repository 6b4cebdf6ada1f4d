#pragma once

#include <string>
#include <vector>

namespace stashy::http {

/**
 * multipart/form-data body builder.
 *
 * Parts are emitted in the order they were added. A generated boundary is
 * re-rolled whenever a part's payload happens to contain it.
 */
class MultipartBody {
public:
    // Random boundary
    MultipartBody();

    // Fixed boundary; the caller guarantees it does not occur in any payload
    explicit MultipartBody(std::string boundary);

    void add_field(const std::string& name, const std::string& value);

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  const std::string& data);

    // Value for the Content-Type header, including the boundary
    std::string content_type() const;

    std::string encode() const;

    const std::string& boundary() const { return boundary_; }
    size_t part_count() const { return parts_.size(); }

private:
    struct Part {
        std::string name;
        std::string filename;       // Empty for plain fields
        std::string content_type;   // Empty for plain fields
        std::string data;
        bool is_file = false;
    };

    std::vector<Part> parts_;
    std::string boundary_;
    bool generated_ = false;

    void ensure_boundary_absent(const std::string& data);
    static std::string random_boundary();
    static std::string quote(const std::string& value);
};

}  // namespace stashy::http
