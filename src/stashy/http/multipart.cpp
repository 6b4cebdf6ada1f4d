#include <stashy/http/multipart.hpp>

#include <random>
#include <sstream>

namespace stashy::http {

MultipartBody::MultipartBody()
    : boundary_(random_boundary()), generated_(true) {}

MultipartBody::MultipartBody(std::string boundary)
    : boundary_(std::move(boundary)), generated_(false) {}

std::string MultipartBody::random_boundary() {
    static const char* HEX = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string boundary = "----stashy";
    for (int i = 0; i < 32; ++i) {
        boundary += HEX[dist(gen)];
    }
    return boundary;
}

void MultipartBody::ensure_boundary_absent(const std::string& data) {
    if (!generated_) return;

    auto collides = [this, &data]() {
        if (data.find(boundary_) != std::string::npos) return true;
        for (const auto& part : parts_) {
            if (part.data.find(boundary_) != std::string::npos) return true;
        }
        return false;
    };
    while (collides()) {
        boundary_ = random_boundary();
    }
}

void MultipartBody::add_field(const std::string& name, const std::string& value) {
    ensure_boundary_absent(value);
    Part part;
    part.name = name;
    part.data = value;
    parts_.push_back(std::move(part));
}

void MultipartBody::add_file(const std::string& name,
                             const std::string& filename,
                             const std::string& content_type,
                             const std::string& data) {
    ensure_boundary_absent(data);
    Part part;
    part.name = name;
    part.filename = filename;
    part.content_type = content_type.empty() ? "application/octet-stream" : content_type;
    part.data = data;
    part.is_file = true;
    parts_.push_back(std::move(part));
}

std::string MultipartBody::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

// Quoted-string for Content-Disposition parameters. CR/LF are dropped and
// double quotes percent-encoded, matching what browsers send.
std::string MultipartBody::quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '\r' || c == '\n') continue;
        if (c == '"') {
            out += "%22";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string MultipartBody::encode() const {
    std::ostringstream out;
    for (const auto& part : parts_) {
        out << "--" << boundary_ << "\r\n";
        out << "Content-Disposition: form-data; name=" << quote(part.name);
        if (part.is_file) {
            out << "; filename=" << quote(part.filename) << "\r\n";
            out << "Content-Type: " << part.content_type;
        }
        out << "\r\n\r\n";
        out << part.data << "\r\n";
    }
    out << "--" << boundary_ << "--\r\n";
    return out.str();
}

}  // namespace stashy::http
