#include <stashy/types.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace stashy {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

}  // namespace

const char* visibility_name(Visibility v) {
    return v == Visibility::PUBLIC ? "public" : "private";
}

std::optional<Visibility> parse_visibility(const std::string& s) {
    if (s == "public") return Visibility::PUBLIC;
    if (s == "private") return Visibility::PRIVATE;
    return std::nullopt;
}

const char* sort_order_name(SortOrder order) {
    switch (order) {
        case SortOrder::NEWEST: return "newest";
        case SortOrder::OLDEST: return "oldest";
        case SortOrder::ALPHA_ASC: return "alpha-asc";
        case SortOrder::ALPHA_DESC: return "alpha-desc";
    }
    return "newest";
}

std::optional<SortOrder> parse_sort_order(const std::string& s) {
    if (s == "newest") return SortOrder::NEWEST;
    if (s == "oldest") return SortOrder::OLDEST;
    if (s == "alpha-asc") return SortOrder::ALPHA_ASC;
    if (s == "alpha-desc") return SortOrder::ALPHA_DESC;
    return std::nullopt;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    size_t pos = 0;
    int year, month, day, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_digits(text, pos, 2, second)) return std::nullopt;
        }
    }

    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (pos < text.size() && !read_digits(text, pos, 2, om)) return std::nullopt;
            offset_seconds = (oh * 3600 + om * 60) * (c == '+' ? 1 : -1);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(seconds * 1000 + millis)));
}

std::string format_timestamp(const Timestamp& ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

}  // namespace stashy
