#include "trellis/types.hpp"
#include <cstdio>
#include <cctype>

namespace trellis::detail {

namespace {

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
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

std::string format_timestamp(timestamp_t t) {
    auto millis = std::chrono::time_point_cast<std::chrono::milliseconds>(t);
    auto date = std::chrono::floor<std::chrono::days>(millis);
    std::chrono::year_month_day ymd{date};
    int64_t rem = (millis - date).count();  // [0, 86400000)

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(rem / 3600000),
                  static_cast<int>((rem / 60000) % 60),
                  static_cast<int>((rem / 1000) % 60),
                  static_cast<int>(rem % 1000));
    return buf;
}

std::optional<timestamp_t> parse_timestamp(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) return std::nullopt;

    int hour = 0, minute = 0, second = 0, millis = 0;
    int64_t offset_minutes = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') return std::nullopt;
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(text, pos, ':') && !read_digits(text, pos, 2, second)) return std::nullopt;
        if (expect(text, pos, '.')) {
            // Keep millisecond precision, ignore further digits
            int scale = 100;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (scale > 0) {
                    millis += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++pos;
                ++digits;
            }
            if (digits == 0) return std::nullopt;
        }
        if (pos < text.size()) {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(text, pos, 2, oh)) return std::nullopt;
                expect(text, pos, ':');
                if (!read_digits(text, pos, 2, om)) return std::nullopt;
                offset_minutes = (oh * 60 + om) * (zone == '+' ? 1 : -1);
            } else {
                return std::nullopt;
            }
        }
        if (pos != text.size()) return std::nullopt;
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    auto utc = std::chrono::sys_days{ymd}
        + std::chrono::hours{hour}
        + std::chrono::minutes{minute - offset_minutes}
        + std::chrono::seconds{second}
        + std::chrono::milliseconds{millis};
    return timestamp_t(utc);
}

} // namespace trellis::detail
