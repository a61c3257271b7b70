#include "strata/types.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace strata {

// ============================================================================
// Column type lattice
// ============================================================================

std::string sql_type(column_type type) {
    switch (type) {
        case column_type::text: return "TEXT";
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::double_precision: return "DOUBLE";
        case column_type::numeric: return "NUMERIC";
        case column_type::boolean: return "BOOLEAN";
        case column_type::date: return "DATETIME";
        case column_type::blob: return "BLOB";
        case column_type::any: return "ANY";
    }
    return "TEXT";
}

column_type column_type_from_sql(std::string_view declared) {
    std::string upper(declared);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    // Order matters: first substring hit wins
    static const std::array<std::pair<const char*, column_type>, 9> table = {{
        {"TEXT", column_type::text},
        {"INTEGER", column_type::integer},
        {"REAL", column_type::real},
        {"DOUBLE", column_type::double_precision},
        {"NUMERIC", column_type::numeric},
        {"BOOLEAN", column_type::boolean},
        {"DATE", column_type::date},    // also matches DATETIME
        {"BLOB", column_type::blob},
        {"ANY", column_type::any},
    }};
    for (const auto& [needle, type] : table) {
        if (upper.find(needle) != std::string::npos) {
            return type;
        }
    }
    return column_type::text;
}

// ============================================================================
// Timestamps
// ============================================================================

namespace {

struct calendar_time {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int offset_minutes = 0;  // east of UTC
};

calendar_time split(timestamp_t t) {
    using namespace std::chrono;
    auto ms = floor<milliseconds>(t);
    auto day_point = floor<days>(ms);
    year_month_day ymd{day_point};
    auto in_day = ms - day_point;

    calendar_time out;
    out.year = static_cast<int>(ymd.year());
    out.month = static_cast<unsigned>(ymd.month());
    out.day = static_cast<unsigned>(ymd.day());
    auto total_ms = in_day.count();
    out.hour = static_cast<int>(total_ms / 3600000);
    out.minute = static_cast<int>((total_ms / 60000) % 60);
    out.second = static_cast<int>((total_ms / 1000) % 60);
    out.millis = static_cast<int>(total_ms % 1000);
    return out;
}

std::optional<timestamp_t> join(const calendar_time& c) {
    using namespace std::chrono;
    year_month_day ymd{year{c.year}, month{c.month}, day{c.day}};
    if (!ymd.ok() || c.hour > 23 || c.minute > 59 || c.second > 60) {
        return std::nullopt;
    }
    auto tp = sys_days{ymd} + hours{c.hour} + minutes{c.minute} + seconds{c.second}
            + milliseconds{c.millis} - minutes{c.offset_minutes};
    return timestamp_from_millis(tp.time_since_epoch().count());
}

// Cursor over the text being parsed
class scanner {
public:
    explicit scanner(std::string_view text) : text_(text) {}

    bool at_end() const { return pos_ == text_.size(); }

    bool peek(char c) const { return pos_ < text_.size() && text_[pos_] == c; }

    bool expect(char c) {
        if (!peek(c)) return false;
        ++pos_;
        return true;
    }

    bool digits(size_t count, int& out) {
        if (pos_ + count > text_.size()) return false;
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

    // Fractional seconds: any number of digits, rounded down to millis
    bool fraction(int& millis) {
        size_t start = pos_;
        int value = 0;
        size_t taken = 0;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            if (taken < 3) {
                value = value * 10 + (text_[pos_] - '0');
                ++taken;
            }
            ++pos_;
        }
        if (pos_ == start) return false;
        while (taken < 3) {
            value *= 10;
            ++taken;
        }
        millis = value;
        return true;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
};

bool scan_date(scanner& s, calendar_time& c) {
    int month = 0;
    int day = 0;
    if (!s.digits(4, c.year) || !s.expect('-') || !s.digits(2, month) || !s.expect('-') || !s.digits(2, day)) {
        return false;
    }
    c.month = static_cast<unsigned>(month);
    c.day = static_cast<unsigned>(day);
    return true;
}

bool scan_time(scanner& s, calendar_time& c) {
    return s.digits(2, c.hour) && s.expect(':') && s.digits(2, c.minute) && s.expect(':') && s.digits(2, c.second);
}

// Z, +HH:MM, +HHMM, -HH:MM, -HHMM
bool scan_zone(scanner& s, calendar_time& c) {
    if (s.expect('Z')) return true;
    int sign = 0;
    if (s.expect('+')) sign = 1;
    else if (s.expect('-')) sign = -1;
    else return false;

    int hours = 0;
    int minutes = 0;
    if (!s.digits(2, hours)) return false;
    s.expect(':');
    if (!s.digits(2, minutes)) return false;
    c.offset_minutes = sign * (hours * 60 + minutes);
    return true;
}

// YYYY-MM-DDTHH:MM:SS[.fff](Z|offset)
std::optional<timestamp_t> parse_iso8601(std::string_view text) {
    scanner s(text);
    calendar_time c;
    if (!scan_date(s, c) || !s.expect('T') || !scan_time(s, c)) return std::nullopt;
    if (s.expect('.') && !s.fraction(c.millis)) return std::nullopt;
    if (!scan_zone(s, c) || !s.at_end()) return std::nullopt;
    return join(c);
}

// YYYY-MM-DD<sep>HH:MM:SS[.fff], interpreted as UTC
std::optional<timestamp_t> parse_date_time(std::string_view text, char separator, bool with_fraction) {
    scanner s(text);
    calendar_time c;
    if (!scan_date(s, c) || !s.expect(separator) || !scan_time(s, c)) return std::nullopt;
    if (with_fraction && (!s.expect('.') || !s.fraction(c.millis))) return std::nullopt;
    if (!with_fraction && separator == 'T') {
        s.expect('Z');
    }
    if (!s.at_end()) return std::nullopt;
    return join(c);
}

std::optional<timestamp_t> parse_date_only(std::string_view text) {
    scanner s(text);
    calendar_time c;
    if (!scan_date(s, c) || !s.at_end()) return std::nullopt;
    return join(c);
}

std::optional<timestamp_t> parse_epoch_seconds(std::string_view text) {
    std::string buffer(text);
    if (buffer.empty()) return std::nullopt;
    char* end = nullptr;
    double seconds = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || !std::isfinite(seconds)) {
        return std::nullopt;
    }
    return checked_timestamp_from_seconds(seconds);
}

} // namespace

std::optional<timestamp_t> timestamp_from_millis(int64_t millis) {
    using namespace std::chrono;
    constexpr auto limit = duration_cast<milliseconds>(timestamp_t::duration::max()).count();
    if (millis > limit || millis < -limit) {
        return std::nullopt;
    }
    return timestamp_t(duration_cast<timestamp_t::duration>(milliseconds(millis)));
}

std::optional<timestamp_t> checked_timestamp_from_seconds(double seconds) {
    double millis = std::round(seconds * 1000.0);
    // [-2^63, 2^63) before the cast
    if (!std::isfinite(millis) || millis < -9223372036854775808.0 || millis >= 9223372036854775808.0) {
        return std::nullopt;
    }
    return timestamp_from_millis(static_cast<int64_t>(millis));
}

timestamp_t timestamp_from_seconds(double seconds) {
    auto t = checked_timestamp_from_seconds(seconds);
    if (!t) {
        throw value_conversion_error("Timestamp out of range: " + std::to_string(seconds) + " seconds");
    }
    return *t;
}

double timestamp_to_seconds(timestamp_t t) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    return static_cast<double>(millis) / 1000.0;
}

std::string format_timestamp(timestamp_t t) {
    auto c = split(t);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02d:%02d:%02d.%03d",
                  c.year, c.month, c.day, c.hour, c.minute, c.second, c.millis);
    return buffer;
}

std::string format_iso8601(timestamp_t t) {
    auto c = split(t);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  c.year, c.month, c.day, c.hour, c.minute, c.second, c.millis);
    return buffer;
}

std::optional<timestamp_t> parse_timestamp(std::string_view text) {
    if (auto t = parse_epoch_seconds(text)) return t;
    if (auto t = parse_iso8601(text)) return t;
    if (auto t = parse_date_time(text, ' ', true)) return t;
    if (auto t = parse_date_time(text, ' ', false)) return t;
    if (auto t = parse_date_only(text)) return t;
    if (auto t = parse_date_time(text, 'T', true)) return t;
    return parse_date_time(text, 'T', false);
}

// ============================================================================
// Base64 (RFC 4648, padded)
// ============================================================================

namespace {
constexpr char base64_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
} // namespace

std::string base64_encode(const blob_t& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= bytes.size()) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += base64_alphabet[(n >> 18) & 0x3F];
        out += base64_alphabet[(n >> 12) & 0x3F];
        out += base64_alphabet[(n >> 6) & 0x3F];
        out += base64_alphabet[n & 0x3F];
        i += 3;
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = bytes[i] << 16;
        out += base64_alphabet[(n >> 18) & 0x3F];
        out += base64_alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += base64_alphabet[(n >> 18) & 0x3F];
        out += base64_alphabet[(n >> 12) & 0x3F];
        out += base64_alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<blob_t> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) return std::nullopt;

    blob_t out;
    out.reserve((text.size() / 4) * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final quad
                if (i + 4 != text.size() || k < 2) return std::nullopt;
                values[k] = 0;
                ++padding;
            } else {
                if (padding > 0) return std::nullopt;
                values[k] = base64_index(c);
                if (values[k] < 0) return std::nullopt;
            }
        }
        uint32_t n = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

std::string describe(const storage_value& v) {
    return std::visit([](auto&& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << value;
            return ss.str();
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + value + "'";
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_iso8601(value);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return "<blob " + std::to_string(value.size()) + " bytes>";
        } else {
            return value.json;
        }
    }, v);
}

} // namespace strata
