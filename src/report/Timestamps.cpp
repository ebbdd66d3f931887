#include "report/Timestamps.hpp"

#include <chrono>
#include <cctype>
#include <cstdio>

namespace report {

static const char* const kMonthShort[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
static const char* const kMonthLong[] = {"January", "February", "March", "April", "May", "June",
                                         "July", "August", "September", "October", "November", "December"};

// Howard Hinnant's days_from_civil / civil_from_days.
static std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static void civil_from_days(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<std::int64_t> parse_iso8601(const std::string& s) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, se = 0;

    if (!read_digits(s, 0, 4, y)) return std::nullopt;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (!read_digits(s, 5, 2, mo) || !read_digits(s, 8, 2, d)) return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return std::nullopt;

    size_t pos = 10;
    std::int64_t offset = 0;

    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        if (s.size() < pos + 9) return std::nullopt;
        if (!read_digits(s, pos + 1, 2, h) || s[pos + 3] != ':' ||
            !read_digits(s, pos + 4, 2, mi) || s[pos + 6] != ':' ||
            !read_digits(s, pos + 7, 2, se)) {
            return std::nullopt;
        }
        if (h > 23 || mi > 59 || se > 60) return std::nullopt;
        pos += 9;

        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        }

        if (pos < s.size()) {
            if (s[pos] == 'Z') {
                ++pos;
            } else if (s[pos] == '+' || s[pos] == '-') {
                int oh = 0, om = 0;
                if (!read_digits(s, pos + 1, 2, oh)) return std::nullopt;
                size_t mpos = pos + 3;
                if (mpos < s.size() && s[mpos] == ':') ++mpos;
                if (!read_digits(s, mpos, 2, om)) return std::nullopt;
                offset = (oh * 3600 + om * 60) * (s[pos] == '+' ? 1 : -1);
                pos = mpos + 2;
            }
        }
    }

    if (pos != s.size()) return std::nullopt;

    const std::int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return days * 86400 + h * 3600 + mi * 60 + se - offset;
}

CivilTime to_civil(std::int64_t epoch_seconds) {
    std::int64_t days = epoch_seconds / 86400;
    std::int64_t rem = epoch_seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    CivilTime ct;
    civil_from_days(days, ct.year, ct.month, ct.day);
    ct.hour = static_cast<int>(rem / 3600);
    ct.minute = static_cast<int>((rem % 3600) / 60);
    ct.second = static_cast<int>(rem % 60);
    return ct;
}

std::string format_iso8601(std::int64_t epoch_seconds) {
    const CivilTime ct = to_civil(epoch_seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  ct.year, ct.month, ct.day, ct.hour, ct.minute, ct.second);
    return buf;
}

std::string current_utc_iso8601() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return format_iso8601(static_cast<std::int64_t>(secs));
}

std::string short_date_label(const std::string& iso) {
    const auto t = parse_iso8601(iso);
    if (!t) return "";
    const CivilTime ct = to_civil(*t);
    return std::string(kMonthShort[ct.month - 1]) + " " + std::to_string(ct.day);
}

std::string long_date_label(const std::string& iso) {
    const auto t = parse_iso8601(iso);
    if (!t) return "";
    const CivilTime ct = to_civil(*t);
    return std::string(kMonthLong[ct.month - 1]) + " " + std::to_string(ct.day) + ", " + std::to_string(ct.year);
}

}  // namespace report
