#include "report/TextUtil.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace textutil {

std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string capitalize(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string title_case_words(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool word_start = true;

    for (char ch : s) {
        char c = (ch == '_') ? ' ' : ch;
        if (c == ' ') {
            out.push_back(c);
            word_start = true;
            continue;
        }
        if (word_start && std::isalnum(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else {
            out.push_back(c);
        }
        word_start = false;
    }
    return out;
}

std::string truncate(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    if (max <= 3) return s.substr(0, max);
    return s.substr(0, max - 3) + "...";
}

std::string format_thousands(double v) {
    const long long n = std::llround(v);
    std::string digits = std::to_string(n < 0 ? -n : n);

    std::string out;
    out.reserve(digits.size() + digits.size() / 3 + 1);
    const size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead % 3 && i >= (lead == 0 ? 3 : lead)) out.push_back(',');
        out.push_back(digits[i]);
    }
    if (n < 0) out.insert(out.begin(), '-');
    return out;
}

std::string format_fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    std::string out = buf;
    // snprintf keeps the sign of a rounded-away negative ("-0.0")
    if (out[0] == '-') {
        bool all_zero = true;
        for (size_t i = 1; i < out.size(); ++i) {
            if (out[i] != '0' && out[i] != '.') {
                all_zero = false;
                break;
            }
        }
        if (all_zero) out.erase(out.begin());
    }
    return out;
}

std::string format_int(double v) {
    return std::to_string(std::llround(v));
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        if (std::isspace(ch)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(static_cast<char>(ch));
            prev_space = false;
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> word_wrap(const std::string& s, size_t max_chars) {
    std::vector<std::string> lines;
    if (max_chars == 0) max_chars = 1;

    const std::string text = collapse_whitespace(s);
    std::string cur;
    size_t i = 0;

    while (i < text.size()) {
        size_t j = text.find(' ', i);
        if (j == std::string::npos) j = text.size();
        std::string word = text.substr(i, j - i);
        i = j + 1;

        while (word.size() > max_chars) {
            if (!cur.empty()) {
                lines.push_back(cur);
                cur.clear();
            }
            lines.push_back(word.substr(0, max_chars));
            word = word.substr(max_chars);
        }

        if (cur.empty()) {
            cur = word;
        } else if (cur.size() + 1 + word.size() <= max_chars) {
            cur += " " + word;
        } else {
            lines.push_back(cur);
            cur = word;
        }
    }

    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

std::string sanitize_utf8(const std::string& s) {
    static const char* kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out += s[i++];
            continue;
        }

        size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
            min_cp = 0x10000;
        }

        size_t k = 1;
        while (len > 0 && k < len && i + k < s.size() &&
               (static_cast<unsigned char>(s[i + k]) & 0xC0) == 0x80) {
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
            ++k;
        }

        const bool ok = len > 0 && k == len && cp >= min_cp && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
        if (ok) {
            out.append(s, i, len);
            i += len;
        } else {
            // one replacement per maximal bad prefix
            out += kReplacement;
            i += len > 0 ? k : 1;
        }
    }
    return out;
}

}  // namespace textutil
