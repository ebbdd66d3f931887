#include "render/PdfWriter.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

#include <zlib.h>

#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace render {

// Helvetica and Helvetica-Bold advance widths for ASCII 32..126, 1/1000 em.
static const int kHelvetica[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    278, 278, 584, 584, 584, 556, 1015,
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    278, 278, 278, 469, 556, 333,
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,
    334, 260, 334, 584,
};

static const int kHelveticaBold[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    333, 333, 584, 584, 584, 611, 975,
    722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    333, 278, 333, 584, 556, 333,
    556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
    611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
    389, 280, 389, 584,
};

static int glyph_width(unsigned char c, bool bold) {
    if (c >= 32 && c <= 126) return bold ? kHelveticaBold[c - 32] : kHelvetica[c - 32];
    switch (c) {
        case 0x95: return 350;                  // bullet
        case 0x85: return 1000;                 // ellipsis
        case 0x96: return 556;                  // en dash
        case 0x97: return 1000;                 // em dash
        case 0x91:
        case 0x92: return bold ? 278 : 222;
        case 0x93:
        case 0x94: return bold ? 500 : 333;
        default:   return 556;
    }
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Rgb parse_color(const std::string& hex, Rgb fallback) {
    std::string h = hex;
    if (!h.empty() && h[0] == '#') h = h.substr(1);
    if (h.size() != 6) return fallback;

    int v[6];
    for (size_t i = 0; i < 6; ++i) {
        v[i] = hex_digit(h[i]);
        if (v[i] < 0) return fallback;
    }
    Rgb c;
    c.r = (v[0] * 16 + v[1]) / 255.0;
    c.g = (v[2] * 16 + v[3]) / 255.0;
    c.b = (v[4] * 16 + v[5]) / 255.0;
    return c;
}

Rgb blend_with_white(Rgb c, double alpha) {
    if (alpha >= 1.0) return c;
    if (alpha < 0.0) alpha = 0.0;
    Rgb out;
    out.r = c.r * alpha + (1.0 - alpha);
    out.g = c.g * alpha + (1.0 - alpha);
    out.b = c.b * alpha + (1.0 - alpha);
    return out;
}

static int win_ansi_byte(std::uint32_t cp) {
    if (cp < 0x80) return static_cast<int>(cp);
    if (cp >= 0xA0 && cp <= 0xFF) return static_cast<int>(cp);
    switch (cp) {
        case 0x20AC: return 0x80;
        case 0x201A: return 0x82;
        case 0x0192: return 0x83;
        case 0x201E: return 0x84;
        case 0x2026: return 0x85;
        case 0x2020: return 0x86;
        case 0x2021: return 0x87;
        case 0x02C6: return 0x88;
        case 0x2030: return 0x89;
        case 0x0160: return 0x8A;
        case 0x2039: return 0x8B;
        case 0x0152: return 0x8C;
        case 0x017D: return 0x8E;
        case 0x2018: return 0x91;
        case 0x2019: return 0x92;
        case 0x201C: return 0x93;
        case 0x201D: return 0x94;
        case 0x2022: return 0x95;
        case 0x2013: return 0x96;
        case 0x2014: return 0x97;
        case 0x02DC: return 0x98;
        case 0x2122: return 0x99;
        case 0x0161: return 0x9A;
        case 0x203A: return 0x9B;
        case 0x0153: return 0x9C;
        case 0x017E: return 0x9E;
        case 0x0178: return 0x9F;
        default:     return '?';
    }
}

std::string to_win_ansi(const std::string& raw) {
    const std::string utf8 = textutil::sanitize_utf8(raw);
    std::string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        const unsigned char c = static_cast<unsigned char>(utf8[i]);
        std::uint32_t cp = 0;
        size_t len = 1;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            len = 4;
        } else {
            out += '?';
            ++i;
            continue;
        }

        bool valid = i + len <= utf8.size();
        for (size_t k = 1; valid && k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out += '?';
            ++i;
            continue;
        }
        i += len;

        if (cp == '\t' || cp == '\n' || cp == '\r') {
            out += ' ';
            continue;
        }
        if (cp < 0x20) continue;
        out += static_cast<char>(win_ansi_byte(cp));
    }
    return out;
}

static double encoded_width(const std::string& encoded, double size, bool bold) {
    long units = 0;
    for (char c : encoded) units += glyph_width(static_cast<unsigned char>(c), bold);
    return static_cast<double>(units) * size / 1000.0;
}

double text_width(const std::string& text, double size, bool bold) {
    return encoded_width(to_win_ansi(text), size, bold);
}

static bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Longest prefix of `word` (cut on a code point boundary) that fits.
static size_t fitting_prefix(const std::string& word, double size, bool bold, double max_width) {
    size_t best = 0;
    for (size_t i = 1; i <= word.size(); ++i) {
        if (i < word.size() && is_continuation(word[i])) continue;
        if (text_width(word.substr(0, i), size, bold) > max_width) break;
        best = i;
    }
    if (best == 0) {
        // always make progress, even when one glyph is wider than the box
        best = 1;
        while (best < word.size() && is_continuation(word[best])) ++best;
    }
    return best;
}

std::vector<std::string> wrap_to_width(const std::string& text, double size, bool bold, double max_width) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) words.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) words.push_back(cur);

    std::vector<std::string> lines;
    std::string line;
    for (std::string w : words) {
        const std::string candidate = line.empty() ? w : line + " " + w;
        if (text_width(candidate, size, bold) <= max_width) {
            line = candidate;
            continue;
        }
        if (!line.empty()) {
            lines.push_back(line);
            line.clear();
        }
        while (text_width(w, size, bold) > max_width) {
            const size_t cut = fitting_prefix(w, size, bold, max_width);
            lines.push_back(w.substr(0, cut));
            w = w.substr(cut);
        }
        line = w;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

std::string fit_to_width(const std::string& text, double size, bool bold, double max_width) {
    if (text_width(text, size, bold) <= max_width) return text;

    std::string s = text;
    while (!s.empty()) {
        s.pop_back();
        while (!s.empty() && is_continuation(s.back())) s.pop_back();
        if (!s.empty() && text_width(s + "...", size, bold) <= max_width) return s + "...";
    }
    return "...";
}

static std::string num(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0" || s.empty()) s = "0";
    return s;
}

static std::string pdf_string(const std::string& encoded) {
    std::string out = "(";
    for (char ch : encoded) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += ch;
        } else if (c >= 0x80) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\%03o", c);
            out += buf;
        } else {
            out += ch;
        }
    }
    out += ")";
    return out;
}

void PdfCanvas::op(const std::string& s) {
    out_ += s;
    out_ += '\n';
}

void PdfCanvas::fill_color(Rgb c) {
    op(num(c.r) + " " + num(c.g) + " " + num(c.b) + " rg");
}

void PdfCanvas::stroke_color(Rgb c) {
    op(num(c.r) + " " + num(c.g) + " " + num(c.b) + " RG");
}

void PdfCanvas::line_width(double w) {
    op(num(w) + " w");
}

void PdfCanvas::move_to(double x, double y) {
    op(num(x) + " " + num(y) + " m");
}

void PdfCanvas::line_to(double x, double y) {
    op(num(x) + " " + num(y) + " l");
}

void PdfCanvas::curve_to(double x1, double y1, double x2, double y2, double x3, double y3) {
    op(num(x1) + " " + num(y1) + " " + num(x2) + " " + num(y2) + " " + num(x3) + " " + num(y3) + " c");
}

void PdfCanvas::close_path() {
    op("h");
}

void PdfCanvas::rect(double x, double y, double w, double h) {
    op(num(x) + " " + num(y) + " " + num(w) + " " + num(h) + " re");
}

void PdfCanvas::circle(double cx, double cy, double r) {
    // four cubic quadrants
    const double k = 0.5522847498 * r;
    move_to(cx + r, cy);
    curve_to(cx + r, cy + k, cx + k, cy + r, cx, cy + r);
    curve_to(cx - k, cy + r, cx - r, cy + k, cx - r, cy);
    curve_to(cx - r, cy - k, cx - k, cy - r, cx, cy - r);
    curve_to(cx + k, cy - r, cx + r, cy - k, cx + r, cy);
    close_path();
}

void PdfCanvas::fill() {
    op("f");
}

void PdfCanvas::stroke() {
    op("S");
}

void PdfCanvas::fill_stroke() {
    op("B");
}

void PdfCanvas::text(double x, double y, const std::string& s, double size, bool bold, Rgb color) {
    if (s.empty()) return;
    op("BT");
    op(std::string(bold ? "/F2 " : "/F1 ") + num(size) + " Tf");
    op(num(color.r) + " " + num(color.g) + " " + num(color.b) + " rg");
    op(num(x) + " " + num(y) + " Td");
    op(pdf_string(to_win_ansi(s)) + " Tj");
    op("ET");
}

std::string deflate_stream(const std::string& data) {
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::string compressed;
    compressed.resize(bound);

    const int zres = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &bound,
                               reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()),
                               Z_DEFAULT_COMPRESSION);
    if (zres != Z_OK) {
        throw std::runtime_error("compress2 failed with code " + std::to_string(zres));
    }
    compressed.resize(bound);
    return compressed;
}

void PdfDocument::add_page(std::string content) {
    pages_.push_back(std::move(content));
}

static std::string pdf_date(const std::string& iso) {
    const auto t = report::parse_iso8601(iso);
    if (!t) return "";
    const report::CivilTime c = report::to_civil(*t);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "D:%04d%02d%02d%02d%02d%02dZ", c.year, c.month, c.day, c.hour, c.minute,
                  c.second);
    return buf;
}

std::string PdfDocument::finish() const {
    if (pages_.empty()) throw std::runtime_error("PDF document has no pages");

    // 1, 2 fonts; then content/page pairs; then pages, catalog, info
    const size_t n = pages_.size();
    const size_t pages_index = 3 + 2 * n;
    const size_t catalog_index = pages_index + 1;
    const size_t info_index = catalog_index + 1;

    std::vector<std::string> objects;
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>");

    std::string kids;
    for (size_t i = 0; i < n; ++i) {
        const std::string stream = deflate_stream(pages_[i]);
        objects.push_back("<< /Length " + std::to_string(stream.size()) + " /Filter /FlateDecode >>\nstream\n" +
                          stream + "\nendstream");

        const size_t content_index = 3 + 2 * i;
        objects.push_back("<< /Type /Page /Parent " + std::to_string(pages_index) + " 0 R /MediaBox [0 0 " +
                          num(kPageWidth) + " " + num(kPageHeight) + "] /Contents " +
                          std::to_string(content_index) + " 0 R /Resources << /Font << /F1 1 0 R /F2 2 0 R >> >> >>");
        if (!kids.empty()) kids += " ";
        kids += std::to_string(content_index + 1) + " 0 R";
    }
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(n) + " >>");
    objects.push_back("<< /Type /Catalog /Pages " + std::to_string(pages_index) + " 0 R >>");

    std::string info = "<< /Producer (reportgen)";
    if (!title_.empty()) info += " /Title " + pdf_string(to_win_ansi(title_));
    const std::string date = pdf_date(created_);
    if (!date.empty()) info += " /CreationDate (" + date + ")";
    info += " >>";
    objects.push_back(info);

    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<size_t> offsets;
    offsets.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(out.size());
        out += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    const size_t xref_pos = out.size();
    out += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (size_t off : offsets) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%010zu 00000 n \n", off);
        out += buf;
    }
    out += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root " + std::to_string(catalog_index) +
           " 0 R /Info " + std::to_string(info_index) + " 0 R >>\nstartxref\n" + std::to_string(xref_pos) +
           "\n%%EOF";
    return out;
}

}  // namespace render
