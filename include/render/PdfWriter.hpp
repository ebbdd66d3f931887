#pragma once

#include <string>
#include <vector>

// Minimal PDF 1.4 writer: Helvetica Type1 faces, Flate content streams, one
// content stream per page. Coordinates are PDF user space (origin bottom-left).
namespace render {

constexpr double kPageWidth = 595.0;     // A4
constexpr double kPageHeight = 842.0;

struct Rgb {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

// "#rrggbb" or "rrggbb"; anything else yields `fallback`.
Rgb parse_color(const std::string& hex, Rgb fallback = {});

// Flattens a translucent fill onto a white page.
Rgb blend_with_white(Rgb c, double alpha);

// UTF-8 to the WinAnsi bytes the standard fonts are encoded with. Code points
// outside WinAnsi become '?'.
std::string to_win_ansi(const std::string& utf8);

// Advance width of `text` in points using the Helvetica metrics.
double text_width(const std::string& text, double size, bool bold);

// Greedy wrap on spaces to `max_width` points; overlong words are split.
std::vector<std::string> wrap_to_width(const std::string& text, double size, bool bold, double max_width);

// `text` cut with "..." so it fits `max_width`.
std::string fit_to_width(const std::string& text, double size, bool bold, double max_width);

class PdfCanvas {
public:
    void fill_color(Rgb c);
    void stroke_color(Rgb c);
    void line_width(double w);

    void move_to(double x, double y);
    void line_to(double x, double y);
    void curve_to(double x1, double y1, double x2, double y2, double x3, double y3);
    void close_path();
    void rect(double x, double y, double w, double h);
    void circle(double cx, double cy, double r);

    void fill();
    void stroke();
    void fill_stroke();

    // Baseline-anchored single line, WinAnsi converted and escaped here.
    void text(double x, double y, const std::string& s, double size, bool bold, Rgb color);

    const std::string& content() const { return out_; }

private:
    void op(const std::string& s);

    std::string out_;
};

class PdfDocument {
public:
    void set_title(const std::string& title) { title_ = title; }
    // ISO-8601; written as the info dictionary CreationDate when it parses.
    void set_creation_date(const std::string& iso) { created_ = iso; }

    void add_page(std::string content);
    size_t page_count() const { return pages_.size(); }

    // Serialises the whole file. Throws std::runtime_error when a stream
    // cannot be compressed.
    std::string finish() const;

private:
    std::string title_;
    std::string created_;
    std::vector<std::string> pages_;
};

// zlib stream for a FlateDecode filter.
std::string deflate_stream(const std::string& data);

}  // namespace render
