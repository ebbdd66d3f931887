#include "render/Renderers.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

#include "render/PdfWriter.hpp"
#include "render/RenderError.hpp"

namespace render {

using doc::PageBlock;
using doc::PageBlockKind;
using doc::PageStyle;

static constexpr double kMargin = 50.0;
static constexpr double kContentWidth = kPageWidth - 2.0 * kMargin;
static constexpr double kContentTop = kPageHeight - 70.0;
static constexpr double kCoverTop = kPageHeight - 80.0;
static constexpr double kContentBottom = 64.0;

static const Rgb kText = parse_color("#111827");
static const Rgb kMuted = parse_color("#6b7280");
static const Rgb kRule = parse_color("#e5e7eb");
static const Rgb kPanel = parse_color("#f3f4f6");
static const Rgb kWhite = {1.0, 1.0, 1.0};

// Lays PagedReport sheets out top to bottom, opening continuation sheets
// whenever a block runs past the footer.
class PdfPageFlow {
public:
    PdfPageFlow(const doc::PagedReport& report, PdfDocument& out) : report_(report), out_(out) {
        brand_ = parse_color(report.brand.color, parse_color(report::kDefaultBrandColor));
    }

    void render(const doc::Page& page) {
        open_sheet(page.style);
        for (size_t i = 0; i < page.blocks.size(); ++i) {
            reserve_ = 0.0;
            for (size_t j = i + 1; j < page.blocks.size() && page.blocks[j].keep_with_previous; ++j) {
                reserve_ += kept_block_height(page.blocks[j]);
            }
            draw_block(page.blocks[i]);
            reserve_ = 0.0;
        }
        close_sheet();
    }

private:
    Rgb ink() const { return style_ == PageStyle::LeadCapture ? kWhite : kText; }
    Rgb muted() const { return style_ == PageStyle::LeadCapture ? kWhite : kMuted; }
    Rgb color_or(const std::string& hex, Rgb fallback) const { return parse_color(hex, fallback); }

    void open_sheet(PageStyle style) {
        style_ = style;
        canvas_ = PdfCanvas();
        ++page_number_;

        switch (style) {
            case PageStyle::Cover:
                canvas_.fill_color(brand_);
                canvas_.rect(0.0, kPageHeight - 8.0, kPageWidth, 8.0);
                canvas_.fill();
                draw_line_text(report_.brand.name, kPageHeight - 40.0, 12.0, true, brand_, true);
                y_ = kCoverTop;
                break;
            case PageStyle::LeadCapture:
                canvas_.fill_color(brand_);
                canvas_.rect(0.0, 0.0, kPageWidth, kPageHeight);
                canvas_.fill();
                y_ = kPageHeight - 60.0;
                break;
            case PageStyle::Content:
                draw_header();
                draw_footer();
                y_ = kContentTop;
                break;
        }
        top_ = y_;
    }

    void close_sheet() {
        out_.add_page(canvas_.content());
    }

    void continue_sheet() {
        close_sheet();
        open_sheet(PageStyle::Content);
    }

    void draw_header() {
        const double base = kPageHeight - 36.0;
        canvas_.text(kMargin, base, fit_to_width(report_.brand.name, 10.0, true, kContentWidth / 2.0), 10.0, true,
                     brand_);
        const std::string domain = fit_to_width(report_.domain, 9.0, false, kContentWidth / 2.0);
        canvas_.text(kPageWidth - kMargin - text_width(domain, 9.0, false), base, domain, 9.0, false, kMuted);

        canvas_.stroke_color(kRule);
        canvas_.line_width(0.75);
        canvas_.move_to(kMargin, kPageHeight - 46.0);
        canvas_.line_to(kPageWidth - kMargin, kPageHeight - 46.0);
        canvas_.stroke();
    }

    void draw_footer() {
        canvas_.stroke_color(kRule);
        canvas_.line_width(0.75);
        canvas_.move_to(kMargin, 50.0);
        canvas_.line_to(kPageWidth - kMargin, 50.0);
        canvas_.stroke();

        const std::string page = "Page " + std::to_string(page_number_);
        canvas_.text(kMargin, 36.0, fit_to_width(report_.footer, 8.0, false, kContentWidth - 60.0), 8.0, false, kMuted);
        canvas_.text(kPageWidth - kMargin - text_width(page, 8.0, false), 36.0, page, 8.0, false, kMuted);
    }

    bool at_top() const { return y_ >= top_; }

    // Room kept free below the current block for the line that must follow it.
    void ensure(double height) {
        if (y_ - height < kContentBottom + reserve_ && !at_top()) continue_sheet();
    }

    static double kept_block_height(const PageBlock& b) {
        switch (b.kind) {
            case PageBlockKind::Paragraph:
                return 14.0 * static_cast<double>(wrap_to_width(b.text, 10.0, b.bold, kContentWidth).size());
            case PageBlockKind::Meta:
                return 12.0 * static_cast<double>(wrap_to_width(b.text, 8.5, b.bold, kContentWidth).size()) + 2.0;
            case PageBlockKind::ProgressBar:
                return 16.0;
            default:
                return 0.0;
        }
    }

    void draw_line_text(const std::string& line, double baseline, double size, bool bold, Rgb color, bool centered) {
        const double x = centered ? kMargin + (kContentWidth - text_width(line, size, bold)) / 2.0 : kMargin;
        canvas_.text(x, baseline, line, size, bold, color);
    }

    void draw_wrapped(const std::string& text, double size, bool bold, Rgb color, bool centered, double leading) {
        for (const auto& line : wrap_to_width(text, size, bold, kContentWidth)) {
            ensure(leading);
            y_ -= leading;
            draw_line_text(line, y_ + leading * 0.25, size, bold, color, centered);
        }
    }

    void draw_block(const PageBlock& b) {
        switch (b.kind) {
            case PageBlockKind::Title:
                draw_wrapped(b.text, 24.0, true, color_or(b.color, ink()), true, 30.0);
                y_ -= 4.0;
                break;
            case PageBlockKind::Heading:
                ensure(22.0 + 48.0);
                if (!at_top()) y_ -= 12.0;
                draw_wrapped(b.text, 16.0, true, ink(), b.centered, 22.0);
                y_ -= 4.0;
                break;
            case PageBlockKind::Subheading:
                ensure(17.0 + 30.0);
                if (!at_top()) y_ -= 6.0;
                draw_wrapped(b.text, 12.0, true, color_or(b.color, ink()), b.centered, 17.0);
                break;
            case PageBlockKind::Subtitle:
                draw_wrapped(b.text, 9.0, false, muted(), b.centered, 13.0);
                y_ -= 4.0;
                break;
            case PageBlockKind::Paragraph:
                draw_wrapped(b.text, 10.0, b.bold, color_or(b.color, ink()), b.centered, 14.0);
                break;
            case PageBlockKind::Meta:
                draw_wrapped(b.text, 8.5, b.bold, color_or(b.color, muted()), b.centered, 12.0);
                y_ -= 2.0;
                break;
            case PageBlockKind::Chart:
                if (!b.charts.empty()) draw_chart_row({b.charts.front()});
                break;
            case PageBlockKind::ChartRow:
                draw_chart_row(b.charts);
                break;
            case PageBlockKind::ScoreCards:
                draw_cards(b.cards);
                break;
            case PageBlockKind::Table:
                draw_table(b.table);
                break;
            case PageBlockKind::ProgressBar:
                draw_progress(b.fraction, color_or(b.color, brand_));
                break;
            case PageBlockKind::Spacer:
                y_ = std::max(y_ - b.height, kContentBottom);
                break;
        }
    }

    void draw_chart_row(const std::vector<chart::Chart>& charts) {
        std::vector<const chart::Chart*> shown;
        for (const auto& c : charts) {
            if (!c.empty()) shown.push_back(&c);
        }
        if (shown.empty()) return;

        const double gap = 12.0;
        double total = gap * static_cast<double>(shown.size() - 1);
        double height = 0.0;
        for (const auto* c : shown) {
            total += c->width;
            height = std::max(height, c->height);
        }
        const double fit = total > kContentWidth ? kContentWidth / total : 1.0;

        ensure(height * fit + 8.0);
        double x = kMargin + (kContentWidth - total * fit) / 2.0;
        for (const auto* c : shown) {
            draw_chart(*c, x, y_, fit);
            x += (c->width + gap) * fit;
        }
        y_ -= height * fit + 8.0;
    }

    void draw_chart(const chart::Chart& c, double left, double top, double fit) {
        const double s = c.scale() * fit;
        auto X = [&](double cx) { return left + cx * s; };
        auto Y = [&](double cy) { return top - cy * s; };

        for (const auto& p : c.primitives) {
            const bool has_fill = !p.style.fill.empty();
            const bool has_stroke = !p.style.stroke.empty() && p.style.stroke_width > 0.0;
            if (has_fill && p.kind != chart::PrimitiveKind::Text) {
                canvas_.fill_color(blend_with_white(parse_color(p.style.fill), p.style.fill_opacity));
            }
            if (has_stroke) {
                canvas_.stroke_color(parse_color(p.style.stroke));
                canvas_.line_width(std::max(p.style.stroke_width * s, 0.1));
            }

            switch (p.kind) {
                case chart::PrimitiveKind::Line:
                case chart::PrimitiveKind::Polyline:
                    if (!has_stroke || p.points.size() < 2) break;
                    canvas_.move_to(X(p.points[0].x), Y(p.points[0].y));
                    for (size_t i = 1; i < p.points.size(); ++i) canvas_.line_to(X(p.points[i].x), Y(p.points[i].y));
                    canvas_.stroke();
                    break;
                case chart::PrimitiveKind::Polygon:
                    if (p.points.size() < 3 || (!has_fill && !has_stroke)) break;
                    canvas_.move_to(X(p.points[0].x), Y(p.points[0].y));
                    for (size_t i = 1; i < p.points.size(); ++i) canvas_.line_to(X(p.points[i].x), Y(p.points[i].y));
                    canvas_.close_path();
                    paint(has_fill, has_stroke);
                    break;
                case chart::PrimitiveKind::Circle:
                    if (!has_fill && !has_stroke) break;
                    canvas_.circle(X(p.center.x), Y(p.center.y), p.radius * s);
                    paint(has_fill, has_stroke);
                    break;
                case chart::PrimitiveKind::Rect:
                    if (!has_fill && !has_stroke) break;
                    canvas_.rect(X(p.x), Y(p.y + p.height), p.width * s, p.height * s);
                    paint(has_fill, has_stroke);
                    break;
                case chart::PrimitiveKind::Text: {
                    const double size = p.font_size * s;
                    const double w = text_width(p.text, size, p.bold);
                    double x = X(p.x);
                    if (p.anchor == chart::TextAnchor::Middle) x -= w / 2.0;
                    if (p.anchor == chart::TextAnchor::End) x -= w;
                    canvas_.text(x, Y(p.y), p.text, size, p.bold, parse_color(p.style.fill, kText));
                    break;
                }
            }
        }
    }

    void paint(bool fill, bool stroke) {
        if (fill && stroke) {
            canvas_.fill_stroke();
        } else if (fill) {
            canvas_.fill();
        } else {
            canvas_.stroke();
        }
    }

    void draw_cards(const std::vector<doc::ScoreCard>& cards) {
        if (cards.empty()) return;

        bool notes = false;
        for (const auto& c : cards) notes = notes || !c.note.empty();

        const double gap = 8.0;
        const double n = static_cast<double>(cards.size());
        const double w = (kContentWidth - gap * (n - 1.0)) / n;
        const double h = notes ? 66.0 : 56.0;

        ensure(h + 10.0);
        const double top = y_ - 4.0;
        for (size_t i = 0; i < cards.size(); ++i) {
            const auto& c = cards[i];
            const double x = kMargin + static_cast<double>(i) * (w + gap);
            canvas_.fill_color(kPanel);
            canvas_.rect(x, top - h, w, h);
            canvas_.fill();

            auto centered = [&](const std::string& s, double baseline, double size, bool bold, Rgb color) {
                const std::string line = fit_to_width(s, size, bold, w - 8.0);
                canvas_.text(x + (w - text_width(line, size, bold)) / 2.0, baseline, line, size, bold, color);
            };
            centered(c.label, top - 14.0, 8.0, false, kMuted);
            centered(c.value, top - 38.0, 20.0, true, parse_color(c.value_color, kText));
            if (!c.note.empty()) centered(c.note, top - 56.0, 7.5, false, parse_color(c.note_color, kMuted));
        }
        y_ = top - h - 6.0;
    }

    void draw_table_row(const doc::PageTable& t, const std::vector<std::string>& cells, double height, bool header) {
        const double size = 8.5;
        if (header) {
            canvas_.fill_color(kPanel);
            canvas_.rect(kMargin, y_ - height, kContentWidth, height);
            canvas_.fill();
        }

        double x = kMargin;
        for (size_t i = 0; i < t.columns.size(); ++i) {
            const double frac = i < t.widths.size() ? t.widths[i] : 1.0 / static_cast<double>(t.columns.size());
            const double w = kContentWidth * frac;
            if (i < cells.size()) {
                canvas_.text(x + 4.0, y_ - height + 5.0, fit_to_width(cells[i], size, header, w - 8.0), size, header,
                             header ? kText : ink());
            }
            x += w;
        }

        y_ -= height;
        canvas_.stroke_color(kRule);
        canvas_.line_width(0.5);
        canvas_.move_to(kMargin, y_);
        canvas_.line_to(kMargin + kContentWidth, y_);
        canvas_.stroke();
    }

    void draw_table(const doc::PageTable& t) {
        if (t.columns.empty()) return;
        const double header_h = 18.0;
        const double row_h = 16.0;

        ensure(header_h + row_h);
        draw_table_row(t, t.columns, header_h, true);
        for (size_t r = 0; r < t.rows.size(); ++r) {
            const auto& row = t.rows[r];
            const double below = r + 1 == t.rows.size() && reserve_ > 0.0 ? reserve_ + 8.0 : 0.0;
            if (y_ - row_h < kContentBottom + below) {
                continue_sheet();
                draw_table_row(t, t.columns, header_h, true);
            }
            draw_table_row(t, row, row_h, false);
        }
        y_ -= 8.0;
    }

    void draw_progress(double fraction, Rgb color) {
        ensure(16.0);
        const double bar_y = y_ - 9.0;
        canvas_.fill_color(kRule);
        canvas_.rect(kMargin, bar_y, kContentWidth, 6.0);
        canvas_.fill();
        if (fraction > 0.0) {
            canvas_.fill_color(color);
            canvas_.rect(kMargin, bar_y, kContentWidth * std::min(fraction, 1.0), 6.0);
            canvas_.fill();
        }
        y_ -= 16.0;
    }

    const doc::PagedReport& report_;
    PdfDocument& out_;
    PdfCanvas canvas_;
    Rgb brand_;
    PageStyle style_ = PageStyle::Content;
    double y_ = kContentTop;
    double top_ = kContentTop;
    double reserve_ = 0.0;
    int page_number_ = 0;
};

std::string write_paged_pdf(const doc::PagedReport& report, const std::string& created_at) {
    PdfDocument out;
    out.set_title(report.title);
    out.set_creation_date(created_at);

    PdfPageFlow flow(report, out);
    for (const auto& page : report.pages) flow.render(page);
    return out.finish();
}

std::string render_pdf(const report::ReportData& data, report::TemplateType type) {
    const doc::PagedReport paged = type == report::TemplateType::Detailed ? doc::assemble_detailed_pages(data)
                                                                          : doc::assemble_summary_pages(data);
    try {
        return write_paged_pdf(paged, data.generated_at);
    } catch (const std::exception& e) {
        std::cerr << "PdfRenderer: " << e.what() << "\n";
        throw RenderError(data.crawl.id, report::OutputFormat::Pdf, e.what());
    }
}

}  // namespace render
