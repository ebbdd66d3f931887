#include "doc/PageLayout.hpp"

#include <utility>

namespace doc {

PageBlock title_block(const std::string& text, const std::string& color) {
    PageBlock b;
    b.kind = PageBlockKind::Title;
    b.text = text;
    b.color = color;
    b.bold = true;
    b.centered = true;
    return b;
}

PageBlock heading_block(const std::string& text) {
    PageBlock b;
    b.kind = PageBlockKind::Heading;
    b.text = text;
    b.bold = true;
    return b;
}

PageBlock subheading_block(const std::string& text, const std::string& color) {
    PageBlock b;
    b.kind = PageBlockKind::Subheading;
    b.text = text;
    b.color = color;
    b.bold = true;
    return b;
}

PageBlock subtitle_block(const std::string& text) {
    PageBlock b;
    b.kind = PageBlockKind::Subtitle;
    b.text = text;
    return b;
}

PageBlock paragraph_block(const std::string& text, bool bold) {
    PageBlock b;
    b.kind = PageBlockKind::Paragraph;
    b.text = text;
    b.bold = bold;
    return b;
}

PageBlock meta_block(const std::string& text, const std::string& color) {
    PageBlock b;
    b.kind = PageBlockKind::Meta;
    b.text = text;
    b.color = color;
    return b;
}

PageBlock more_block(const std::string& text) {
    PageBlock b = meta_block(text);
    b.keep_with_previous = true;
    return b;
}

PageBlock chart_block(chart::Chart c) {
    PageBlock b;
    b.kind = PageBlockKind::Chart;
    b.charts.push_back(std::move(c));
    b.centered = true;
    return b;
}

PageBlock chart_row_block(std::vector<chart::Chart> charts) {
    PageBlock b;
    b.kind = PageBlockKind::ChartRow;
    b.charts = std::move(charts);
    return b;
}

PageBlock table_block(PageTable t) {
    PageBlock b;
    b.kind = PageBlockKind::Table;
    b.table = std::move(t);
    return b;
}

PageBlock progress_block(double fraction, const std::string& color) {
    PageBlock b;
    b.kind = PageBlockKind::ProgressBar;
    b.fraction = fraction < 0.0 ? 0.0 : (fraction > 1.0 ? 1.0 : fraction);
    b.color = color;
    return b;
}

PageBlock spacer_block(double height) {
    PageBlock b;
    b.kind = PageBlockKind::Spacer;
    b.height = height;
    return b;
}

}  // namespace doc
