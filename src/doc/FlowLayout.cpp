#include "doc/FlowLayout.hpp"

#include <utility>

namespace doc {

FlowBlock flow_title(const std::string& text, const std::string& color) {
    FlowBlock b;
    b.kind = FlowKind::Title;
    b.runs.push_back({text, true, false, color, 0});
    b.centered = true;
    return b;
}

FlowBlock flow_heading(const std::string& text, int level) {
    FlowBlock b;
    b.kind = level <= 1 ? FlowKind::Heading1 : FlowKind::Heading2;
    b.runs.push_back({text, true, false, "", 0});
    return b;
}

FlowBlock flow_text(const std::string& text, bool bold, const std::string& color) {
    FlowBlock b;
    b.kind = FlowKind::Paragraph;
    b.runs.push_back({text, bold, false, color, 0});
    return b;
}

FlowBlock flow_muted(const std::string& text) {
    FlowBlock b;
    b.kind = FlowKind::Paragraph;
    b.runs.push_back({text, false, false, "#6b7280", 18});
    return b;
}

FlowBlock flow_bullet(const std::string& text) {
    FlowBlock b;
    b.kind = FlowKind::Bullet;
    b.runs.push_back({text, false, false, "", 0});
    return b;
}

FlowBlock flow_table(std::vector<std::string> header, std::vector<std::vector<std::string>> rows) {
    FlowBlock b;
    b.kind = FlowKind::Table;
    b.table.header = std::move(header);
    b.table.rows = std::move(rows);
    return b;
}

FlowBlock flow_page_break() {
    FlowBlock b;
    b.kind = FlowKind::PageBreak;
    return b;
}

}  // namespace doc
