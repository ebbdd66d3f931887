#include "chart/BarChart.hpp"

#include <algorithm>
#include <cmath>

namespace chart {

Chart layout_bar_chart(const std::vector<BarDatum>& data, const BarChartOptions& opt) {
    Chart c;
    c.width = c.view_width = opt.width;
    c.height = c.view_height = opt.height;
    if (data.empty()) return c;

    const double top = opt.title.empty() ? 16.0 : 34.0;
    const double bottom = 30.0;
    const double left = 40.0;
    const double right = 20.0;
    const double chart_w = opt.width - left - right;
    const double chart_h = opt.height - top - bottom;
    const double base_y = top + chart_h;

    double max_v = 0.0;
    for (const auto& d : data) max_v = std::max(max_v, d.value);
    if (opt.max_value && *opt.max_value > 0.0) max_v = *opt.max_value;
    if (max_v <= 0.0) max_v = 1.0;

    auto& out = c.primitives;
    if (!opt.title.empty()) {
        out.push_back(make_text(opt.width / 2.0, 18.0, opt.title, 11.0, "#1f2937", TextAnchor::Middle, true));
    }

    out.push_back(make_line({left, base_y}, {opt.width - right, base_y}, "#d1d5db", 0.5));

    const double slot = chart_w / static_cast<double>(data.size());
    const double bar_w = slot * 0.6;

    for (size_t i = 0; i < data.size(); ++i) {
        const auto& d = data[i];
        const double v = std::min(std::max(d.value, 0.0), max_v);
        const double h = v / max_v * chart_h;
        const double slot_x = left + static_cast<double>(i) * slot;
        const double bx = slot_x + (slot - bar_w) / 2.0;
        const double cx = slot_x + slot / 2.0;

        out.push_back(make_rect(bx, base_y - h, bar_w, h, d.color));
        out.push_back(make_text(cx, base_y - h - 4.0, std::to_string(std::lround(d.value)) + opt.value_suffix,
                                8.0, "#374151", TextAnchor::Middle, true));
        out.push_back(make_text(cx, opt.height - 12.0, d.label, 7.0, "#6b7280", TextAnchor::Middle));
    }

    return c;
}

}  // namespace chart
