#include "chart/LineChart.hpp"

#include <algorithm>
#include <stdexcept>

namespace chart {

static const char* const kGridColor = "#e5e7eb";
static const char* const kAxisTextColor = "#9ca3af";
static const char* const kTitleColor = "#1f2937";
static const char* const kLegendTextColor = "#374151";

Padding line_chart_padding(const LineChartOptions& opt, size_t series_count) {
    Padding p;
    p.top = opt.title.empty() ? 10.0 : 30.0;
    p.right = 20.0;
    p.bottom = series_count > 1 ? 50.0 : 30.0;
    p.left = 40.0;
    return p;
}

Chart layout_line_chart(const std::vector<Series>& series, const LineChartOptions& opt) {
    Chart c;
    c.width = c.view_width = opt.width;
    c.height = c.view_height = opt.height;

    if (series.empty() || series.front().data.empty()) return c;
    if (opt.max_y <= opt.min_y) {
        throw std::invalid_argument("layout_line_chart: max_y must be greater than min_y");
    }

    const bool legend = series.size() > 1;
    const Padding pad = line_chart_padding(opt, series.size());
    const double chart_w = opt.width - pad.left - pad.right;
    const double chart_h = opt.height - pad.top - pad.bottom;
    const size_t n = series.front().data.size();

    auto x_at = [&](size_t i) {
        const double denom = static_cast<double>(std::max<size_t>(n - 1, 1));
        return pad.left + (static_cast<double>(i) / denom) * chart_w;
    };
    auto y_at = [&](double v) {
        return pad.top + chart_h - ((v - opt.min_y) / (opt.max_y - opt.min_y)) * chart_h;
    };

    auto& out = c.primitives;

    if (!opt.title.empty()) {
        out.push_back(make_text(opt.width / 2.0, 18.0, opt.title, 11.0, kTitleColor, TextAnchor::Middle, true));
    }

    for (double g : {0.0, 25.0, 50.0, 75.0, 100.0}) {
        if (g < opt.min_y || g > opt.max_y) continue;
        const double y = y_at(g);
        out.push_back(make_line({pad.left, y}, {opt.width - pad.right, y}, kGridColor, 0.5));
        out.push_back(make_text(pad.left - 6.0, y + 3.0, std::to_string(static_cast<int>(g)), 8.0,
                                kAxisTextColor, TextAnchor::End));
    }

    // same-day crawls produce equal adjacent labels
    const auto& first = series.front().data;
    const double label_y = opt.height - (legend ? 22.0 : 6.0);
    for (size_t i = 0; i < first.size(); ++i) {
        if (i > 0 && first[i - 1].label == first[i].label) continue;
        out.push_back(make_text(x_at(i), label_y, first[i].label, 7.0, kAxisTextColor, TextAnchor::Middle));
    }

    for (const auto& s : series) {
        std::vector<Point> pts;
        const size_t m = std::min(s.data.size(), n);
        pts.reserve(m);
        for (size_t i = 0; i < m; ++i) pts.push_back({x_at(i), y_at(s.data[i].value)});

        out.push_back(make_polyline(pts, s.color, 2.0));

        Style dot;
        dot.fill = s.color;
        for (const auto& p : pts) out.push_back(make_circle(p, 3.0, dot));
    }

    if (legend) {
        for (size_t i = 0; i < series.size(); ++i) {
            const double lx = pad.left + static_cast<double>(i) * 100.0;
            out.push_back(make_rect(lx, opt.height - 14.0, 10.0, 10.0, series[i].color));
            out.push_back(make_text(lx + 14.0, opt.height - 5.0, series[i].name, 8.0, kLegendTextColor));
        }
    }

    return c;
}

}  // namespace chart
