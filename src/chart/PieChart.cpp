#include "chart/PieChart.hpp"

#include <algorithm>
#include <cmath>

namespace chart {

static const double kArcStep = kPi / 36.0;

std::vector<SliceAngles> pie_angles(const std::vector<PieSlice>& slices) {
    double total = 0.0;
    for (const auto& s : slices) total += std::max(0.0, s.value);

    std::vector<SliceAngles> out;
    out.reserve(slices.size());

    double cursor = -kPi / 2.0;
    for (const auto& s : slices) {
        const double v = std::max(0.0, s.value);
        const double span = total > 0.0 ? v / total * 2.0 * kPi : 0.0;
        out.push_back({cursor, cursor + span});
        cursor += span;
    }
    return out;
}

Chart layout_pie_chart(const std::vector<PieSlice>& slices, const PieChartOptions& opt) {
    Chart c;
    c.width = c.view_width = opt.size + (opt.legend ? opt.legend_width : 0.0);
    c.height = c.view_height = opt.size;

    double total = 0.0;
    int positive = 0;
    for (const auto& s : slices) {
        if (s.value > 0.0) {
            total += s.value;
            ++positive;
        }
    }
    if (total <= 0.0) return c;

    const Point center{opt.size / 2.0, opt.size / 2.0};
    const double r = opt.size / 2.0 - 4.0;
    const auto angles = pie_angles(slices);
    auto& out = c.primitives;

    for (size_t i = 0; i < slices.size(); ++i) {
        if (slices[i].value <= 0.0) continue;

        Style st;
        st.fill = slices[i].color;
        st.stroke = "#ffffff";
        st.stroke_width = 1.0;

        if (positive == 1) {
            out.push_back(make_circle(center, r, st));
            continue;
        }

        std::vector<Point> pts{center};
        const auto arc = arc_points(center, r, angles[i].start, angles[i].end, kArcStep);
        pts.insert(pts.end(), arc.begin(), arc.end());
        out.push_back(make_polygon(pts, st));
    }

    if (opt.legend) {
        double ly = std::max(10.0, center.y - 9.0 * static_cast<double>(positive));
        const double lx = opt.size + 12.0;
        for (const auto& s : slices) {
            if (s.value <= 0.0) continue;
            out.push_back(make_rect(lx, ly, 10.0, 10.0, s.color));
            out.push_back(make_text(lx + 14.0, ly + 8.0,
                                    s.label + " (" + std::to_string(std::lround(s.value)) + ")", 8.0, "#374151"));
            ly += 18.0;
        }
    }

    return c;
}

Chart layout_score_gauge(double score, const std::string& caption, double size, const std::string& color) {
    Chart c;
    c.width = c.view_width = size;
    c.height = c.view_height = size;

    const double v = std::min(100.0, std::max(0.0, score));
    const Point center{size / 2.0, size / 2.0};
    const double stroke = size * 0.08;
    const double r = size / 2.0 - stroke;
    auto& out = c.primitives;

    Style track;
    track.stroke = "#e5e7eb";
    track.stroke_width = stroke;
    out.push_back(make_circle(center, r, track));

    if (v > 0.0) {
        const double start = -kPi / 2.0;
        out.push_back(make_polyline(arc_points(center, r, start, start + v / 100.0 * 2.0 * kPi, kArcStep),
                                    color, stroke));
    }

    out.push_back(make_text(center.x, center.y + size * 0.06, std::to_string(std::lround(score)), size * 0.22,
                            "#111827", TextAnchor::Middle, true));
    if (!caption.empty()) {
        out.push_back(make_text(center.x, center.y + size * 0.2, caption, size * 0.08, "#6b7280",
                                TextAnchor::Middle));
    }
    return c;
}

}  // namespace chart
