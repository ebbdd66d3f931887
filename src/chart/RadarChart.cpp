#include "chart/RadarChart.hpp"

#include <algorithm>
#include <cmath>

namespace chart {

static const char* const kAxisLabels[4] = {"Technical", "Content", "AI Readiness", "Performance"};

static double clamp_score(double v) {
    return std::min(100.0, std::max(0.0, v));
}

RadarGeometry radar_geometry(const RadarScores& s, double size) {
    RadarGeometry g;
    g.view_box = size + 80.0;
    g.center = {g.view_box / 2.0, g.view_box / 2.0};
    g.radius = (size - 60.0) / 2.0;

    const double values[4] = {s.technical, s.content, s.ai_readiness, s.performance};
    for (int i = 0; i < 4; ++i) {
        g.angles[i] = i * 2.0 * kPi / 4.0 - kPi / 2.0;
        g.data_points[i] = polar(g.center, clamp_score(values[i]) / 100.0 * g.radius, g.angles[i]);
    }
    return g;
}

Chart layout_radar_chart(const RadarScores& s, double size, const std::string& color) {
    const RadarGeometry g = radar_geometry(s, size);

    Chart c;
    c.width = c.height = size;
    c.view_width = c.view_height = g.view_box;
    auto& out = c.primitives;

    Style ring;
    ring.stroke = "#e5e7eb";
    ring.stroke_width = 0.5;
    for (double frac : {0.25, 0.5, 0.75, 1.0}) {
        std::vector<Point> pts;
        for (double a : g.angles) pts.push_back(polar(g.center, g.radius * frac, a));
        out.push_back(make_polygon(pts, ring));
    }

    for (double a : g.angles) {
        out.push_back(make_line(g.center, polar(g.center, g.radius, a), "#d1d5db", 0.5));
    }

    Style area;
    area.stroke = color;
    area.stroke_width = 2.0;
    area.fill = color;
    area.fill_opacity = 0.15;
    out.push_back(make_polygon(std::vector<Point>(g.data_points.begin(), g.data_points.end()), area));

    Style dot;
    dot.fill = color;
    for (const auto& p : g.data_points) out.push_back(make_circle(p, 3.0, dot));

    const double values[4] = {s.technical, s.content, s.ai_readiness, s.performance};
    for (int i = 0; i < 4; ++i) {
        const Point lp = polar(g.center, g.radius + 18.0, g.angles[i]);
        out.push_back(make_text(lp.x, lp.y + 3.0, kAxisLabels[i], 8.0, "#374151", TextAnchor::Middle));

        const Point vp = polar(g.center, g.radius + 8.0, g.angles[i]);
        out.push_back(make_text(vp.x, vp.y + 12.0, std::to_string(std::lround(values[i])), 7.0, color,
                                TextAnchor::Middle, true));
    }

    return c;
}

}  // namespace chart
