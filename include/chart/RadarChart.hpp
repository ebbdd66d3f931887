#pragma once

#include <array>
#include <string>

#include "chart/Geometry.hpp"

namespace chart {

struct RadarScores {
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    double performance = 0.0;
};

struct RadarGeometry {
    double view_box = 0.0;
    Point center;
    double radius = 0.0;
    std::array<double, 4> angles{};          // radians, top first, clockwise
    std::array<Point, 4> data_points{};
};

// view box = size + 80, radius = (size - 60) / 2, axes at i*90deg - 90deg.
// Values are clamped to 0..100.
RadarGeometry radar_geometry(const RadarScores& s, double size = 200.0);

// Rings at 25/50/75/100% radius, four axes, the data polygon with a dot per
// vertex, axis labels at r+18 and value labels at r+8.
Chart layout_radar_chart(const RadarScores& s, double size = 200.0, const std::string& color = "#4f46e5");

}  // namespace chart
