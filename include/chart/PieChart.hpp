#pragma once

#include <string>
#include <vector>

#include "chart/Geometry.hpp"

namespace chart {

struct PieSlice {
    std::string label;
    double value = 0.0;
    std::string color;
};

struct PieChartOptions {
    double size = 160.0;
    bool legend = true;
    double legend_width = 150.0;
};

struct SliceAngles {
    double start = 0.0;      // radians, -pi/2 is twelve o'clock
    double end = 0.0;
};

// Sequential angles for the positive slices, starting at the top and turning
// clockwise. Zero and negative slices get an empty span.
std::vector<SliceAngles> pie_angles(const std::vector<PieSlice>& slices);

// Each slice is a polygon (centre + arc). A lone slice is a full circle.
// Empty when the value total is not positive.
Chart layout_pie_chart(const std::vector<PieSlice>& slices, const PieChartOptions& opt = {});

// Cover ring: grey track, coloured arc for score/100 of the turn, score and
// caption text in the middle.
Chart layout_score_gauge(double score, const std::string& caption, double size = 120.0,
                         const std::string& color = "#4f46e5");

}  // namespace chart
