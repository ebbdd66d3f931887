#pragma once

#include <string>
#include <vector>

#include "chart/Geometry.hpp"

namespace chart {

struct DataPoint {
    std::string label;
    double value = 0.0;
};

struct Series {
    std::string name;
    std::vector<DataPoint> data;
    std::string color;
};

struct LineChartOptions {
    double width = 450.0;
    double height = 200.0;
    std::string title;
    double min_y = 0.0;
    double max_y = 100.0;
};

struct Padding {
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double left = 0.0;
};

// top 30 with a title else 10, right 20, bottom 50 with a legend else 30,
// left 40. A legend is drawn when there is more than one series.
Padding line_chart_padding(const LineChartOptions& opt, size_t series_count);

// All series share the x slots of the first one. Returns an empty chart when
// there is no series or the first one has no points. Throws
// std::invalid_argument when max_y <= min_y.
Chart layout_line_chart(const std::vector<Series>& series, const LineChartOptions& opt = {});

}  // namespace chart
