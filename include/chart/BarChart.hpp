#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chart/Geometry.hpp"

namespace chart {

struct BarDatum {
    std::string label;
    double value = 0.0;
    std::string color;
};

struct BarChartOptions {
    double width = 450.0;
    double height = 180.0;
    std::string title;
    std::optional<double> max_value;     // scale top, largest value otherwise
    std::string value_suffix;            // appended to value labels, e.g. "%"
};

// One slot per datum; each bar is 60% of its slot, centred, rising from the
// baseline in proportion to value / max. Negative values draw as zero.
// Empty data -> empty chart.
Chart layout_bar_chart(const std::vector<BarDatum>& data, const BarChartOptions& opt = {});

}  // namespace chart
