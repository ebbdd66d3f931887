#include "report/Grading.hpp"

#include <cmath>

namespace report {

double round_to(double value, int decimals) {
    double scale = 1.0;
    for (int i = 0; i < decimals; ++i) scale *= 10.0;
    return std::round(value * scale) / scale;
}

double weighted_overall(double technical,
                        double content,
                        double ai_readiness,
                        std::optional<double> performance,
                        const CategoryWeights& w) {
    double sum = technical * w.technical + content * w.content + ai_readiness * w.ai_readiness;
    double weight = w.technical + w.content + w.ai_readiness;

    if (performance) {
        sum += *performance * w.performance;
        weight += w.performance;
    }

    if (weight <= 0.0) return 0.0;
    return round_to(sum / weight, 1);
}

std::string letter_grade(double score) {
    if (score >= 90.0) return "A";
    if (score >= 80.0) return "B";
    if (score >= 70.0) return "C";
    if (score >= 60.0) return "D";
    return "F";
}

double average_present(const std::vector<std::optional<double>>& values) {
    double sum = 0.0;
    int n = 0;
    for (const auto& v : values) {
        if (!v) continue;
        sum += *v;
        ++n;
    }
    if (n == 0) return 0.0;
    return round_to(sum / n, 1);
}

}  // namespace report
