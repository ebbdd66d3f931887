#pragma once

#include <optional>
#include <string>
#include <vector>

namespace report {

struct CategoryWeights {
    double technical = 0.25;
    double content = 0.25;
    double ai_readiness = 0.25;
    double performance = 0.25;
};

// Weighted mean of the category scores, rounded to one decimal. When
// performance is absent its weight is dropped and the rest renormalised, so
// an overall score always exists.
double weighted_overall(double technical,
                        double content,
                        double ai_readiness,
                        std::optional<double> performance,
                        const CategoryWeights& w = {});

// A >= 90, B >= 80, C >= 70, D >= 60, else F.
std::string letter_grade(double score);

// Mean of the present values rounded to one decimal; 0 when none present.
double average_present(const std::vector<std::optional<double>>& values);

double round_to(double value, int decimals);

}  // namespace report
