// src/analytics/statistics_utils.cpp
#include "trade_journal/analytics/statistics_utils.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace trade_journal {
namespace statistics {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

namespace {
double sum_squared_deviations(const std::vector<double>& values) {
    const double m = mean(values);
    double sum = 0.0;
    for (double v : values) {
        sum += (v - m) * (v - m);
    }
    return sum;
}
}  // namespace

double sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    return std::sqrt(sum_squared_deviations(values) / static_cast<double>(values.size() - 1));
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::sqrt(sum_squared_deviations(values) / static_cast<double>(values.size()));
}

double safe_divide(double numerator, double denominator) {
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        return 0.0;
    }
    return numerator / denominator;
}

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

}  // namespace statistics
}  // namespace trade_journal
