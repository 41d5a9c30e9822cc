// include/trade_journal/analytics/statistics_utils.hpp
#pragma once

#include <vector>

namespace trade_journal {
namespace statistics {

double mean(const std::vector<double>& values);

/**
 * @brief Median, averaging the two middle values for even counts; 0 when empty
 */
double median(std::vector<double> values);

/**
 * @brief Sample standard deviation (n - 1); 0 with fewer than two values
 */
double sample_stddev(const std::vector<double>& values);

/**
 * @brief Population standard deviation (n); 0 when empty
 */
double population_stddev(const std::vector<double>& values);

/**
 * @brief numerator / denominator, or 0 when the denominator is 0
 */
double safe_divide(double numerator, double denominator);

double clamp(double value, double low, double high);

}  // namespace statistics
}  // namespace trade_journal
