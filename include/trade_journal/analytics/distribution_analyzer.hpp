// include/trade_journal/analytics/distribution_analyzer.hpp
#pragma once

#include <string>
#include <vector>
#include "trade_journal/core/error.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

struct HistogramBin {
    double bin_start = 0.0;
    double bin_end = 0.0;
    int count = 0;
    double total_pnl = 0.0;
};

/**
 * @brief How much of the result comes from the best and worst few trades
 */
struct ConcentrationStats {
    int total_trades = 0;
    int profitable_trades_count = 0;
    int losing_trades_count = 0;
    double concentration_percent = 0.0;
    int top_k_profit = 0;
    int top_k_loss = 0;
    double profit_share_top = 0.0;  // 0..1
    double loss_share_top = 0.0;    // 0..1
    double mean_return = 0.0;
    double median_return = 0.0;
    double stability_score = 100.0;  // 0..100
    std::vector<std::string> insights;
};

struct DistributionConcentration {
    std::vector<HistogramBin> histogram;
    ConcentrationStats concentration;
};

/**
 * @brief Histogram and concentration analysis of net P&L per pair
 *
 * stability_score = 100 * (1 - 0.6 * profit_share_top - 0.4 * cv / (1 + cv)),
 * clamped to [0, 100], where cv is the population coefficient of variation
 * of the winning returns. With no winners it is 100.
 */
class DistributionAnalyzer {
public:
    static constexpr double MIN_CONCENTRATION_PERCENT = 5.0;
    static constexpr double MAX_CONCENTRATION_PERCENT = 30.0;
    static constexpr int LIMITED_SAMPLE_TRADES = 30;

    explicit DistributionAnalyzer(int histogram_bins = 20);

    /**
     * @brief Analyze a pair set
     * @param pairs Date-filtered pairs
     * @param concentration_percent Share of winners (and losers) counted as "top", 5..30
     * @return Analysis or INVALID_CONCENTRATION
     */
    Result<DistributionConcentration> analyze(const std::vector<PairedTrade>& pairs,
                                              double concentration_percent) const;

    std::vector<HistogramBin> build_histogram(const std::vector<double>& values) const;

    /**
     * @brief Number of trades in the top group: ceil(percent / 100 * count)
     */
    static int top_count(double concentration_percent, int count);

    static double stability_score(double profit_share_top, const std::vector<double>& winning_returns);

private:
    std::vector<std::string> build_insights(const ConcentrationStats& stats) const;

    int histogram_bins_;
};

}  // namespace trade_journal
