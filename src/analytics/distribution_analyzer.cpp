// src/analytics/distribution_analyzer.cpp
#include "trade_journal/analytics/distribution_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>
#include <numeric>
#include <sstream>
#include "trade_journal/analytics/statistics_utils.hpp"

namespace trade_journal {

namespace {

std::string percent_text(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

std::string percent_label(double percent) {
    std::ostringstream oss;
    oss << percent << "%";
    return oss.str();
}

}  // namespace

DistributionAnalyzer::DistributionAnalyzer(int histogram_bins)
    : histogram_bins_(std::max(1, histogram_bins)) {}

Result<DistributionConcentration> DistributionAnalyzer::analyze(
    const std::vector<PairedTrade>& pairs, double concentration_percent) const {
    if (!std::isfinite(concentration_percent) ||
        concentration_percent < MIN_CONCENTRATION_PERCENT ||
        concentration_percent > MAX_CONCENTRATION_PERCENT) {
        std::ostringstream oss;
        oss << "Concentration percent must be between " << MIN_CONCENTRATION_PERCENT << " and "
            << MAX_CONCENTRATION_PERCENT << ", got " << concentration_percent;
        return make_error<DistributionConcentration>(ErrorCode::INVALID_CONCENTRATION, oss.str(),
                                                     "DistributionAnalyzer");
    }

    DistributionConcentration result;
    ConcentrationStats& stats = result.concentration;
    stats.concentration_percent = concentration_percent;

    if (pairs.empty()) {
        stats.insights.push_back("No trades in the selected timeframe.");
        return Result<DistributionConcentration>(std::move(result));
    }

    std::vector<double> values;
    std::vector<double> winners;
    std::vector<double> losers;
    values.reserve(pairs.size());
    for (const auto& pair : pairs) {
        values.push_back(pair.net_pnl);
        if (pair.net_pnl > 0.0) {
            winners.push_back(pair.net_pnl);
        } else if (pair.net_pnl < 0.0) {
            losers.push_back(pair.net_pnl);
        }
    }

    result.histogram = build_histogram(values);

    stats.total_trades = static_cast<int>(values.size());
    stats.profitable_trades_count = static_cast<int>(winners.size());
    stats.losing_trades_count = static_cast<int>(losers.size());
    stats.mean_return = statistics::mean(values);
    stats.median_return = statistics::median(values);

    // ========== Concentration ==========

    std::sort(winners.begin(), winners.end(), std::greater<double>());
    std::sort(losers.begin(), losers.end());

    stats.top_k_profit = top_count(concentration_percent, stats.profitable_trades_count);
    stats.top_k_loss = top_count(concentration_percent, stats.losing_trades_count);

    const double total_profit = std::accumulate(winners.begin(), winners.end(), 0.0);
    const double total_loss = std::accumulate(losers.begin(), losers.end(), 0.0);
    const double top_profit =
        std::accumulate(winners.begin(), winners.begin() + stats.top_k_profit, 0.0);
    const double top_loss = std::accumulate(losers.begin(), losers.begin() + stats.top_k_loss, 0.0);

    stats.profit_share_top = statistics::safe_divide(top_profit, total_profit);
    stats.loss_share_top = statistics::safe_divide(top_loss, total_loss);
    stats.stability_score = stability_score(stats.profit_share_top, winners);
    stats.insights = build_insights(stats);

    return Result<DistributionConcentration>(std::move(result));
}

std::vector<HistogramBin> DistributionAnalyzer::build_histogram(
    const std::vector<double>& values) const {
    std::vector<HistogramBin> bins;
    if (values.empty()) {
        return bins;
    }

    const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double low = *min_it;
    const double high = *max_it;

    if (high <= low) {
        HistogramBin single;
        single.bin_start = low;
        single.bin_end = high;
        single.count = static_cast<int>(values.size());
        single.total_pnl = std::accumulate(values.begin(), values.end(), 0.0);
        bins.push_back(single);
        return bins;
    }

    // Edges and positions stay finite when the span overflows or is subnormal
    const double span = high - low;
    auto edge = [&](int i) {
        const double t = static_cast<double>(i) / histogram_bins_;
        return low * (1.0 - t) + high * t;
    };
    bins.resize(histogram_bins_);
    for (int i = 0; i < histogram_bins_; ++i) {
        bins[i].bin_start = edge(i);
        bins[i].bin_end = i == histogram_bins_ - 1 ? high : edge(i + 1);
    }

    // Bins are half-open except the last, which also takes the maximum
    for (double value : values) {
        const double position = std::isfinite(span)
                                    ? (value - low) / span
                                    : (value / 2.0 - low / 2.0) / (high / 2.0 - low / 2.0);
        int index = std::isfinite(position)
                        ? static_cast<int>(std::floor(std::min(position, 1.0) * histogram_bins_))
                        : histogram_bins_ - 1;
        index = std::min(std::max(index, 0), histogram_bins_ - 1);
        bins[index].count++;
        bins[index].total_pnl += value;
    }
    return bins;
}

int DistributionAnalyzer::top_count(double concentration_percent, int count) {
    if (count <= 0) {
        return 0;
    }
    const double raw = concentration_percent * count / 100.0;
    const int k = static_cast<int>(std::ceil(raw - 1e-9));
    return std::min(std::max(k, 1), count);
}

double DistributionAnalyzer::stability_score(double profit_share_top,
                                             const std::vector<double>& winning_returns) {
    if (winning_returns.empty()) {
        return 100.0;
    }
    const double cv = statistics::safe_divide(statistics::population_stddev(winning_returns),
                                              statistics::mean(winning_returns));
    const double dispersion = cv / (1.0 + cv);
    const double score = 100.0 * (1.0 - 0.6 * profit_share_top - 0.4 * dispersion);
    return statistics::clamp(score, 0.0, 100.0);
}

std::vector<std::string> DistributionAnalyzer::build_insights(
    const ConcentrationStats& stats) const {
    std::vector<std::string> insights;
    const std::string top = percent_label(stats.concentration_percent);

    if (stats.total_trades < LIMITED_SAMPLE_TRADES) {
        insights.push_back("Limited data: results may be noisy with fewer than 30 trades.");
    }

    if (stats.profitable_trades_count > 0) {
        const std::string share = percent_text(stats.profit_share_top);
        if (stats.profit_share_top < 0.2) {
            insights.push_back("Your profits are well distributed. The top " + top +
                               " of winning trades account for " + share + " of total profit.");
        } else if (stats.profit_share_top <= 0.4) {
            insights.push_back("Your profits show moderate concentration. The top " + top +
                               " of winning trades generate " + share + " of total profit.");
        } else if (stats.profit_share_top <= 0.7) {
            insights.push_back("A small group of trades generates a large share of profits. The top " +
                               top + " of winning trades produce " + share +
                               " of total profit. Consider systematizing the conditions of your "
                               "best trades.");
        } else {
            insights.push_back("Severe profit concentration: the top " + top +
                               " of winning trades generate " + share +
                               " of total profit. Without them the equity curve would be much "
                               "flatter.");
        }
    }

    if (stats.losing_trades_count > 0) {
        const std::string share = percent_text(stats.loss_share_top);
        if (stats.loss_share_top < 0.2) {
            insights.push_back("Your losses are well distributed. The worst " + top +
                               " of losing trades account for " + share + " of total loss.");
        } else if (stats.loss_share_top <= 0.5) {
            insights.push_back("Your losses show moderate concentration. The worst " + top +
                               " of losing trades account for " + share + " of total loss.");
        } else if (stats.loss_share_top <= 0.7) {
            insights.push_back("A small group of bad trades is responsible for most of your "
                               "drawdowns. The worst " +
                               top + " of losing trades account for " + share +
                               " of total loss. Tightening risk controls could stabilize your "
                               "equity.");
        } else {
            insights.push_back("Severe loss concentration: the worst " + top +
                               " of losing trades cause " + share +
                               " of total loss. Consider hard stop rules or daily loss limits.");
        }
    }

    const double mean_abs = std::abs(stats.mean_return);
    const double median_abs = std::max(std::abs(stats.median_return), 0.01);
    if (stats.mean_return != 0.0 && mean_abs / median_abs >= 1.5) {
        insights.push_back("Median and average returns differ significantly, suggesting results "
                           "are skewed by a few large winners or losers.");
    } else if (std::abs(stats.mean_return - stats.median_return) < mean_abs * 0.1) {
        insights.push_back("Median and average returns are closely aligned, indicating consistent "
                           "returns rather than rare outlier events.");
    }

    if (stats.stability_score >= 80.0) {
        insights.push_back("Your performance is broadly supported by many trades rather than a "
                           "few outliers.");
    } else if (stats.stability_score < 50.0) {
        insights.push_back("Your results show high variance and instability. Focus on replicating "
                           "your best setups while capping downside on the worst trades.");
    }

    return insights;
}

}  // namespace trade_journal
