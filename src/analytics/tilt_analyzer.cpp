// src/analytics/tilt_analyzer.cpp
#include "trade_journal/analytics/tilt_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "trade_journal/analytics/metrics_calculator.hpp"
#include "trade_journal/analytics/statistics_utils.hpp"

namespace trade_journal {

namespace {

constexpr double MAX_WIN_RATE_DROP = 0.5;

enum class Outcome { NONE, WIN, LOSS };

struct ConditionalCount {
    int total = 0;
    int wins = 0;
    double pnl_sum = 0.0;

    void add(double pnl) {
        total++;
        pnl_sum += pnl;
        if (pnl > 0.0) {
            wins++;
        }
    }

    double win_rate(double fallback) const {
        return total > 0 ? static_cast<double>(wins) / total : fallback;
    }
};

std::string pct(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

}  // namespace

TiltAnalyzer::TiltAnalyzer(TiltOptions options) : options_(options) {
    options_.max_streak = std::max(1, options_.max_streak);
}

TiltStats TiltAnalyzer::analyze(const std::vector<PairedTrade>& pairs) const {
    TiltStats stats;
    stats.total_trades = static_cast<int>(pairs.size());

    const std::vector<PairedTrade> ordered = MetricsCalculator::sort_by_exit(pairs);

    int wins = 0;
    int losses = 0;
    double loss_sum = 0.0;

    ConditionalCount after_loss;
    ConditionalCount after_win;
    int losses_after_loss = 0;
    double loss_sum_after_loss = 0.0;
    std::vector<ConditionalCount> after_k(options_.max_streak + 1);
    ConditionalCount after_two;

    Outcome previous = Outcome::NONE;
    int loss_run = 0;

    for (const auto& pair : ordered) {
        const double pnl = pair.net_pnl;
        if (pnl == 0.0) {
            previous = Outcome::NONE;
            loss_run = 0;
            continue;
        }

        if (previous == Outcome::LOSS) {
            after_loss.add(pnl);
            if (pnl < 0.0) {
                losses_after_loss++;
                loss_sum_after_loss += pnl;
            }
        } else if (previous == Outcome::WIN) {
            after_win.add(pnl);
        }
        if (loss_run >= 2) {
            after_two.add(pnl);
        }
        for (int k = 1; k <= options_.max_streak && k <= loss_run; ++k) {
            after_k[k].add(pnl);
        }

        if (pnl > 0.0) {
            wins++;
            previous = Outcome::WIN;
            loss_run = 0;
        } else {
            losses++;
            loss_sum += pnl;
            previous = Outcome::LOSS;
            loss_run++;
        }
    }

    const int decided = wins + losses;
    stats.baseline_win_rate = statistics::safe_divide(wins, decided);
    stats.baseline_loss_rate = statistics::safe_divide(losses, decided);
    stats.avg_loss_normally = statistics::safe_divide(loss_sum, losses);

    stats.win_rate_after_loss = after_loss.win_rate(stats.baseline_win_rate);
    stats.win_rate_after_win = after_win.win_rate(stats.baseline_win_rate);
    stats.win_rate_after_2_losses = after_two.win_rate(stats.baseline_win_rate);
    stats.avg_loss_after_loss = losses_after_loss > 0 ? loss_sum_after_loss / losses_after_loss
                                                      : stats.avg_loss_normally;
    stats.prob_loss_after_loss = statistics::safe_divide(losses_after_loss, after_loss.total);

    // ========== Streak Statistics ==========

    for (int k = 1; k <= options_.max_streak; ++k) {
        StreakStats streak;
        streak.k = k;
        streak.sample_size = after_k[k].total;
        streak.win_rate_after_k_losses = after_k[k].win_rate(0.0);
        streak.avg_pnl_after_k_losses = statistics::safe_divide(after_k[k].pnl_sum, after_k[k].total);
        streak.sufficient_sample = streak.sample_size >= options_.min_sample;
        stats.streak_stats.push_back(streak);

        if (!stats.recommended_streak && streak.sufficient_sample &&
            stats.baseline_win_rate - streak.win_rate_after_k_losses >=
                options_.win_drop_threshold) {
            stats.recommended_streak = k;
        }
    }

    // Rates and streak samples above are reported at any size; scoring needs enough history
    if (stats.total_trades < options_.min_total_trades) {
        stats.recommended_streak.reset();
        stats.tilt_category = CATEGORY_INSUFFICIENT;
        stats.coaching_lines.push_back("Not enough trade history to evaluate tilt yet. Need at least " +
                                       std::to_string(options_.min_total_trades) + " trades.");
        return stats;
    }

    // ========== Score ==========

    const double drop_term = statistics::clamp(
        (stats.baseline_win_rate - stats.win_rate_after_loss) / MAX_WIN_RATE_DROP, 0.0, 1.0);

    double growth_term = 0.0;
    if (stats.avg_loss_normally < 0.0 && stats.avg_loss_after_loss < 0.0) {
        growth_term = statistics::clamp(
            std::abs(stats.avg_loss_after_loss) / std::abs(stats.avg_loss_normally) - 1.0, 0.0,
            1.0);
    }

    const double chain_term = statistics::clamp(
        (stats.prob_loss_after_loss - stats.baseline_loss_rate) / MAX_WIN_RATE_DROP, 0.0, 1.0);

    stats.tilt_score =
        statistics::clamp(4.0 * drop_term + 3.0 * growth_term + 3.0 * chain_term, 0.0, 10.0);
    stats.tilt_category = categorize(stats.tilt_score);
    stats.coaching_lines = build_coaching_lines(stats);

    return stats;
}

std::string TiltAnalyzer::categorize(double tilt_score) {
    if (tilt_score <= 3.0) {
        return CATEGORY_CALM;
    }
    if (tilt_score <= 7.0) {
        return CATEGORY_MODERATE;
    }
    return CATEGORY_HIGH;
}

std::vector<std::string> TiltAnalyzer::build_coaching_lines(const TiltStats& stats) const {
    std::vector<std::string> lines;

    if (stats.tilt_score <= 3.0) {
        lines.push_back("Your performance after losing trades is similar to your baseline. "
                        "There is no strong evidence of emotional tilt.");
        lines.push_back("You win " + pct(stats.baseline_win_rate) + " of trades overall and " +
                        pct(stats.win_rate_after_loss) + " after a loss.");
        if (stats.recommended_streak) {
            lines.push_back("Your win rate still drops after " +
                            std::to_string(*stats.recommended_streak) +
                            " losses in a row. Consider pausing at that point.");
        } else {
            lines.push_back("A fixed 'stop after N losses' rule is optional for you. A standard "
                            "daily loss cap is likely sufficient.");
        }
    } else if (stats.tilt_score <= 7.0) {
        lines.push_back("Your performance degrades after losing trades, but not catastrophically.");
        lines.push_back("Your win rate drops from " + pct(stats.baseline_win_rate) + " to " +
                        pct(stats.win_rate_after_loss) +
                        " after a loss, and the chance of another loss after losing is " +
                        pct(stats.prob_loss_after_loss) + ".");
        if (stats.recommended_streak) {
            lines.push_back("Consider stopping for the day after " +
                            std::to_string(*stats.recommended_streak) +
                            " losing trades in a row.");
        } else {
            lines.push_back("No single streak length stands out as a clear cutoff. Watch your "
                            "behavior after losses and enforce a daily loss cap.");
        }
    } else {
        lines.push_back("Your trading shows strong signs of emotional tilt after losses.");
        lines.push_back("Your win rate falls from " + pct(stats.baseline_win_rate) + " to " +
                        pct(stats.win_rate_after_loss) + " after a loss, and to " +
                        pct(stats.win_rate_after_2_losses) + " after two losses in a row.");
        if (stats.avg_loss_after_loss < stats.avg_loss_normally) {
            lines.push_back("Your average loss becomes larger after losing, which suggests "
                            "revenge trading or loss of discipline.");
        }
        if (stats.recommended_streak) {
            lines.push_back("Set a hard rule to stop trading for the day after " +
                            std::to_string(*stats.recommended_streak) +
                            " consecutive losing trades.");
        }
        lines.push_back("Use a fixed maximum daily loss and reduce position size after a loss.");
    }

    return lines;
}

}  // namespace trade_journal
