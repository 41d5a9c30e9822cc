// include/trade_journal/analytics/tilt_analyzer.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

/**
 * @brief Outcomes of trades that followed at least k consecutive losses
 */
struct StreakStats {
    int k = 0;
    int sample_size = 0;
    double win_rate_after_k_losses = 0.0;
    double avg_pnl_after_k_losses = 0.0;
    bool sufficient_sample = false;
};

struct TiltStats {
    int total_trades = 0;
    double baseline_win_rate = 0.0;
    double baseline_loss_rate = 0.0;
    double win_rate_after_loss = 0.0;
    double win_rate_after_win = 0.0;
    double win_rate_after_2_losses = 0.0;
    double avg_loss_normally = 0.0;    // Negative or 0
    double avg_loss_after_loss = 0.0;  // Negative or 0
    double prob_loss_after_loss = 0.0;
    double tilt_score = 0.0;  // 0..10
    std::string tilt_category;
    std::optional<int> recommended_streak;
    std::vector<StreakStats> streak_stats;
    std::vector<std::string> coaching_lines;
};

struct TiltOptions {
    int max_streak = 4;
    int min_sample = 10;
    int min_total_trades = 10;
    double win_drop_threshold = 0.15;
};

/**
 * @brief Measures how results change after losing trades
 *
 * Pairs are taken in exit order as one sequence across symbols and
 * strategies. Breakeven pairs are not outcomes: they are skipped in every
 * rate and they end a running loss streak.
 *
 * tilt_score = 4 * A + 3 * B + 3 * C, each term in [0, 1]:
 *   A = (baseline_win_rate - win_rate_after_loss) / 0.5
 *   B = |avg_loss_after_loss| / |avg_loss_normally| - 1
 *   C = (prob_loss_after_loss - baseline_loss_rate) / 0.5
 */
class TiltAnalyzer {
public:
    static constexpr const char* CATEGORY_INSUFFICIENT = "Insufficient Data";
    static constexpr const char* CATEGORY_CALM = "Calm & Disciplined";
    static constexpr const char* CATEGORY_MODERATE = "Moderate Tilt Risk";
    static constexpr const char* CATEGORY_HIGH = "High Tilt";

    explicit TiltAnalyzer(TiltOptions options = TiltOptions());

    TiltStats analyze(const std::vector<PairedTrade>& pairs) const;

    static std::string categorize(double tilt_score);

private:
    std::vector<std::string> build_coaching_lines(const TiltStats& stats) const;

    TiltOptions options_;
};

}  // namespace trade_journal
