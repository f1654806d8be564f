#pragma once

#include "backtest/trade_record.hpp"

#include <cmath>
#include <map>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestResult — aggregate statistics over closed trades, in R
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::vector<Trade> trades;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double total_r = 0.0;
    double total_pnl = 0.0;      // per share
    double expectancy_r = 0.0;
    double profit_factor = 0.0;
    double max_drawdown_r = 0.0;
    double sharpe = 0.0;         // per trade
    double avg_bars_held = 0.0;
    double avg_entry_health = 0.0;
    double trades_per_session = 0.0;
    std::map<ExitReason, int> exit_reason_counts;
    std::map<ModelTag, int> model_counts;
    std::vector<double> session_r;
};

// ---------------------------------------------------------------------------
// BacktestResult utilities — shared by per-session and multi-session summaries
// ---------------------------------------------------------------------------
namespace backtest_util {

inline void compute_max_drawdown(BacktestResult& result) {
    if (result.trades.empty()) return;
    double peak = 0.0;
    double equity = 0.0;
    double max_dd = 0.0;
    for (const auto& trade : result.trades) {
        equity += trade.r_multiple;
        if (equity > peak) peak = equity;
        double dd = peak - equity;
        if (dd > max_dd) max_dd = dd;
    }
    result.max_drawdown_r = max_dd;
}

inline void compute_sharpe(BacktestResult& result) {
    if (result.trades.size() < 2) return;
    double n = static_cast<double>(result.trades.size());
    double mean = result.total_r / n;
    double sum_sq = 0.0;
    for (const auto& trade : result.trades) {
        double diff = trade.r_multiple - mean;
        sum_sq += diff * diff;
    }
    double stddev = std::sqrt(sum_sq / (n - 1.0));
    if (stddev > 0.0) {
        result.sharpe = mean / stddev;
    }
}

// Recompute every derived field from result.trades. Leaves session_r alone.
inline void recompute_derived(BacktestResult& agg, int active_sessions) {
    agg.total_trades = static_cast<int>(agg.trades.size());
    agg.winning_trades = 0;
    agg.losing_trades = 0;
    agg.total_r = 0.0;
    agg.total_pnl = 0.0;
    agg.exit_reason_counts.clear();
    agg.model_counts.clear();

    double gross_wins = 0.0;
    double gross_losses = 0.0;
    double sum_bars = 0.0;
    double sum_health = 0.0;
    for (const auto& trade : agg.trades) {
        agg.total_r += trade.r_multiple;
        agg.total_pnl += trade.pnl;
        sum_bars += static_cast<double>(trade.bars_held);
        sum_health += static_cast<double>(trade.entry_health.score);

        if (trade.is_winner) {
            agg.winning_trades++;
            gross_wins += trade.r_multiple;
        } else {
            agg.losing_trades++;
            gross_losses += std::abs(trade.r_multiple);
        }
        agg.exit_reason_counts[trade.exit_reason]++;
        agg.model_counts[trade.model]++;
    }

    agg.win_rate = 0.0;
    agg.expectancy_r = 0.0;
    agg.avg_bars_held = 0.0;
    agg.avg_entry_health = 0.0;
    if (agg.total_trades > 0) {
        double n = static_cast<double>(agg.total_trades);
        agg.win_rate = static_cast<double>(agg.winning_trades) / n;
        agg.expectancy_r = agg.total_r / n;
        agg.avg_bars_held = sum_bars / n;
        agg.avg_entry_health = sum_health / n;
    }

    agg.profit_factor = gross_losses > 0.0 ? gross_wins / gross_losses : 0.0;

    agg.trades_per_session = 0.0;
    if (active_sessions > 0) {
        agg.trades_per_session = static_cast<double>(agg.total_trades)
                                 / static_cast<double>(active_sessions);
    }

    agg.max_drawdown_r = 0.0;
    agg.sharpe = 0.0;
    compute_max_drawdown(agg);
    compute_sharpe(agg);
}

inline BacktestResult summarize(const std::vector<Trade>& trades) {
    BacktestResult result{};
    result.trades = trades;
    recompute_derived(result, 1);
    result.session_r.push_back(result.total_r);
    return result;
}

}  // namespace backtest_util
