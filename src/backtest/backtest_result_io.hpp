#pragma once

#include "backtest/backtest_result.hpp"
#include "backtest/session_runner.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"

#include <array>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

// Finite numbers at fixed significant digits; NaN / inf as null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss.precision(10);
    ss << v;
    return ss.str();
}

inline std::string factors_json(const std::array<bool, HEALTH_FACTOR_COUNT>& factors) {
    std::ostringstream ss;
    ss << "{";
    for (int i = 0; i < HEALTH_FACTOR_COUNT; ++i) {
        if (i > 0) ss << ",";
        ss << "\"" << health_factor::name(i) << "\":" << (factors[i] ? "true" : "false");
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Trade& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"id\":\"" << json_escape(t.id) << "\"";
    ss << ",\"ticker\":\"" << json_escape(t.ticker) << "\"";
    ss << ",\"zone_id\":\"" << json_escape(t.zone_id) << "\"";
    ss << ",\"zone_high\":" << json_number(t.zone_high);
    ss << ",\"zone_low\":" << json_number(t.zone_low);
    ss << ",\"zone_rank\":\"" << to_string(t.zone_rank) << "\"";
    ss << ",\"direction\":\"" << to_string(t.direction) << "\"";
    ss << ",\"model\":\"" << to_string(t.model) << "\"";
    ss << ",\"origin\":\"" << to_string(t.origin) << "\"";
    ss << ",\"entry_price\":" << json_number(t.entry_price);
    ss << ",\"entry_ts\":" << t.entry_ts;
    ss << ",\"entry_time\":\"" << time_utils::clock_string(t.entry_ts) << "\"";
    ss << ",\"entry_bar_idx\":" << t.entry_bar_idx;
    ss << ",\"stop_price\":" << json_number(t.stop_price);
    ss << ",\"risk\":" << json_number(t.risk);
    ss << ",\"r_target\":" << json_number(t.r_target);
    ss << ",\"target\":" << json_number(t.target);
    ss << ",\"target_kind\":\"" << to_string(t.target_kind) << "\"";
    ss << ",\"entry_health\":" << t.entry_health.score;
    ss << ",\"entry_tier\":\"" << to_string(t.entry_health.tier()) << "\"";
    ss << ",\"mfe_price\":" << json_number(t.mfe.price);
    ss << ",\"mfe_ts\":" << t.mfe.ts;
    ss << ",\"mfe_bar_offset\":" << t.mfe.bar_offset;
    ss << ",\"mfe_r\":" << json_number(t.mfe_r());
    ss << ",\"mae_price\":" << json_number(t.mae.price);
    ss << ",\"mae_ts\":" << t.mae.ts;
    ss << ",\"mae_bar_offset\":" << t.mae.bar_offset;
    ss << ",\"mae_r\":" << json_number(t.mae_r());
    ss << ",\"exit_reason\":\"" << to_string(t.exit_reason) << "\"";
    ss << ",\"exit_price\":" << json_number(t.exit_price);
    ss << ",\"exit_ts\":" << t.exit_ts;
    ss << ",\"exit_time\":\"" << time_utils::clock_string(t.exit_ts) << "\"";
    ss << ",\"exit_bar_idx\":" << t.exit_bar_idx;
    ss << ",\"exit_health\":" << t.exit_health.score;
    ss << ",\"bars_held\":" << t.bars_held;
    ss << ",\"pnl\":" << json_number(t.pnl);
    ss << ",\"r_multiple\":" << json_number(t.r_multiple);
    ss << ",\"is_winner\":" << (t.is_winner ? "true" : "false");
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Event& e) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"trade_id\":\"" << json_escape(e.trade_id) << "\"";
    ss << ",\"sequence\":" << e.sequence;
    ss << ",\"type\":\"" << to_string(e.type) << "\"";
    ss << ",\"ts\":" << e.ts;
    ss << ",\"time\":\"" << time_utils::clock_string(e.ts) << "\"";
    ss << ",\"bar_offset\":" << e.bar_offset;
    ss << ",\"price\":" << json_number(e.price);
    ss << ",\"health_score\":" << e.health_score;
    ss << ",\"health_delta\":" << e.health_delta;
    ss << ",\"factors\":" << factors_json(e.factors);
    ss << "}";
    return ss.str();
}

inline std::string summary_fields(const BacktestResult& r) {
    std::ostringstream ss;
    ss << "\"total_trades\":" << r.total_trades;
    ss << ",\"winning_trades\":" << r.winning_trades;
    ss << ",\"losing_trades\":" << r.losing_trades;
    ss << ",\"win_rate\":" << json_number(r.win_rate);
    ss << ",\"total_r\":" << json_number(r.total_r);
    ss << ",\"total_pnl\":" << json_number(r.total_pnl);
    ss << ",\"expectancy_r\":" << json_number(r.expectancy_r);
    ss << ",\"profit_factor\":" << json_number(r.profit_factor);
    ss << ",\"max_drawdown_r\":" << json_number(r.max_drawdown_r);
    ss << ",\"sharpe\":" << json_number(r.sharpe);
    ss << ",\"avg_bars_held\":" << json_number(r.avg_bars_held);
    ss << ",\"avg_entry_health\":" << json_number(r.avg_entry_health);
    ss << ",\"trades_per_session\":" << json_number(r.trades_per_session);

    ss << ",\"exit_reasons\":{";
    bool first = true;
    for (const auto& [reason, count] : r.exit_reason_counts) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << to_string(reason) << "\":" << count;
    }
    ss << "}";

    ss << ",\"models\":{";
    first = true;
    for (const auto& [model, count] : r.model_counts) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << to_string(model) << "\":" << count;
    }
    ss << "}";
    return ss.str();
}

// Serialize aggregate statistics (trades omitted)
inline std::string to_json(const BacktestResult& result) {
    return "{" + summary_fields(result) + "}";
}

// Serialize one session: counters, trades and the full event log
inline std::string to_json(const SessionResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"ticker\":\"" << json_escape(r.spec.ticker) << "\"";
    ss << ",\"date\":" << r.spec.date;
    ss << ",\"bars_processed\":" << r.bars_processed;
    ss << ",\"zones_total\":" << r.zones_total;
    ss << ",\"skipped_zones\":" << r.skipped_zones;
    ss << ",\"entry_evaluations\":" << r.entry_evaluations;
    ss << ",\"skipped_evaluations\":" << r.skipped_evaluations;
    ss << ",\"skipped_min_risk\":" << r.skipped_min_risk;

    ss << ",\"trades\":[";
    for (size_t i = 0; i < r.trades.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.trades[i]);
    }
    ss << "]";

    ss << ",\"events\":[";
    for (size_t i = 0; i < r.events.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.events[i]);
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Serialize a run: per-session outcomes plus the aggregate
inline std::string to_json(const std::vector<SessionOutcome>& outcomes,
                           const BacktestResult& aggregate) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"summary\":" << to_json(aggregate);
    ss << ",\"sessions\":[";
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& o = outcomes[i];
        ss << "{";
        ss << "\"ticker\":\"" << json_escape(o.spec.ticker) << "\"";
        ss << ",\"date\":" << o.spec.date;
        ss << ",\"bar_count\":" << o.bar_count;
        ss << ",\"skipped\":" << (o.skipped ? "true" : "false");
        if (o.skipped) ss << ",\"skip_reason\":\"" << json_escape(o.skip_reason) << "\"";
        ss << ",\"halted\":" << (o.halted ? "true" : "false");
        if (o.halted) {
            ss << ",\"diagnostic\":\"" << json_escape(o.diagnostic) << "\"";
            ss << ",\"halted_trade_id\":\"" << json_escape(o.halted_trade_id) << "\"";
            ss << ",\"halted_bar_index\":" << o.halted_bar_index;
        }
        if (o.result) {
            ss << ",\"summary\":" << to_json(o.summary);
            ss << ",\"result\":" << to_json(*o.result);
        }
        ss << "}";
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

}  // namespace backtest_io
