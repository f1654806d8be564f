#pragma once

#include "bars/bar.hpp"

#include <cmath>
#include <cstdint>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>

enum class StructureDirection { BEAR = -1, NEUTRAL = 0, BULL = 1 };

enum class BreakType { NONE, BOS, CHOCH };

inline const char* to_string(StructureDirection d) {
    switch (d) {
        case StructureDirection::BULL:    return "BULL";
        case StructureDirection::BEAR:    return "BEAR";
        case StructureDirection::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

inline const char* to_string(BreakType b) {
    switch (b) {
        case BreakType::BOS:   return "BOS";
        case BreakType::CHOCH: return "CHOCH";
        case BreakType::NONE:  return "NONE";
    }
    return "NONE";
}

// ---------------------------------------------------------------------------
// StructureConfig
// ---------------------------------------------------------------------------
struct StructureConfig {
    int fractal_bars = 2;  // bars required on each side of a swing point

    int window() const { return 2 * fractal_bars + 1; }

    void validate() const {
        if (fractal_bars < 1) {
            throw std::invalid_argument("fractal_bars must be >= 1, got " +
                                        std::to_string(fractal_bars));
        }
    }
};

// ---------------------------------------------------------------------------
// StructureState — per-timeframe market structure after the latest bar
// ---------------------------------------------------------------------------
struct StructureState {
    StructureDirection direction = StructureDirection::NEUTRAL;
    double strong_level = std::numeric_limits<double>::quiet_NaN();  // reversal level
    double weak_level = std::numeric_limits<double>::quiet_NaN();    // continuation target
    BreakType last_break = BreakType::NONE;

    // Set only on the bar that produced a break.
    bool broke_this_bar = false;
    StructureDirection break_direction = StructureDirection::NEUTRAL;

    int bars_seen = 0;

    bool has_levels() const { return !std::isnan(strong_level) && !std::isnan(weak_level); }

    // A change of character against `trade_dir` happened on the latest bar.
    bool choch_against(StructureDirection trade_dir) const {
        return broke_this_bar && last_break == BreakType::CHOCH &&
               trade_dir != StructureDirection::NEUTRAL &&
               break_direction != trade_dir;
    }
};

// ---------------------------------------------------------------------------
// StructureDetector — incremental fractal swing detection with BOS / ChoCH
//
// A swing point at index i is confirmed when bar i + fractal_bars arrives.
// Only the latest unbroken swing high and swing low are tracked; a newer
// swing of the same polarity replaces the older one and a break consumes it.
// ---------------------------------------------------------------------------
class StructureDetector {
public:
    StructureDetector() = default;
    explicit StructureDetector(const StructureConfig& cfg) : cfg_(cfg) { cfg_.validate(); }

    const StructureState& update(const Bar& bar) {
        window_.push_back(bar);
        if (static_cast<int>(window_.size()) > cfg_.window()) {
            window_.pop_front();
        }
        state_.bars_seen++;
        state_.broke_this_bar = false;
        state_.break_direction = StructureDirection::NEUTRAL;

        if (static_cast<int>(window_.size()) == cfg_.window()) {
            confirm_swings();
        }

        if (!std::isnan(upper_) && bar.close > upper_) {
            apply_break(StructureDirection::BULL, upper_, bar);
            upper_ = NaN;
        }
        if (!std::isnan(lower_) && bar.close < lower_) {
            apply_break(StructureDirection::BEAR, lower_, bar);
            lower_ = NaN;
        }

        if (state_.direction == StructureDirection::BULL) {
            if (std::isnan(extreme_) || bar.high > extreme_) extreme_ = bar.high;
            state_.weak_level = extreme_;
            state_.strong_level = std::isnan(lower_) ? broken_level_ : lower_;
        } else if (state_.direction == StructureDirection::BEAR) {
            if (std::isnan(extreme_) || bar.low < extreme_) extreme_ = bar.low;
            state_.weak_level = extreme_;
            state_.strong_level = std::isnan(upper_) ? broken_level_ : upper_;
        }

        return state_;
    }

    const StructureState& state() const { return state_; }

    // Currently tracked, unbroken swing levels (NaN when none).
    double upper_fractal() const { return upper_; }
    double lower_fractal() const { return lower_; }

    void reset() {
        window_.clear();
        state_ = StructureState{};
        upper_ = NaN;
        lower_ = NaN;
        broken_level_ = NaN;
        extreme_ = NaN;
    }

private:
    static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    StructureConfig cfg_;
    std::deque<Bar> window_;
    StructureState state_;

    double upper_ = NaN;
    double lower_ = NaN;
    double broken_level_ = NaN;
    double extreme_ = NaN;

    void confirm_swings() {
        const int p = cfg_.fractal_bars;
        const Bar& pivot = window_[p];
        bool swing_high = true;
        bool swing_low = true;
        for (int j = 0; j < cfg_.window(); ++j) {
            if (j == p) continue;
            if (!(window_[j].high < pivot.high)) swing_high = false;
            if (!(window_[j].low > pivot.low)) swing_low = false;
        }
        if (swing_high) upper_ = pivot.high;
        if (swing_low) lower_ = pivot.low;
    }

    void apply_break(StructureDirection dir, double level, const Bar& bar) {
        // Breaking out of NEUTRAL counts as a change of character.
        state_.last_break = (state_.direction == dir) ? BreakType::BOS : BreakType::CHOCH;
        state_.direction = dir;
        state_.broke_this_bar = true;
        state_.break_direction = dir;
        broken_level_ = level;
        extreme_ = (dir == StructureDirection::BULL) ? bar.high : bar.low;
    }
};
