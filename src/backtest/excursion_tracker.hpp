#pragma once

#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "data/zone.hpp"
#include "health/health_scorer.hpp"

#include <cstdint>

// ---------------------------------------------------------------------------
// ExcursionTracker — running MFE / MAE for one open trade
//
// Both extremes start at the entry price at offset 0. A bar moves an extreme
// only on strict improvement; ties keep the earlier bar.
// ---------------------------------------------------------------------------
class ExcursionTracker {
public:
    ExcursionTracker(Direction dir, double entry_price, uint64_t entry_ts,
                     const HealthScore& entry_health)
        : dir_(dir) {
        mfe_ = Excursion{entry_price, entry_ts, 0, entry_health};
        mae_ = mfe_;
    }

    void update(const Bar& bar, int bar_offset, const HealthScore& health) {
        double favorable = (dir_ == Direction::LONG) ? bar.high : bar.low;
        double adverse = (dir_ == Direction::LONG) ? bar.low : bar.high;
        double s = static_cast<double>(sign(dir_));

        if ((favorable - mfe_.price) * s > 0.0) {
            mfe_ = Excursion{favorable, bar.close_ts, bar_offset, health};
        }
        if ((mae_.price - adverse) * s > 0.0) {
            mae_ = Excursion{adverse, bar.close_ts, bar_offset, health};
        }
    }

    // Same-bar and adjacent-bar trades: favourable excursion is attributed to
    // the entry instant, adverse excursion to the exit instant.
    void finalize(uint64_t entry_ts, uint64_t exit_ts, int bars_held) {
        if (bars_held > 1) return;
        mfe_.ts = entry_ts;
        mfe_.bar_offset = 0;
        mae_.ts = exit_ts;
        mae_.bar_offset = bars_held;
    }

    const Excursion& mfe() const { return mfe_; }
    const Excursion& mae() const { return mae_; }

private:
    Direction dir_;
    Excursion mfe_;
    Excursion mae_;
};
