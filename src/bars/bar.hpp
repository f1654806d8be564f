#pragma once

#include "time_utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar — one OHLCV sample at a fixed timeframe
// ---------------------------------------------------------------------------
struct Bar {
    // Temporal fields (UTC nanoseconds; close_ts is exclusive bar end)
    uint64_t open_ts = 0;
    uint64_t close_ts = 0;

    // OHLCV fields
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    uint64_t volume = 0;

    double range() const { return high - low; }

    double typical_price() const { return (high + low + close) / 3.0; }
};

// ---------------------------------------------------------------------------
// Timeframe — named fixed interval ("M5", "H1", ...)
// ---------------------------------------------------------------------------
struct Timeframe {
    std::string name;
    uint64_t interval_s = 300;

    uint64_t interval_ns() const { return interval_s * time_utils::NS_PER_SEC; }

    // Bucket start for a timestamp. Buckets are anchored at ET midnight so
    // that M5/M15/H1 boundaries line up with the session clock.
    uint64_t bucket_start(uint64_t ts) const {
        uint64_t midnight = time_utils::midnight_et_ns(ts);
        uint64_t since = ts - midnight;
        return midnight + (since / interval_ns()) * interval_ns();
    }
};

namespace timeframes {

inline Timeframe m5()  { return {"M5", 300}; }
inline Timeframe m15() { return {"M15", 900}; }
inline Timeframe h1()  { return {"H1", 3600}; }
inline Timeframe h4()  { return {"H4", 14400}; }

// Default higher-timeframe stack for the structure-alignment health factors,
// coarsest first.
inline std::vector<Timeframe> default_stack() { return {h4(), h1(), m15(), m5()}; }

}  // namespace timeframes
