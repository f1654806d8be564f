#pragma once

#include "bars/bar.hpp"
#include "data/zone.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SessionSpec — one (ticker, trading day) with its wall-clock boundaries
// ---------------------------------------------------------------------------
struct SessionSpec {
    std::string ticker;
    int date = 0;  // YYYYMMDD, ET

    uint64_t session_start_ns = 0;
    uint64_t session_end_ns = 0;
    uint64_t entry_start_ns = 0;  // inclusive
    uint64_t entry_end_ns = 0;    // inclusive
    uint64_t force_exit_ns = 0;

    // US equity regular hours: 09:30-16:00, entries 09:30-15:45, force exit 15:50.
    static SessionSpec regular(const std::string& ticker, int date) {
        SessionSpec s;
        s.ticker = ticker;
        s.date = date;
        s.session_start_ns = time_utils::et_clock_ns(date, 9, 30);
        s.session_end_ns = time_utils::et_clock_ns(date, 16, 0);
        s.entry_start_ns = time_utils::et_clock_ns(date, 9, 30);
        s.entry_end_ns = time_utils::et_clock_ns(date, 15, 45);
        s.force_exit_ns = time_utils::et_clock_ns(date, 15, 50);
        return s;
    }

    bool in_session(uint64_t ts) const { return ts >= session_start_ns && ts <= session_end_ns; }

    bool in_entry_window(uint64_t ts) const { return ts >= entry_start_ns && ts <= entry_end_ns; }

    void validate() const {
        if (ticker.empty()) throw std::invalid_argument("SessionSpec: empty ticker");
        if (session_end_ns <= session_start_ns) {
            throw std::invalid_argument("SessionSpec: session end must follow session start");
        }
        if (entry_start_ns > entry_end_ns || entry_start_ns < session_start_ns ||
            entry_end_ns > session_end_ns) {
            throw std::invalid_argument("SessionSpec: entry window outside the session");
        }
        if (force_exit_ns < session_start_ns || force_exit_ns > session_end_ns) {
            throw std::invalid_argument("SessionSpec: force exit outside the session");
        }
        if (entry_end_ns > force_exit_ns) {
            throw std::invalid_argument("SessionSpec: entry window extends past force exit");
        }
    }
};

// ---------------------------------------------------------------------------
// SessionInput — everything one simulation pass consumes
//
// `bars` is the trigger series. It may begin before session_start_ns so that
// structure and indicators are warm by the open. `htf_bars` optionally
// supplies higher-timeframe series keyed by Timeframe::name; any timeframe
// not supplied is aggregated from the trigger bars.
// ---------------------------------------------------------------------------
struct SessionInput {
    SessionSpec spec;
    std::vector<Bar> bars;
    std::vector<Zone> zones;
    std::map<std::string, std::vector<Bar>> htf_bars;
};
