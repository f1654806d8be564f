#pragma once

#include "data/zone.hpp"
#include "entry/entry_classifier.hpp"
#include "health/health_scorer.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

enum class ExitReason { STOP, TARGET, CHOCH, EOD };

// Declaration order is the tie-break rank for events sharing a timestamp.
enum class EventType { ENTRY, HEALTH_CHANGE, MFE, MAE, EXIT };

inline const char* to_string(ExitReason r) {
    switch (r) {
        case ExitReason::STOP:   return "STOP";
        case ExitReason::TARGET: return "TARGET";
        case ExitReason::CHOCH:  return "CHOCH";
        case ExitReason::EOD:    return "EOD";
    }
    return "UNKNOWN";
}

inline const char* to_string(EventType t) {
    switch (t) {
        case EventType::ENTRY:         return "ENTRY";
        case EventType::HEALTH_CHANGE: return "HEALTH_CHANGE";
        case EventType::MFE:           return "MFE";
        case EventType::MAE:           return "MAE";
        case EventType::EXIT:          return "EXIT";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Excursion — best or worst price reached while a trade was open
// ---------------------------------------------------------------------------
struct Excursion {
    double price = 0.0;
    uint64_t ts = 0;
    int bar_offset = 0;
    HealthScore health;
};

// ---------------------------------------------------------------------------
// Trade — one closed trade. Built by the simulator, immutable afterwards.
// ---------------------------------------------------------------------------
struct Trade {
    std::string id;
    std::string ticker;
    std::string zone_id;
    double zone_high = 0.0;
    double zone_low = 0.0;
    ZoneRank zone_rank = ZoneRank::PRIMARY;

    Direction direction = Direction::LONG;
    ModelTag model = ModelTag::CONTINUATION_PRIMARY;
    Origin origin = Origin::NONE;

    // Entry
    double entry_price = 0.0;
    uint64_t entry_ts = 0;
    int entry_bar_idx = 0;
    double stop_price = 0.0;
    double risk = 0.0;
    double r_target = 0.0;
    double target = 0.0;
    TargetKind target_kind = TargetKind::R_MULTIPLE;
    HealthScore entry_health;

    // Excursions
    Excursion mfe;
    Excursion mae;

    // Exit
    ExitReason exit_reason = ExitReason::EOD;
    double exit_price = 0.0;
    uint64_t exit_ts = 0;
    int exit_bar_idx = 0;
    int bars_held = 0;
    HealthScore exit_health;

    // Outcome
    double pnl = 0.0;          // per share
    double r_multiple = 0.0;
    bool is_winner = false;

    double mfe_r() const { return risk > 0.0 ? (mfe.price - entry_price) * sign(direction) / risk : 0.0; }
    double mae_r() const { return risk > 0.0 ? (mae.price - entry_price) * sign(direction) / risk : 0.0; }
};

// ---------------------------------------------------------------------------
// Event — one entry in a trade's lifecycle log
// ---------------------------------------------------------------------------
struct Event {
    std::string trade_id;
    EventType type = EventType::ENTRY;
    int sequence = 0;
    uint64_t ts = 0;      // canonical time
    int bar_offset = 0;   // bars after entry
    double price = 0.0;
    int health_score = 0;
    int health_delta = 0; // current - entry
    std::array<bool, HEALTH_FACTOR_COUNT> factors{};
};

// ---------------------------------------------------------------------------
// InvariantViolation — a state-machine logic defect; halts the session
// ---------------------------------------------------------------------------
class InvariantViolation : public std::logic_error {
public:
    InvariantViolation(const std::string& what, std::string trade_id, int bar_index)
        : std::logic_error(what + " [trade=" + trade_id + " bar=" +
                           std::to_string(bar_index) + "]"),
          trade_id_(std::move(trade_id)), bar_index_(bar_index) {}

    const std::string& trade_id() const { return trade_id_; }
    int bar_index() const { return bar_index_; }

private:
    std::string trade_id_;
    int bar_index_;
};
