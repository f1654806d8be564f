#pragma once

#include "bars/bar.hpp"
#include "data/zone.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>

enum class EntryKind { CONTINUATION, REJECTION };

enum class ModelTag {
    CONTINUATION_PRIMARY,
    REJECTION_PRIMARY,
    CONTINUATION_SECONDARY,
    REJECTION_SECONDARY,
};

enum class Origin { NONE, BELOW, ABOVE };

enum class TargetKind { R_MULTIPLE, ZONE_TARGET };

inline ModelTag make_model_tag(EntryKind kind, ZoneRank rank) {
    if (rank == ZoneRank::PRIMARY) {
        return kind == EntryKind::CONTINUATION ? ModelTag::CONTINUATION_PRIMARY
                                               : ModelTag::REJECTION_PRIMARY;
    }
    return kind == EntryKind::CONTINUATION ? ModelTag::CONTINUATION_SECONDARY
                                           : ModelTag::REJECTION_SECONDARY;
}

inline const char* to_string(ModelTag m) {
    switch (m) {
        case ModelTag::CONTINUATION_PRIMARY:   return "CONTINUATION_PRIMARY";
        case ModelTag::REJECTION_PRIMARY:      return "REJECTION_PRIMARY";
        case ModelTag::CONTINUATION_SECONDARY: return "CONTINUATION_SECONDARY";
        case ModelTag::REJECTION_SECONDARY:    return "REJECTION_SECONDARY";
    }
    return "UNKNOWN";
}

// Short model code used in trade identifiers.
inline const char* model_code(ModelTag m) {
    switch (m) {
        case ModelTag::CONTINUATION_PRIMARY:   return "EPCH1";
        case ModelTag::REJECTION_PRIMARY:      return "EPCH2";
        case ModelTag::CONTINUATION_SECONDARY: return "EPCH3";
        case ModelTag::REJECTION_SECONDARY:    return "EPCH4";
    }
    return "EPCH0";
}

inline const char* to_string(Origin o) {
    switch (o) {
        case Origin::BELOW: return "BELOW";
        case Origin::ABOVE: return "ABOVE";
        case Origin::NONE:  return "NONE";
    }
    return "NONE";
}

inline const char* to_string(TargetKind k) {
    return k == TargetKind::ZONE_TARGET ? "ZONE_TARGET" : "R_MULTIPLE";
}

// ---------------------------------------------------------------------------
// EntryConfig
// ---------------------------------------------------------------------------
struct EntryConfig {
    uint64_t origin_lookback_s = 15000;  // wall-clock history scanned for origin
    double stop_buffer = 0.05;           // fixed distance beyond the zone boundary
    double stop_buffer_pct = 0.0;        // extra buffer as a fraction of |entry - boundary|
    double min_risk = 0.01;
    double target_r_multiple = 3.0;

    void validate() const {
        if (origin_lookback_s == 0) {
            throw std::invalid_argument("origin_lookback_s must be > 0");
        }
        if (stop_buffer < 0.0 || stop_buffer_pct < 0.0) {
            throw std::invalid_argument("stop buffer must be non-negative");
        }
        if (min_risk < 0.0) {
            throw std::invalid_argument("min_risk must be non-negative");
        }
        if (!(target_r_multiple > 0.0)) {
            throw std::invalid_argument("target_r_multiple must be > 0");
        }
    }
};

// ---------------------------------------------------------------------------
// EntrySignal — a fired entry with its risk levels
// ---------------------------------------------------------------------------
struct EntrySignal {
    ModelTag model = ModelTag::CONTINUATION_PRIMARY;
    EntryKind kind = EntryKind::CONTINUATION;
    Direction direction = Direction::LONG;
    Origin origin = Origin::NONE;

    double entry_price = 0.0;
    double stop_price = 0.0;
    double risk = 0.0;
    double r_target = 0.0;  // entry +/- target_r_multiple * risk
    double target = 0.0;    // level actually used
    TargetKind target_kind = TargetKind::R_MULTIPLE;
};

struct EntryStats {
    int evaluations = 0;
    int fired = 0;
    int no_origin = 0;       // skipped: no prior close outside the zone
    int below_min_risk = 0;  // skipped: stop too close to entry
};

// ---------------------------------------------------------------------------
// EntryClassifier — zone-relative continuation / rejection detection
//
// Origin is taken from bars pushed before the bar under evaluation, so the
// trigger bar never decides its own origin. Continuation and rejection need
// closes on opposite sides of the zone for the same origin and cannot both
// fire.
// ---------------------------------------------------------------------------
class EntryClassifier {
public:
    EntryClassifier(const EntryConfig& cfg, uint64_t bar_interval_s)
        : cfg_(cfg) {
        cfg_.validate();
        if (bar_interval_s == 0) {
            throw std::invalid_argument("bar_interval_s must be > 0");
        }
        lookback_bars_ = static_cast<int>(
            std::max<uint64_t>(1, cfg_.origin_lookback_s / bar_interval_s));
    }

    int lookback_bars() const { return lookback_bars_; }

    // Side of the most recent prior close strictly outside the zone.
    Origin find_origin(const Zone& zone) const {
        for (auto it = closes_.rbegin(); it != closes_.rend(); ++it) {
            if (*it < zone.low) return Origin::BELOW;
            if (*it > zone.high) return Origin::ABOVE;
        }
        return Origin::NONE;
    }

    static bool continuation_fires(Origin origin, const Zone& zone, const Bar& bar) {
        return (origin == Origin::BELOW && bar.close > zone.high) ||
               (origin == Origin::ABOVE && bar.close < zone.low);
    }

    static bool rejection_fires(Origin origin, const Zone& zone, const Bar& bar) {
        return (origin == Origin::ABOVE && bar.low <= zone.high && bar.close > zone.high) ||
               (origin == Origin::BELOW && bar.high >= zone.low && bar.close < zone.low);
    }

    // Evaluate one zone against the current bar. Does not record the bar;
    // call push_bar() once every zone has been evaluated.
    std::optional<EntrySignal> evaluate(const Zone& zone, const Bar& bar) {
        stats_.evaluations++;

        Origin origin = find_origin(zone);
        if (origin == Origin::NONE) {
            stats_.no_origin++;
            return std::nullopt;
        }

        EntrySignal sig{};
        sig.origin = origin;
        if (continuation_fires(origin, zone, bar)) {
            sig.kind = EntryKind::CONTINUATION;
            sig.direction = (origin == Origin::BELOW) ? Direction::LONG : Direction::SHORT;
        } else if (rejection_fires(origin, zone, bar)) {
            sig.kind = EntryKind::REJECTION;
            sig.direction = (origin == Origin::ABOVE) ? Direction::LONG : Direction::SHORT;
        } else {
            return std::nullopt;
        }
        sig.model = make_model_tag(sig.kind, zone.rank);
        sig.entry_price = bar.close;

        compute_levels(zone, sig);
        if (sig.risk < cfg_.min_risk) {
            stats_.below_min_risk++;
            return std::nullopt;
        }

        stats_.fired++;
        return sig;
    }

    void push_bar(const Bar& bar) {
        closes_.push_back(bar.close);
        if (static_cast<int>(closes_.size()) > lookback_bars_) closes_.pop_front();
    }

    const EntryStats& stats() const { return stats_; }

    void reset() {
        closes_.clear();
        stats_ = EntryStats{};
    }

private:
    EntryConfig cfg_;
    int lookback_bars_ = 1;
    std::deque<double> closes_;
    EntryStats stats_;

    void compute_levels(const Zone& zone, EntrySignal& sig) const {
        if (sig.direction == Direction::LONG) {
            double buffer = cfg_.stop_buffer +
                            cfg_.stop_buffer_pct * std::abs(sig.entry_price - zone.low);
            sig.stop_price = zone.low - buffer;
        } else {
            double buffer = cfg_.stop_buffer +
                            cfg_.stop_buffer_pct * std::abs(sig.entry_price - zone.high);
            sig.stop_price = zone.high + buffer;
        }
        sig.risk = std::abs(sig.entry_price - sig.stop_price);

        double s = static_cast<double>(sign(sig.direction));
        sig.r_target = sig.entry_price + s * cfg_.target_r_multiple * sig.risk;
        sig.target = sig.r_target;
        sig.target_kind = TargetKind::R_MULTIPLE;

        if (zone.has_target() && (zone.target - sig.r_target) * s > 0.0) {
            sig.target = zone.target;
            sig.target_kind = TargetKind::ZONE_TARGET;
        }
    }
};
