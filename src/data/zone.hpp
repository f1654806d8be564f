#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

enum class Direction { LONG = 1, SHORT = -1 };

enum class ZoneBias { BULLISH, BEARISH };

enum class ZoneRank { PRIMARY, SECONDARY };

inline int sign(Direction d) { return d == Direction::LONG ? 1 : -1; }

inline const char* to_string(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

inline const char* to_string(ZoneBias b) {
    return b == ZoneBias::BULLISH ? "BULLISH" : "BEARISH";
}

inline const char* to_string(ZoneRank r) {
    return r == ZoneRank::PRIMARY ? "PRIMARY" : "SECONDARY";
}

inline ZoneBias parse_zone_bias(const std::string& s) {
    if (s == "BULLISH" || s == "BULL" || s == "bullish" || s == "bull") return ZoneBias::BULLISH;
    if (s == "BEARISH" || s == "BEAR" || s == "bearish" || s == "bear") return ZoneBias::BEARISH;
    throw std::invalid_argument("Unknown zone bias: " + s);
}

inline ZoneRank parse_zone_rank(const std::string& s) {
    if (s == "PRIMARY" || s == "primary") return ZoneRank::PRIMARY;
    if (s == "SECONDARY" || s == "secondary") return ZoneRank::SECONDARY;
    throw std::invalid_argument("Unknown zone rank: " + s);
}

// ---------------------------------------------------------------------------
// Zone — externally supplied price band, fixed for one session
// ---------------------------------------------------------------------------
struct Zone {
    std::string id;
    double high = std::numeric_limits<double>::quiet_NaN();
    double low = std::numeric_limits<double>::quiet_NaN();
    ZoneBias bias = ZoneBias::BULLISH;
    ZoneRank rank = ZoneRank::PRIMARY;

    // Optional precomputed target and volume point of control (NaN if absent).
    double target = std::numeric_limits<double>::quiet_NaN();
    double poc = std::numeric_limits<double>::quiet_NaN();

    bool is_valid() const {
        return std::isfinite(high) && std::isfinite(low) && high > low;
    }

    bool has_target() const { return std::isfinite(target); }
};
