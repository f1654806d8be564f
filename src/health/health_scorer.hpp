#pragma once

#include "data/zone.hpp"
#include "features/indicator_engine.hpp"
#include "structure/structure_detector.hpp"

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

constexpr int HEALTH_FACTOR_COUNT = 10;
constexpr int HEALTH_STRUCTURE_FACTORS = 4;

// Sub-factor slots in HealthScore::factors.
namespace health_factor {
    constexpr int HTF_0         = 0;  // coarsest higher timeframe
    constexpr int HTF_1         = 1;
    constexpr int HTF_2         = 2;
    constexpr int HTF_3         = 3;
    constexpr int VOL_ROC       = 4;
    constexpr int VOL_DELTA     = 5;
    constexpr int CVD_SLOPE     = 6;
    constexpr int SMA_ALIGNMENT = 7;
    constexpr int SMA_MOMENTUM  = 8;
    constexpr int VWAP          = 9;

    inline const char* name(int idx) {
        static const char* NAMES[HEALTH_FACTOR_COUNT] = {
            "htf_0", "htf_1", "htf_2", "htf_3", "vol_roc",
            "vol_delta", "cvd_slope", "sma_alignment", "sma_momentum", "vwap"};
        return (idx >= 0 && idx < HEALTH_FACTOR_COUNT) ? NAMES[idx] : "unknown";
    }
}  // namespace health_factor

enum class HealthTier { CRITICAL, WEAK, MODERATE, STRONG };

inline const char* to_string(HealthTier t) {
    switch (t) {
        case HealthTier::STRONG:   return "STRONG";
        case HealthTier::MODERATE: return "MODERATE";
        case HealthTier::WEAK:     return "WEAK";
        case HealthTier::CRITICAL: return "CRITICAL";
    }
    return "CRITICAL";
}

inline HealthTier tier_for(int score) {
    if (score >= 8) return HealthTier::STRONG;
    if (score >= 6) return HealthTier::MODERATE;
    if (score >= 4) return HealthTier::WEAK;
    return HealthTier::CRITICAL;
}

// ---------------------------------------------------------------------------
// HealthConfig — sub-factor thresholds
// ---------------------------------------------------------------------------
struct HealthConfig {
    double vol_roc_threshold = 30.0;   // percent
    double cvd_rising = 0.1;
    double cvd_falling = -0.1;
    double sma_widening_ratio = 1.1;

    void validate() const {
        if (!(sma_widening_ratio > 0.0)) {
            throw std::invalid_argument("sma_widening_ratio must be > 0");
        }
        if (cvd_falling > cvd_rising) {
            throw std::invalid_argument("cvd_falling must not exceed cvd_rising");
        }
    }
};

// ---------------------------------------------------------------------------
// HealthInputs — everything the ten sub-factors read, as raw numbers
// ---------------------------------------------------------------------------
struct HealthInputs {
    std::array<StructureDirection, HEALTH_STRUCTURE_FACTORS> htf_directions{
        StructureDirection::NEUTRAL, StructureDirection::NEUTRAL,
        StructureDirection::NEUTRAL, StructureDirection::NEUTRAL};
    IndicatorSnapshot indicators;
};

// ---------------------------------------------------------------------------
// HealthScore
// ---------------------------------------------------------------------------
struct HealthScore {
    int score = 0;
    std::array<bool, HEALTH_FACTOR_COUNT> factors{};

    HealthTier tier() const { return tier_for(score); }

    int structure_score() const { return count(0, HEALTH_STRUCTURE_FACTORS); }
    int volume_score() const { return count(health_factor::VOL_ROC, health_factor::SMA_ALIGNMENT); }
    int price_score() const { return count(health_factor::SMA_ALIGNMENT, HEALTH_FACTOR_COUNT); }

    bool operator==(const HealthScore& o) const {
        return score == o.score && factors == o.factors;
    }
    bool operator!=(const HealthScore& o) const { return !(*this == o); }

private:
    int count(int begin, int end) const {
        int n = 0;
        for (int i = begin; i < end; ++i) n += factors[i] ? 1 : 0;
        return n;
    }
};

// ---------------------------------------------------------------------------
// Sub-factor threshold functions. NaN inputs are never healthy.
// ---------------------------------------------------------------------------
namespace health_factors {

inline bool structure_aligned(StructureDirection tf_dir, Direction dir) {
    return (dir == Direction::LONG && tf_dir == StructureDirection::BULL) ||
           (dir == Direction::SHORT && tf_dir == StructureDirection::BEAR);
}

inline bool vol_roc_elevated(double vol_roc, const HealthConfig& cfg) {
    return !std::isnan(vol_roc) && vol_roc >= cfg.vol_roc_threshold;
}

inline bool vol_delta_aligned(double vol_delta, Direction dir) {
    if (std::isnan(vol_delta)) return false;
    return dir == Direction::LONG ? vol_delta > 0.0 : vol_delta < 0.0;
}

inline bool cvd_slope_aligned(double cvd_slope, Direction dir, const HealthConfig& cfg) {
    if (std::isnan(cvd_slope)) return false;
    return dir == Direction::LONG ? cvd_slope >= cfg.cvd_rising : cvd_slope <= cfg.cvd_falling;
}

inline bool sma_aligned(double sma_fast, double sma_slow, Direction dir) {
    if (std::isnan(sma_fast) || std::isnan(sma_slow)) return false;
    return dir == Direction::LONG ? sma_fast > sma_slow : sma_fast < sma_slow;
}

inline bool sma_widening(double spread, double prev_spread, const HealthConfig& cfg) {
    if (std::isnan(spread) || std::isnan(prev_spread)) return false;
    double prev = std::abs(prev_spread);
    if (prev == 0.0) return false;
    return std::abs(spread) / prev > cfg.sma_widening_ratio;
}

inline bool vwap_aligned(double close, double vwap, Direction dir) {
    if (std::isnan(close) || std::isnan(vwap)) return false;
    return dir == Direction::LONG ? close > vwap : close < vwap;
}

}  // namespace health_factors

// ---------------------------------------------------------------------------
// HealthScorer — the single scoring path used at entry and on every bar
// ---------------------------------------------------------------------------
class HealthScorer {
public:
    HealthScorer() = default;
    explicit HealthScorer(const HealthConfig& cfg) : cfg_(cfg) { cfg_.validate(); }

    HealthScore score(const HealthInputs& in, Direction dir) const {
        namespace hf = health_factors;
        const IndicatorSnapshot& ind = in.indicators;

        HealthScore hs{};
        for (int i = 0; i < HEALTH_STRUCTURE_FACTORS; ++i) {
            hs.factors[i] = hf::structure_aligned(in.htf_directions[i], dir);
        }
        hs.factors[health_factor::VOL_ROC] = hf::vol_roc_elevated(ind.vol_roc, cfg_);
        hs.factors[health_factor::VOL_DELTA] = hf::vol_delta_aligned(ind.vol_delta, dir);
        hs.factors[health_factor::CVD_SLOPE] = hf::cvd_slope_aligned(ind.cvd_slope, dir, cfg_);
        hs.factors[health_factor::SMA_ALIGNMENT] = hf::sma_aligned(ind.sma_fast, ind.sma_slow, dir);
        hs.factors[health_factor::SMA_MOMENTUM] =
            hf::sma_widening(ind.sma_spread, ind.prev_sma_spread, cfg_);
        hs.factors[health_factor::VWAP] = hf::vwap_aligned(ind.close, ind.vwap, dir);

        for (bool f : hs.factors) hs.score += f ? 1 : 0;
        return hs;
    }

    const HealthConfig& config() const { return cfg_; }

private:
    HealthConfig cfg_;
};
