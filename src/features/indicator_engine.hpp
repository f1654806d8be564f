#pragma once

#include "bars/bar.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorConfig — window lengths for the raw health inputs
// ---------------------------------------------------------------------------
struct IndicatorConfig {
    int sma_fast = 9;
    int sma_slow = 21;
    int sma_momentum_lookback = 10;  // bars back for the previous SMA spread
    int vol_roc_baseline = 20;       // prior bars averaged for volume ROC
    int vol_delta_window = 5;        // rolling sum of bar deltas
    int cvd_window = 15;             // regression window for CVD slope

    void validate() const {
        auto require = [](int v, int min, const char* name) {
            if (v < min) {
                throw std::invalid_argument(std::string(name) + " must be >= " +
                                            std::to_string(min) + ", got " +
                                            std::to_string(v));
            }
        };
        require(sma_fast, 1, "sma_fast");
        require(sma_slow, 1, "sma_slow");
        require(sma_momentum_lookback, 1, "sma_momentum_lookback");
        require(vol_roc_baseline, 1, "vol_roc_baseline");
        require(vol_delta_window, 1, "vol_delta_window");
        require(cvd_window, 2, "cvd_window");
    }
};

// ---------------------------------------------------------------------------
// IndicatorSnapshot — raw numeric inputs for one bar (NaN while warming up)
// ---------------------------------------------------------------------------
struct IndicatorSnapshot {
    static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    uint64_t timestamp = 0;
    double close = NaN;

    double sma_fast = NaN;
    double sma_slow = NaN;
    double sma_spread = NaN;       // fast - slow
    double prev_sma_spread = NaN;  // spread sma_momentum_lookback bars ago

    double vol_roc = NaN;    // percent vs prior-bar baseline
    double bar_delta = NaN;  // single-bar signed volume estimate
    double vol_delta = NaN;  // rolling sum of bar_delta
    double cvd_slope = NaN;  // normalized by mean volume

    double vwap = NaN;
};

// Signed volume estimate from where the bar closed within its range.
inline double bar_delta(const Bar& bar) {
    double range = bar.range();
    if (range <= 0.0) return 0.0;
    double position = (bar.close - bar.low) / range;
    return (2.0 * position - 1.0) * static_cast<double>(bar.volume);
}

// Least-squares slope of y against x = 0..n-1.
inline double linear_regression_slope(const std::deque<double>& y) {
    size_t n = y.size();
    if (n < 2) return std::numeric_limits<double>::quiet_NaN();
    double x_mean = static_cast<double>(n - 1) / 2.0;
    double y_mean = 0.0;
    for (double v : y) y_mean += v;
    y_mean /= static_cast<double>(n);

    double num = 0.0, den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - x_mean;
        num += dx * (y[i] - y_mean);
        den += dx * dx;
    }
    if (den == 0.0) return 0.0;
    return num / den;
}

// ---------------------------------------------------------------------------
// IndicatorEngine — streaming SMA / volume / CVD / VWAP computation
// ---------------------------------------------------------------------------
class IndicatorEngine {
public:
    IndicatorEngine() = default;
    explicit IndicatorEngine(const IndicatorConfig& cfg) : cfg_(cfg) { cfg_.validate(); }

    // Process a single bar and return its snapshot.
    IndicatorSnapshot update(const Bar& bar) {
        IndicatorSnapshot snap{};
        snap.timestamp = bar.close_ts;
        snap.close = bar.close;

        compute_sma(bar, snap);
        compute_volume(bar, snap);
        compute_vwap(bar, snap);

        bar_count_++;
        last_ = snap;
        return snap;
    }

    std::vector<IndicatorSnapshot> compute_all(const std::vector<Bar>& bars) {
        reset();
        std::vector<IndicatorSnapshot> out;
        out.reserve(bars.size());
        for (const auto& bar : bars) out.push_back(update(bar));
        return out;
    }

    const IndicatorSnapshot& last() const { return last_; }
    int bar_count() const { return bar_count_; }

    void reset() {
        bar_count_ = 0;
        closes_.clear();
        spreads_.clear();
        volumes_.clear();
        deltas_.clear();
        cvd_.clear();
        cvd_volumes_.clear();
        cumulative_delta_ = 0.0;
        vwap_date_ = 0;
        cum_tpv_ = 0.0;
        cum_vol_ = 0.0;
        last_ = IndicatorSnapshot{};
    }

private:
    IndicatorConfig cfg_;
    int bar_count_ = 0;
    IndicatorSnapshot last_;

    std::deque<double> closes_;
    std::deque<double> spreads_;      // one entry per bar, NaN until sma_slow is ready
    std::deque<double> volumes_;      // ROC baseline
    std::deque<double> deltas_;
    std::deque<double> cvd_;
    std::deque<double> cvd_volumes_;
    double cumulative_delta_ = 0.0;

    int vwap_date_ = 0;
    double cum_tpv_ = 0.0;
    double cum_vol_ = 0.0;

    static double mean_tail(const std::deque<double>& values, size_t n) {
        double sum = 0.0;
        for (size_t i = values.size() - n; i < values.size(); ++i) sum += values[i];
        return sum / static_cast<double>(n);
    }

    // -----------------------------------------------------------------------
    // Moving averages
    // -----------------------------------------------------------------------
    void compute_sma(const Bar& bar, IndicatorSnapshot& snap) {
        size_t keep = static_cast<size_t>(std::max(cfg_.sma_fast, cfg_.sma_slow));
        closes_.push_back(bar.close);
        if (closes_.size() > keep) closes_.pop_front();

        if (closes_.size() >= static_cast<size_t>(cfg_.sma_fast)) {
            snap.sma_fast = mean_tail(closes_, static_cast<size_t>(cfg_.sma_fast));
        }
        if (closes_.size() >= static_cast<size_t>(cfg_.sma_slow)) {
            snap.sma_slow = mean_tail(closes_, static_cast<size_t>(cfg_.sma_slow));
        }
        snap.sma_spread = snap.sma_fast - snap.sma_slow;

        spreads_.push_back(snap.sma_spread);
        if (spreads_.size() > static_cast<size_t>(cfg_.sma_momentum_lookback) + 1) {
            spreads_.pop_front();
        }
        if (spreads_.size() == static_cast<size_t>(cfg_.sma_momentum_lookback) + 1) {
            snap.prev_sma_spread = spreads_.front();
        }
    }

    // -----------------------------------------------------------------------
    // Volume ROC, volume delta, CVD slope
    // -----------------------------------------------------------------------
    void compute_volume(const Bar& bar, IndicatorSnapshot& snap) {
        double vol = static_cast<double>(bar.volume);

        // Baseline excludes the current bar.
        if (volumes_.size() >= static_cast<size_t>(cfg_.vol_roc_baseline)) {
            double baseline = mean_tail(volumes_, static_cast<size_t>(cfg_.vol_roc_baseline));
            if (baseline > 0.0) snap.vol_roc = (vol - baseline) / baseline * 100.0;
        }
        volumes_.push_back(vol);
        if (volumes_.size() > static_cast<size_t>(cfg_.vol_roc_baseline)) volumes_.pop_front();

        double delta = bar_delta(bar);
        snap.bar_delta = delta;
        deltas_.push_back(delta);
        if (deltas_.size() > static_cast<size_t>(cfg_.vol_delta_window)) deltas_.pop_front();
        if (deltas_.size() == static_cast<size_t>(cfg_.vol_delta_window)) {
            double sum = 0.0;
            for (double d : deltas_) sum += d;
            snap.vol_delta = sum;
        }

        cumulative_delta_ += delta;
        cvd_.push_back(cumulative_delta_);
        cvd_volumes_.push_back(vol);
        if (cvd_.size() > static_cast<size_t>(cfg_.cvd_window)) {
            cvd_.pop_front();
            cvd_volumes_.pop_front();
        }
        if (cvd_.size() == static_cast<size_t>(cfg_.cvd_window)) {
            double avg_vol = mean_tail(cvd_volumes_, cvd_volumes_.size());
            if (avg_vol > 0.0) snap.cvd_slope = linear_regression_slope(cvd_) / avg_vol;
        }
    }

    // -----------------------------------------------------------------------
    // Session VWAP (typical price, resets on ET date change)
    // -----------------------------------------------------------------------
    void compute_vwap(const Bar& bar, IndicatorSnapshot& snap) {
        int date = time_utils::et_date(bar.open_ts);
        if (date != vwap_date_) {
            vwap_date_ = date;
            cum_tpv_ = 0.0;
            cum_vol_ = 0.0;
        }
        double vol = static_cast<double>(bar.volume);
        cum_tpv_ += bar.typical_price() * vol;
        cum_vol_ += vol;
        if (cum_vol_ > 0.0) snap.vwap = cum_tpv_ / cum_vol_;
    }
};
