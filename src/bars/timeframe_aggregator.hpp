#pragma once

#include "bars/bar.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

// ---------------------------------------------------------------------------
// TimeframeAggregator — builds higher-timeframe bars from a finer series
//
// Buckets are wall-clock aligned (Timeframe::bucket_start). A bucket is
// emitted as soon as an input bar reaches its end; a bucket left incomplete
// by a data gap is emitted when the first bar of a later bucket arrives.
// No bar is synthesized for an empty bucket.
// ---------------------------------------------------------------------------
class TimeframeAggregator {
public:
    explicit TimeframeAggregator(const Timeframe& tf) : tf_(tf) {}

    std::vector<Bar> on_bar(const Bar& bar) {
        std::vector<Bar> completed;

        uint64_t bucket = tf_.bucket_start(bar.open_ts);
        if (active_ && bucket != bucket_start_) {
            completed.push_back(finalize_bar());
        }

        if (!active_) {
            start_bar_at(bar, bucket);
        } else {
            update_bar(bar);
        }

        if (bar.close_ts >= bucket_start_ + tf_.interval_ns()) {
            completed.push_back(finalize_bar());
        }
        return completed;
    }

    std::optional<Bar> flush() {
        if (!active_) return std::nullopt;
        return finalize_bar();
    }

    const Timeframe& timeframe() const { return tf_; }

private:
    Timeframe tf_;
    bool active_ = false;
    uint64_t bucket_start_ = 0;
    Bar current_{};

    void start_bar_at(const Bar& bar, uint64_t bucket) {
        active_ = true;
        bucket_start_ = bucket;
        current_ = bar;
        current_.open_ts = bucket;
    }

    void update_bar(const Bar& bar) {
        current_.high = std::max(current_.high, bar.high);
        current_.low = std::min(current_.low, bar.low);
        current_.close = bar.close;
        current_.close_ts = bar.close_ts;
        current_.volume += bar.volume;
    }

    Bar finalize_bar() {
        active_ = false;
        Bar out = current_;
        out.close_ts = std::min(out.close_ts, bucket_start_ + tf_.interval_ns());
        return out;
    }
};
