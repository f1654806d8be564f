#pragma once

#include "backtest/excursion_tracker.hpp"
#include "backtest/exit_state_machine.hpp"
#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "bars/timeframe_aggregator.hpp"
#include "data/session.hpp"
#include "data/zone.hpp"
#include "entry/entry_classifier.hpp"
#include "features/indicator_engine.hpp"
#include "health/health_scorer.hpp"
#include "structure/structure_detector.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SimulatorConfig — aggregates every component config for one session pass
// ---------------------------------------------------------------------------
struct SimulatorConfig {
    Timeframe trigger_tf = timeframes::m5();

    // Structure-alignment timeframes, coarsest first. At most four; missing
    // slots score as unaligned.
    std::vector<Timeframe> higher_timeframes = timeframes::default_stack();

    // Structure series whose ChoCH closes trades: -1 = the trigger series,
    // otherwise an index into higher_timeframes.
    int choch_timeframe = -1;

    StructureConfig structure;
    EntryConfig entry;
    IndicatorConfig indicators;
    HealthConfig health;
    ExitConfig exit;

    void validate() const {
        if (trigger_tf.interval_s == 0) {
            throw std::invalid_argument("trigger timeframe interval must be > 0");
        }
        if (static_cast<int>(higher_timeframes.size()) > HEALTH_STRUCTURE_FACTORS) {
            throw std::invalid_argument("at most " + std::to_string(HEALTH_STRUCTURE_FACTORS) +
                                        " higher timeframes are scored");
        }
        for (const auto& tf : higher_timeframes) {
            if (tf.interval_s == 0) {
                throw std::invalid_argument("timeframe " + tf.name + " has zero interval");
            }
        }
        if (choch_timeframe < -1 ||
            choch_timeframe >= static_cast<int>(higher_timeframes.size())) {
            throw std::invalid_argument("choch_timeframe out of range: " +
                                        std::to_string(choch_timeframe));
        }
        structure.validate();
        entry.validate();
        indicators.validate();
        health.validate();
    }
};

// ---------------------------------------------------------------------------
// SessionResult — closed trades and their event logs for one session
// ---------------------------------------------------------------------------
struct SessionResult {
    SessionSpec spec;
    std::vector<Trade> trades;   // ordered by entry time, then id
    std::vector<Event> events;   // grouped by trade in `trades` order, by sequence
    int bars_processed = 0;
    int zones_total = 0;
    int skipped_zones = 0;        // invalid bounds or duplicate id
    int entry_evaluations = 0;
    int skipped_evaluations = 0;  // no price origin within the lookback
    int skipped_min_risk = 0;
};

// ---------------------------------------------------------------------------
// TradeSimulator — single pass over the trigger bars of one session
//
// Per bar:
//   1. update trigger structure, higher-timeframe structures, indicators
//   2. classify every valid zone that has no open trade
//   3. excursion + exit for trades opened on an earlier bar
// A trade closed on bar N leaves its zone free for entries from bar N+1.
// ---------------------------------------------------------------------------
class TradeSimulator {
public:
    explicit TradeSimulator(const SimulatorConfig& cfg) : cfg_(cfg), scorer_(cfg.health) {
        cfg_.validate();
    }

    // std::nullopt when the session has no bars.
    std::optional<SessionResult> run(const SessionInput& input) {
        if (input.bars.empty()) return std::nullopt;
        input.spec.validate();
        check_bar_order(input.bars);

        reset(input);

        SessionResult result{};
        result.spec = input.spec;
        result.zones_total = static_cast<int>(input.zones.size());

        std::vector<size_t> zones = valid_zones(input.zones, result.skipped_zones);

        int n = static_cast<int>(input.bars.size());
        for (int i = 0; i < n; ++i) {
            const Bar& bar = input.bars[i];

            // 1. State updates
            trigger_structure_.update(bar);
            for (auto& feed : feeds_) advance_feed(feed, bar);
            IndicatorSnapshot snap = indicators_.update(bar);
            HealthInputs inputs = health_inputs(snap);
            StructureState choch_view = choch_state();

            // 2. Entries
            if (spec_.in_entry_window(bar.close_ts)) {
                for (size_t z : zones) {
                    if (open_.count(z)) continue;
                    auto sig = classifier_->evaluate(input.zones[z], bar);
                    if (sig) open_trade(z, input.zones[z], *sig, bar, i, inputs);
                }
            }
            classifier_->push_bar(bar);

            // 3. Exits
            for (auto it = open_.begin(); it != open_.end();) {
                Position& pos = it->second;
                if (pos.trade.entry_bar_idx >= i) {
                    ++it;
                    continue;
                }
                int offset = i - pos.trade.entry_bar_idx;
                HealthScore health = scorer_.score(inputs, pos.trade.direction);
                pos.current_health = health;
                pos.excursion.update(bar, offset, health);
                if (health.score != pos.last_health.score) {
                    pos.health_changes.push_back({offset, bar.close_ts, bar.close, health});
                    pos.last_health = health;
                }

                auto decision = pos.exit.evaluate(bar, choch_view, i);
                if (decision) {
                    close_trade(pos, *decision, i, health);
                    it = open_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        // Bars ran out with trades still open.
        for (auto& entry : open_) {
            Position& pos = entry.second;
            ExitDecision d = pos.exit.close_at_data_end(input.bars.back(), n - 1);
            close_trade(pos, d, n - 1, pos.current_health);
        }
        open_.clear();

        std::stable_sort(closed_.begin(), closed_.end(),
                         [](const ClosedTrade& a, const ClosedTrade& b) {
                             if (a.trade.entry_ts != b.trade.entry_ts)
                                 return a.trade.entry_ts < b.trade.entry_ts;
                             return a.trade.id < b.trade.id;
                         });
        for (auto& c : closed_) {
            result.trades.push_back(c.trade);
            result.events.insert(result.events.end(), c.events.begin(), c.events.end());
        }
        closed_.clear();

        const EntryStats& stats = classifier_->stats();
        result.bars_processed = n;
        result.entry_evaluations = stats.evaluations;
        result.skipped_evaluations = stats.no_origin;
        result.skipped_min_risk = stats.below_min_risk;
        return result;
    }

    const SimulatorConfig& config() const { return cfg_; }

    // Trade identifier: {ticker}_{MMDDYY}_{MODEL}_{HHMM}, ET entry time.
    static std::string make_trade_id(const std::string& ticker, ModelTag model,
                                     uint64_t entry_ts) {
        int date = time_utils::et_date(entry_ts);
        int minutes = time_utils::minutes_of_day(entry_ts);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%02d%02d%02d_%s_%02d%02d",
                      (date / 100) % 100, date % 100, (date / 10000) % 100,
                      model_code(model), minutes / 60, minutes % 60);
        return ticker + "_" + buf;
    }

private:
    struct HealthChange {
        int bar_offset;
        uint64_t bar_ts;
        double price;
        HealthScore health;
    };

    struct Position {
        Trade trade;
        ExcursionTracker excursion;
        ExitStateMachine exit;
        HealthScore last_health;  // as of the last HEALTH_CHANGE
        HealthScore current_health;
        std::vector<HealthChange> health_changes;
    };

    struct ClosedTrade {
        Trade trade;
        std::vector<Event> events;
    };

    struct HtfFeed {
        Timeframe tf;
        StructureDetector detector;
        const std::vector<Bar>* bars = nullptr;  // external series, if supplied
        size_t next = 0;
        std::optional<TimeframeAggregator> aggregator;

        // Break seen on an HTF bar completed during the current trigger bar.
        bool break_this_bar = false;
        BreakType break_type = BreakType::NONE;
        StructureDirection break_direction = StructureDirection::NEUTRAL;
    };

    SimulatorConfig cfg_;
    HealthScorer scorer_;

    SessionSpec spec_;
    StructureDetector trigger_structure_;
    std::vector<HtfFeed> feeds_;
    IndicatorEngine indicators_;
    std::optional<EntryClassifier> classifier_;

    std::map<size_t, Position> open_;  // keyed by zone index
    std::vector<ClosedTrade> closed_;
    std::map<std::string, int> id_counts_;

    void reset(const SessionInput& input) {
        spec_ = input.spec;
        trigger_structure_ = StructureDetector(cfg_.structure);
        indicators_ = IndicatorEngine(cfg_.indicators);
        classifier_.emplace(cfg_.entry, cfg_.trigger_tf.interval_s);
        open_.clear();
        closed_.clear();
        id_counts_.clear();

        feeds_.clear();
        for (const auto& tf : cfg_.higher_timeframes) {
            HtfFeed feed;
            feed.tf = tf;
            feed.detector = StructureDetector(cfg_.structure);
            auto it = input.htf_bars.find(tf.name);
            if (it != input.htf_bars.end()) {
                feed.bars = &it->second;
            } else {
                feed.aggregator.emplace(tf);
            }
            feeds_.push_back(std::move(feed));
        }
    }

    static void check_bar_order(const std::vector<Bar>& bars) {
        for (size_t i = 1; i < bars.size(); ++i) {
            if (bars[i].open_ts <= bars[i - 1].open_ts) {
                throw std::invalid_argument("bars out of order at index " + std::to_string(i));
            }
        }
    }

    static std::vector<size_t> valid_zones(const std::vector<Zone>& zones, int& skipped) {
        std::vector<size_t> out;
        std::set<std::string> seen;
        for (size_t z = 0; z < zones.size(); ++z) {
            if (!zones[z].is_valid() || !seen.insert(zones[z].id).second) {
                ++skipped;
                continue;
            }
            out.push_back(z);
        }
        return out;
    }

    void advance_feed(HtfFeed& feed, const Bar& bar) {
        feed.break_this_bar = false;
        auto consume = [&feed](const Bar& htf_bar) {
            const StructureState& st = feed.detector.update(htf_bar);
            if (st.broke_this_bar) {
                feed.break_this_bar = true;
                feed.break_type = st.last_break;
                feed.break_direction = st.break_direction;
            }
        };

        if (feed.bars) {
            const auto& series = *feed.bars;
            while (feed.next < series.size() && series[feed.next].close_ts <= bar.close_ts) {
                consume(series[feed.next++]);
            }
        } else {
            for (const Bar& b : feed.aggregator->on_bar(bar)) consume(b);
        }
    }

    HealthInputs health_inputs(const IndicatorSnapshot& snap) const {
        HealthInputs in{};
        for (size_t k = 0; k < feeds_.size(); ++k) {
            in.htf_directions[k] = feeds_[k].detector.state().direction;
        }
        in.indicators = snap;
        return in;
    }

    StructureState choch_state() const {
        if (cfg_.choch_timeframe < 0) return trigger_structure_.state();
        const HtfFeed& feed = feeds_[static_cast<size_t>(cfg_.choch_timeframe)];
        StructureState view = feed.detector.state();
        view.broke_this_bar = feed.break_this_bar;
        if (feed.break_this_bar) {
            view.last_break = feed.break_type;
            view.break_direction = feed.break_direction;
        }
        return view;
    }

    std::string unique_id(const std::string& base) {
        int n = ++id_counts_[base];
        return n == 1 ? base : base + "_" + std::to_string(n);
    }

    void open_trade(size_t z, const Zone& zone, const EntrySignal& sig, const Bar& bar,
                    int bar_idx, const HealthInputs& inputs) {
        Trade t{};
        t.id = unique_id(make_trade_id(spec_.ticker, sig.model, bar.close_ts));
        if (open_.count(z)) {
            throw InvariantViolation("second open trade on zone " + zone.id, t.id, bar_idx);
        }
        t.ticker = spec_.ticker;
        t.zone_id = zone.id;
        t.zone_high = zone.high;
        t.zone_low = zone.low;
        t.zone_rank = zone.rank;
        t.direction = sig.direction;
        t.model = sig.model;
        t.origin = sig.origin;
        t.entry_price = sig.entry_price;
        t.entry_ts = bar.close_ts;
        t.entry_bar_idx = bar_idx;
        t.stop_price = sig.stop_price;
        t.risk = sig.risk;
        t.r_target = sig.r_target;
        t.target = sig.target;
        t.target_kind = sig.target_kind;
        t.entry_health = scorer_.score(inputs, sig.direction);

        ExcursionTracker excursion(t.direction, t.entry_price, t.entry_ts, t.entry_health);
        ExitStateMachine exit(t.id, t.direction, t.stop_price, t.target, spec_.force_exit_ns,
                              cfg_.exit);
        HealthScore entry_health = t.entry_health;
        open_.emplace(z, Position{std::move(t), excursion, std::move(exit), entry_health,
                                   entry_health, {}});
    }

    void close_trade(Position& pos, const ExitDecision& d, int bar_idx,
                     const HealthScore& exit_health) {
        Trade& t = pos.trade;
        t.exit_reason = d.reason;
        t.exit_price = d.price;
        t.exit_ts = d.ts;
        t.exit_bar_idx = bar_idx;
        t.bars_held = bar_idx - t.entry_bar_idx;
        t.exit_health = exit_health;

        pos.excursion.finalize(t.entry_ts, t.exit_ts, t.bars_held);
        t.mfe = pos.excursion.mfe();
        t.mae = pos.excursion.mae();

        t.pnl = (t.exit_price - t.entry_price) * static_cast<double>(sign(t.direction));
        t.r_multiple = t.risk > 0.0 ? t.pnl / t.risk : 0.0;
        t.is_winner = t.pnl > 0.0;

        closed_.push_back(ClosedTrade{t, build_events(pos)});
    }

    // Bar timestamp when it is inside both the session and the trade window,
    // otherwise entry + offset * interval clamped to the trade window.
    uint64_t canonical_time(uint64_t bar_ts, int offset, const Trade& t) const {
        if (spec_.in_session(bar_ts) && bar_ts >= t.entry_ts && bar_ts <= t.exit_ts) {
            return bar_ts;
        }
        uint64_t est = t.entry_ts + static_cast<uint64_t>(offset) * cfg_.trigger_tf.interval_ns();
        return std::clamp(est, t.entry_ts, t.exit_ts);
    }

    std::vector<Event> build_events(const Position& pos) const {
        const Trade& t = pos.trade;
        std::vector<Event> events;

        auto push = [&](EventType type, uint64_t ts, int offset, double price,
                        const HealthScore& h) {
            Event e{};
            e.trade_id = t.id;
            e.type = type;
            e.ts = ts;
            e.bar_offset = offset;
            e.price = price;
            e.health_score = h.score;
            e.health_delta = h.score - t.entry_health.score;
            e.factors = h.factors;
            events.push_back(e);
        };

        push(EventType::ENTRY, t.entry_ts, 0, t.entry_price, t.entry_health);
        for (const auto& hc : pos.health_changes) {
            push(EventType::HEALTH_CHANGE, canonical_time(hc.bar_ts, hc.bar_offset, t),
                 hc.bar_offset, hc.price, hc.health);
        }
        push(EventType::MFE, canonical_time(t.mfe.ts, t.mfe.bar_offset, t), t.mfe.bar_offset,
             t.mfe.price, t.mfe.health);
        push(EventType::MAE, canonical_time(t.mae.ts, t.mae.bar_offset, t), t.mae.bar_offset,
             t.mae.price, t.mae.health);
        push(EventType::EXIT, t.exit_ts, t.bars_held, t.exit_price, t.exit_health);

        std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
            if (a.ts != b.ts) return a.ts < b.ts;
            if (a.type != b.type) return a.type < b.type;
            return a.bar_offset < b.bar_offset;
        });
        for (size_t k = 0; k < events.size(); ++k) events[k].sequence = static_cast<int>(k);
        return events;
    }
};
