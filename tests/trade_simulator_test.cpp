// trade_simulator_test.cpp — end-to-end session simulation over synthetic bars
//
// Every scenario starts with six flat pre-open bars closing at 99.5, below
// zone Z1 [100, 101], so the first bar that closes above 101 is a
// continuation long entered at its close.

#include <gtest/gtest.h>

#include "backtest/backtest_result_io.hpp"
#include "backtest/trade_simulator.hpp"
#include "test_bar_helpers.hpp"

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using test_helpers::M5_NS;
using test_helpers::Ohlc;
using test_helpers::SESSION_DATE;
using test_helpers::et;
using test_helpers::make_bar;
using test_helpers::make_bars;
using test_helpers::make_flat_bars;
using test_helpers::make_zone;

const Ohlc ENTRY_ROW = {99.5, 101.6, 99.4, 101.5};
constexpr double ENTRY_PRICE = 101.5;
constexpr double STOP_PRICE = 99.95;
constexpr double RISK = 1.55;

std::vector<Bar> premarket_below() { return make_flat_bars(99.5, 6, et(9, 0)); }

std::vector<Bar> then(std::vector<Bar> bars, const std::vector<Ohlc>& rows) {
    uint64_t start = bars.back().open_ts + M5_NS;
    for (const auto& b : make_bars(rows, start)) bars.push_back(b);
    return bars;
}

SessionInput session_with(std::vector<Bar> bars, std::vector<Zone> zones) {
    SessionInput in;
    in.spec = SessionSpec::regular("SPY", SESSION_DATE);
    in.bars = std::move(bars);
    in.zones = std::move(zones);
    return in;
}

std::vector<Zone> z1() { return {make_zone("Z1", 101.0, 100.0)}; }

// Entry, one bar up, then a bar through the 3R target.
SessionInput target_session() {
    return session_with(then(premarket_below(), {ENTRY_ROW,
                                                 {101.5, 102.5, 101.3, 102.3},
                                                 {102.3, 106.5, 102.2, 106.2}}),
                        z1());
}

// Entry, then a swing low at 101.0 that is closed through six bars later.
SessionInput choch_session() {
    return session_with(then(premarket_below(), {ENTRY_ROW,
                                                 {101.5, 101.8, 101.3, 101.6},
                                                 {101.6, 101.9, 101.2, 101.5},
                                                 {101.5, 101.7, 101.0, 101.2},
                                                 {101.2, 101.6, 101.1, 101.4},
                                                 {101.4, 101.6, 101.2, 101.3},
                                                 {101.3, 101.4, 100.8, 100.9}}),
                        z1());
}

SessionResult run(const SessionInput& in, const SimulatorConfig& cfg = {}) {
    TradeSimulator sim(cfg);
    auto result = sim.run(in);
    if (!result) throw std::runtime_error("expected a session result");
    return *result;
}

std::vector<Event> events_of(const SessionResult& r, const std::string& trade_id) {
    std::vector<Event> out;
    for (const auto& e : r.events) {
        if (e.trade_id == trade_id) out.push_back(e);
    }
    return out;
}

// Moves a 2022-01-03 scenario onto the same ET wall-clock times of `date`.
SessionInput on_date(SessionInput in, int date) {
    uint64_t shift = time_utils::date_to_midnight_ns(date) - test_helpers::MIDNIGHT_ET_NS;
    for (auto& b : in.bars) {
        b.open_ts += shift;
        b.close_ts += shift;
    }
    in.spec = SessionSpec::regular(in.spec.ticker, date);
    return in;
}

int count_type(const std::vector<Event>& events, EventType type) {
    int n = 0;
    for (const auto& e : events) n += e.type == type ? 1 : 0;
    return n;
}

}  // namespace

// ===========================================================================
// Entries and exits
// ===========================================================================
class TradeSimulatorTest : public ::testing::Test {};

TEST_F(TradeSimulatorTest, ContinuationLongHitsTarget) {
    SessionResult r = run(target_session());
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];

    EXPECT_EQ(t.id, "SPY_010322_EPCH1_0935");
    EXPECT_EQ(t.ticker, "SPY");
    EXPECT_EQ(t.zone_id, "Z1");
    EXPECT_EQ(t.direction, Direction::LONG);
    EXPECT_EQ(t.model, ModelTag::CONTINUATION_PRIMARY);
    EXPECT_EQ(t.origin, Origin::BELOW);
    EXPECT_DOUBLE_EQ(t.entry_price, ENTRY_PRICE);
    EXPECT_EQ(t.entry_ts, et(9, 35));
    EXPECT_EQ(t.entry_bar_idx, 6);
    EXPECT_NEAR(t.stop_price, STOP_PRICE, 1e-9);
    EXPECT_NEAR(t.risk, RISK, 1e-9);

    EXPECT_EQ(t.exit_reason, ExitReason::TARGET);
    EXPECT_NEAR(t.exit_price, 106.15, 1e-9);
    EXPECT_EQ(t.exit_ts, et(9, 45));
    EXPECT_EQ(t.bars_held, 2);
    EXPECT_NEAR(t.r_multiple, 3.0, 1e-9);
    EXPECT_NEAR(t.pnl, 4.65, 1e-9);
    EXPECT_TRUE(t.is_winner);
}

TEST_F(TradeSimulatorTest, ExcursionsRecordBarExtremes) {
    SessionResult r = run(target_session());
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];

    EXPECT_DOUBLE_EQ(t.mfe.price, 106.5);
    EXPECT_EQ(t.mfe.bar_offset, 2);
    EXPECT_EQ(t.mfe.ts, et(9, 45));
    EXPECT_DOUBLE_EQ(t.mae.price, 101.3);
    EXPECT_EQ(t.mae.bar_offset, 1);
    EXPECT_EQ(t.mae.ts, et(9, 40));
    EXPECT_GT(t.mfe_r(), 3.0);
    EXPECT_LT(t.mae_r(), 0.0);
}

TEST_F(TradeSimulatorTest, StopBeatsTargetOnSameBar) {
    SessionResult r = run(session_with(
        then(premarket_below(), {ENTRY_ROW, {101.5, 107.0, 99.0, 103.0}}), z1()));
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::STOP);
    EXPECT_NEAR(t.exit_price, STOP_PRICE, 1e-9);
    EXPECT_NEAR(t.r_multiple, -1.0, 1e-9);
    EXPECT_FALSE(t.is_winner);
    EXPECT_EQ(t.bars_held, 1);

    // One-bar trade: favourable at entry, adverse at exit.
    EXPECT_EQ(t.mfe.ts, t.entry_ts);
    EXPECT_EQ(t.mfe.bar_offset, 0);
    EXPECT_EQ(t.mae.ts, t.exit_ts);
    EXPECT_EQ(t.mae.bar_offset, 1);
}

TEST_F(TradeSimulatorTest, ChochAgainstLongClosesAtBarClose) {
    SessionResult r = run(choch_session());
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::CHOCH);
    EXPECT_DOUBLE_EQ(t.exit_price, 100.9);
    EXPECT_EQ(t.exit_ts, et(10, 5));
    EXPECT_EQ(t.bars_held, 6);
    EXPECT_NEAR(t.r_multiple, (100.9 - ENTRY_PRICE) / RISK, 1e-9);
}

TEST_F(TradeSimulatorTest, ChochOnHigherTimeframeSeries) {
    SimulatorConfig same;
    same.choch_timeframe = 3;  // M5 aggregated from the trigger bars
    SessionResult r = run(choch_session(), same);
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::CHOCH);

    SimulatorConfig slow;
    slow.choch_timeframe = 0;  // H4 never breaks in one morning
    r = run(choch_session(), slow);
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::EOD);
    EXPECT_EQ(r.trades[0].exit_ts, et(10, 5));
}

TEST_F(TradeSimulatorTest, ChochExitDisabled) {
    SimulatorConfig cfg;
    cfg.exit.choch_exit = false;
    SessionResult r = run(choch_session(), cfg);
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::EOD);
}

TEST_F(TradeSimulatorTest, ForcedExitAtCutoff) {
    auto bars = then(premarket_below(), {ENTRY_ROW});
    bars.push_back(make_bar(101.5, 101.9, 101.2, 101.7, et(15, 45)));
    bars.push_back(make_bar(101.7, 101.9, 101.2, 101.8, et(15, 50)));
    SessionResult r = run(session_with(bars, z1()));

    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::EOD);
    EXPECT_DOUBLE_EQ(t.exit_price, 101.7);
    EXPECT_EQ(t.exit_ts, et(15, 50));
    EXPECT_EQ(t.exit_bar_idx, 7);
}

TEST_F(TradeSimulatorTest, SummerSessionUsesDaylightClock) {
    constexpr int JULY = 20220701;
    SessionResult r = run(on_date(target_session(), JULY));
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.id, "SPY_070122_EPCH1_0935");
    EXPECT_EQ(t.entry_ts, time_utils::et_clock_ns(JULY, 9, 35));
    EXPECT_EQ(t.exit_ts, time_utils::et_clock_ns(JULY, 9, 45));
    EXPECT_EQ(time_utils::clock_string(t.entry_ts), "09:35:00");
}

TEST_F(TradeSimulatorTest, SummerForcedExitAtLocalCutoff) {
    constexpr int JULY = 20220701;
    auto bars = then(premarket_below(), {ENTRY_ROW});
    bars.push_back(make_bar(101.5, 101.9, 101.2, 101.7, et(15, 45)));
    bars.push_back(make_bar(101.7, 101.9, 101.2, 101.8, et(15, 50)));
    SessionResult r = run(on_date(session_with(bars, z1()), JULY));

    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::EOD);
    EXPECT_DOUBLE_EQ(t.exit_price, 101.7);
    EXPECT_EQ(t.exit_ts, time_utils::et_clock_ns(JULY, 15, 50));
    EXPECT_EQ(time_utils::clock_string(t.exit_ts), "15:50:00");
}

TEST_F(TradeSimulatorTest, EventOnBarPastCutoffGetsEstimatedTime) {
    // A quiet bar, then a gap to a bar closing at 15:55 that sets the MFE and
    // is force-exited at the 15:50 cutoff.
    auto bars = then(premarket_below(), {ENTRY_ROW, {101.5, 101.7, 101.3, 101.6}});
    bars.push_back(make_bar(101.6, 102.9, 101.4, 102.5, et(15, 50)));
    SessionInput in = session_with(bars, z1());
    SessionResult r = run(in);

    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::EOD);
    EXPECT_EQ(t.exit_ts, et(15, 50));
    EXPECT_EQ(t.bars_held, 2);
    EXPECT_DOUBLE_EQ(t.mfe.price, 102.9);
    EXPECT_EQ(t.mfe.bar_offset, 2);
    EXPECT_EQ(t.mfe.ts, et(15, 55));

    auto events = events_of(r, t.id);
    const Event* mfe = nullptr;
    for (const auto& e : events) {
        EXPECT_GE(e.ts, t.entry_ts);
        EXPECT_LE(e.ts, t.exit_ts);
        EXPECT_TRUE(in.spec.in_session(e.ts));
        if (e.type == EventType::MFE) mfe = &e;
    }
    ASSERT_NE(mfe, nullptr);
    // entry 09:35 + 2 bars of 5 minutes
    EXPECT_EQ(mfe->ts, et(9, 45));
    EXPECT_EQ(mfe->bar_offset, 2);
    EXPECT_DOUBLE_EQ(mfe->price, 102.9);
}

TEST_F(TradeSimulatorTest, DataEndClosesOpenTrade) {
    SessionResult r = run(session_with(
        then(premarket_below(), {ENTRY_ROW, {101.5, 101.9, 101.2, 101.7}}), z1()));
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.exit_reason, ExitReason::EOD);
    EXPECT_DOUBLE_EQ(t.exit_price, 101.7);
    EXPECT_EQ(t.exit_ts, et(9, 40));
    EXPECT_EQ(t.bars_held, 1);
}

TEST_F(TradeSimulatorTest, RejectionLongFromAbove) {
    SessionResult r = run(session_with(
        then(make_flat_bars(102.0, 6, et(9, 0)), {{102.0, 102.1, 100.8, 101.3}}), z1()));
    ASSERT_EQ(r.trades.size(), 1u);
    const Trade& t = r.trades[0];
    EXPECT_EQ(t.model, ModelTag::REJECTION_PRIMARY);
    EXPECT_EQ(t.direction, Direction::LONG);
    EXPECT_EQ(t.origin, Origin::ABOVE);
    EXPECT_EQ(t.id, "SPY_010322_EPCH2_0935");
    EXPECT_NEAR(t.risk, 1.35, 1e-9);
}

TEST_F(TradeSimulatorTest, NoEntryBeforeWindowOpens) {
    auto bars = make_flat_bars(99.5, 3, et(8, 30));
    bars.push_back(make_bar(99.5, 101.6, 99.4, 101.5, et(8, 45)));
    SessionResult r = run(session_with(bars, z1()));
    EXPECT_TRUE(r.trades.empty());
    EXPECT_EQ(r.entry_evaluations, 0);
}

TEST_F(TradeSimulatorTest, NoEntryAfterWindowCloses) {
    auto bars = make_flat_bars(99.5, 5, et(15, 20));
    bars.push_back(make_bar(99.5, 101.6, 99.4, 101.5, et(15, 45)));
    SessionResult r = run(session_with(bars, z1()));
    EXPECT_TRUE(r.trades.empty());
}

TEST_F(TradeSimulatorTest, ZoneFreeAgainAfterExit) {
    SessionInput in = target_session();
    // Dips back into the zone from above and closes above it: rejection long.
    in.bars = then(in.bars, {{106.2, 106.3, 100.9, 101.4}});
    SessionResult r = run(in);

    ASSERT_EQ(r.trades.size(), 2u);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::TARGET);
    EXPECT_EQ(r.trades[1].model, ModelTag::REJECTION_PRIMARY);
    EXPECT_EQ(r.trades[1].zone_id, "Z1");
    EXPECT_GT(r.trades[1].entry_ts, r.trades[0].exit_ts);
    EXPECT_EQ(r.trades[1].bars_held, 0);
}

TEST_F(TradeSimulatorTest, AtMostOneOpenTradePerZone) {
    SessionInput in = choch_session();
    in.zones.push_back(make_zone("Z2", 103.0, 102.0));
    SessionResult r = run(in);

    std::map<std::string, std::vector<const Trade*>> by_zone;
    for (const auto& t : r.trades) by_zone[t.zone_id].push_back(&t);
    for (const auto& [zone, trades] : by_zone) {
        for (size_t i = 1; i < trades.size(); ++i) {
            EXPECT_GE(trades[i]->entry_ts, trades[i - 1]->exit_ts) << zone;
        }
    }
    ASSERT_EQ(by_zone["Z1"].size(), 1u);
}

TEST_F(TradeSimulatorTest, IndependentZonesTradeSeparately) {
    SessionInput in = session_with(
        then(premarket_below(), {ENTRY_ROW, {101.5, 104.6, 101.3, 104.5}}),
        {make_zone("Z1", 101.0, 100.0), make_zone("Z2", 104.0, 103.0, ZoneRank::SECONDARY)});
    SessionResult r = run(in);

    ASSERT_EQ(r.trades.size(), 2u);
    EXPECT_EQ(r.trades[0].zone_id, "Z1");
    EXPECT_EQ(r.trades[1].zone_id, "Z2");
    EXPECT_EQ(r.trades[1].model, ModelTag::CONTINUATION_SECONDARY);
    EXPECT_EQ(r.trades[1].id, "SPY_010322_EPCH3_0940");
    EXPECT_LT(r.trades[0].entry_ts, r.trades[1].entry_ts);
}

TEST_F(TradeSimulatorTest, CollidingIdsGetSuffix) {
    SessionInput in = target_session();
    in.zones.push_back(make_zone("Z3", 101.2, 100.5));
    SessionResult r = run(in);

    ASSERT_EQ(r.trades.size(), 2u);
    EXPECT_EQ(r.trades[0].id, "SPY_010322_EPCH1_0935");
    EXPECT_EQ(r.trades[1].id, "SPY_010322_EPCH1_0935_2");
    EXPECT_EQ(r.trades[1].zone_id, "Z3");
}

// ===========================================================================
// Event log
// ===========================================================================
TEST_F(TradeSimulatorTest, EventLogIsOrderedAndComplete) {
    for (const SessionInput& in : {target_session(), choch_session()}) {
        SessionResult r = run(in);
        ASSERT_EQ(r.trades.size(), 1u);
        const Trade& t = r.trades[0];
        auto events = events_of(r, t.id);
        ASSERT_EQ(events.size(), r.events.size());

        EXPECT_EQ(count_type(events, EventType::ENTRY), 1);
        EXPECT_EQ(count_type(events, EventType::MFE), 1);
        EXPECT_EQ(count_type(events, EventType::MAE), 1);
        EXPECT_EQ(count_type(events, EventType::EXIT), 1);
        EXPECT_EQ(events.front().type, EventType::ENTRY);
        EXPECT_EQ(events.back().type, EventType::EXIT);

        for (size_t i = 0; i < events.size(); ++i) {
            EXPECT_EQ(events[i].sequence, static_cast<int>(i));
            EXPECT_GE(events[i].ts, t.entry_ts);
            EXPECT_LE(events[i].ts, t.exit_ts);
            EXPECT_TRUE(in.spec.in_session(events[i].ts));
            EXPECT_EQ(events[i].health_delta, events[i].health_score - t.entry_health.score);
            if (i > 0) EXPECT_GE(events[i].ts, events[i - 1].ts);
        }
        EXPECT_EQ(events.front().health_delta, 0);
        EXPECT_EQ(events.back().health_score, t.exit_health.score);
    }
}

TEST_F(TradeSimulatorTest, HealthChangeEventsOnlyOnScoreChange) {
    SessionResult r = run(choch_session());
    ASSERT_EQ(r.trades.size(), 1u);
    int last = r.trades[0].entry_health.score;
    for (const auto& e : r.events) {
        if (e.type != EventType::HEALTH_CHANGE) continue;
        EXPECT_NE(e.health_score, last);
        last = e.health_score;
    }
}

TEST_F(TradeSimulatorTest, EventsGroupedByTradeOrder) {
    SessionInput in = session_with(
        then(premarket_below(), {ENTRY_ROW, {101.5, 104.6, 101.3, 104.5}}),
        {make_zone("Z1", 101.0, 100.0), make_zone("Z2", 104.0, 103.0)});
    SessionResult r = run(in);
    ASSERT_EQ(r.trades.size(), 2u);

    size_t first_count = events_of(r, r.trades[0].id).size();
    for (size_t i = 0; i < r.events.size(); ++i) {
        const std::string& expected = i < first_count ? r.trades[0].id : r.trades[1].id;
        EXPECT_EQ(r.events[i].trade_id, expected);
    }
}

// ===========================================================================
// Input handling
// ===========================================================================
TEST_F(TradeSimulatorTest, EmptySessionHasNoResult) {
    TradeSimulator sim{SimulatorConfig{}};
    EXPECT_FALSE(sim.run(session_with({}, z1())).has_value());
}

TEST_F(TradeSimulatorTest, InvalidAndDuplicateZonesAreSkipped) {
    SessionInput in = target_session();
    in.zones.push_back(make_zone("BAD", 100.0, 101.0));
    in.zones.push_back(make_zone("Z1", 111.0, 110.0));
    SessionResult r = run(in);
    EXPECT_EQ(r.zones_total, 3);
    EXPECT_EQ(r.skipped_zones, 2);
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(r.trades[0].zone_high, 101.0);
}

TEST_F(TradeSimulatorTest, CountersTrackEvaluations) {
    SessionResult r = run(target_session());
    EXPECT_EQ(r.bars_processed, 9);
    EXPECT_EQ(r.entry_evaluations, 2);
    EXPECT_EQ(r.skipped_evaluations, 0);
    EXPECT_EQ(r.skipped_min_risk, 0);
}

TEST_F(TradeSimulatorTest, NoPriorOutsideCloseCountsAsSkipped) {
    SessionResult r = run(session_with(
        then(make_flat_bars(100.5, 6, et(9, 0)), {{100.5, 101.6, 100.4, 101.5}}), z1()));
    EXPECT_TRUE(r.trades.empty());
    EXPECT_EQ(r.skipped_evaluations, 2);
}

TEST_F(TradeSimulatorTest, OutOfOrderBarsThrow) {
    SessionInput in = target_session();
    std::swap(in.bars[2], in.bars[3]);
    TradeSimulator sim{SimulatorConfig{}};
    EXPECT_THROW(sim.run(in), std::invalid_argument);
}

TEST_F(TradeSimulatorTest, InvalidSessionSpecThrows) {
    SessionInput in = target_session();
    in.spec.ticker.clear();
    TradeSimulator sim{SimulatorConfig{}};
    EXPECT_THROW(sim.run(in), std::invalid_argument);
}

TEST_F(TradeSimulatorTest, ExternalSeriesMatchesAggregation) {
    SessionInput aggregated = choch_session();
    SessionInput external = choch_session();
    external.htf_bars["M5"] = external.bars;

    SessionResult a = run(aggregated);
    SessionResult b = run(external);
    EXPECT_EQ(backtest_io::to_json(a), backtest_io::to_json(b));
}

TEST_F(TradeSimulatorTest, DeterministicAcrossRunsAndInstances) {
    SimulatorConfig cfg;
    TradeSimulator sim(cfg);
    auto first = sim.run(choch_session());
    auto again = sim.run(choch_session());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(backtest_io::to_json(*first), backtest_io::to_json(*again));
    EXPECT_EQ(backtest_io::to_json(*first), backtest_io::to_json(run(choch_session(), cfg)));
}

// ===========================================================================
// Config and identifiers
// ===========================================================================
TEST(SimulatorConfigTest, Validation) {
    SimulatorConfig cfg;
    EXPECT_NO_THROW(cfg.validate());

    SimulatorConfig too_many;
    too_many.higher_timeframes.push_back(timeframes::m5());
    EXPECT_THROW(too_many.validate(), std::invalid_argument);

    SimulatorConfig bad_choch;
    bad_choch.choch_timeframe = 4;
    EXPECT_THROW(bad_choch.validate(), std::invalid_argument);
    EXPECT_THROW(TradeSimulator{bad_choch}, std::invalid_argument);

    SimulatorConfig zero_interval;
    zero_interval.trigger_tf.interval_s = 0;
    EXPECT_THROW(zero_interval.validate(), std::invalid_argument);
}

TEST(SimulatorConfigTest, FewerHigherTimeframesAllowed) {
    SimulatorConfig cfg;
    cfg.higher_timeframes = {timeframes::h1()};
    EXPECT_NO_THROW(cfg.validate());
    SessionResult r = run(target_session(), cfg);
    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_FALSE(r.trades[0].entry_health.factors[health_factor::HTF_3]);
}

TEST(TradeIdTest, Format) {
    EXPECT_EQ(TradeSimulator::make_trade_id("SPY", ModelTag::CONTINUATION_PRIMARY, et(9, 35)),
              "SPY_010322_EPCH1_0935");
    EXPECT_EQ(TradeSimulator::make_trade_id("SPY", ModelTag::CONTINUATION_PRIMARY,
                                            time_utils::et_clock_ns(20220701, 9, 35)),
              "SPY_070122_EPCH1_0935");
    EXPECT_EQ(TradeSimulator::make_trade_id("QQQ", ModelTag::REJECTION_SECONDARY, et(14, 5)),
              "QQQ_010322_EPCH4_1405");
}

TEST(SessionSpecTest, RegularHours) {
    SessionSpec s = SessionSpec::regular("SPY", SESSION_DATE);
    EXPECT_NO_THROW(s.validate());
    EXPECT_EQ(s.session_start_ns, et(9, 30));
    EXPECT_EQ(s.session_end_ns, et(16, 0));
    EXPECT_EQ(s.entry_end_ns, et(15, 45));
    EXPECT_EQ(s.force_exit_ns, et(15, 50));
    EXPECT_TRUE(s.in_entry_window(et(15, 45)));
    EXPECT_FALSE(s.in_entry_window(et(15, 50)));
    EXPECT_TRUE(s.in_session(et(16, 0)));
}

TEST(SessionSpecTest, SummerHoursFollowDaylightTime) {
    SessionSpec s = SessionSpec::regular("SPY", 20220701);
    EXPECT_NO_THROW(s.validate());
    // 09:30 EDT = 13:30 UTC
    EXPECT_EQ(s.session_start_ns, 1656682200ULL * test_helpers::NS_PER_SEC);
    EXPECT_EQ(s.session_end_ns - s.session_start_ns, 390 * test_helpers::NS_PER_MIN);
    EXPECT_EQ(time_utils::clock_string(s.entry_end_ns), "15:45:00");
    EXPECT_EQ(time_utils::clock_string(s.force_exit_ns), "15:50:00");
    EXPECT_EQ(time_utils::et_date(s.session_start_ns), 20220701);
}

TEST(SessionSpecTest, RejectsInconsistentWindows) {
    SessionSpec s = SessionSpec::regular("SPY", SESSION_DATE);
    s.force_exit_ns = et(15, 40);
    EXPECT_THROW(s.validate(), std::invalid_argument);

    SessionSpec t = SessionSpec::regular("SPY", SESSION_DATE);
    t.entry_start_ns = et(9, 0);
    EXPECT_THROW(t.validate(), std::invalid_argument);
}
