#pragma once

#include "backtest/backtest_result.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"
#include "data/session.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RunnerConfig
// ---------------------------------------------------------------------------
struct RunnerConfig {
    int workers = 1;       // <= 0: one per hardware thread
    bool verbose = false;  // progress on stdout, halts on stderr
};

// ---------------------------------------------------------------------------
// SessionOutcome — result of a single session's backtest
// ---------------------------------------------------------------------------
struct SessionOutcome {
    SessionSpec spec;
    std::optional<SessionResult> result;
    BacktestResult summary;
    int bar_count = 0;

    bool skipped = false;      // no bars
    std::string skip_reason;

    bool halted = false;       // invariant violation, unusable input or other failure
    std::string diagnostic;
    std::string halted_trade_id;
    int halted_bar_index = -1;
};

// ---------------------------------------------------------------------------
// SessionRunner — runs independent sessions, optionally on worker threads
//
// Each session gets its own TradeSimulator; nothing mutable is shared between
// sessions. Outcomes come back in input order regardless of worker count.
// A failing session is reported as halted; it never takes down the run.
// ---------------------------------------------------------------------------
class SessionRunner {
public:
    // Replaces the per-session TradeSimulator pass when set.
    using SessionBody = std::function<std::optional<SessionResult>(const SessionInput&)>;

    explicit SessionRunner(const SimulatorConfig& config, const RunnerConfig& runner = {},
                           SessionBody body = nullptr)
        : config_(config), runner_(runner), body_(std::move(body)) {
        config_.validate();
    }

    SessionOutcome run_session(const SessionInput& input) const {
        SessionOutcome out{};
        out.spec = input.spec;
        out.bar_count = static_cast<int>(input.bars.size());

        try {
            if (body_) {
                out.result = body_(input);
            } else {
                TradeSimulator sim(config_);
                out.result = sim.run(input);
            }
        } catch (const InvariantViolation& e) {
            out.halted = true;
            out.diagnostic = e.what();
            out.halted_trade_id = e.trade_id();
            out.halted_bar_index = e.bar_index();
        } catch (const std::invalid_argument& e) {
            out.halted = true;
            out.diagnostic = e.what();
        } catch (const std::exception& e) {
            out.halted = true;
            out.diagnostic = std::string("unexpected error: ") + e.what();
        }

        if (out.halted) {
            log_error(input.spec, "halted: " + out.diagnostic);
            return out;
        }
        if (!out.result) {
            out.skipped = true;
            out.skip_reason = "No bars";
            log_info(input.spec, "skipped (no bars)");
            return out;
        }

        out.summary = backtest_util::summarize(out.result->trades);
        log_info(input.spec, std::to_string(out.summary.total_trades) + " trades, " +
                                 std::to_string(out.result->skipped_zones) + " zones skipped");
        return out;
    }

    std::vector<SessionOutcome> run_all(const std::vector<SessionInput>& inputs) const {
        std::vector<SessionOutcome> outcomes(inputs.size());
        int workers = worker_count(inputs.size());

        if (workers <= 1) {
            for (size_t i = 0; i < inputs.size(); ++i) outcomes[i] = run_session(inputs[i]);
            return outcomes;
        }

        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                for (size_t i = next++; i < inputs.size(); i = next++) {
                    outcomes[i] = run_session(inputs[i]);
                }
            });
        }
        for (auto& t : pool) t.join();
        return outcomes;
    }

    BacktestResult aggregate(const std::vector<SessionOutcome>& outcomes) const {
        BacktestResult agg{};
        int active_sessions = 0;

        for (const auto& o : outcomes) {
            if (o.skipped || o.halted || !o.result) continue;
            ++active_sessions;
            agg.trades.insert(agg.trades.end(),
                              o.result->trades.begin(), o.result->trades.end());
            agg.session_r.push_back(o.summary.total_r);
        }

        backtest_util::recompute_derived(agg, active_sessions);
        return agg;
    }

    const SimulatorConfig& config() const { return config_; }

private:
    SimulatorConfig config_;
    RunnerConfig runner_;
    SessionBody body_;
    mutable std::mutex log_mutex_;

    int worker_count(size_t sessions) const {
        int w = runner_.workers;
        if (w <= 0) w = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
        return std::min<int>(w, static_cast<int>(std::max<size_t>(sessions, 1)));
    }

    void log_info(const SessionSpec& spec, const std::string& msg) const {
        if (!runner_.verbose) return;
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cout << "[" << spec.ticker << " " << spec.date << "] " << msg << "\n";
    }

    void log_error(const SessionSpec& spec, const std::string& msg) const {
        if (!runner_.verbose) return;
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cerr << "[" << spec.ticker << " " << spec.date << "] " << msg << "\n";
    }
};
