#pragma once

#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "data/zone.hpp"
#include "structure/structure_detector.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

enum class TradeState { OPEN, CLOSED };

// ---------------------------------------------------------------------------
// ExitConfig
// ---------------------------------------------------------------------------
struct ExitConfig {
    bool choch_exit = true;  // close on a change of character against the trade
};

struct ExitDecision {
    ExitReason reason = ExitReason::EOD;
    double price = 0.0;
    uint64_t ts = 0;
};

// ---------------------------------------------------------------------------
// ExitStateMachine — OPEN -> CLOSED, first matching condition wins
//
//   1. STOP    intrabar touch of the stop level, filled at the stop
//   2. TARGET  intrabar touch of the target, filled at the target
//   3. CHOCH   change of character against the trade, filled at the close
//   4. EOD     bar closes at or after the cutoff, filled at the close and
//              stamped with the cutoff
// ---------------------------------------------------------------------------
class ExitStateMachine {
public:
    ExitStateMachine(std::string trade_id, Direction dir, double stop, double target,
                     uint64_t force_exit_ns, const ExitConfig& cfg = {})
        : trade_id_(std::move(trade_id)), dir_(dir), stop_(stop), target_(target),
          force_exit_ns_(force_exit_ns), cfg_(cfg) {}

    std::optional<ExitDecision> evaluate(const Bar& bar, const StructureState& choch_tf,
                                         int bar_index) {
        require_open(bar_index);

        // A bar closing past the cutoff never stamps an exit after it.
        uint64_t ts = std::min(bar.close_ts, force_exit_ns_);

        std::optional<ExitDecision> decision;
        if (stop_hit(bar)) {
            decision = ExitDecision{ExitReason::STOP, stop_, ts};
        } else if (target_hit(bar)) {
            decision = ExitDecision{ExitReason::TARGET, target_, ts};
        } else if (cfg_.choch_exit && choch_tf.choch_against(to_structure(dir_))) {
            decision = ExitDecision{ExitReason::CHOCH, bar.close, ts};
        } else if (bar.close_ts >= force_exit_ns_) {
            decision = ExitDecision{ExitReason::EOD, bar.close, force_exit_ns_};
        }

        if (decision) state_ = TradeState::CLOSED;
        return decision;
    }

    // Bar stream ended with the trade still open.
    ExitDecision close_at_data_end(const Bar& last_bar, int bar_index) {
        require_open(bar_index);
        state_ = TradeState::CLOSED;
        return ExitDecision{ExitReason::EOD, last_bar.close,
                            std::min(last_bar.close_ts, force_exit_ns_)};
    }

    bool stop_hit(const Bar& bar) const {
        return dir_ == Direction::LONG ? bar.low <= stop_ : bar.high >= stop_;
    }

    bool target_hit(const Bar& bar) const {
        return dir_ == Direction::LONG ? bar.high >= target_ : bar.low <= target_;
    }

    TradeState state() const { return state_; }
    bool is_open() const { return state_ == TradeState::OPEN; }
    const std::string& trade_id() const { return trade_id_; }

    static StructureDirection to_structure(Direction d) {
        return d == Direction::LONG ? StructureDirection::BULL : StructureDirection::BEAR;
    }

private:
    std::string trade_id_;
    Direction dir_;
    double stop_;
    double target_;
    uint64_t force_exit_ns_;
    ExitConfig cfg_;
    TradeState state_ = TradeState::OPEN;

    void require_open(int bar_index) const {
        if (state_ == TradeState::CLOSED) {
            throw InvariantViolation("exit evaluated on a closed trade", trade_id_, bar_index);
        }
    }
};
