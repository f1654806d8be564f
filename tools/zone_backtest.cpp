// zone_backtest.cpp — CLI tool for running the zone backtest over OHLCV bars
//
// Pipeline: DBN / CSV bars -> per-date SessionInput -> SessionRunner -> JSON or Parquet.
//
// Usage: ./zone_backtest --ticker <sym> --bars <path> --zones <csv> --output <path>

#include "backtest/backtest_result_io.hpp"
#include "backtest/session_runner.hpp"
#include "backtest/trade_simulator.hpp"
#include "data/csv_io.hpp"
#include "data/session.hpp"
#include "time_utils.hpp"

#include <databento/dbn_file_store.hpp>
#include <databento/record.hpp>

// Arrow/Parquet for Parquet output
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr double DBN_PRICE_SCALE = 1e-9;

// ===========================================================================
// Bar loading
// ===========================================================================
bool is_dbn_path(const std::string& path) {
    return path.find(".dbn") != std::string::npos;
}

// OHLCV records from a DBN file. instrument_id == 0 keeps every instrument.
std::vector<Bar> load_dbn_bars(const std::string& path, uint64_t interval_s,
                               uint32_t instrument_id) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Bar file not found: " + path);
    }
    std::vector<Bar> bars;
    databento::DbnFileStore store{std::filesystem::path(path)};
    while (const auto* record = store.NextRecord()) {
        if (const auto* ohlcv = record->GetIf<databento::OhlcvMsg>()) {
            if (instrument_id != 0 && ohlcv->hd.instrument_id != instrument_id) continue;
            Bar bar{};
            bar.open_ts = static_cast<uint64_t>(ohlcv->hd.ts_event.time_since_epoch().count());
            bar.close_ts = bar.open_ts + interval_s * time_utils::NS_PER_SEC;
            bar.open = static_cast<double>(ohlcv->open) * DBN_PRICE_SCALE;
            bar.high = static_cast<double>(ohlcv->high) * DBN_PRICE_SCALE;
            bar.low = static_cast<double>(ohlcv->low) * DBN_PRICE_SCALE;
            bar.close = static_cast<double>(ohlcv->close) * DBN_PRICE_SCALE;
            bar.volume = ohlcv->volume;
            bars.push_back(bar);
        }
    }
    return bars;
}

// ===========================================================================
// Parquet output
// ===========================================================================
void check_status(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b) {
    std::shared_ptr<arrow::Array> arr;
    check_status(b.Finish(&arr), "Arrow builder");
    return arr;
}

std::shared_ptr<arrow::Array> string_column(const std::vector<std::string>& values) {
    arrow::StringBuilder b;
    for (const auto& v : values) check_status(b.Append(v), "Arrow append");
    return finish(b);
}

std::shared_ptr<arrow::Array> int64_column(const std::vector<int64_t>& values) {
    arrow::Int64Builder b;
    check_status(b.AppendValues(values), "Arrow append");
    return finish(b);
}

std::shared_ptr<arrow::Array> double_column(const std::vector<double>& values) {
    arrow::DoubleBuilder b;
    check_status(b.AppendValues(values), "Arrow append");
    return finish(b);
}

std::shared_ptr<arrow::Array> bool_column(const std::vector<bool>& values) {
    arrow::BooleanBuilder b;
    for (bool v : values) check_status(b.Append(v), "Arrow append");
    return finish(b);
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    check_status(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                            /*chunk_size=*/table->num_rows(), props),
                 "Failed to write Parquet");
    check_status(outfile->Close(), "Failed to close Parquet file");
}

void write_trades_parquet(const std::vector<Trade>& trades, const std::string& path) {
    std::vector<std::string> ids, tickers, zone_ids, directions, models, exit_reasons, target_kinds;
    std::vector<int64_t> entry_ts, exit_ts, bars_held, entry_health, exit_health;
    std::vector<double> entry_price, stop_price, target, exit_price, risk, pnl, r_multiple,
        mfe_price, mae_price, mfe_r, mae_r;
    std::vector<bool> winners;

    for (const auto& t : trades) {
        ids.push_back(t.id);
        tickers.push_back(t.ticker);
        zone_ids.push_back(t.zone_id);
        directions.push_back(to_string(t.direction));
        models.push_back(to_string(t.model));
        exit_reasons.push_back(to_string(t.exit_reason));
        target_kinds.push_back(to_string(t.target_kind));
        entry_ts.push_back(static_cast<int64_t>(t.entry_ts));
        exit_ts.push_back(static_cast<int64_t>(t.exit_ts));
        bars_held.push_back(t.bars_held);
        entry_health.push_back(t.entry_health.score);
        exit_health.push_back(t.exit_health.score);
        entry_price.push_back(t.entry_price);
        stop_price.push_back(t.stop_price);
        target.push_back(t.target);
        exit_price.push_back(t.exit_price);
        risk.push_back(t.risk);
        pnl.push_back(t.pnl);
        r_multiple.push_back(t.r_multiple);
        mfe_price.push_back(t.mfe.price);
        mae_price.push_back(t.mae.price);
        mfe_r.push_back(t.mfe_r());
        mae_r.push_back(t.mae_r());
        winners.push_back(t.is_winner);
    }

    arrow::FieldVector fields = {
        arrow::field("trade_id", arrow::utf8()),
        arrow::field("ticker", arrow::utf8()),
        arrow::field("zone_id", arrow::utf8()),
        arrow::field("direction", arrow::utf8()),
        arrow::field("model", arrow::utf8()),
        arrow::field("exit_reason", arrow::utf8()),
        arrow::field("target_kind", arrow::utf8()),
        arrow::field("entry_ts", arrow::int64()),
        arrow::field("exit_ts", arrow::int64()),
        arrow::field("bars_held", arrow::int64()),
        arrow::field("entry_health", arrow::int64()),
        arrow::field("exit_health", arrow::int64()),
        arrow::field("entry_price", arrow::float64()),
        arrow::field("stop_price", arrow::float64()),
        arrow::field("target", arrow::float64()),
        arrow::field("exit_price", arrow::float64()),
        arrow::field("risk", arrow::float64()),
        arrow::field("pnl", arrow::float64()),
        arrow::field("r_multiple", arrow::float64()),
        arrow::field("mfe_price", arrow::float64()),
        arrow::field("mae_price", arrow::float64()),
        arrow::field("mfe_r", arrow::float64()),
        arrow::field("mae_r", arrow::float64()),
        arrow::field("is_winner", arrow::boolean()),
    };

    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        string_column(ids), string_column(tickers), string_column(zone_ids),
        string_column(directions), string_column(models), string_column(exit_reasons),
        string_column(target_kinds),
        int64_column(entry_ts), int64_column(exit_ts), int64_column(bars_held),
        int64_column(entry_health), int64_column(exit_health),
        double_column(entry_price), double_column(stop_price), double_column(target),
        double_column(exit_price), double_column(risk), double_column(pnl),
        double_column(r_multiple), double_column(mfe_price), double_column(mae_price),
        double_column(mfe_r), double_column(mae_r),
        bool_column(winners),
    };

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), path);
}

void write_events_parquet(const std::vector<Event>& events, const std::string& path) {
    std::vector<std::string> trade_ids, types;
    std::vector<int64_t> sequence, ts, bar_offset, health, delta;
    std::vector<double> price;
    std::vector<std::vector<bool>> factors(HEALTH_FACTOR_COUNT);

    for (const auto& e : events) {
        trade_ids.push_back(e.trade_id);
        types.push_back(to_string(e.type));
        sequence.push_back(e.sequence);
        ts.push_back(static_cast<int64_t>(e.ts));
        bar_offset.push_back(e.bar_offset);
        health.push_back(e.health_score);
        delta.push_back(e.health_delta);
        price.push_back(e.price);
        for (int f = 0; f < HEALTH_FACTOR_COUNT; ++f) factors[f].push_back(e.factors[f]);
    }

    arrow::FieldVector fields = {
        arrow::field("trade_id", arrow::utf8()),
        arrow::field("event_type", arrow::utf8()),
        arrow::field("sequence", arrow::int64()),
        arrow::field("ts", arrow::int64()),
        arrow::field("bar_offset", arrow::int64()),
        arrow::field("health_score", arrow::int64()),
        arrow::field("health_delta", arrow::int64()),
        arrow::field("price", arrow::float64()),
    };
    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        string_column(trade_ids), string_column(types), int64_column(sequence),
        int64_column(ts), int64_column(bar_offset), int64_column(health),
        int64_column(delta), double_column(price),
    };
    for (int f = 0; f < HEALTH_FACTOR_COUNT; ++f) {
        fields.push_back(arrow::field(health_factor::name(f), arrow::boolean()));
        arrays.push_back(bool_column(factors[f]));
    }

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), path);
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --ticker <sym> --bars <path> --zones <csv> --output <path> [options]\n"
              << "\n"
              << "  --ticker         Symbol used in trade ids\n"
              << "  --bars           OHLCV bars (.dbn / .dbn.zst or .csv)\n"
              << "  --zones          Zone CSV (id,high,low,bias,rank[,target,poc,ticker,date])\n"
              << "  --output         Output file (.json, or .parquet for trades + <stem>_events.parquet)\n"
              << "  --interval       Trigger bar interval in seconds (default 300)\n"
              << "  --instrument-id  DBN instrument filter (default: all)\n"
              << "  --date           Run a single YYYYMMDD session\n"
              << "  --lookback-s     Origin lookback in seconds (default 15000)\n"
              << "  --stop-buffer    Stop distance beyond the zone (default 0.05)\n"
              << "  --target-r       Target R multiple (default 3.0)\n"
              << "  --fractal-bars   Bars each side of a swing point (default 2)\n"
              << "  --choch-tf       -1 = trigger series, else higher-timeframe index (default -1)\n"
              << "  --no-choch       Disable ChoCH exits\n"
              << "  --workers        Worker threads, 0 = hardware (default 1)\n"
              << "  --verbose        Per-session progress\n";
}

}  // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string ticker;
    std::string bars_path;
    std::string zones_path;
    std::string output_path;
    uint32_t instrument_id = 0;
    int only_date = 0;

    SimulatorConfig sim_cfg;
    RunnerConfig runner_cfg;

    // Parse CLI args
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--ticker" && i + 1 < argc) {
                ticker = argv[++i];
            } else if (arg == "--bars" && i + 1 < argc) {
                bars_path = argv[++i];
            } else if (arg == "--zones" && i + 1 < argc) {
                zones_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--interval" && i + 1 < argc) {
                sim_cfg.trigger_tf = Timeframe{"TRIGGER", std::stoull(argv[++i])};
            } else if (arg == "--instrument-id" && i + 1 < argc) {
                instrument_id = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--date" && i + 1 < argc) {
                only_date = std::stoi(argv[++i]);
            } else if (arg == "--lookback-s" && i + 1 < argc) {
                sim_cfg.entry.origin_lookback_s = std::stoull(argv[++i]);
            } else if (arg == "--stop-buffer" && i + 1 < argc) {
                sim_cfg.entry.stop_buffer = std::stod(argv[++i]);
            } else if (arg == "--target-r" && i + 1 < argc) {
                sim_cfg.entry.target_r_multiple = std::stod(argv[++i]);
            } else if (arg == "--fractal-bars" && i + 1 < argc) {
                sim_cfg.structure.fractal_bars = std::stoi(argv[++i]);
            } else if (arg == "--choch-tf" && i + 1 < argc) {
                sim_cfg.choch_timeframe = std::stoi(argv[++i]);
            } else if (arg == "--no-choch") {
                sim_cfg.exit.choch_exit = false;
            } else if (arg == "--workers" && i + 1 < argc) {
                runner_cfg.workers = std::stoi(argv[++i]);
            } else if (arg == "--verbose") {
                runner_cfg.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Validate required args
    if (ticker.empty() || bars_path.empty() || zones_path.empty() || output_path.empty()) {
        std::cerr << "Missing required argument\n";
        print_usage(argv[0]);
        return 1;
    }

    // Detect output format by file extension
    std::filesystem::path out(output_path);
    bool use_parquet = out.extension() == ".parquet";
    if (!use_parquet && out.extension() != ".json") {
        std::cerr << "Unsupported output format. Use .json or .parquet extension.\n";
        return 1;
    }

    try {
        sim_cfg.validate();
        uint64_t interval_s = sim_cfg.trigger_tf.interval_s;

        std::cout << "Loading bars: " << bars_path << "\n";
        std::vector<Bar> bars = is_dbn_path(bars_path)
            ? load_dbn_bars(bars_path, interval_s, instrument_id)
            : csv_io::load_bars(bars_path, interval_s);
        auto zones = csv_io::load_zones(zones_path);
        std::cout << "  " << bars.size() << " bars, " << zones.size() << " zones\n";

        std::vector<SessionInput> inputs;
        for (auto& [date, day_bars] : csv_io::split_by_date(bars)) {
            if (only_date != 0 && date != only_date) continue;
            SessionInput input;
            input.spec = SessionSpec::regular(ticker, date);
            input.bars = std::move(day_bars);
            input.zones = csv_io::zones_for(zones, ticker, date);
            inputs.push_back(std::move(input));
        }
        std::cout << "Running " << inputs.size() << " sessions\n";

        SessionRunner runner(sim_cfg, runner_cfg);
        auto outcomes = runner.run_all(inputs);
        BacktestResult agg = runner.aggregate(outcomes);

        int halted = 0;
        for (const auto& o : outcomes) {
            if (o.halted) {
                ++halted;
                std::cerr << "  HALTED " << o.spec.date << ": " << o.diagnostic << "\n";
            }
        }

        if (use_parquet) {
            std::vector<Event> events;
            for (const auto& o : outcomes) {
                if (o.result) {
                    events.insert(events.end(), o.result->events.begin(), o.result->events.end());
                }
            }
            std::filesystem::path events_path = out;
            events_path.replace_filename(out.stem().string() + "_events.parquet");
            write_trades_parquet(agg.trades, output_path);
            write_events_parquet(events, events_path.string());
        } else {
            std::ofstream json(output_path);
            if (!json.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
            json << backtest_io::to_json(outcomes, agg) << "\n";
        }

        std::cout << "Trades: " << agg.total_trades
                  << "  win rate: " << agg.win_rate
                  << "  total R: " << agg.total_r
                  << "  expectancy R: " << agg.expectancy_r
                  << "  halted sessions: " << halted << "\n";
        std::cout << "Wrote " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
