#pragma once

#include "bars/bar.hpp"
#include "data/zone.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Zone row as loaded from CSV. date == 0 and empty ticker apply to every session.
struct ZoneRecord {
    std::string ticker;
    int date = 0;
    Zone zone;
};

namespace csv_io {

inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        while (!field.empty() && (field.back() == '\r' || field.back() == ' ')) field.pop_back();
        size_t start = field.find_first_not_of(' ');
        fields.push_back(start == std::string::npos ? "" : field.substr(start));
    }
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

// Column name -> index. Throws if a required column is missing.
inline std::map<std::string, size_t> index_header(const std::string& line,
                                                  const std::vector<std::string>& required) {
    std::map<std::string, size_t> cols;
    auto names = split_line(line);
    for (size_t i = 0; i < names.size(); ++i) cols[names[i]] = i;
    for (const auto& r : required) {
        if (!cols.count(r)) throw std::runtime_error("CSV header missing column: " + r);
    }
    return cols;
}

inline double parse_double(const std::string& s, int line_no) {
    if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Line " + std::to_string(line_no) + ": not a number: " + s);
    }
}

inline uint64_t parse_u64(const std::string& s, int line_no) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Line " + std::to_string(line_no) + ": not an integer: " + s);
    }
    return std::stoull(s);
}

inline const std::string& field(const std::vector<std::string>& row,
                                const std::map<std::string, size_t>& cols,
                                const std::string& name) {
    static const std::string EMPTY;
    auto it = cols.find(name);
    if (it == cols.end() || it->second >= row.size()) return EMPTY;
    return row[it->second];
}

// ---------------------------------------------------------------------------
// Zones: id,high,low,bias,rank[,target][,poc][,ticker][,date]
// ---------------------------------------------------------------------------
inline std::vector<ZoneRecord> read_zones(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) throw std::runtime_error("Zone CSV is empty");
    auto cols = index_header(line, {"id", "high", "low", "bias", "rank"});

    std::vector<ZoneRecord> zones;
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto row = split_line(line);

        ZoneRecord rec;
        rec.ticker = field(row, cols, "ticker");
        const std::string& date = field(row, cols, "date");
        rec.date = date.empty() ? 0 : static_cast<int>(parse_u64(date, line_no));

        Zone& z = rec.zone;
        z.id = field(row, cols, "id");
        z.high = parse_double(field(row, cols, "high"), line_no);
        z.low = parse_double(field(row, cols, "low"), line_no);
        try {
            z.bias = parse_zone_bias(field(row, cols, "bias"));
            z.rank = parse_zone_rank(field(row, cols, "rank"));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": " + e.what());
        }
        z.target = parse_double(field(row, cols, "target"), line_no);
        z.poc = parse_double(field(row, cols, "poc"), line_no);
        zones.push_back(std::move(rec));
    }
    return zones;
}

inline std::vector<ZoneRecord> load_zones(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open zone file: " + path);
    return read_zones(in);
}

// Zones that apply to one (ticker, date).
inline std::vector<Zone> zones_for(const std::vector<ZoneRecord>& records,
                                   const std::string& ticker, int date) {
    std::vector<Zone> out;
    for (const auto& r : records) {
        if (!r.ticker.empty() && r.ticker != ticker) continue;
        if (r.date != 0 && r.date != date) continue;
        out.push_back(r.zone);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Bars: ts_event,open,high,low,close,volume[,close_ts]
// ts_event is the bar open in UTC nanoseconds. Without close_ts the bar
// closes interval_s after it opens.
// ---------------------------------------------------------------------------
inline std::vector<Bar> read_bars(std::istream& in, uint64_t interval_s) {
    std::string line;
    if (!std::getline(in, line)) throw std::runtime_error("Bar CSV is empty");
    auto cols = index_header(line, {"ts_event", "open", "high", "low", "close", "volume"});

    std::vector<Bar> bars;
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto row = split_line(line);

        Bar bar{};
        bar.open_ts = parse_u64(field(row, cols, "ts_event"), line_no);
        const std::string& close_ts = field(row, cols, "close_ts");
        bar.close_ts = close_ts.empty() ? bar.open_ts + interval_s * time_utils::NS_PER_SEC
                                        : parse_u64(close_ts, line_no);
        bar.open = parse_double(field(row, cols, "open"), line_no);
        bar.high = parse_double(field(row, cols, "high"), line_no);
        bar.low = parse_double(field(row, cols, "low"), line_no);
        bar.close = parse_double(field(row, cols, "close"), line_no);
        bar.volume = parse_u64(field(row, cols, "volume"), line_no);

        if (!std::isfinite(bar.open) || !std::isfinite(bar.close) || !(bar.high >= bar.low)) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": malformed OHLC");
        }
        bars.push_back(bar);
    }
    return bars;
}

inline std::vector<Bar> load_bars(const std::string& path, uint64_t interval_s) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open bar file: " + path);
    return read_bars(in, interval_s);
}

// Split a multi-day series by ET calendar date of the bar open.
inline std::map<int, std::vector<Bar>> split_by_date(const std::vector<Bar>& bars) {
    std::map<int, std::vector<Bar>> days;
    for (const auto& bar : bars) days[time_utils::et_date(bar.open_ts)].push_back(bar);
    return days;
}

}  // namespace csv_io
