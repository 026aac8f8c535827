#pragma once

#include "bars/bar.hpp"
#include "time_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// bar_csv — load OHLCV bars from CSV
//
//   timestamp,open,high,low,close,volume[,vwap]
//
// timestamp: epoch seconds, milliseconds or nanoseconds (by magnitude), or an
// ET wall-clock "YYYY-MM-DD" / "YYYY-MM-DD HH:MM[:SS]" ("T" separator also
// accepted). A first row whose open column is not numeric is a header.
// ---------------------------------------------------------------------------
namespace bar_csv {

namespace detail {

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

inline std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) cols.push_back(trim(col));
    return cols;
}

inline bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

inline bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}  // namespace detail

// Parse one timestamp field. Throws std::invalid_argument if unrecognized.
inline uint64_t parse_timestamp(const std::string& field) {
    if (detail::is_all_digits(field)) {
        uint64_t v = std::stoull(field);
        if (v < 100'000'000'000ULL) return v * time_utils::NS_PER_SEC;       // seconds
        if (v < 100'000'000'000'000ULL) return v * 1'000'000ULL;             // milliseconds
        return v;                                                            // nanoseconds
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    char sep = ' ';
    int n = std::sscanf(field.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                        &y, &mo, &d, &sep, &h, &mi, &s);
    bool date_only = (n == 3);
    bool with_time = (n >= 6 && (sep == ' ' || sep == 'T'));
    if (!date_only && !with_time) {
        throw std::invalid_argument("unrecognized timestamp '" + field + "'");
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) {
        throw std::invalid_argument("timestamp out of range '" + field + "'");
    }
    return time_utils::et_wall_clock_to_ns(y, mo, d, h, mi, s);
}

// Parse rows from a stream. Bars are returned in file order; callers run
// bars::normalize() before use. Bad rows throw std::invalid_argument.
inline std::vector<Bar> parse_bars(std::istream& in) {
    std::vector<Bar> out;
    std::string line;
    int line_no = 0;
    bool first_data_row = true;

    while (std::getline(in, line)) {
        ++line_no;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        if (detail::trim(line).empty()) continue;

        auto cols = detail::split_row(line);
        std::string where = "line " + std::to_string(line_no) + ": ";

        if (first_data_row) {
            first_data_row = false;
            double probe = 0.0;
            if (cols.size() >= 2 && !detail::parse_double(cols[1], probe)) continue;  // header
        }

        if (cols.size() < 6) {
            throw std::invalid_argument(where + "expected at least 6 columns, got " +
                                     std::to_string(cols.size()));
        }

        Bar bar{};
        try {
            bar.timestamp = parse_timestamp(cols[0]);
        } catch (const std::exception& e) {
            throw std::invalid_argument(where + e.what());
        }

        double* targets[] = {&bar.open, &bar.high, &bar.low, &bar.close, &bar.volume};
        for (size_t c = 0; c < 5; ++c) {
            if (!detail::parse_double(cols[c + 1], *targets[c])) {
                throw std::invalid_argument(where + "bad number '" + cols[c + 1] + "'");
            }
        }
        if (cols.size() >= 7 && !cols[6].empty()) {
            if (!detail::parse_double(cols[6], bar.vwap)) {
                throw std::invalid_argument(where + "bad vwap '" + cols[6] + "'");
            }
        }
        out.push_back(bar);
    }
    return out;
}

inline std::vector<Bar> load_bars(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open bar file: " + path);
    }
    return parse_bars(f);
}

}  // namespace bar_csv
