#pragma once

#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar — one OHLCV sample for a fixed interval
// ---------------------------------------------------------------------------
struct Bar {
    uint64_t timestamp = 0;  // bar open, UTC nanoseconds
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double vwap = std::numeric_limits<double>::quiet_NaN();  // NaN when the feed has none

    bool has_vwap() const { return !std::isnan(vwap); }
};

namespace bars {

// Throws std::invalid_argument on the first bar that breaks the OHLC invariant
// or the strictly-increasing timestamp order.
inline void validate(const std::vector<Bar>& series) {
    for (size_t i = 0; i < series.size(); ++i) {
        const auto& b = series[i];
        std::string where = "bar " + std::to_string(i) + ": ";
        if (!std::isfinite(b.open) || !std::isfinite(b.high) ||
            !std::isfinite(b.low) || !std::isfinite(b.close)) {
            throw std::invalid_argument(where + "non-finite price");
        }
        if (b.close <= 0.0) {
            throw std::invalid_argument(where + "close must be positive");
        }
        if (!(b.volume >= 0.0)) {
            throw std::invalid_argument(where + "negative volume");
        }
        double body_hi = std::max(b.open, b.close);
        double body_lo = std::min(b.open, b.close);
        if (b.high < body_hi || body_lo < b.low) {
            throw std::invalid_argument(where + "high/low do not bracket open/close");
        }
        if (i > 0 && b.timestamp <= series[i - 1].timestamp) {
            throw std::invalid_argument(where + "timestamps not strictly increasing");
        }
    }
}

// Sort ascending by timestamp, drop duplicate timestamps keeping the latest
// occurrence, then validate.
inline std::vector<Bar> normalize(std::vector<Bar> series) {
    std::vector<size_t> order(series.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return series[a].timestamp < series[b].timestamp;
    });

    std::vector<Bar> out;
    out.reserve(series.size());
    for (size_t k = 0; k < order.size(); ++k) {
        const Bar& b = series[order[k]];
        if (!out.empty() && out.back().timestamp == b.timestamp) {
            out.back() = b;  // later input row wins
        } else {
            out.push_back(b);
        }
    }
    validate(out);
    return out;
}

// Keep bars whose ET wall-clock minute lies in [open_minute, close_minute).
inline std::vector<Bar> filter_market_hours(const std::vector<Bar>& series,
                                            int open_minute, int close_minute) {
    std::vector<Bar> out;
    out.reserve(series.size());
    for (const auto& b : series) {
        int m = time_utils::minute_of_day_et(b.timestamp);
        if (m >= open_minute && m < close_minute) out.push_back(b);
    }
    return out;
}

inline std::vector<double> closes(const std::vector<Bar>& series) {
    std::vector<double> out(series.size());
    for (size_t i = 0; i < series.size(); ++i) out[i] = series[i].close;
    return out;
}

}  // namespace bars
