#pragma once

#include "signals/weight_map.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TradingMode — bar granularity and forward horizons
// ---------------------------------------------------------------------------
enum class TradingMode { SCALP, DAY, SWING };

inline const char* trading_mode_name(TradingMode m) {
    switch (m) {
        case TradingMode::SCALP: return "scalp";
        case TradingMode::DAY:   return "day";
        case TradingMode::SWING: return "swing";
    }
    return "unknown";
}

inline TradingMode trading_mode_from_name(const std::string& s) {
    if (s == "scalp") return TradingMode::SCALP;
    if (s == "day")   return TradingMode::DAY;
    if (s == "swing") return TradingMode::SWING;
    throw std::invalid_argument("unknown mode '" + s + "' (expected scalp|day|swing)");
}

inline bool is_intraday(TradingMode m) { return m != TradingMode::SWING; }

// ---------------------------------------------------------------------------
// HorizonConfig — forward bar offsets and their labels
// ---------------------------------------------------------------------------
struct HorizonConfig {
    std::vector<int> bars;
    std::vector<std::string> labels;

    static HorizonConfig for_mode(TradingMode m) {
        switch (m) {
            case TradingMode::SCALP:  // 1-minute bars
                return {{1, 3, 5, 10}, {"1min", "3min", "5min", "10min"}};
            case TradingMode::DAY:    // 5-minute bars
                return {{3, 6, 12, 24}, {"15min", "30min", "1hr", "2hr"}};
            case TradingMode::SWING:  // daily bars
                return {{1, 2, 3, 5}, {"1d", "2d", "3d", "5d"}};
        }
        throw std::invalid_argument("unknown trading mode");
    }

    // Throws std::invalid_argument unless bars is non-empty, positive,
    // strictly ascending and matched one-to-one by labels.
    void validate() const {
        if (bars.empty()) throw std::invalid_argument("horizon list is empty");
        if (labels.size() != bars.size()) {
            throw std::invalid_argument("horizon labels do not match horizon count");
        }
        for (size_t i = 0; i < bars.size(); ++i) {
            if (bars[i] < 1) throw std::invalid_argument("horizon must be at least one bar");
            if (i > 0 && bars[i] <= bars[i - 1]) {
                throw std::invalid_argument("horizons must be strictly ascending");
            }
        }
    }

    int max_horizon() const { return bars.empty() ? 0 : bars.back(); }
    size_t size() const { return bars.size(); }

    // Horizon used to rank and compare runs: the third, or the last when
    // fewer than three are configured.
    size_t reference_index() const { return bars.size() > 2 ? 2 : bars.size() - 1; }
};

// ---------------------------------------------------------------------------
// SessionCuts — ET minute-of-day upper bounds of the intraday sessions
// ---------------------------------------------------------------------------
struct SessionCuts {
    int open_rush_end = 9 * 60 + 21;    // 09:21
    int power_open_end = 10 * 60 + 1;   // 10:01
    int midday_end = 15 * 60 + 1;       // 15:01
    int power_hour_end = 16 * 60 + 16;  // 16:16
};

// ---------------------------------------------------------------------------
// ValidatorConfig — everything a ticker run needs besides its bars
// ---------------------------------------------------------------------------
struct ValidatorConfig {
    TradingMode mode = TradingMode::DAY;
    HorizonConfig horizons = HorizonConfig::for_mode(TradingMode::DAY);
    ScoringConfig scoring;
    std::vector<double> confidence_bins = {65.0, 70.0, 75.0, 80.0};
    SessionCuts sessions;
    bool filter_market_hours = true;      // intraday modes only
    int market_open_minute = 9 * 60 + 30;
    int market_close_minute = 16 * 60;
    int min_bars = 100;

    static ValidatorConfig for_mode(TradingMode m) {
        ValidatorConfig cfg;
        cfg.mode = m;
        cfg.horizons = HorizonConfig::for_mode(m);
        switch (m) {
            case TradingMode::SCALP: cfg.min_bars = 200; break;
            case TradingMode::DAY:   cfg.min_bars = 100; break;
            case TradingMode::SWING:
                cfg.min_bars = 50;
                cfg.filter_market_hours = false;
                break;
        }
        return cfg;
    }

    void validate() const {
        horizons.validate();
        if (confidence_bins.empty()) throw std::invalid_argument("confidence bins are empty");
        for (size_t i = 0; i < confidence_bins.size(); ++i) {
            if (confidence_bins[i] < 0.0 || confidence_bins[i] > 100.0) {
                throw std::invalid_argument("confidence bin outside [0, 100]");
            }
            if (i > 0 && confidence_bins[i] <= confidence_bins[i - 1]) {
                throw std::invalid_argument("confidence bins must be strictly ascending");
            }
        }
        if (market_open_minute >= market_close_minute) {
            throw std::invalid_argument("market open must precede market close");
        }
    }
};
