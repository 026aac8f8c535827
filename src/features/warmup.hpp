#pragma once

#include "features/indicators.hpp"

#include <algorithm>

// ---------------------------------------------------------------------------
// WarmupTracker — how many leading bars the core indicators leave undefined
//
// The warm-up length is the longest of the EMA stack, the MACD signal line,
// the ADX double smoothing, the Bollinger window, RSI and the volume average.
// The long trend SMA is not counted: signals that depend on it read as
// inactive until it is defined.
// ---------------------------------------------------------------------------
class WarmupTracker {
public:
    WarmupTracker() = default;
    explicit WarmupTracker(const indicators::IndicatorParams& params) : params_(params) {}

    int warmup_bars() const {
        const auto& p = params_;
        return std::max({p.ema_fast, p.ema_mid, p.ema_slow,
                         p.macd_slow + p.macd_signal - 1,
                         2 * p.adx_period - 1,
                         p.bb_period,
                         p.rsi_period + 1,
                         p.volume_period});
    }

    bool is_warmup(int bar_index) const {
        return bar_index < warmup_bars();
    }

    // Fewest bars that leave at least one scorable bar with a full forward
    // window of max_horizon bars, floored at min_bars.
    int required_bars(int max_horizon, int min_bars = 0) const {
        return std::max(min_bars, warmup_bars() + max_horizon + 1);
    }

private:
    indicators::IndicatorParams params_{};
};
