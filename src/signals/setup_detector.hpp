#pragma once

#include "bars/bar.hpp"
#include "features/indicators.hpp"
#include "signals/signal_engine.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// SetupId — named conjunctive entry patterns
// ---------------------------------------------------------------------------
enum class SetupId : int {
    RSI_OVERSOLD_BOUNCE = 0,
    RSI_OVERBOUGHT_FADE,
    VWAP_RECLAIM,
    VWAP_REJECTION,
    BB_SQUEEZE_BREAKOUT_LONG,
    BB_SQUEEZE_BREAKOUT_SHORT,
    EMA_TREND_PULLBACK_LONG,
    EMA_TREND_PULLBACK_SHORT,
    VOLUME_CLIMAX_REVERSAL_LONG,
    VOLUME_CLIMAX_REVERSAL_SHORT,
    MACD_BULLISH_CROSS,
    MACD_BEARISH_CROSS,
    MOMENTUM_BREAKOUT_LONG,
    MOMENTUM_BREAKOUT_SHORT,
};

constexpr size_t SETUP_COUNT = 14;

namespace setups {

struct SetupInfo {
    SetupId id;
    std::string_view name;
    int direction;
};

inline constexpr std::array<SetupInfo, SETUP_COUNT> SETUP_INFO = {{
    {SetupId::RSI_OVERSOLD_BOUNCE,          "RSI_OVERSOLD_BOUNCE",          direction::BULL},
    {SetupId::RSI_OVERBOUGHT_FADE,          "RSI_OVERBOUGHT_FADE",          direction::BEAR},
    {SetupId::VWAP_RECLAIM,                 "VWAP_RECLAIM",                 direction::BULL},
    {SetupId::VWAP_REJECTION,               "VWAP_REJECTION",               direction::BEAR},
    {SetupId::BB_SQUEEZE_BREAKOUT_LONG,     "BB_SQUEEZE_BREAKOUT_LONG",     direction::BULL},
    {SetupId::BB_SQUEEZE_BREAKOUT_SHORT,    "BB_SQUEEZE_BREAKOUT_SHORT",    direction::BEAR},
    {SetupId::EMA_TREND_PULLBACK_LONG,      "EMA_TREND_PULLBACK_LONG",      direction::BULL},
    {SetupId::EMA_TREND_PULLBACK_SHORT,     "EMA_TREND_PULLBACK_SHORT",     direction::BEAR},
    {SetupId::VOLUME_CLIMAX_REVERSAL_LONG,  "VOLUME_CLIMAX_REVERSAL_LONG",  direction::BULL},
    {SetupId::VOLUME_CLIMAX_REVERSAL_SHORT, "VOLUME_CLIMAX_REVERSAL_SHORT", direction::BEAR},
    {SetupId::MACD_BULLISH_CROSS,           "MACD_BULLISH_CROSS",           direction::BULL},
    {SetupId::MACD_BEARISH_CROSS,           "MACD_BEARISH_CROSS",           direction::BEAR},
    {SetupId::MOMENTUM_BREAKOUT_LONG,       "MOMENTUM_BREAKOUT_LONG",       direction::BULL},
    {SetupId::MOMENTUM_BREAKOUT_SHORT,      "MOMENTUM_BREAKOUT_SHORT",      direction::BEAR},
}};

inline std::string_view setup_name(SetupId id) {
    return SETUP_INFO[static_cast<size_t>(id)].name;
}

inline int setup_direction(SetupId id) {
    return SETUP_INFO[static_cast<size_t>(id)].direction;
}

inline SetupId setup_from_name(std::string_view name) {
    for (const auto& info : SETUP_INFO) {
        if (info.name == name) return info.id;
    }
    throw std::invalid_argument("unknown setup '" + std::string(name) + "'");
}

}  // namespace setups

// ---------------------------------------------------------------------------
// SetupThresholds — per-setup trigger levels
//
// Empirical defaults, flagged for recalibration.
// ---------------------------------------------------------------------------
struct SetupThresholds {
    // RSI extremes (bounce / fade)
    double extreme_rsi_low = 25.0;
    double extreme_rsi_high = 75.0;
    double extreme_vol_ratio = 2.0;
    double extreme_body_ratio = 0.4;
    double extreme_bb_low = 0.15;
    double extreme_bb_high = 0.85;

    // VWAP reclaim / rejection
    double vwap_vol_ratio = 2.0;
    double vwap_body_ratio = 0.4;
    double reclaim_rsi_low = 40.0;
    double reclaim_rsi_high = 60.0;
    double rejection_rsi_min = 45.0;
    double rejection_upper_wick = 0.5;

    // Volume climax reversal
    double climax_vol_ratio = 3.0;
    double climax_wick = 0.6;
    double climax_rsi_low = 30.0;
    double climax_rsi_high = 70.0;
    double climax_bb_low = 0.1;
    double climax_bb_high = 0.9;
    double climax_max_body = 0.35;

    // Bollinger squeeze breakout
    int squeeze_window = 50;
    int squeeze_min_periods = 20;
    double squeeze_quantile = 0.15;
    double breakout_vol_ratio = 2.5;
    double breakout_body_ratio = 0.5;
    double breakout_adx = 20.0;

    // EMA trend pullback
    double pullback_band = 0.003;       // low/high within 0.3% of EMA21
    double pullback_vol_ratio = 1.5;
    double pullback_body_ratio = 0.4;
    double pullback_long_rsi_low = 40.0;
    double pullback_long_rsi_high = 55.0;
    double pullback_short_rsi_low = 45.0;
    double pullback_short_rsi_high = 60.0;
    double pullback_adx = 20.0;

    // MACD cross
    double cross_rsi_low = 40.0;
    double cross_rsi_high = 60.0;
    double cross_vol_ratio = 1.5;

    // Momentum breakout
    double momentum_vol_ratio = 2.5;
    double momentum_adx = 25.0;
    double momentum_body_ratio = 0.6;
    double momentum_long_rsi_low = 55.0;
    double momentum_long_rsi_high = 72.0;
    double momentum_short_rsi_low = 28.0;
    double momentum_short_rsi_high = 45.0;
};

// ---------------------------------------------------------------------------
// SetupRecord — one triggered setup at one bar
// ---------------------------------------------------------------------------
struct SetupRecord {
    size_t bar_index = 0;
    uint64_t timestamp = 0;
    SetupId setup = SetupId::RSI_OVERSOLD_BOUNCE;
    int direction = direction::NEUTRAL;
    double entry_price = 0.0;
    double rsi = 0.0;
    double vol_ratio = 0.0;
};

// ---------------------------------------------------------------------------
// SetupDetector
//
// Indicators are computed once over the series; each bar is then evaluated
// from its own values and the previous bar's, never from later bars.
// Comparisons against NaN are false, so no setup fires inside a warm-up.
// ---------------------------------------------------------------------------
class SetupDetector {
public:
    explicit SetupDetector(SetupThresholds thresholds = {},
                           indicators::IndicatorParams params = {})
        : th_(thresholds), params_(params) {}

    const SetupThresholds& thresholds() const { return th_; }

    // Records sorted by bar index, then by setup order.
    std::vector<SetupRecord> detect_all(const std::vector<Bar>& bars) const {
        Inputs in = compute_inputs(bars);
        std::vector<SetupRecord> out;
        for (size_t i = 0; i < bars.size(); ++i) {
            auto fired = evaluate(in, i);
            for (size_t k = 0; k < SETUP_COUNT; ++k) {
                if (!fired[k]) continue;
                SetupRecord r;
                r.bar_index = i;
                r.timestamp = bars[i].timestamp;
                r.setup = setups::SETUP_INFO[k].id;
                r.direction = setups::SETUP_INFO[k].direction;
                r.entry_price = bars[i].close;
                r.rsi = in.rsi[i];
                r.vol_ratio = in.vol_ratio[i];
                out.push_back(r);
            }
        }
        return out;
    }

    // Per-bar flags for every setup, exposed for inspection and tests.
    std::vector<std::array<bool, SETUP_COUNT>> evaluate_all(const std::vector<Bar>& bars) const {
        Inputs in = compute_inputs(bars);
        std::vector<std::array<bool, SETUP_COUNT>> out(bars.size());
        for (size_t i = 0; i < bars.size(); ++i) out[i] = evaluate(in, i);
        return out;
    }

private:
    SetupThresholds th_;
    indicators::IndicatorParams params_;

    struct Inputs {
        const std::vector<Bar>* bars = nullptr;
        indicators::Series rsi;
        indicators::MacdResult macd;
        indicators::BollingerBands bb;
        indicators::Series bw_floor;
        indicators::Series adx;
        indicators::Series ema_fast, ema_mid, ema_slow;
        indicators::Series vol_ratio;
        indicators::Series vwap;
    };

    Inputs compute_inputs(const std::vector<Bar>& bars) const {
        using namespace indicators;
        const auto& p = params_;
        Inputs in;
        in.bars = &bars;
        Series c = column(bars, &Bar::close);
        in.rsi = rsi(c, p.rsi_period);
        in.macd = macd(c, p.macd_fast, p.macd_slow, p.macd_signal);
        in.bb = bollinger(c, p.bb_period, p.bb_k);
        in.bw_floor = rolling_quantile(in.bb.bandwidth, th_.squeeze_window,
                                       th_.squeeze_quantile, th_.squeeze_min_periods);
        in.adx = adx(bars, p.adx_period).adx;
        in.ema_fast = ema(c, p.ema_fast);
        in.ema_mid = ema(c, p.ema_mid);
        in.ema_slow = ema(c, p.ema_slow);
        in.vol_ratio = volume_ratio(bars, p.volume_period);
        bool feed_vwap = !bars.empty() && std::all_of(bars.begin(), bars.end(),
                                                      [](const Bar& b) { return b.has_vwap(); });
        in.vwap = feed_vwap ? column(bars, &Bar::vwap) : vwap(bars);
        return in;
    }

    std::array<bool, SETUP_COUNT> evaluate(const Inputs& in, size_t i) const {
        std::array<bool, SETUP_COUNT> f{};
        if (i == 0) return f;  // every setup reads the previous bar

        const Bar& b = (*in.bars)[i];
        const Bar& prev = (*in.bars)[i - 1];
        const auto shape = indicators::candle_shape(b);
        const double rsi = in.rsi[i];
        const double vr = in.vol_ratio[i];
        const double pos = in.bb.position[i];
        const double hist = in.macd.histogram[i];
        const double prev_hist = in.macd.histogram[i - 1];
        const double adx = in.adx[i];
        const double e8 = in.ema_fast[i], e21 = in.ema_mid[i], e50 = in.ema_slow[i];
        const bool hist_rising = hist > prev_hist;
        const bool hist_falling = hist < prev_hist;
        const auto& t = th_;

        auto set = [&](SetupId id, bool v) { f[static_cast<size_t>(id)] = v; };

        set(SetupId::RSI_OVERSOLD_BOUNCE,
            rsi < t.extreme_rsi_low && vr > t.extreme_vol_ratio && shape.bullish &&
            shape.body_ratio > t.extreme_body_ratio && pos < t.extreme_bb_low && hist_rising);

        set(SetupId::RSI_OVERBOUGHT_FADE,
            rsi > t.extreme_rsi_high && vr > t.extreme_vol_ratio && shape.bearish &&
            shape.body_ratio > t.extreme_body_ratio && pos > t.extreme_bb_high && hist_falling);

        set(SetupId::VWAP_RECLAIM,
            prev.close < in.vwap[i - 1] && b.close > in.vwap[i] &&
            vr > t.vwap_vol_ratio && shape.bullish && shape.body_ratio > t.vwap_body_ratio &&
            rsi > t.reclaim_rsi_low && rsi < t.reclaim_rsi_high && hist_rising);

        set(SetupId::VWAP_REJECTION,
            b.high > in.vwap[i] && b.close < in.vwap[i] &&
            vr > t.vwap_vol_ratio && shape.bearish && shape.body_ratio > t.vwap_body_ratio &&
            shape.upper_wick_pct > t.rejection_upper_wick && rsi > t.rejection_rsi_min &&
            hist_falling);

        bool squeezed = in.bb.bandwidth[i] < in.bw_floor[i];
        set(SetupId::BB_SQUEEZE_BREAKOUT_LONG,
            squeezed && b.close > in.bb.upper[i] && vr > t.breakout_vol_ratio &&
            shape.bullish && shape.body_ratio > t.breakout_body_ratio &&
            adx > t.breakout_adx && e8 > e21);

        set(SetupId::BB_SQUEEZE_BREAKOUT_SHORT,
            squeezed && b.close < in.bb.lower[i] && vr > t.breakout_vol_ratio &&
            shape.bearish && shape.body_ratio > t.breakout_body_ratio &&
            adx > t.breakout_adx && e8 < e21);

        set(SetupId::EMA_TREND_PULLBACK_LONG,
            e8 > e21 && e21 > e50 &&
            b.low <= e21 * (1.0 + t.pullback_band) && b.close > e21 &&
            shape.bullish && shape.body_ratio > t.pullback_body_ratio &&
            vr > t.pullback_vol_ratio &&
            rsi > t.pullback_long_rsi_low && rsi < t.pullback_long_rsi_high &&
            adx > t.pullback_adx && hist_rising);

        set(SetupId::EMA_TREND_PULLBACK_SHORT,
            e8 < e21 && e21 < e50 &&
            b.high >= e21 * (1.0 - t.pullback_band) && b.close < e21 &&
            shape.bearish && shape.body_ratio > t.pullback_body_ratio &&
            vr > t.pullback_vol_ratio &&
            rsi > t.pullback_short_rsi_low && rsi < t.pullback_short_rsi_high &&
            adx > t.pullback_adx && hist_falling);

        set(SetupId::VOLUME_CLIMAX_REVERSAL_LONG,
            vr > t.climax_vol_ratio && shape.lower_wick_pct > t.climax_wick &&
            rsi < t.climax_rsi_low && pos < t.climax_bb_low &&
            shape.body_ratio < t.climax_max_body);

        set(SetupId::VOLUME_CLIMAX_REVERSAL_SHORT,
            vr > t.climax_vol_ratio && shape.upper_wick_pct > t.climax_wick &&
            rsi > t.climax_rsi_high && pos > t.climax_bb_high &&
            shape.body_ratio < t.climax_max_body);

        const double ml = in.macd.line[i], ms = in.macd.signal[i];
        const double pml = in.macd.line[i - 1], pms = in.macd.signal[i - 1];
        set(SetupId::MACD_BULLISH_CROSS,
            ml > ms && pml <= pms &&
            rsi > t.cross_rsi_low && rsi < t.cross_rsi_high && vr > t.cross_vol_ratio &&
            shape.bullish && e8 > e21 && hist > 0.0);

        set(SetupId::MACD_BEARISH_CROSS,
            ml < ms && pml >= pms &&
            rsi > t.cross_rsi_low && rsi < t.cross_rsi_high && vr > t.cross_vol_ratio &&
            shape.bearish && e8 < e21 && hist < 0.0);

        set(SetupId::MOMENTUM_BREAKOUT_LONG,
            b.close > e8 && e8 > e21 && vr > t.momentum_vol_ratio && adx > t.momentum_adx &&
            hist > 0.0 && hist_rising &&
            rsi > t.momentum_long_rsi_low && rsi < t.momentum_long_rsi_high &&
            shape.bullish && shape.body_ratio > t.momentum_body_ratio);

        set(SetupId::MOMENTUM_BREAKOUT_SHORT,
            b.close < e8 && e8 < e21 && vr > t.momentum_vol_ratio && adx > t.momentum_adx &&
            hist < 0.0 && hist_falling &&
            rsi > t.momentum_short_rsi_low && rsi < t.momentum_short_rsi_high &&
            shape.bearish && shape.body_ratio > t.momentum_body_ratio);

        return f;
    }
};
