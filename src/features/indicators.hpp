#pragma once

#include "bars/bar.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// indicators — classic technical indicators over a bar series
//
// Every function returns a series index-aligned to its input. Entries inside
// the lookback window are NaN; NaN inputs propagate. Every ratio goes through
// safe_div(), so a zero or NaN denominator yields NaN and never ±inf.
// ---------------------------------------------------------------------------
namespace indicators {

using Series = std::vector<double>;

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// ---------------------------------------------------------------------------
// IndicatorParams — lookbacks and thresholds shared by signals and setups
// ---------------------------------------------------------------------------
struct IndicatorParams {
    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int bb_period = 20;
    double bb_k = 2.0;
    int atr_period = 14;
    int adx_period = 14;
    int ema_fast = 8;
    int ema_mid = 21;
    int ema_slow = 50;
    int volume_period = 20;
    int trend_sma = 200;
    int divergence_lookback = 14;
    double divergence_band = 0.01;      // price within 1% of its rolling extreme
    double divergence_rsi_margin = 5.0; // RSI points away from its own extreme
    double squeeze_threshold = 0.03;    // BB bandwidth
};

// ---------------------------------------------------------------------------
// Guarded arithmetic
// ---------------------------------------------------------------------------
inline double safe_div(double num, double den) {
    if (std::isnan(num) || std::isnan(den) || den == 0.0) return NaN;
    double q = num / den;
    return std::isfinite(q) ? q : NaN;
}

inline double clip(double x, double lo, double hi) {
    if (std::isnan(x)) return NaN;
    return std::min(hi, std::max(lo, x));
}

// sign(NaN) is NaN.
inline double sign(double x) {
    if (std::isnan(x)) return NaN;
    return (x > 0.0) ? 1.0 : (x < 0.0 ? -1.0 : 0.0);
}

// ---------------------------------------------------------------------------
// Column extraction
// ---------------------------------------------------------------------------
inline Series column(const std::vector<Bar>& bars, double Bar::*field) {
    Series out(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) out[i] = bars[i].*field;
    return out;
}

// ---------------------------------------------------------------------------
// Moving averages and rolling statistics
// ---------------------------------------------------------------------------

// Recursive EMA with alpha = 2/(period+1), seeded with the first valid value.
// Output stays NaN until `period` valid observations have been folded in.
// A NaN input yields NaN at that index and leaves the state untouched.
inline Series ema(const Series& x, int period) {
    Series out(x.size(), NaN);
    if (period < 1) return out;
    const double alpha = 2.0 / (period + 1.0);
    double state = NaN;
    int seen = 0;
    for (size_t i = 0; i < x.size(); ++i) {
        if (std::isnan(x[i])) continue;
        state = (seen == 0) ? x[i] : alpha * x[i] + (1.0 - alpha) * state;
        ++seen;
        if (seen >= period) out[i] = state;
    }
    return out;
}

// Rolling mean; NaN until the window is full or while it holds a NaN.
inline Series sma(const Series& x, int period) {
    Series out(x.size(), NaN);
    if (period < 1) return out;
    size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < x.size(); ++i) {
        double sum = 0.0;
        bool ok = true;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            if (std::isnan(x[j])) { ok = false; break; }
            sum += x[j];
        }
        if (ok) out[i] = sum / static_cast<double>(p);
    }
    return out;
}

// Rolling sample standard deviation (n-1 denominator).
inline Series rolling_std(const Series& x, int period) {
    Series out(x.size(), NaN);
    if (period < 2) return out;
    size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < x.size(); ++i) {
        double sum = 0.0;
        bool ok = true;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            if (std::isnan(x[j])) { ok = false; break; }
            sum += x[j];
        }
        if (!ok) continue;
        double mean = sum / static_cast<double>(p);
        double ss = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) ss += (x[j] - mean) * (x[j] - mean);
        out[i] = std::sqrt(ss / static_cast<double>(p - 1));
    }
    return out;
}

inline Series rolling_min(const Series& x, int period) {
    Series out(x.size(), NaN);
    if (period < 1) return out;
    size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < x.size(); ++i) {
        double m = x[i + 1 - p];
        for (size_t j = i + 1 - p; j <= i && !std::isnan(m); ++j) {
            m = std::isnan(x[j]) ? NaN : std::min(m, x[j]);
        }
        out[i] = m;
    }
    return out;
}

inline Series rolling_max(const Series& x, int period) {
    Series out(x.size(), NaN);
    if (period < 1) return out;
    size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < x.size(); ++i) {
        double m = x[i + 1 - p];
        for (size_t j = i + 1 - p; j <= i && !std::isnan(m); ++j) {
            m = std::isnan(x[j]) ? NaN : std::max(m, x[j]);
        }
        out[i] = m;
    }
    return out;
}

// Rolling q-quantile (linear interpolation) over the valid values of the
// trailing window. NaN when fewer than min_periods valid values are present.
inline Series rolling_quantile(const Series& x, int window, double q, int min_periods) {
    Series out(x.size(), NaN);
    if (window < 1) return out;
    size_t w = static_cast<size_t>(window);
    std::vector<double> buf;
    buf.reserve(w);
    for (size_t i = 0; i < x.size(); ++i) {
        size_t start = (i + 1 >= w) ? i + 1 - w : 0;
        buf.clear();
        for (size_t j = start; j <= i; ++j) {
            if (!std::isnan(x[j])) buf.push_back(x[j]);
        }
        if (buf.empty() || static_cast<int>(buf.size()) < min_periods) continue;
        std::sort(buf.begin(), buf.end());
        double pos = q * static_cast<double>(buf.size() - 1);
        size_t lo = static_cast<size_t>(std::floor(pos));
        size_t hi = std::min(lo + 1, buf.size() - 1);
        double frac = pos - static_cast<double>(lo);
        out[i] = buf[lo] + (buf[hi] - buf[lo]) * frac;
    }
    return out;
}

// Percentile rank of the latest value within its trailing window, ties
// averaged, in (0, 1]. NaN until the window is full and NaN-free.
inline Series rolling_pct_rank(const Series& x, int window) {
    Series out(x.size(), NaN);
    if (window < 1) return out;
    size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < x.size(); ++i) {
        if (std::isnan(x[i])) continue;
        double less = 0.0, equal = 0.0;
        bool ok = true;
        for (size_t j = i + 1 - w; j <= i; ++j) {
            if (std::isnan(x[j])) { ok = false; break; }
            if (x[j] < x[i]) less += 1.0;
            else if (x[j] == x[i]) equal += 1.0;
        }
        if (!ok) continue;
        double avg_rank = less + (equal + 1.0) / 2.0;
        out[i] = avg_rank / static_cast<double>(w);
    }
    return out;
}

// Fractional change over `periods` bars.
inline Series pct_change(const Series& x, int periods = 1) {
    Series out(x.size(), NaN);
    if (periods < 1) return out;
    size_t p = static_cast<size_t>(periods);
    for (size_t i = p; i < x.size(); ++i) {
        out[i] = safe_div(x[i] - x[i - p], x[i - p]);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Oscillators and trend
// ---------------------------------------------------------------------------

// RSI from rolling mean gain / loss. 50 when the window has no losses.
inline Series rsi(const Series& close, int period = 14) {
    size_t n = close.size();
    Series gain(n, 0.0), loss(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        double d = close[i] - close[i - 1];
        if (std::isnan(d)) { gain[i] = NaN; loss[i] = NaN; continue; }
        if (d > 0.0) gain[i] = d;
        if (d < 0.0) loss[i] = -d;
    }
    Series avg_gain = sma(gain, period);
    Series avg_loss = sma(loss, period);

    Series out(n, NaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i])) continue;
        if (avg_loss[i] == 0.0) { out[i] = 50.0; continue; }
        double rs = safe_div(avg_gain[i], avg_loss[i]);
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

struct MacdResult {
    Series line;
    Series signal;
    Series histogram;
};

inline MacdResult macd(const Series& close, int fast = 12, int slow = 26, int signal = 9) {
    Series f = ema(close, fast);
    Series s = ema(close, slow);
    MacdResult r;
    r.line.resize(close.size());
    for (size_t i = 0; i < close.size(); ++i) r.line[i] = f[i] - s[i];
    r.signal = ema(r.line, signal);
    r.histogram.resize(close.size());
    for (size_t i = 0; i < close.size(); ++i) r.histogram[i] = r.line[i] - r.signal[i];
    return r;
}

struct BollingerBands {
    Series upper;
    Series mid;
    Series lower;
    Series bandwidth;  // (upper - lower) / mid
    Series position;   // (close - lower) / (upper - lower), clipped to [0, 1]
};

inline BollingerBands bollinger(const Series& close, int period = 20, double k = 2.0) {
    size_t n = close.size();
    BollingerBands bb;
    bb.mid = sma(close, period);
    Series sd = rolling_std(close, period);
    bb.upper.assign(n, NaN);
    bb.lower.assign(n, NaN);
    bb.bandwidth.assign(n, NaN);
    bb.position.assign(n, NaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(bb.mid[i]) || std::isnan(sd[i])) continue;
        bb.upper[i] = bb.mid[i] + k * sd[i];
        bb.lower[i] = bb.mid[i] - k * sd[i];
        bb.bandwidth[i] = safe_div(bb.upper[i] - bb.lower[i], bb.mid[i]);
        bb.position[i] = clip(safe_div(close[i] - bb.lower[i], bb.upper[i] - bb.lower[i]), 0.0, 1.0);
    }
    return bb;
}

inline Series true_range(const std::vector<Bar>& bars) {
    Series tr(bars.size(), NaN);
    for (size_t i = 0; i < bars.size(); ++i) {
        double r = bars[i].high - bars[i].low;
        if (i > 0) {
            double pc = bars[i - 1].close;
            r = std::max({r, std::abs(bars[i].high - pc), std::abs(bars[i].low - pc)});
        }
        tr[i] = r;
    }
    return tr;
}

inline Series atr(const std::vector<Bar>& bars, int period = 14) {
    return sma(true_range(bars), period);
}

struct AdxResult {
    Series adx;
    Series plus_di;
    Series minus_di;
};

// Wilder-style directional movement smoothed with the EMA above. A bar range
// of zero (ATR == 0) or +DI + -DI == 0 yields NaN for that bar.
inline AdxResult adx(const std::vector<Bar>& bars, int period = 14) {
    size_t n = bars.size();
    Series plus_dm(n, 0.0), minus_dm(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        double up = bars[i].high - bars[i - 1].high;
        double down = bars[i - 1].low - bars[i].low;
        if (up > down && up > 0.0) plus_dm[i] = up;
        if (down > up && down > 0.0) minus_dm[i] = down;
    }
    Series atr_val = atr(bars, period);
    Series plus_smooth = ema(plus_dm, period);
    Series minus_smooth = ema(minus_dm, period);

    AdxResult r;
    r.plus_di.assign(n, NaN);
    r.minus_di.assign(n, NaN);
    Series dx(n, NaN);
    for (size_t i = 0; i < n; ++i) {
        r.plus_di[i] = 100.0 * safe_div(plus_smooth[i], atr_val[i]);
        r.minus_di[i] = 100.0 * safe_div(minus_smooth[i], atr_val[i]);
        dx[i] = 100.0 * safe_div(std::abs(r.plus_di[i] - r.minus_di[i]),
                                 r.plus_di[i] + r.minus_di[i]);
    }
    r.adx = ema(dx, period);
    return r;
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

// Cumulative typical-price VWAP from the first bar.
inline Series vwap(const std::vector<Bar>& bars) {
    Series out(bars.size(), NaN);
    double cum_pv = 0.0, cum_v = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        double tp = (bars[i].high + bars[i].low + bars[i].close) / 3.0;
        cum_pv += tp * bars[i].volume;
        cum_v += bars[i].volume;
        out[i] = safe_div(cum_pv, cum_v);
    }
    return out;
}

// Typical-price VWAP over a trailing window of `period` bars.
inline Series rolling_vwap(const std::vector<Bar>& bars, int period) {
    Series out(bars.size(), NaN);
    if (period < 1) return out;
    size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < bars.size(); ++i) {
        double pv = 0.0, v = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            double tp = (bars[j].high + bars[j].low + bars[j].close) / 3.0;
            pv += tp * bars[j].volume;
            v += bars[j].volume;
        }
        out[i] = safe_div(pv, v);
    }
    return out;
}

inline Series volume_sma(const std::vector<Bar>& bars, int period = 20) {
    return sma(column(bars, &Bar::volume), period);
}

// Volume relative to its rolling mean.
inline Series volume_ratio(const std::vector<Bar>& bars, int period = 20) {
    Series avg = volume_sma(bars, period);
    Series out(bars.size(), NaN);
    for (size_t i = 0; i < bars.size(); ++i) out[i] = safe_div(bars[i].volume, avg[i]);
    return out;
}

// ---------------------------------------------------------------------------
// Pattern detectors
// ---------------------------------------------------------------------------

// +1 when price sits within `band` of its rolling low while RSI is more than
// `margin` above its own rolling low; -1 for the mirrored case at the high
// (bearish wins when both hold). NaN until both rolling windows are defined.
inline Series rsi_divergence(const Series& close, const Series& rsi_vals,
                             int lookback = 14, double band = 0.01, double margin = 5.0) {
    size_t n = close.size();
    Series pmin = rolling_min(close, lookback);
    Series pmax = rolling_max(close, lookback);
    Series rmin = rolling_min(rsi_vals, lookback);
    Series rmax = rolling_max(rsi_vals, lookback);
    Series out(n, NaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(pmin[i]) || std::isnan(rmin[i]) || std::isnan(rsi_vals[i])) continue;
        double s = 0.0;
        if (close[i] <= pmin[i] * (1.0 + band) && rsi_vals[i] > rmin[i] + margin) s = 1.0;
        if (close[i] >= pmax[i] * (1.0 - band) && rsi_vals[i] < rmax[i] - margin) s = -1.0;
        out[i] = s;
    }
    return out;
}

// 1.0 where bandwidth < threshold, 0.0 otherwise, NaN where bandwidth is.
inline Series detect_squeeze(const Series& bandwidth, double threshold = 0.03) {
    Series out(bandwidth.size(), NaN);
    for (size_t i = 0; i < bandwidth.size(); ++i) {
        if (std::isnan(bandwidth[i])) continue;
        out[i] = (bandwidth[i] < threshold) ? 1.0 : 0.0;
    }
    return out;
}

// Per-bar candle geometry. Ratios are NaN on a zero-range bar.
struct CandleShape {
    double body_ratio = NaN;
    double lower_wick_pct = NaN;
    double upper_wick_pct = NaN;
    bool bullish = false;
    bool bearish = false;
};

inline CandleShape candle_shape(const Bar& b) {
    CandleShape s;
    double range = b.high - b.low;
    s.body_ratio = safe_div(std::abs(b.close - b.open), range);
    s.lower_wick_pct = safe_div(std::min(b.open, b.close) - b.low, range);
    s.upper_wick_pct = safe_div(b.high - std::max(b.open, b.close), range);
    s.bullish = b.close > b.open;
    s.bearish = b.close < b.open;
    return s;
}

// Candle score: hammer closing up +1, hammer closing down -0.5, bullish
// engulfing of a bearish prior bar +1, doji (body < 10% of range) forced to 0.
inline Series candlestick_score(const std::vector<Bar>& bars) {
    Series out(bars.size(), 0.0);
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& b = bars[i];
        CandleShape s = candle_shape(b);
        bool doji = s.body_ratio < 0.1;
        bool hammer = s.lower_wick_pct > 0.6 && s.body_ratio < 0.3;
        bool engulf = false;
        if (i > 0) {
            const Bar& p = bars[i - 1];
            engulf = p.close < p.open && b.close > b.open &&
                     b.close > p.open && b.open < p.close;
        }
        double score = 0.0;
        if (hammer && b.close > b.open) score = 1.0;
        if (hammer && b.close < b.open) score = -0.5;
        if (engulf) score = 1.0;
        if (doji) score = 0.0;
        out[i] = score;
    }
    return out;
}

}  // namespace indicators
