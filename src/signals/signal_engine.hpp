#pragma once

#include "bars/bar.hpp"
#include "features/indicators.hpp"
#include "signals/signal_table.hpp"
#include "signals/weight_map.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Direction codes
// ---------------------------------------------------------------------------
namespace direction {
    constexpr int BEAR    = -1;
    constexpr int NEUTRAL =  0;
    constexpr int BULL    =  1;

    inline const char* name(int d) {
        return d == BULL ? "BULL" : (d == BEAR ? "BEAR" : "NEUTRAL");
    }
}  // namespace direction

// ---------------------------------------------------------------------------
// ScoreRecord — per-bar aggregate of the weighted signals
// ---------------------------------------------------------------------------
struct ScoreRecord {
    double bull_score = 0.0;
    double bear_score = 0.0;
    double net_score = 0.0;          // bull - bear
    double active_weight = 0.0;      // weights of signals that fired on this bar
    double raw_strength = 0.0;       // (bull + bear) / active_weight * 100, clipped
    double directional_conf = 0.0;   // |bull - bear| / (bull + bear) * 100
    double confidence = 0.0;         // blend of the two, 0..100
    int direction = direction::NEUTRAL;
};

struct EntryMasks {
    std::vector<bool> long_entries;
    std::vector<bool> short_entries;
};

// Confidence distribution of one scored series.
struct ScoreSummary {
    static constexpr std::array<double, 8> HISTOGRAM_EDGES = {0, 30, 50, 60, 65, 70, 80, 100};

    size_t bars = 0;
    double min_confidence = 0.0;
    double median_confidence = 0.0;
    double max_confidence = 0.0;
    double mean_confidence = 0.0;
    int bull_count = 0;
    int bear_count = 0;
    int neutral_count = 0;
    // histogram[k] counts confidence in (edge[k], edge[k+1]]; the first bin
    // also takes confidence == 0.
    std::array<int, HISTOGRAM_EDGES.size() - 1> histogram{};
    int active_signals = 0;          // weighted signals that fired on any bar
    int weighted_signals = 0;
};

namespace signal_scoring {

// Score every bar, folding signals in the given order. The sums are
// independent of the order up to floating-point rounding. Each signal may
// appear at most once; a repeat throws std::invalid_argument.
inline std::vector<ScoreRecord> score(const SignalTable& table, const WeightMap& weights,
                                      const ScoringConfig& cfg,
                                      const std::vector<SignalId>& order) {
    std::array<bool, SIGNAL_COUNT> seen{};
    for (SignalId id : order) {
        auto idx = static_cast<size_t>(id);
        if (seen[idx]) {
            throw std::invalid_argument("signal listed twice in scoring order: " +
                                        std::string(signals::signal_name(id)));
        }
        seen[idx] = true;
    }

    size_t n = table.size();
    std::vector<ScoreRecord> out(n);

    for (SignalId id : order) {
        int w = weights[id];
        if (w == 0) continue;
        const auto& col = table[id];
        for (size_t i = 0; i < n; ++i) {
            double s = std::isnan(col[i]) ? 0.0 : col[i];
            out[i].bull_score += std::max(s, 0.0) * w;
            out[i].bear_score += std::max(-s, 0.0) * w;
            if (std::abs(s) > cfg.active_epsilon) out[i].active_weight += w;
        }
    }

    for (auto& r : out) {
        double denom = (r.active_weight == 0.0) ? 1.0 : r.active_weight;
        double total = r.bull_score + r.bear_score;
        r.net_score = r.bull_score - r.bear_score;
        r.raw_strength = std::clamp(total / denom * 100.0, 0.0, 100.0);
        r.directional_conf = (total > 0.0)
            ? std::clamp(std::abs(r.net_score) / total * 100.0, 0.0, 100.0)
            : 0.0;
        r.confidence = std::clamp(cfg.strength_blend * r.raw_strength +
                                  cfg.direction_blend * r.directional_conf, 0.0, 100.0);
        r.direction = (r.net_score > 0.0) ? direction::BULL
                    : (r.net_score < 0.0 ? direction::BEAR : direction::NEUTRAL);
    }
    return out;
}

inline std::vector<ScoreRecord> score(const SignalTable& table, const WeightMap& weights,
                                      const ScoringConfig& cfg = {}) {
    return score(table, weights, cfg, weights.weighted_signals());
}

inline EntryMasks generate_entries(const std::vector<ScoreRecord>& scores, double threshold) {
    EntryMasks m;
    m.long_entries.resize(scores.size());
    m.short_entries.resize(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        bool pass = scores[i].confidence >= threshold;
        m.long_entries[i] = pass && scores[i].direction == direction::BULL;
        m.short_entries[i] = pass && scores[i].direction == direction::BEAR;
    }
    return m;
}

inline ScoreSummary summarize_scores(const std::vector<ScoreRecord>& scores,
                                     const SignalTable& table, const WeightMap& weights,
                                     const ScoringConfig& cfg = {}) {
    ScoreSummary s;
    s.bars = scores.size();
    if (!scores.empty()) {
        std::vector<double> conf;
        conf.reserve(scores.size());
        double sum = 0.0;
        for (const auto& r : scores) {
            conf.push_back(r.confidence);
            sum += r.confidence;
            if (r.direction == direction::BULL) ++s.bull_count;
            else if (r.direction == direction::BEAR) ++s.bear_count;
            else ++s.neutral_count;

            const auto& edges = ScoreSummary::HISTOGRAM_EDGES;
            for (size_t k = 0; k + 1 < edges.size(); ++k) {
                bool lower_ok = (k == 0) ? r.confidence >= edges[k] : r.confidence > edges[k];
                if (lower_ok && r.confidence <= edges[k + 1]) { ++s.histogram[k]; break; }
            }
        }
        std::sort(conf.begin(), conf.end());
        size_t m = conf.size();
        s.min_confidence = conf.front();
        s.max_confidence = conf.back();
        s.median_confidence = (m % 2 == 1) ? conf[m / 2] : 0.5 * (conf[m / 2 - 1] + conf[m / 2]);
        s.mean_confidence = sum / static_cast<double>(m);
    }

    for (SignalId id : weights.weighted_signals()) {
        ++s.weighted_signals;
        const auto& col = table[id];
        for (double v : col) {
            if (!std::isnan(v) && std::abs(v) > cfg.active_epsilon) { ++s.active_signals; break; }
        }
    }
    return s;
}

}  // namespace signal_scoring

// ---------------------------------------------------------------------------
// SignalEngine — bars → bounded signals → per-bar score
// ---------------------------------------------------------------------------
class SignalEngine {
public:
    explicit SignalEngine(WeightMap weights = WeightMap::defaults(),
                          ScoringConfig cfg = {},
                          indicators::IndicatorParams params = {})
        : weights_(weights), cfg_(cfg), params_(params) {
        if (cfg_.threshold < 0.0 || cfg_.threshold > 100.0) {
            throw std::invalid_argument("confidence threshold must be within [0, 100]");
        }
        if (cfg_.strength_blend < 0.0 || cfg_.direction_blend < 0.0) {
            throw std::invalid_argument("confidence blend weights must be non-negative");
        }
    }

    const WeightMap& weights() const { return weights_; }
    const ScoringConfig& config() const { return cfg_; }
    const indicators::IndicatorParams& params() const { return params_; }

    // Transforms (value ranges in brackets):
    //   ema_alignment        [-1,1]  +1 when EMA8 > EMA21 > EMA50, -1 reversed
    //   rsi_position         [-1,1]  (RSI-50)/20, -1 above 70, +1 below 30
    //   macd_histogram       [-1,1]  histogram / ATR, clipped
    //   bollinger_position   [-1,1]  position * 2 - 1
    //   bb_squeeze           {0,1}   bandwidth below squeeze threshold
    //   vwap_deviation       [-1,1]  (close - VWAP) / ATR, clipped
    //   call_put_ratio       ±0.5    up/down bar on volume ratio > 1.5       (proxy)
    //   sweep_activity       ±1      volume ratio > 3, signed by the bar     (proxy)
    //   dark_pool_direction  ±0.3    volume > 2x avg with a small move       (proxy)
    //   iv_rank              ±0.3    bandwidth 20-bar rank >0.8 -, <0.2 +    (proxy)
    //   volume_spike         ±1/0.5  volume ratio > 2 / > 1.5, signed
    //   regime_alignment     [-1,1]  side of SMA200 while the EMA stack is aligned
    //   candlestick_pattern  [-0.5,1]
    //   multi_tf_confluence  [-1,1]  close / SMA20 / SMA50 / SMA200 stacked
    //   rsi_divergence       [-1,1]
    //   adx_filter           [-1,1]  trend strength times EMA alignment
    //   volatility_runner    {0,1}   >5% up bar on volume ratio > 3
    //   net_premium_momentum [-1,1]  5-bar change, clipped to ±10%, * 10     (proxy)
    //   sector_tide_alignment ±0.5   SMA200 regime
    //   etf_tide_macro        ±0.3   SMA200 regime
    //   squeeze_composite    [0,1]   squeeze while ADX confirms the trend
    //   vol_regime           ±0.5    bandwidth above 50-bar 80th pct -, below 20th +
    //   volume_direction     ±1      volume ratio > 1.5, signed
    //   earnings_gap_trade   ±1      bar move beyond 4%
    // All remaining signals have no price/volume derivation and are zero.
    SignalTable compute_all_signals(const std::vector<Bar>& bars) const {
        using namespace indicators;
        const auto& p = params_;
        size_t n = bars.size();

        Series c = column(bars, &Bar::close);
        Series v = column(bars, &Bar::volume);

        Series rsi_v = rsi(c, p.rsi_period);
        MacdResult m = macd(c, p.macd_fast, p.macd_slow, p.macd_signal);
        BollingerBands bb = bollinger(c, p.bb_period, p.bb_k);
        Series atr_v = atr(bars, p.atr_period);
        AdxResult adx_v = adx(bars, p.adx_period);
        Series e_fast = ema(c, p.ema_fast);
        Series e_mid = ema(c, p.ema_mid);
        Series e_slow = ema(c, p.ema_slow);
        Series vol_avg = volume_sma(bars, p.volume_period);
        Series sma_trend = sma(c, p.trend_sma);
        Series sma_20 = sma(c, 20);
        Series sma_50 = sma(c, 50);
        Series squeeze = detect_squeeze(bb.bandwidth, p.squeeze_threshold);
        Series candle = candlestick_score(bars);
        Series div = rsi_divergence(c, rsi_v, p.divergence_lookback,
                                    p.divergence_band, p.divergence_rsi_margin);
        Series pc = pct_change(c, 1);
        Series mom5 = pct_change(c, 5);
        Series bw_rank = rolling_pct_rank(bb.bandwidth, 20);
        Series bw_q80 = rolling_quantile(bb.bandwidth, 50, 0.8, 50);
        Series bw_q20 = rolling_quantile(bb.bandwidth, 50, 0.2, 50);

        bool feed_vwap = n > 0 && std::all_of(bars.begin(), bars.end(),
                                              [](const Bar& b) { return b.has_vwap(); });
        Series vwap_v = feed_vwap ? column(bars, &Bar::vwap) : vwap(bars);

        SignalTable t;
        for (auto& col : t.columns) col.assign(n, 0.0);
        t.timestamps.resize(n);

        t.raw.rsi = rsi_v;
        t.raw.macd_hist = m.histogram;
        t.raw.atr = atr_v;
        t.raw.adx = adx_v.adx;
        t.raw.bb_bandwidth = bb.bandwidth;
        t.raw.volume_ratio.assign(n, NaN);
        t.raw.price_change = pc;
        t.raw.close = c;

        for (size_t i = 0; i < n; ++i) {
            t.timestamps[i] = bars[i].timestamp;
            double vr = safe_div(v[i], vol_avg[i]);
            t.raw.volume_ratio[i] = vr;
            double dir = sign(pc[i]);

            double ema_align = ((e_fast[i] > e_mid[i] && e_mid[i] > e_slow[i]) ? 1.0 : 0.0) -
                               ((e_fast[i] < e_mid[i] && e_mid[i] < e_slow[i]) ? 1.0 : 0.0);
            double regime = (c[i] > sma_trend[i]) ? 1.0 : (c[i] < sma_trend[i] ? -1.0 : 0.0);

            t[SignalId::EMA_ALIGNMENT][i] = ema_align;

            double r = rsi_v[i];
            t[SignalId::RSI_POSITION][i] = (r > 70.0) ? -1.0 : (r < 30.0 ? 1.0 : (r - 50.0) / 20.0);

            t[SignalId::MACD_HISTOGRAM][i] = clip(safe_div(m.histogram[i], atr_v[i]), -1.0, 1.0);
            t[SignalId::BOLLINGER_POSITION][i] = clip(bb.position[i] * 2.0 - 1.0, -1.0, 1.0);
            t[SignalId::BB_SQUEEZE][i] = squeeze[i];
            t[SignalId::VWAP_DEVIATION][i] = clip(safe_div(c[i] - vwap_v[i], atr_v[i]), -1.0, 1.0);

            t[SignalId::CALL_PUT_RATIO][i] = (pc[i] > 0.0 && vr > 1.5) ? 0.5
                                           : ((pc[i] < 0.0 && vr > 1.5) ? -0.5 : 0.0);
            t[SignalId::SWEEP_ACTIVITY][i] = ((vr > 3.0) ? 1.0 : 0.0) * dir;
            t[SignalId::DARK_POOL_DIRECTION][i] =
                (v[i] > vol_avg[i] * 2.0 && std::abs(pc[i]) < atr_v[i] / c[i] * 0.3) ? 0.3 * dir : 0.0;

            double rank = bw_rank[i];
            t[SignalId::IV_RANK][i] = (rank > 0.8) ? -0.3 : (rank < 0.2 ? 0.3 : 0.0);

            double spike = (vr > 2.0) ? 1.0 : (vr > 1.5 ? 0.5 : 0.0);
            t[SignalId::VOLUME_SPIKE][i] = spike * dir;

            t[SignalId::REGIME_ALIGNMENT][i] = regime * std::abs(ema_align);
            t[SignalId::CANDLESTICK_PATTERN][i] = candle[i];

            double mtf = ((c[i] > sma_20[i] && sma_20[i] > sma_50[i] && c[i] > sma_trend[i]) ? 1.0 : 0.0) -
                         ((c[i] < sma_20[i] && sma_20[i] < sma_50[i] && c[i] < sma_trend[i]) ? 1.0 : 0.0);
            t[SignalId::MULTI_TF_CONFLUENCE][i] = mtf;
            t[SignalId::RSI_DIVERGENCE][i] = div[i];

            double a = adx_v.adx[i];
            double adx_filter = ((a > 25.0) ? 1.0 : (a < 15.0 ? -0.5 : 0.0)) * ema_align;
            t[SignalId::ADX_FILTER][i] = adx_filter;

            t[SignalId::VOLATILITY_RUNNER][i] = (pc[i] > 0.05 && vr > 3.0) ? 1.0 : 0.0;
            t[SignalId::NET_PREMIUM_MOMENTUM][i] = clip(mom5[i], -0.1, 0.1) * 10.0;

            t[SignalId::SECTOR_TIDE_ALIGNMENT][i] = regime * 0.5;
            t[SignalId::ETF_TIDE_MACRO][i] = regime * 0.3;
            t[SignalId::SQUEEZE_COMPOSITE][i] = squeeze[i] * clip(adx_filter, 0.0, 1.0);

            double bw = bb.bandwidth[i];
            t[SignalId::VOL_REGIME][i] = (bw > bw_q80[i]) ? -0.5 : (bw < bw_q20[i] ? 0.5 : 0.0);

            t[SignalId::VOLUME_DIRECTION][i] = ((vr > 1.5) ? 1.0 : 0.0) * dir;
            t[SignalId::EARNINGS_GAP_TRADE][i] = (std::abs(pc[i]) > 0.04) ? dir : 0.0;
        }
        return t;
    }

    std::vector<ScoreRecord> score(const SignalTable& table) const {
        return signal_scoring::score(table, weights_, cfg_);
    }

    std::vector<ScoreRecord> score_bars(const std::vector<Bar>& bars) const {
        return score(compute_all_signals(bars));
    }

    EntryMasks generate_entries(const std::vector<ScoreRecord>& scores) const {
        return signal_scoring::generate_entries(scores, cfg_.threshold);
    }

    ScoreSummary summarize(const SignalTable& table, const std::vector<ScoreRecord>& scores) const {
        return signal_scoring::summarize_scores(scores, table, weights_, cfg_);
    }

private:
    WeightMap weights_;
    ScoringConfig cfg_;
    indicators::IndicatorParams params_;
};
