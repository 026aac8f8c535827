#pragma once

#include "backtest/accuracy_report.hpp"
#include "backtest/horizon_config.hpp"
#include "backtest/prediction.hpp"
#include "backtest/session.hpp"
#include "bars/bar.hpp"
#include "features/indicators.hpp"
#include "features/warmup.hpp"
#include "signals/setup_detector.hpp"
#include "signals/signal_engine.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SkipKind — why a ticker produced no predictions
// ---------------------------------------------------------------------------
enum class SkipKind {
    NONE,
    INSUFFICIENT_DATA,
    NO_QUALIFYING_PREDICTIONS,
    MALFORMED_DATA,
    ERROR,
};

inline const char* skip_kind_name(SkipKind k) {
    switch (k) {
        case SkipKind::NONE:                      return "none";
        case SkipKind::INSUFFICIENT_DATA:         return "insufficient_data";
        case SkipKind::NO_QUALIFYING_PREDICTIONS: return "no_qualifying_predictions";
        case SkipKind::MALFORMED_DATA:            return "malformed_data";
        case SkipKind::ERROR:                     return "error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// TickerResult — one ticker's run; report.predictions == 0 when skipped
// ---------------------------------------------------------------------------
struct TickerResult {
    std::string ticker;
    int bar_count = 0;            // bars scored, after market-hours filtering
    bool skipped = false;
    SkipKind skip_kind = SkipKind::NONE;
    std::string skip_reason;
    ScoreSummary score_summary;
    AccuracyReport report;
};

struct SetupTickerResult {
    std::string ticker;
    int bar_count = 0;
    bool skipped = false;
    SkipKind skip_kind = SkipKind::NONE;
    std::string skip_reason;
    int setups_detected = 0;      // including those too close to the end to measure
    std::vector<SetupOutcome> outcomes;
};

// ---------------------------------------------------------------------------
// outcome — forward-window measurements on a close series
// ---------------------------------------------------------------------------
namespace outcome {

// Caller guarantees entry + h < closes.size().
inline HorizonOutcome measure(const std::vector<double>& closes, size_t entry, int h, int dir) {
    HorizonOutcome o;
    double entry_price = closes[entry];
    double future = closes[entry + static_cast<size_t>(h)];
    o.change_pct = (future - entry_price) / entry_price * 100.0;
    if (dir == direction::BULL) {
        o.correct = o.change_pct > 0.0;
        o.dir_move = o.change_pct;
    } else {
        o.correct = o.change_pct < 0.0;
        o.dir_move = -o.change_pct;
    }
    return o;
}

// Scans closes[entry .. entry + max_h] inclusive.
inline Excursion excursion(const std::vector<double>& closes, size_t entry, int max_h, int dir) {
    double entry_price = closes[entry];
    auto first = closes.begin() + static_cast<std::ptrdiff_t>(entry);
    auto last = first + max_h + 1;
    auto [lo, hi] = std::minmax_element(first, last);
    Excursion e;
    if (dir == direction::BULL) {
        e.mfe = (*hi - entry_price) / entry_price * 100.0;
        e.mae = (*lo - entry_price) / entry_price * 100.0;
    } else {
        e.mfe = (entry_price - *lo) / entry_price * 100.0;
        e.mae = (entry_price - *hi) / entry_price * 100.0;
    }
    return e;
}

inline bool has_full_window(size_t entry, size_t n_bars, int max_h) {
    return entry + static_cast<size_t>(max_h) < n_bars;
}

}  // namespace outcome

// ---------------------------------------------------------------------------
// OutcomeValidator — score a ticker's bars and measure every call
// ---------------------------------------------------------------------------
class OutcomeValidator {
public:
    explicit OutcomeValidator(ValidatorConfig cfg,
                              WeightMap weights = WeightMap::defaults(),
                              indicators::IndicatorParams params = {},
                              SetupThresholds setup_thresholds = {})
        : cfg_(std::move(cfg)),
          engine_(weights, cfg_.scoring, params),
          detector_(setup_thresholds, params),
          warmup_(params) {
        cfg_.validate();
    }

    const ValidatorConfig& config() const { return cfg_; }
    const SignalEngine& engine() const { return engine_; }

    // Minimum bars after filtering for the scoring pipeline.
    int required_bars() const {
        return warmup_.required_bars(cfg_.horizons.max_horizon(), cfg_.min_bars);
    }

    int required_setup_bars() const {
        return warmup_.required_bars(cfg_.horizons.max_horizon(),
                                     std::max(cfg_.min_bars, SETUP_MIN_BARS));
    }

    // Throws std::invalid_argument if the bars are malformed.
    TickerResult validate(const std::string& ticker, std::vector<Bar> bars) const {
        TickerResult res;
        res.ticker = ticker;
        res.report = accuracy_report::compile(ticker, {}, cfg_);

        bars = prepare(std::move(bars));
        res.bar_count = static_cast<int>(bars.size());

        int need = required_bars();
        if (res.bar_count < need) {
            res.skipped = true;
            res.skip_kind = SkipKind::INSUFFICIENT_DATA;
            res.skip_reason = "Insufficient data (" + std::to_string(res.bar_count) +
                              " bars, need " + std::to_string(need) + ")";
            return res;
        }

        SignalTable table = engine_.compute_all_signals(bars);
        std::vector<ScoreRecord> scores = engine_.score(table);
        res.score_summary = engine_.summarize(table, scores);

        std::vector<double> closes = bars::closes(bars);
        std::vector<Prediction> preds = collect_predictions(bars, closes, scores);
        if (preds.empty()) {
            res.skipped = true;
            res.skip_kind = SkipKind::NO_QUALIFYING_PREDICTIONS;
            res.skip_reason = "No predictions above threshold";
            return res;
        }

        res.report = accuracy_report::compile(ticker, preds, cfg_);
        return res;
    }

    // Setup mode: detected setups measured over the same horizons.
    SetupTickerResult validate_setups(const std::string& ticker, std::vector<Bar> bars) const {
        SetupTickerResult res;
        res.ticker = ticker;

        bars = prepare(std::move(bars));
        res.bar_count = static_cast<int>(bars.size());

        int need = required_setup_bars();
        if (res.bar_count < need) {
            res.skipped = true;
            res.skip_kind = SkipKind::INSUFFICIENT_DATA;
            res.skip_reason = "Insufficient data (" + std::to_string(res.bar_count) +
                              " bars, need " + std::to_string(need) + ")";
            return res;
        }

        std::vector<SetupRecord> found = detector_.detect_all(bars);
        res.setups_detected = static_cast<int>(found.size());
        std::vector<double> closes = bars::closes(bars);
        int max_h = cfg_.horizons.max_horizon();

        for (const auto& rec : found) {
            if (!outcome::has_full_window(rec.bar_index, closes.size(), max_h)) continue;
            SetupOutcome so;
            so.setup = rec;
            so.outcomes = measure_all(closes, rec.bar_index, rec.direction);
            so.excursion = outcome::excursion(closes, rec.bar_index, max_h, rec.direction);
            if (is_intraday(cfg_.mode)) {
                so.session = session::classify_timestamp(rec.timestamp, cfg_.sessions);
            }
            res.outcomes.push_back(std::move(so));
        }

        if (res.outcomes.empty()) {
            res.skipped = true;
            res.skip_kind = SkipKind::NO_QUALIFYING_PREDICTIONS;
            res.skip_reason = found.empty() ? "No setups detected"
                                            : "No setups with a full forward window";
        }
        return res;
    }

private:
    static constexpr int SETUP_MIN_BARS = 200;

    ValidatorConfig cfg_;
    SignalEngine engine_;
    SetupDetector detector_;
    WarmupTracker warmup_;

    std::vector<Bar> prepare(std::vector<Bar> bars) const {
        bars = bars::normalize(std::move(bars));
        if (is_intraday(cfg_.mode) && cfg_.filter_market_hours) {
            bars = bars::filter_market_hours(bars, cfg_.market_open_minute,
                                             cfg_.market_close_minute);
        }
        return bars;
    }

    std::vector<HorizonOutcome> measure_all(const std::vector<double>& closes,
                                            size_t entry, int dir) const {
        std::vector<HorizonOutcome> out;
        out.reserve(cfg_.horizons.size());
        for (int h : cfg_.horizons.bars) {
            out.push_back(outcome::measure(closes, entry, h, dir));
        }
        return out;
    }

    std::vector<Prediction> collect_predictions(const std::vector<Bar>& bars,
                                                const std::vector<double>& closes,
                                                const std::vector<ScoreRecord>& scores) const {
        std::vector<Prediction> preds;
        int max_h = cfg_.horizons.max_horizon();
        double threshold = cfg_.scoring.threshold;

        for (size_t i = 0; i < scores.size(); ++i) {
            const ScoreRecord& s = scores[i];
            if (s.confidence < threshold || s.direction == direction::NEUTRAL) continue;
            if (!outcome::has_full_window(i, closes.size(), max_h)) continue;

            Prediction p;
            p.bar_index = i;
            p.timestamp = bars[i].timestamp;
            p.entry_price = closes[i];
            p.direction = s.direction;
            p.confidence = s.confidence;
            p.bull_score = s.bull_score;
            p.bear_score = s.bear_score;
            p.outcomes = measure_all(closes, i, s.direction);
            p.excursion = outcome::excursion(closes, i, max_h, s.direction);
            if (is_intraday(cfg_.mode)) {
                p.session = session::classify_timestamp(bars[i].timestamp, cfg_.sessions);
            }
            preds.push_back(std::move(p));
        }
        return preds;
    }
};
