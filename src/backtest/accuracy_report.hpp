#pragma once

#include "backtest/horizon_config.hpp"
#include "backtest/prediction.hpp"
#include "backtest/session.hpp"
#include "signals/setup_detector.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// HorizonStats — accuracy and move statistics at one horizon
//
// Accuracies are fractions in [0, 1]. bull/bear accuracy are NaN when there
// were no calls in that direction.
// ---------------------------------------------------------------------------
struct HorizonStats {
    std::string label;
    int bars = 0;
    int correct = 0;
    double accuracy = 0.0;
    double avg_move = 0.0;       // mean change_pct
    double avg_dir_move = 0.0;   // mean direction-normalized move
    double bull_accuracy = std::numeric_limits<double>::quiet_NaN();
    double bear_accuracy = std::numeric_limits<double>::quiet_NaN();
};

// Confidence range [low, high); the last bucket is [low, 100].
struct BucketStats {
    double low = 0.0;
    double high = 100.0;
    int count = 0;
    double accuracy = 0.0;        // at the longest horizon
    double avg_confidence = 0.0;
    double avg_mfe = 0.0;

    std::string label() const {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g-%g", low, high);
        return buf;
    }
};

struct SessionStats {
    session::Session session = session::Session::NONE;
    int count = 0;
    double accuracy = 0.0;        // at the longest horizon
    double avg_confidence = 0.0;
};

// ---------------------------------------------------------------------------
// AccuracyReport — everything derived from one ticker's predictions
// ---------------------------------------------------------------------------
struct AccuracyReport {
    std::string ticker;
    TradingMode mode = TradingMode::DAY;
    int predictions = 0;
    int bull_predictions = 0;
    int bear_predictions = 0;
    double avg_confidence = 0.0;
    std::vector<HorizonStats> horizons;
    double avg_mfe = 0.0;
    double avg_mae = 0.0;
    double mfe_mae_ratio = 0.0;
    std::vector<BucketStats> confidence_buckets;  // non-empty buckets only
    std::vector<SessionStats> sessions;           // intraday, non-empty only
    std::vector<Prediction> raw_predictions;
};

// ---------------------------------------------------------------------------
// UniverseAggregate — roll-up over the tickers that produced predictions
// ---------------------------------------------------------------------------
struct UniverseAggregate {
    TradingMode mode = TradingMode::DAY;
    int tickers_tested = 0;       // tickers with at least one prediction
    int tickers_excluded = 0;     // tickers with none
    int total_predictions = 0;
    int total_bull = 0;
    int total_bear = 0;
    double avg_confidence = 0.0;  // plain mean over tickers
    double avg_mfe = 0.0;         // plain mean over tickers
    double avg_mae = 0.0;         // plain mean over tickers
    double mfe_mae_ratio = 0.0;
    std::vector<HorizonStats> horizons;       // prediction-count weighted
    std::vector<BucketStats> confidence_buckets;
    std::vector<SessionStats> sessions;
};

// ---------------------------------------------------------------------------
// SetupStats / SetupReport — setup-mode breakdown
// ---------------------------------------------------------------------------
struct SetupStats {
    SetupId setup = SetupId::RSI_OVERSOLD_BOUNCE;
    int count = 0;
    std::vector<double> accuracy;  // per horizon
    double avg_mfe = 0.0;
    double avg_mae = 0.0;
    double mfe_mae_ratio = 0.0;
};

struct SetupReport {
    std::vector<std::string> labels;
    int total = 0;
    int longs = 0;
    int shorts = 0;
    std::vector<double> accuracy;  // per horizon, all setups
    double avg_mfe = 0.0;
    double avg_mae = 0.0;
    double mfe_mae_ratio = 0.0;
    std::vector<SetupStats> per_setup;  // setup order, setups that fired
    std::vector<SetupStats> ranking;    // by accuracy at reference_horizon, best first
    size_t reference_horizon = 0;
};

// ---------------------------------------------------------------------------
// Version comparison
// ---------------------------------------------------------------------------
struct TickerComparison {
    std::string ticker;
    double accuracy_a = 0.0;
    double accuracy_b = 0.0;
    double delta = 0.0;   // b - a
    double mfe_a = 0.0;
    double mfe_b = 0.0;
    int winner = 0;       // -1 run A, +1 run B, 0 tie
};

struct HorizonDelta {
    std::string label;
    double accuracy_a = 0.0;
    double accuracy_b = 0.0;
    double delta = 0.0;
};

struct ComparisonReport {
    std::string reference_label;
    std::vector<TickerComparison> tickers;  // common tickers, by name
    int wins_a = 0;
    int wins_b = 0;
    int ties = 0;
    std::vector<HorizonDelta> aggregate;
};

namespace accuracy_report {

constexpr double MIN_MAE_DENOMINATOR = 0.001;

inline double mfe_mae_ratio(double avg_mfe, double avg_mae) {
    return avg_mfe / std::max(std::abs(avg_mae), MIN_MAE_DENOMINATOR);
}

// Index of the bucket holding `confidence`, or -1 below the first boundary.
inline int bucket_index(double confidence, const std::vector<double>& bins) {
    for (size_t i = 0; i < bins.size(); ++i) {
        bool last = (i + 1 == bins.size());
        double high = last ? 100.0 : bins[i + 1];
        bool in_range = confidence >= bins[i] &&
                        (last ? confidence <= high : confidence < high);
        if (in_range) return static_cast<int>(i);
    }
    return -1;
}

// ---------------------------------------------------------------------------
// Per-ticker report
// ---------------------------------------------------------------------------
inline AccuracyReport compile(const std::string& ticker,
                              const std::vector<Prediction>& preds,
                              const ValidatorConfig& cfg) {
    AccuracyReport r;
    r.ticker = ticker;
    r.mode = cfg.mode;
    r.predictions = static_cast<int>(preds.size());
    r.raw_predictions = preds;

    const auto& hz = cfg.horizons;
    r.horizons.resize(hz.size());
    for (size_t h = 0; h < hz.size(); ++h) {
        r.horizons[h].label = hz.labels[h];
        r.horizons[h].bars = hz.bars[h];
    }
    if (preds.empty()) return r;

    double n = static_cast<double>(preds.size());
    double sum_conf = 0.0, sum_mfe = 0.0, sum_mae = 0.0;
    std::vector<int> bull_correct(hz.size(), 0), bear_correct(hz.size(), 0);
    std::vector<double> sum_move(hz.size(), 0.0), sum_dir(hz.size(), 0.0);

    for (const auto& p : preds) {
        if (p.direction == direction::BULL) ++r.bull_predictions;
        if (p.direction == direction::BEAR) ++r.bear_predictions;
        sum_conf += p.confidence;
        sum_mfe += p.excursion.mfe;
        sum_mae += p.excursion.mae;
        for (size_t h = 0; h < hz.size() && h < p.outcomes.size(); ++h) {
            const auto& o = p.outcomes[h];
            sum_move[h] += o.change_pct;
            sum_dir[h] += o.dir_move;
            if (o.correct) {
                ++r.horizons[h].correct;
                if (p.direction == direction::BULL) ++bull_correct[h];
                else ++bear_correct[h];
            }
        }
    }

    r.avg_confidence = sum_conf / n;
    r.avg_mfe = sum_mfe / n;
    r.avg_mae = sum_mae / n;
    r.mfe_mae_ratio = mfe_mae_ratio(r.avg_mfe, r.avg_mae);

    for (size_t h = 0; h < hz.size(); ++h) {
        auto& hs = r.horizons[h];
        hs.accuracy = hs.correct / n;
        hs.avg_move = sum_move[h] / n;
        hs.avg_dir_move = sum_dir[h] / n;
        if (r.bull_predictions > 0) hs.bull_accuracy = static_cast<double>(bull_correct[h]) / r.bull_predictions;
        if (r.bear_predictions > 0) hs.bear_accuracy = static_cast<double>(bear_correct[h]) / r.bear_predictions;
    }

    // Confidence buckets, judged at the longest horizon
    size_t last_h = hz.size() - 1;
    const auto& bins = cfg.confidence_bins;
    std::vector<BucketStats> buckets(bins.size());
    std::vector<int> bucket_correct(bins.size(), 0);
    for (size_t i = 0; i < bins.size(); ++i) {
        buckets[i].low = bins[i];
        buckets[i].high = (i + 1 < bins.size()) ? bins[i + 1] : 100.0;
    }
    for (const auto& p : preds) {
        int b = bucket_index(p.confidence, bins);
        if (b < 0) continue;
        auto& bs = buckets[static_cast<size_t>(b)];
        ++bs.count;
        bs.avg_confidence += p.confidence;
        bs.avg_mfe += p.excursion.mfe;
        if (p.outcomes.size() > last_h && p.outcomes[last_h].correct) ++bucket_correct[static_cast<size_t>(b)];
    }
    for (size_t i = 0; i < buckets.size(); ++i) {
        auto& bs = buckets[i];
        if (bs.count == 0) continue;
        bs.accuracy = static_cast<double>(bucket_correct[i]) / bs.count;
        bs.avg_confidence /= bs.count;
        bs.avg_mfe /= bs.count;
        r.confidence_buckets.push_back(bs);
    }

    // Session breakdown
    if (is_intraday(cfg.mode)) {
        std::map<session::Session, SessionStats> by_session;
        std::map<session::Session, int> sess_correct;
        for (const auto& p : preds) {
            if (p.session == session::Session::NONE) continue;
            auto& ss = by_session[p.session];
            ss.session = p.session;
            ++ss.count;
            ss.avg_confidence += p.confidence;
            if (p.outcomes.size() > last_h && p.outcomes[last_h].correct) ++sess_correct[p.session];
        }
        for (auto& [s, ss] : by_session) {
            ss.accuracy = static_cast<double>(sess_correct[s]) / ss.count;
            ss.avg_confidence /= ss.count;
            r.sessions.push_back(ss);
        }
    }
    return r;
}

// ---------------------------------------------------------------------------
// Universe aggregate
//
// Reports with zero predictions are counted in tickers_excluded and take no
// part in any figure.
// ---------------------------------------------------------------------------
inline UniverseAggregate aggregate(const std::vector<AccuracyReport>& reports) {
    UniverseAggregate agg;
    std::vector<const AccuracyReport*> valid;
    for (const auto& r : reports) {
        if (r.predictions > 0) valid.push_back(&r);
        else ++agg.tickers_excluded;
    }
    agg.tickers_tested = static_cast<int>(valid.size());
    if (valid.empty()) return agg;

    agg.mode = valid.front()->mode;
    const auto& shape = valid.front()->horizons;
    agg.horizons.resize(shape.size());
    for (size_t h = 0; h < shape.size(); ++h) {
        agg.horizons[h].label = shape[h].label;
        agg.horizons[h].bars = shape[h].bars;
    }

    std::vector<double> bull_w(shape.size(), 0.0), bear_w(shape.size(), 0.0);
    std::vector<double> bull_acc(shape.size(), 0.0), bear_acc(shape.size(), 0.0);
    std::map<std::pair<double, double>, BucketStats> buckets;
    std::map<std::pair<double, double>, double> bucket_correct;
    std::map<session::Session, SessionStats> sessions;
    std::map<session::Session, double> sess_correct;

    for (const AccuracyReport* r : valid) {
        double w = r->predictions;
        agg.total_predictions += r->predictions;
        agg.total_bull += r->bull_predictions;
        agg.total_bear += r->bear_predictions;
        agg.avg_confidence += r->avg_confidence;
        agg.avg_mfe += r->avg_mfe;
        agg.avg_mae += r->avg_mae;

        for (size_t h = 0; h < shape.size() && h < r->horizons.size(); ++h) {
            const auto& hs = r->horizons[h];
            auto& ah = agg.horizons[h];
            ah.correct += hs.correct;
            ah.accuracy += hs.accuracy * w;
            ah.avg_move += hs.avg_move * w;
            ah.avg_dir_move += hs.avg_dir_move * w;
            if (r->bull_predictions > 0 && !std::isnan(hs.bull_accuracy)) {
                bull_acc[h] += hs.bull_accuracy * r->bull_predictions;
                bull_w[h] += r->bull_predictions;
            }
            if (r->bear_predictions > 0 && !std::isnan(hs.bear_accuracy)) {
                bear_acc[h] += hs.bear_accuracy * r->bear_predictions;
                bear_w[h] += r->bear_predictions;
            }
        }

        for (const auto& b : r->confidence_buckets) {
            auto key = std::make_pair(b.low, b.high);
            auto& ab = buckets[key];
            ab.low = b.low;
            ab.high = b.high;
            ab.count += b.count;
            ab.avg_confidence += b.avg_confidence * b.count;
            ab.avg_mfe += b.avg_mfe * b.count;
            bucket_correct[key] += b.accuracy * b.count;
        }
        for (const auto& s : r->sessions) {
            auto& as = sessions[s.session];
            as.session = s.session;
            as.count += s.count;
            as.avg_confidence += s.avg_confidence * s.count;
            sess_correct[s.session] += s.accuracy * s.count;
        }
    }

    double total = agg.total_predictions;
    double n_tickers = static_cast<double>(valid.size());
    agg.avg_confidence /= n_tickers;
    agg.avg_mfe /= n_tickers;
    agg.avg_mae /= n_tickers;
    agg.mfe_mae_ratio = mfe_mae_ratio(agg.avg_mfe, agg.avg_mae);

    for (size_t h = 0; h < agg.horizons.size(); ++h) {
        auto& ah = agg.horizons[h];
        ah.accuracy /= total;
        ah.avg_move /= total;
        ah.avg_dir_move /= total;
        if (bull_w[h] > 0.0) ah.bull_accuracy = bull_acc[h] / bull_w[h];
        if (bear_w[h] > 0.0) ah.bear_accuracy = bear_acc[h] / bear_w[h];
    }

    for (auto& [key, b] : buckets) {
        b.accuracy = bucket_correct[key] / b.count;
        b.avg_confidence /= b.count;
        b.avg_mfe /= b.count;
        agg.confidence_buckets.push_back(b);
    }
    for (auto& [s, ss] : sessions) {
        ss.accuracy = sess_correct[s] / ss.count;
        ss.avg_confidence /= ss.count;
        agg.sessions.push_back(ss);
    }
    return agg;
}

// ---------------------------------------------------------------------------
// Setup-mode report
// ---------------------------------------------------------------------------
inline SetupReport compile_setup_report(const std::vector<SetupOutcome>& outcomes,
                                        const HorizonConfig& horizons) {
    SetupReport rep;
    rep.labels = horizons.labels;
    rep.reference_horizon = horizons.reference_index();
    size_t nh = horizons.size();
    rep.accuracy.assign(nh, 0.0);
    rep.total = static_cast<int>(outcomes.size());
    if (outcomes.empty()) return rep;

    std::array<SetupStats, SETUP_COUNT> per{};
    for (size_t k = 0; k < SETUP_COUNT; ++k) {
        per[k].setup = setups::SETUP_INFO[k].id;
        per[k].accuracy.assign(nh, 0.0);
    }

    for (const auto& o : outcomes) {
        if (o.setup.direction == direction::BULL) ++rep.longs;
        else if (o.setup.direction == direction::BEAR) ++rep.shorts;
        rep.avg_mfe += o.excursion.mfe;
        rep.avg_mae += o.excursion.mae;

        auto& s = per[static_cast<size_t>(o.setup.setup)];
        ++s.count;
        s.avg_mfe += o.excursion.mfe;
        s.avg_mae += o.excursion.mae;
        for (size_t h = 0; h < nh && h < o.outcomes.size(); ++h) {
            if (o.outcomes[h].correct) {
                rep.accuracy[h] += 1.0;
                s.accuracy[h] += 1.0;
            }
        }
    }

    double n = static_cast<double>(outcomes.size());
    for (auto& a : rep.accuracy) a /= n;
    rep.avg_mfe /= n;
    rep.avg_mae /= n;
    rep.mfe_mae_ratio = mfe_mae_ratio(rep.avg_mfe, rep.avg_mae);

    for (auto& s : per) {
        if (s.count == 0) continue;
        for (auto& a : s.accuracy) a /= s.count;
        s.avg_mfe /= s.count;
        s.avg_mae /= s.count;
        s.mfe_mae_ratio = mfe_mae_ratio(s.avg_mfe, s.avg_mae);
        rep.per_setup.push_back(s);
    }

    rep.ranking = rep.per_setup;
    size_t ref = rep.reference_horizon;
    std::stable_sort(rep.ranking.begin(), rep.ranking.end(),
                     [ref](const SetupStats& a, const SetupStats& b) {
                         return a.accuracy[ref] > b.accuracy[ref];
                     });
    return rep;
}

// ---------------------------------------------------------------------------
// Compare two runs over the same universe
// ---------------------------------------------------------------------------
inline ComparisonReport compare_results(const std::vector<AccuracyReport>& a,
                                        const std::vector<AccuracyReport>& b) {
    ComparisonReport cmp;
    std::map<std::string, const AccuracyReport*> map_a, map_b;
    for (const auto& r : a) if (r.predictions > 0) map_a[r.ticker] = &r;
    for (const auto& r : b) if (r.predictions > 0) map_b[r.ticker] = &r;

    for (const auto& [ticker, ra] : map_a) {
        auto it = map_b.find(ticker);
        if (it == map_b.end()) continue;
        const AccuracyReport* rb = it->second;
        if (ra->horizons.empty() || rb->horizons.empty()) continue;

        size_t ref = ra->horizons.size() > 2 ? 2 : ra->horizons.size() - 1;
        ref = std::min(ref, rb->horizons.size() - 1);
        cmp.reference_label = ra->horizons[ref].label;

        TickerComparison tc;
        tc.ticker = ticker;
        tc.accuracy_a = ra->horizons[ref].accuracy;
        tc.accuracy_b = rb->horizons[ref].accuracy;
        tc.delta = tc.accuracy_b - tc.accuracy_a;
        tc.mfe_a = ra->avg_mfe;
        tc.mfe_b = rb->avg_mfe;
        if (tc.accuracy_b > tc.accuracy_a) { tc.winner = 1; ++cmp.wins_b; }
        else if (tc.accuracy_a > tc.accuracy_b) { tc.winner = -1; ++cmp.wins_a; }
        else ++cmp.ties;
        cmp.tickers.push_back(tc);
    }

    UniverseAggregate agg_a = aggregate(a);
    UniverseAggregate agg_b = aggregate(b);
    size_t nh = std::max(agg_a.horizons.size(), agg_b.horizons.size());
    for (size_t h = 0; h < nh; ++h) {
        HorizonDelta d;
        d.label = h < agg_a.horizons.size() ? agg_a.horizons[h].label : agg_b.horizons[h].label;
        d.accuracy_a = h < agg_a.horizons.size() ? agg_a.horizons[h].accuracy : 0.0;
        d.accuracy_b = h < agg_b.horizons.size() ? agg_b.horizons[h].accuracy : 0.0;
        d.delta = d.accuracy_b - d.accuracy_a;
        cmp.aggregate.push_back(d);
    }
    return cmp;
}

}  // namespace accuracy_report
