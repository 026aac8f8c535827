#pragma once

#include "backtest/accuracy_report.hpp"
#include "backtest/horizon_config.hpp"
#include "backtest/outcome_validator.hpp"
#include "backtest/session.hpp"
#include "backtest/universe_runner.hpp"
#include "signals/setup_detector.hpp"
#include "signals/signal_engine.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace report_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// JSON has no NaN or infinity; both are written as null.
inline std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss.precision(10);
    ss << v;
    return ss.str();
}

inline std::string quoted(const std::string& s) { return "\"" + json_escape(s) + "\""; }

inline std::string to_json(const HorizonStats& h) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"label\":" << quoted(h.label);
    ss << ",\"bars\":" << h.bars;
    ss << ",\"correct\":" << h.correct;
    ss << ",\"accuracy\":" << number(h.accuracy);
    ss << ",\"avg_move\":" << number(h.avg_move);
    ss << ",\"avg_dir_move\":" << number(h.avg_dir_move);
    ss << ",\"bull_accuracy\":" << number(h.bull_accuracy);
    ss << ",\"bear_accuracy\":" << number(h.bear_accuracy);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const BucketStats& b) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"range\":" << quoted(b.label());
    ss << ",\"low\":" << number(b.low);
    ss << ",\"high\":" << number(b.high);
    ss << ",\"count\":" << b.count;
    ss << ",\"accuracy\":" << number(b.accuracy);
    ss << ",\"avg_confidence\":" << number(b.avg_confidence);
    ss << ",\"avg_mfe\":" << number(b.avg_mfe);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const SessionStats& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"session\":" << quoted(session::name(s.session));
    ss << ",\"count\":" << s.count;
    ss << ",\"accuracy\":" << number(s.accuracy);
    ss << ",\"avg_confidence\":" << number(s.avg_confidence);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Prediction& p, const std::vector<std::string>& labels) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"bar_index\":" << p.bar_index;
    ss << ",\"timestamp\":" << p.timestamp;
    ss << ",\"direction\":" << quoted(direction::name(p.direction));
    ss << ",\"confidence\":" << number(p.confidence);
    ss << ",\"bull_score\":" << number(p.bull_score);
    ss << ",\"bear_score\":" << number(p.bear_score);
    ss << ",\"entry_price\":" << number(p.entry_price);
    if (p.session != session::Session::NONE) {
        ss << ",\"session\":" << quoted(session::name(p.session));
    }
    ss << ",\"outcomes\":{";
    for (size_t h = 0; h < p.outcomes.size(); ++h) {
        if (h > 0) ss << ",";
        const auto& o = p.outcomes[h];
        std::string key = h < labels.size() ? labels[h] : std::to_string(h);
        ss << quoted(key) << ":{";
        ss << "\"change_pct\":" << number(o.change_pct);
        ss << ",\"correct\":" << (o.correct ? "true" : "false");
        ss << ",\"dir_move\":" << number(o.dir_move);
        ss << "}";
    }
    ss << "}";
    ss << ",\"mfe\":" << number(p.excursion.mfe);
    ss << ",\"mae\":" << number(p.excursion.mae);
    ss << "}";
    return ss.str();
}

template <typename T>
std::string array_json(const std::vector<T>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ",";
        out += to_json(items[i]);
    }
    out += "]";
    return out;
}

// Serialize one ticker's report. Raw predictions are included unless
// include_predictions is false.
inline std::string to_json(const AccuracyReport& r, bool include_predictions = true) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"ticker\":" << quoted(r.ticker);
    ss << ",\"mode\":" << quoted(trading_mode_name(r.mode));
    ss << ",\"total_predictions\":" << r.predictions;
    ss << ",\"bull_predictions\":" << r.bull_predictions;
    ss << ",\"bear_predictions\":" << r.bear_predictions;
    ss << ",\"avg_confidence\":" << number(r.avg_confidence);
    ss << ",\"horizons\":" << array_json(r.horizons);
    ss << ",\"avg_mfe\":" << number(r.avg_mfe);
    ss << ",\"avg_mae\":" << number(r.avg_mae);
    ss << ",\"mfe_mae_ratio\":" << number(r.mfe_mae_ratio);
    ss << ",\"confidence_buckets\":" << array_json(r.confidence_buckets);
    if (is_intraday(r.mode)) {
        ss << ",\"sessions\":" << array_json(r.sessions);
    }
    if (include_predictions) {
        std::vector<std::string> labels;
        for (const auto& h : r.horizons) labels.push_back(h.label);
        ss << ",\"predictions\":[";
        for (size_t i = 0; i < r.raw_predictions.size(); ++i) {
            if (i > 0) ss << ",";
            ss << to_json(r.raw_predictions[i], labels);
        }
        ss << "]";
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const UniverseAggregate& a) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"mode\":" << quoted(trading_mode_name(a.mode));
    ss << ",\"tickers_tested\":" << a.tickers_tested;
    ss << ",\"tickers_excluded\":" << a.tickers_excluded;
    ss << ",\"total_predictions\":" << a.total_predictions;
    ss << ",\"total_bull\":" << a.total_bull;
    ss << ",\"total_bear\":" << a.total_bear;
    ss << ",\"avg_confidence\":" << number(a.avg_confidence);
    ss << ",\"horizons\":" << array_json(a.horizons);
    ss << ",\"avg_mfe\":" << number(a.avg_mfe);
    ss << ",\"avg_mae\":" << number(a.avg_mae);
    ss << ",\"mfe_mae_ratio\":" << number(a.mfe_mae_ratio);
    ss << ",\"confidence_buckets\":" << array_json(a.confidence_buckets);
    if (is_intraday(a.mode)) {
        ss << ",\"sessions\":" << array_json(a.sessions);
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const SetupStats& s, const std::vector<std::string>& labels) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"setup\":" << quoted(std::string(setups::setup_name(s.setup)));
    ss << ",\"direction\":" << quoted(direction::name(setups::setup_direction(s.setup)));
    ss << ",\"count\":" << s.count;
    ss << ",\"accuracy\":{";
    for (size_t h = 0; h < s.accuracy.size(); ++h) {
        if (h > 0) ss << ",";
        std::string key = h < labels.size() ? labels[h] : std::to_string(h);
        ss << quoted(key) << ":" << number(s.accuracy[h]);
    }
    ss << "}";
    ss << ",\"avg_mfe\":" << number(s.avg_mfe);
    ss << ",\"avg_mae\":" << number(s.avg_mae);
    ss << ",\"mfe_mae_ratio\":" << number(s.mfe_mae_ratio);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const SetupReport& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"total\":" << r.total;
    ss << ",\"longs\":" << r.longs;
    ss << ",\"shorts\":" << r.shorts;
    ss << ",\"accuracy\":{";
    for (size_t h = 0; h < r.accuracy.size(); ++h) {
        if (h > 0) ss << ",";
        ss << quoted(r.labels[h]) << ":" << number(r.accuracy[h]);
    }
    ss << "}";
    ss << ",\"avg_mfe\":" << number(r.avg_mfe);
    ss << ",\"avg_mae\":" << number(r.avg_mae);
    ss << ",\"mfe_mae_ratio\":" << number(r.mfe_mae_ratio);
    if (!r.labels.empty()) {
        ss << ",\"ranked_by\":" << quoted(r.labels[r.reference_horizon]);
    }
    ss << ",\"setups\":[";
    for (size_t i = 0; i < r.ranking.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.ranking[i], r.labels);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ComparisonReport& c) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"reference_horizon\":" << quoted(c.reference_label);
    ss << ",\"wins_a\":" << c.wins_a;
    ss << ",\"wins_b\":" << c.wins_b;
    ss << ",\"ties\":" << c.ties;
    ss << ",\"tickers\":[";
    for (size_t i = 0; i < c.tickers.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& t = c.tickers[i];
        ss << "{";
        ss << "\"ticker\":" << quoted(t.ticker);
        ss << ",\"accuracy_a\":" << number(t.accuracy_a);
        ss << ",\"accuracy_b\":" << number(t.accuracy_b);
        ss << ",\"delta\":" << number(t.delta);
        ss << ",\"mfe_a\":" << number(t.mfe_a);
        ss << ",\"mfe_b\":" << number(t.mfe_b);
        ss << ",\"winner\":" << quoted(t.winner > 0 ? "B" : (t.winner < 0 ? "A" : "tie"));
        ss << "}";
    }
    ss << "]";
    ss << ",\"aggregate\":[";
    for (size_t i = 0; i < c.aggregate.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& d = c.aggregate[i];
        ss << "{";
        ss << "\"label\":" << quoted(d.label);
        ss << ",\"accuracy_a\":" << number(d.accuracy_a);
        ss << ",\"accuracy_b\":" << number(d.accuracy_b);
        ss << ",\"delta\":" << number(d.delta);
        ss << "}";
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

// Universe save file: aggregate plus per-ticker reports without their
// prediction lists. Skipped tickers carry their reason.
inline std::string to_json(const UniverseResult& u) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"aggregate\":" << to_json(u.aggregate);
    ss << ",\"per_ticker\":{";
    for (size_t i = 0; i < u.per_ticker.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& t = u.per_ticker[i];
        ss << quoted(t.ticker) << ":";
        if (t.skipped) {
            ss << "{";
            ss << "\"total_predictions\":0";
            ss << ",\"skip_kind\":" << quoted(skip_kind_name(t.skip_kind));
            ss << ",\"error\":" << quoted(t.skip_reason);
            ss << "}";
        } else {
            ss << to_json(t.report, false);
        }
    }
    ss << "}";
    ss << ",\"errors\":[";
    for (size_t i = 0; i < u.errors.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& e = u.errors[i];
        ss << "{\"ticker\":" << quoted(e.ticker)
           << ",\"kind\":" << quoted(skip_kind_name(e.kind))
           << ",\"message\":" << quoted(e.message) << "}";
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

// Throws std::runtime_error if the file cannot be written.
inline void save(const std::string& path, const std::string& json) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << json << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

}  // namespace report_io
