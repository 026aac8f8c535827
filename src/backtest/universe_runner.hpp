#pragma once

#include "backtest/accuracy_report.hpp"
#include "backtest/outcome_validator.hpp"
#include "bars/bar.hpp"

#include <exception>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BarLoader — fetches one ticker's bars; may throw
// ---------------------------------------------------------------------------
using BarLoader = std::function<std::vector<Bar>(const std::string& ticker)>;

// Drops repeated tickers, keeping the first occurrence in input order.
inline std::vector<std::string> unique_tickers(const std::vector<std::string>& tickers) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& t : tickers) {
        if (seen.insert(t).second) out.push_back(t);
    }
    return out;
}

struct TickerError {
    std::string ticker;
    SkipKind kind = SkipKind::ERROR;
    std::string message;
};

// ---------------------------------------------------------------------------
// UniverseResult — per-ticker results plus the roll-up
// ---------------------------------------------------------------------------
struct UniverseResult {
    std::vector<TickerResult> per_ticker;   // input order, one entry per distinct ticker
    UniverseAggregate aggregate;
    std::vector<TickerError> errors;        // malformed data and loader failures

    std::vector<AccuracyReport> reports() const {
        std::vector<AccuracyReport> out;
        out.reserve(per_ticker.size());
        for (const auto& t : per_ticker) out.push_back(t.report);
        return out;
    }
};

struct SetupUniverseResult {
    std::vector<SetupTickerResult> per_ticker;
    SetupReport report;                     // all tickers' setups pooled
    std::vector<TickerError> errors;
};

// ---------------------------------------------------------------------------
// UniverseRunner — runs every ticker independently
//
// A failure in one ticker is recorded against that ticker and the run moves
// on to the next.
// ---------------------------------------------------------------------------
class UniverseRunner {
public:
    UniverseRunner(OutcomeValidator validator, BarLoader loader)
        : validator_(std::move(validator)), loader_(std::move(loader)) {}

    const OutcomeValidator& validator() const { return validator_; }

    TickerResult run_ticker(const std::string& ticker, std::vector<TickerError>& errors) const {
        try {
            return validator_.validate(ticker, loader_(ticker));
        } catch (const std::invalid_argument& e) {
            return failed(ticker, SkipKind::MALFORMED_DATA, e.what(), errors);
        } catch (const std::exception& e) {
            return failed(ticker, SkipKind::ERROR, e.what(), errors);
        }
    }

    UniverseResult run(const std::vector<std::string>& tickers) const {
        UniverseResult res;
        const auto universe = unique_tickers(tickers);
        res.per_ticker.reserve(universe.size());
        for (const auto& t : universe) {
            res.per_ticker.push_back(run_ticker(t, res.errors));
        }
        res.aggregate = accuracy_report::aggregate(res.reports());
        res.aggregate.mode = validator_.config().mode;
        return res;
    }

    SetupUniverseResult run_setups(const std::vector<std::string>& tickers) const {
        SetupUniverseResult res;
        std::vector<SetupOutcome> pooled;
        for (const auto& t : unique_tickers(tickers)) {
            SetupTickerResult tr;
            try {
                tr = validator_.validate_setups(t, loader_(t));
            } catch (const std::invalid_argument& e) {
                tr = failed_setup(t, SkipKind::MALFORMED_DATA, e.what(), res.errors);
            } catch (const std::exception& e) {
                tr = failed_setup(t, SkipKind::ERROR, e.what(), res.errors);
            }
            pooled.insert(pooled.end(), tr.outcomes.begin(), tr.outcomes.end());
            res.per_ticker.push_back(std::move(tr));
        }
        res.report = accuracy_report::compile_setup_report(pooled, validator_.config().horizons);
        return res;
    }

private:
    OutcomeValidator validator_;
    BarLoader loader_;

    TickerResult failed(const std::string& ticker, SkipKind kind, const std::string& msg,
                        std::vector<TickerError>& errors) const {
        TickerResult r;
        r.ticker = ticker;
        r.skipped = true;
        r.skip_kind = kind;
        r.skip_reason = msg;
        r.report = accuracy_report::compile(ticker, {}, validator_.config());
        errors.push_back({ticker, kind, msg});
        return r;
    }

    SetupTickerResult failed_setup(const std::string& ticker, SkipKind kind,
                                   const std::string& msg,
                                   std::vector<TickerError>& errors) const {
        SetupTickerResult r;
        r.ticker = ticker;
        r.skipped = true;
        r.skip_kind = kind;
        r.skip_reason = msg;
        errors.push_back({ticker, kind, msg});
        return r;
    }
};
