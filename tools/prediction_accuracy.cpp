// prediction_accuracy.cpp — score a ticker universe and measure how often
// high-confidence calls were right.
//
// Pipeline: bar_csv -> OutcomeValidator (SignalEngine -> predictions ->
// outcomes) -> accuracy_report -> console tables, JSON, Parquet.
//
// Usage: ./prediction_accuracy --mode day --data-dir data --tickers AAPL MSFT

#include "backtest/accuracy_report.hpp"
#include "backtest/horizon_config.hpp"
#include "backtest/outcome_validator.hpp"
#include "backtest/prediction_parquet.hpp"
#include "backtest/report_io.hpp"
#include "backtest/session.hpp"
#include "backtest/universe_runner.hpp"
#include "bars/bar.hpp"
#include "bars/bar_csv.hpp"
#include "parse_utils.hpp"
#include "signals/weight_map.hpp"

#include <cmath>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
BarLoader make_loader(const std::string& data_dir, int lookback) {
    return [data_dir, lookback](const std::string& ticker) {
        std::string path = (std::filesystem::path(data_dir) / (ticker + ".csv")).string();
        auto series = bars::normalize(bar_csv::load_bars(path));
        if (lookback > 0 && series.size() > static_cast<size_t>(lookback)) {
            series.erase(series.begin(), series.end() - lookback);
        }
        return series;
    };
}

// A threshold in the weight file applies unless --threshold was given.
OutcomeValidator make_validator(ValidatorConfig cfg, const weight_io::WeightFile& wf,
                                const std::string& threshold_override) {
    if (wf.threshold && threshold_override.empty()) cfg.scoring.threshold = *wf.threshold;
    return OutcomeValidator(cfg, wf.weights);
}

double pct(double fraction) { return fraction * 100.0; }

void print_horizon_table(const std::vector<HorizonStats>& horizons) {
    std::printf("  %-8s %9s %9s %10s %10s %10s\n",
                "Horizon", "Accuracy", "Avg move", "Dir move", "Bull acc", "Bear acc");
    for (const auto& h : horizons) {
        std::printf("  %-8s %8.1f%% %+8.3f%% %+9.3f%% ",
                    h.label.c_str(), pct(h.accuracy), h.avg_move, h.avg_dir_move);
        if (std::isnan(h.bull_accuracy)) std::printf("%10s ", "-");
        else std::printf("%9.1f%% ", pct(h.bull_accuracy));
        if (std::isnan(h.bear_accuracy)) std::printf("%10s\n", "-");
        else std::printf("%9.1f%%\n", pct(h.bear_accuracy));
    }
}

void print_buckets(const std::vector<BucketStats>& buckets, const std::string& last_label) {
    if (buckets.empty()) return;
    std::printf("\n  Confidence buckets (accuracy at %s):\n", last_label.c_str());
    std::printf("  %-10s %7s %9s %9s %9s\n", "Range", "Count", "Accuracy", "Avg conf", "Avg MFE");
    for (const auto& b : buckets) {
        std::printf("  %-10s %7d %8.1f%% %9.1f %+8.3f%%\n",
                    b.label().c_str(), b.count, pct(b.accuracy), b.avg_confidence, b.avg_mfe);
    }
}

void print_sessions(const std::vector<SessionStats>& sessions) {
    if (sessions.empty()) return;
    std::printf("\n  Sessions:\n");
    std::printf("  %-12s %7s %9s %9s\n", "Session", "Count", "Accuracy", "Avg conf");
    for (const auto& s : sessions) {
        std::printf("  %-12s %7d %8.1f%% %9.1f\n",
                    session::name(s.session), s.count, pct(s.accuracy), s.avg_confidence);
    }
}

void print_universe(const UniverseResult& u) {
    const auto& a = u.aggregate;

    std::cout << "\n=== Per-ticker ===\n\n";
    std::printf("  %-8s %7s %6s %6s %9s %9s %9s\n",
                "Ticker", "Preds", "Bull", "Bear", "Avg conf", "Ref acc", "MFE/MAE");
    for (const auto& t : u.per_ticker) {
        if (t.skipped) {
            std::printf("  %-8s skipped: %s\n", t.ticker.c_str(), t.skip_reason.c_str());
            continue;
        }
        const auto& r = t.report;
        size_t ref = r.horizons.size() > 2 ? 2 : r.horizons.size() - 1;
        std::printf("  %-8s %7d %6d %6d %9.1f %8.1f%% %9.2f\n",
                    r.ticker.c_str(), r.predictions, r.bull_predictions, r.bear_predictions,
                    r.avg_confidence, pct(r.horizons[ref].accuracy), r.mfe_mae_ratio);
    }

    std::cout << "\n=== Universe (" << trading_mode_name(a.mode) << ") ===\n\n";
    std::printf("  Tickers tested: %d (excluded %d)\n", a.tickers_tested, a.tickers_excluded);
    std::printf("  Predictions: %d (bull %d, bear %d)\n",
                a.total_predictions, a.total_bull, a.total_bear);
    if (a.tickers_tested == 0) return;
    std::printf("  Avg confidence: %.1f\n", a.avg_confidence);
    std::printf("  Avg MFE: %+.3f%%  Avg MAE: %+.3f%%  MFE/MAE: %.2f\n\n",
                a.avg_mfe, a.avg_mae, a.mfe_mae_ratio);
    print_horizon_table(a.horizons);
    print_buckets(a.confidence_buckets, a.horizons.back().label);
    print_sessions(a.sessions);
}

void print_comparison(const ComparisonReport& c) {
    std::cout << "\n=== Comparison (accuracy at " << c.reference_label << ") ===\n\n";
    std::printf("  %-8s %9s %9s %9s %7s\n", "Ticker", "A", "B", "Delta", "Winner");
    for (const auto& t : c.tickers) {
        const char* winner = t.winner > 0 ? "B" : (t.winner < 0 ? "A" : "tie");
        std::printf("  %-8s %8.1f%% %8.1f%% %+8.1f%% %7s\n", t.ticker.c_str(),
                    pct(t.accuracy_a), pct(t.accuracy_b), pct(t.delta), winner);
    }
    std::printf("\n  Wins: A %d, B %d, ties %d\n\n", c.wins_a, c.wins_b, c.ties);
    for (const auto& d : c.aggregate) {
        std::printf("  %-8s A %5.1f%%  B %5.1f%%  delta %+5.1f%%\n", d.label.c_str(),
                    pct(d.accuracy_a), pct(d.accuracy_b), pct(d.delta));
    }
}

void print_errors(const std::vector<TickerError>& errors) {
    for (const auto& e : errors) {
        std::cerr << "  " << e.ticker << " [" << skip_kind_name(e.kind) << "]: "
                  << e.message << "\n";
    }
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --mode <mode> --data-dir <dir> --tickers <T1> [T2 ...] [options]\n"
              << "\n"
              << "  --mode       Trading mode: scalp, day, swing\n"
              << "  --data-dir   Directory holding <TICKER>.csv bar files\n"
              << "  --tickers    Ticker symbols\n"
              << "  --lookback   Keep only the last N bars of each ticker\n"
              << "  --threshold  Minimum confidence for a prediction (0-100, default 65)\n"
              << "  --weights    Weight file (name=weight per line)\n"
              << "  --compare    Two weight files to run and compare\n"
              << "  --save       Write the universe result as JSON\n"
              << "  --parquet    Write every prediction as Parquet\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string mode_str;
    std::string data_dir;
    std::vector<std::string> tickers;
    std::string weights_path;
    std::string compare_a, compare_b;
    std::string save_path;
    std::string parquet_path;
    std::string threshold_str;
    std::string lookback_str;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            mode_str = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--tickers") {
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                tickers.push_back(argv[++i]);
            }
        } else if (arg == "--lookback" && i + 1 < argc) {
            lookback_str = argv[++i];
        } else if (arg == "--threshold" && i + 1 < argc) {
            threshold_str = argv[++i];
        } else if (arg == "--weights" && i + 1 < argc) {
            weights_path = argv[++i];
        } else if (arg == "--compare" && i + 2 < argc) {
            compare_a = argv[++i];
            compare_b = argv[++i];
        } else if (arg == "--save" && i + 1 < argc) {
            save_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            parquet_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Validate required args
    if (mode_str.empty()) {
        std::cerr << "Missing required argument: --mode\n";
        print_usage(argv[0]);
        return 1;
    }
    if (data_dir.empty()) {
        std::cerr << "Missing required argument: --data-dir\n";
        print_usage(argv[0]);
        return 1;
    }
    if (tickers.empty()) {
        std::cerr << "Missing required argument: --tickers\n";
        print_usage(argv[0]);
        return 1;
    }

    ValidatorConfig cfg;
    int lookback = 0;
    WeightMap weights = WeightMap::defaults();
    try {
        cfg = ValidatorConfig::for_mode(trading_mode_from_name(mode_str));
        if (!weights_path.empty()) {
            weight_io::WeightFile wf = weight_io::load(weights_path);
            weights = wf.weights;
            if (wf.threshold) cfg.scoring.threshold = *wf.threshold;
        }
        // --threshold overrides the weight file
        if (!threshold_str.empty()) cfg.scoring.threshold = parse_utils::to_double(threshold_str);
        if (!lookback_str.empty()) lookback = parse_utils::to_int(lookback_str);
        if (lookback < 0) throw std::invalid_argument("--lookback must be non-negative");
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    BarLoader loader = make_loader(data_dir, lookback);

    std::cout << "=== Prediction Accuracy ===\n\n";
    std::cout << "Mode: " << trading_mode_name(cfg.mode)
              << "  Threshold: " << cfg.scoring.threshold
              << "  Tickers: " << tickers.size() << "\n";
    std::cout << "Horizons:";
    for (const auto& l : cfg.horizons.labels) std::cout << " " << l;
    std::cout << "\n";

    // Version comparison
    if (!compare_a.empty()) {
        UniverseResult run_a, run_b;
        try {
            UniverseRunner ra(make_validator(cfg, weight_io::load(compare_a), threshold_str), loader);
            UniverseRunner rb(make_validator(cfg, weight_io::load(compare_b), threshold_str), loader);
            std::cout << "Running A: " << compare_a << "\n";
            run_a = ra.run(tickers);
            std::cout << "Running B: " << compare_b << "\n";
            run_b = rb.run(tickers);
        } catch (const std::exception& e) {
            std::cerr << "Comparison failed: " << e.what() << "\n";
            return 1;
        }
        print_errors(run_a.errors);
        print_errors(run_b.errors);

        ComparisonReport cmp = accuracy_report::compare_results(run_a.reports(), run_b.reports());
        print_comparison(cmp);
        if (!save_path.empty()) {
            try {
                report_io::save(save_path, report_io::to_json(cmp));
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                return 1;
            }
            std::cout << "\nSaved comparison to " << save_path << "\n";
        }
        return 0;
    }

    UniverseResult result;
    try {
        UniverseRunner runner(OutcomeValidator(cfg, weights), loader);
        std::cout << "Required bars per ticker: " << runner.validator().required_bars() << "\n";
        result = runner.run(tickers);
    } catch (const std::exception& e) {
        std::cerr << "Run failed: " << e.what() << "\n";
        return 1;
    }

    if (!result.errors.empty()) {
        std::cerr << "\n" << result.errors.size() << " ticker(s) failed:\n";
        print_errors(result.errors);
    }
    print_universe(result);

    int exit_code = 0;
    if (!save_path.empty()) {
        try {
            report_io::save(save_path, report_io::to_json(result));
            std::cout << "\nSaved results to " << save_path << "\n";
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            exit_code = 1;
        }
    }
    if (!parquet_path.empty()) {
        arrow::Status st = prediction_parquet::write(parquet_path, result.reports());
        if (!st.ok()) {
            std::cerr << "Failed to write Parquet: " << st.ToString() << "\n";
            exit_code = 1;
        } else {
            std::cout << "Wrote " << result.aggregate.total_predictions
                      << " predictions to " << parquet_path << "\n";
        }
    }
    return exit_code;
}
