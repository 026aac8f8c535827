// setup_backtest.cpp — detect named trade setups across a ticker universe
// and rank them by how often price moved their way.
//
// Pipeline: bar_csv -> SetupDetector -> OutcomeValidator (forward outcomes)
// -> compile_setup_report -> console tables.
//
// Usage: ./setup_backtest --mode day --data-dir data --tickers AAPL MSFT

#include "backtest/accuracy_report.hpp"
#include "backtest/horizon_config.hpp"
#include "backtest/outcome_validator.hpp"
#include "backtest/report_io.hpp"
#include "backtest/universe_runner.hpp"
#include "bars/bar.hpp"
#include "bars/bar_csv.hpp"
#include "signals/setup_detector.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

// ===========================================================================
// Report printing
// ===========================================================================
void print_setup_row(const SetupStats& s, const std::vector<std::string>& labels) {
    std::printf("  %-30s %-5s %6d", std::string(setups::setup_name(s.setup)).c_str(),
                setups::setup_direction(s.setup) == direction::BULL ? "LONG" : "SHORT",
                s.count);
    for (size_t h = 0; h < labels.size(); ++h) {
        std::printf(" %7.1f%%", s.accuracy[h] * 100.0);
    }
    std::printf(" %+8.3f%% %+8.3f%% %7.2f\n", s.avg_mfe, s.avg_mae, s.mfe_mae_ratio);
}

void print_setup_header(const std::vector<std::string>& labels) {
    std::printf("  %-30s %-5s %6s", "Setup", "Side", "Count");
    for (const auto& l : labels) std::printf(" %8s", l.c_str());
    std::printf(" %9s %9s %7s\n", "Avg MFE", "Avg MAE", "Ratio");
}

void print_report(const SetupUniverseResult& u) {
    const SetupReport& r = u.report;

    std::cout << "\n=== Per-ticker ===\n\n";
    for (const auto& t : u.per_ticker) {
        if (t.skipped) {
            std::printf("  %-8s skipped: %s\n", t.ticker.c_str(), t.skip_reason.c_str());
        } else {
            std::printf("  %-8s %6d bars  %4d setups measured (%d detected)\n",
                        t.ticker.c_str(), t.bar_count, static_cast<int>(t.outcomes.size()),
                        t.setups_detected);
        }
    }

    std::cout << "\n=== Universe ===\n\n";
    std::printf("  Setups: %d (long %d, short %d)\n", r.total, r.longs, r.shorts);
    if (r.total == 0) return;
    std::printf("  Accuracy:");
    for (size_t h = 0; h < r.labels.size(); ++h) {
        std::printf("  %s %.1f%%", r.labels[h].c_str(), r.accuracy[h] * 100.0);
    }
    std::printf("\n  Avg MFE: %+.3f%%  Avg MAE: %+.3f%%  MFE/MAE: %.2f\n",
                r.avg_mfe, r.avg_mae, r.mfe_mae_ratio);

    std::cout << "\n=== Setups ===\n\n";
    print_setup_header(r.labels);
    for (const auto& s : r.per_setup) print_setup_row(s, r.labels);

    std::cout << "\n=== Ranking (accuracy at " << r.labels[r.reference_horizon] << ") ===\n\n";
    int rank = 0;
    for (const auto& s : r.ranking) {
        std::printf("  %2d. %-30s %7.1f%%  n=%d\n", ++rank,
                    std::string(setups::setup_name(s.setup)).c_str(),
                    s.accuracy[r.reference_horizon] * 100.0, s.count);
    }
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --mode <mode> --data-dir <dir> --tickers <T1> [T2 ...] [--save <path>]\n"
              << "\n"
              << "  --mode       Trading mode: scalp, day, swing\n"
              << "  --data-dir   Directory holding <TICKER>.csv bar files\n"
              << "  --tickers    Ticker symbols\n"
              << "  --save       Write the setup report as JSON\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string mode_str;
    std::string data_dir;
    std::vector<std::string> tickers;
    std::string save_path;

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
        } else if (arg == "--save" && i + 1 < argc) {
            save_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (mode_str.empty() || data_dir.empty() || tickers.empty()) {
        std::cerr << "Missing required argument: --mode, --data-dir and --tickers are required\n";
        print_usage(argv[0]);
        return 1;
    }

    ValidatorConfig cfg;
    try {
        cfg = ValidatorConfig::for_mode(trading_mode_from_name(mode_str));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    BarLoader loader = [data_dir](const std::string& ticker) {
        std::string path = (std::filesystem::path(data_dir) / (ticker + ".csv")).string();
        return bar_csv::load_bars(path);
    };

    std::cout << "=== Setup Backtest ===\n\n";
    std::cout << "Mode: " << trading_mode_name(cfg.mode)
              << "  Tickers: " << tickers.size() << "\n";

    SetupUniverseResult result;
    try {
        UniverseRunner runner(OutcomeValidator(cfg), loader);
        std::cout << "Required bars per ticker: " << runner.validator().required_setup_bars() << "\n";
        result = runner.run_setups(tickers);
    } catch (const std::exception& e) {
        std::cerr << "Run failed: " << e.what() << "\n";
        return 1;
    }

    for (const auto& e : result.errors) {
        std::cerr << "  " << e.ticker << " [" << skip_kind_name(e.kind) << "]: "
                  << e.message << "\n";
    }
    print_report(result);

    if (!save_path.empty()) {
        try {
            report_io::save(save_path, report_io::to_json(result.report));
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
        std::cout << "\nSaved setup report to " << save_path << "\n";
    }
    return 0;
}
