#pragma once

#include "backtest/session.hpp"
#include "signals/setup_detector.hpp"
#include "signals/signal_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// HorizonOutcome — realized result of a call at one forward horizon
// ---------------------------------------------------------------------------
struct HorizonOutcome {
    double change_pct = 0.0;   // (close[t+h] - entry) / entry * 100
    bool correct = false;      // sign of change agrees with the call
    double dir_move = 0.0;     // change_pct, negated for BEAR calls
};

// Best and worst close over [entry, entry + max_horizon], in percent of
// entry, positive meaning in the called direction. mfe >= 0 >= mae.
struct Excursion {
    double mfe = 0.0;
    double mae = 0.0;
};

// ---------------------------------------------------------------------------
// Prediction — one scored bar that cleared the threshold with a direction
// ---------------------------------------------------------------------------
struct Prediction {
    size_t bar_index = 0;
    uint64_t timestamp = 0;
    double entry_price = 0.0;
    int direction = direction::NEUTRAL;
    double confidence = 0.0;
    double bull_score = 0.0;
    double bear_score = 0.0;
    std::vector<HorizonOutcome> outcomes;  // one per configured horizon
    Excursion excursion;
    session::Session session = session::Session::NONE;  // intraday modes only
};

// ---------------------------------------------------------------------------
// SetupOutcome — a triggered setup measured the same way as a prediction
// ---------------------------------------------------------------------------
struct SetupOutcome {
    SetupRecord setup;
    std::vector<HorizonOutcome> outcomes;
    Excursion excursion;
    session::Session session = session::Session::NONE;
};
