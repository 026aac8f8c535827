#pragma once

#include "backtest/horizon_config.hpp"
#include "time_utils.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace session {

// ---------------------------------------------------------------------------
// Session — intraday wall-clock bucket of a prediction's entry bar
// ---------------------------------------------------------------------------
enum class Session { OPEN_RUSH, POWER_OPEN, MIDDAY, POWER_HOUR, AFTER_HOURS, NONE };

inline constexpr std::array<Session, 5> ALL = {
    Session::OPEN_RUSH, Session::POWER_OPEN, Session::MIDDAY,
    Session::POWER_HOUR, Session::AFTER_HOURS};

inline Session classify(int minute_of_day, const SessionCuts& cuts = {}) {
    if (minute_of_day < cuts.open_rush_end) return Session::OPEN_RUSH;
    if (minute_of_day < cuts.power_open_end) return Session::POWER_OPEN;
    if (minute_of_day < cuts.midday_end) return Session::MIDDAY;
    if (minute_of_day < cuts.power_hour_end) return Session::POWER_HOUR;
    return Session::AFTER_HOURS;
}

inline Session classify_timestamp(uint64_t ts, const SessionCuts& cuts = {}) {
    return classify(time_utils::minute_of_day_et(ts), cuts);
}

inline const char* name(Session s) {
    switch (s) {
        case Session::OPEN_RUSH:   return "OPEN_RUSH";
        case Session::POWER_OPEN:  return "POWER_OPEN";
        case Session::MIDDAY:      return "MIDDAY";
        case Session::POWER_HOUR:  return "POWER_HOUR";
        case Session::AFTER_HOURS: return "AFTER_HOURS";
        case Session::NONE:        return "";
    }
    return "";
}

inline Session from_name(const std::string& s) {
    for (Session x : ALL) {
        if (s == name(x)) return x;
    }
    if (s.empty()) return Session::NONE;
    throw std::invalid_argument("unknown session '" + s + "'");
}

}  // namespace session
