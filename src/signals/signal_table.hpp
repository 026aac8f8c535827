#pragma once

#include "features/indicators.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// SignalId — closed set of scored signals
// ---------------------------------------------------------------------------
enum class SignalId : int {
    EMA_ALIGNMENT = 0,
    RSI_POSITION,
    MACD_HISTOGRAM,
    BOLLINGER_POSITION,
    BB_SQUEEZE,
    VWAP_DEVIATION,
    CALL_PUT_RATIO,
    SWEEP_ACTIVITY,
    DARK_POOL_DIRECTION,
    INSIDER_CONGRESS,
    GEX_POSITIONING,
    IV_RANK,
    SHORT_INTEREST,
    VOLUME_SPIKE,
    REGIME_ALIGNMENT,
    GAMMA_WALL,
    IV_SKEW,
    CANDLESTICK_PATTERN,
    NEWS_SENTIMENT,
    MULTI_TF_CONFLUENCE,
    RSI_DIVERGENCE,
    ADX_FILTER,
    VOLATILITY_RUNNER,
    NET_PREMIUM_MOMENTUM,
    STRIKE_FLOW_LEVELS,
    GREEK_FLOW_MOMENTUM,
    SECTOR_TIDE_ALIGNMENT,
    ETF_TIDE_MACRO,
    SQUEEZE_COMPOSITE,
    SEASONALITY_ALIGNMENT,
    VOL_REGIME,
    INSIDER_CONVICTION,
    SPOT_GAMMA_PIN,
    FLOW_HORIZON,
    VOLUME_DIRECTION,
    EARNINGS_GAP_TRADE,
};

constexpr size_t SIGNAL_COUNT = 36;

// How a signal is obtained from OHLCV bars.
//   BACKTESTABLE  computed directly from price/volume
//   PROXY         weak price/volume heuristic standing in for market data
//                 (options flow, dealer gamma, short interest) that bars
//                 do not carry; zero where no heuristic exists
//   EXTERNAL      macro / event / sentiment inputs; zero unless a crude
//                 price-only stand-in exists
enum class SignalCategory : uint8_t { BACKTESTABLE, PROXY, EXTERNAL };

namespace signals {

struct SignalInfo {
    SignalId id;
    std::string_view name;
    SignalCategory category;
    int default_weight;
};

inline constexpr std::array<SignalInfo, SIGNAL_COUNT> SIGNAL_INFO = {{
    {SignalId::EMA_ALIGNMENT,         "ema_alignment",         SignalCategory::BACKTESTABLE, 5},
    {SignalId::RSI_POSITION,          "rsi_position",          SignalCategory::BACKTESTABLE, 3},
    {SignalId::MACD_HISTOGRAM,        "macd_histogram",        SignalCategory::BACKTESTABLE, 2},
    {SignalId::BOLLINGER_POSITION,    "bollinger_position",    SignalCategory::BACKTESTABLE, 1},
    {SignalId::BB_SQUEEZE,            "bb_squeeze",            SignalCategory::BACKTESTABLE, 2},
    {SignalId::VWAP_DEVIATION,        "vwap_deviation",        SignalCategory::BACKTESTABLE, 2},
    {SignalId::CALL_PUT_RATIO,        "call_put_ratio",        SignalCategory::PROXY,        3},
    {SignalId::SWEEP_ACTIVITY,        "sweep_activity",        SignalCategory::PROXY,        2},
    {SignalId::DARK_POOL_DIRECTION,   "dark_pool_direction",   SignalCategory::PROXY,        4},
    {SignalId::INSIDER_CONGRESS,      "insider_congress",      SignalCategory::EXTERNAL,     1},
    {SignalId::GEX_POSITIONING,       "gex_positioning",       SignalCategory::PROXY,        2},
    {SignalId::IV_RANK,               "iv_rank",               SignalCategory::PROXY,        1},
    {SignalId::SHORT_INTEREST,        "short_interest",        SignalCategory::PROXY,        1},
    {SignalId::VOLUME_SPIKE,          "volume_spike",          SignalCategory::BACKTESTABLE, 2},
    {SignalId::REGIME_ALIGNMENT,      "regime_alignment",      SignalCategory::BACKTESTABLE, 3},
    {SignalId::GAMMA_WALL,            "gamma_wall",            SignalCategory::PROXY,        2},
    {SignalId::IV_SKEW,               "iv_skew",               SignalCategory::PROXY,        1},
    {SignalId::CANDLESTICK_PATTERN,   "candlestick_pattern",   SignalCategory::BACKTESTABLE, 2},
    {SignalId::NEWS_SENTIMENT,        "news_sentiment",        SignalCategory::EXTERNAL,     2},
    {SignalId::MULTI_TF_CONFLUENCE,   "multi_tf_confluence",   SignalCategory::BACKTESTABLE, 5},
    {SignalId::RSI_DIVERGENCE,        "rsi_divergence",        SignalCategory::BACKTESTABLE, 3},
    {SignalId::ADX_FILTER,            "adx_filter",            SignalCategory::BACKTESTABLE, 0},
    {SignalId::VOLATILITY_RUNNER,     "volatility_runner",     SignalCategory::EXTERNAL,     5},
    {SignalId::NET_PREMIUM_MOMENTUM,  "net_premium_momentum",  SignalCategory::PROXY,        5},
    {SignalId::STRIKE_FLOW_LEVELS,    "strike_flow_levels",    SignalCategory::PROXY,        4},
    {SignalId::GREEK_FLOW_MOMENTUM,   "greek_flow_momentum",   SignalCategory::PROXY,        4},
    {SignalId::SECTOR_TIDE_ALIGNMENT, "sector_tide_alignment", SignalCategory::EXTERNAL,     3},
    {SignalId::ETF_TIDE_MACRO,        "etf_tide_macro",        SignalCategory::EXTERNAL,     3},
    {SignalId::SQUEEZE_COMPOSITE,     "squeeze_composite",     SignalCategory::BACKTESTABLE, 5},
    {SignalId::SEASONALITY_ALIGNMENT, "seasonality_alignment", SignalCategory::EXTERNAL,     2},
    {SignalId::VOL_REGIME,            "vol_regime",            SignalCategory::BACKTESTABLE, 3},
    {SignalId::INSIDER_CONVICTION,    "insider_conviction",    SignalCategory::EXTERNAL,     3},
    {SignalId::SPOT_GAMMA_PIN,        "spot_gamma_pin",        SignalCategory::PROXY,        3},
    {SignalId::FLOW_HORIZON,          "flow_horizon",          SignalCategory::PROXY,        2},
    {SignalId::VOLUME_DIRECTION,      "volume_direction",      SignalCategory::BACKTESTABLE, 3},
    {SignalId::EARNINGS_GAP_TRADE,    "earnings_gap_trade",    SignalCategory::EXTERNAL,     6},
}};

inline constexpr size_t index_of(SignalId id) { return static_cast<size_t>(id); }

inline std::string_view signal_name(SignalId id) {
    return SIGNAL_INFO[index_of(id)].name;
}

inline SignalCategory signal_category(SignalId id) {
    return SIGNAL_INFO[index_of(id)].category;
}

inline const char* category_name(SignalCategory c) {
    switch (c) {
        case SignalCategory::BACKTESTABLE: return "backtestable";
        case SignalCategory::PROXY:        return "proxy";
        case SignalCategory::EXTERNAL:     return "external";
    }
    return "unknown";
}

// Throws std::invalid_argument for a name outside the closed set.
inline SignalId signal_from_name(std::string_view name) {
    for (const auto& info : SIGNAL_INFO) {
        if (info.name == name) return info.id;
    }
    throw std::invalid_argument("unknown signal '" + std::string(name) + "'");
}

inline std::array<SignalId, SIGNAL_COUNT> all_signals() {
    std::array<SignalId, SIGNAL_COUNT> ids{};
    for (size_t i = 0; i < SIGNAL_COUNT; ++i) ids[i] = SIGNAL_INFO[i].id;
    return ids;
}

}  // namespace signals

// ---------------------------------------------------------------------------
// RawIndicators — unbounded indicator readings kept next to the signals
// ---------------------------------------------------------------------------
struct RawIndicators {
    indicators::Series rsi;
    indicators::Series macd_hist;
    indicators::Series atr;
    indicators::Series adx;
    indicators::Series bb_bandwidth;
    indicators::Series volume_ratio;
    indicators::Series price_change;
    indicators::Series close;
};

// ---------------------------------------------------------------------------
// SignalTable — one bounded series per SignalId, aligned to the bars
// ---------------------------------------------------------------------------
struct SignalTable {
    std::array<indicators::Series, SIGNAL_COUNT> columns;
    RawIndicators raw;
    std::vector<uint64_t> timestamps;

    size_t size() const { return timestamps.size(); }

    indicators::Series& operator[](SignalId id) { return columns[signals::index_of(id)]; }
    const indicators::Series& operator[](SignalId id) const {
        return columns[signals::index_of(id)];
    }
};
