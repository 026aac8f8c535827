#pragma once

#include "parse_utils.hpp"
#include "signals/signal_table.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// WeightMap — non-negative integer weight per SignalId
//
// Immutable once built; with_weight() returns a modified copy.
// ---------------------------------------------------------------------------
class WeightMap {
public:
    // All weights zero.
    WeightMap() { weights_.fill(0); }

    static WeightMap defaults() {
        WeightMap m;
        for (const auto& info : signals::SIGNAL_INFO) {
            m.weights_[signals::index_of(info.id)] = info.default_weight;
        }
        return m;
    }

    // Signals not named are zero. Unknown names and negative weights throw.
    static WeightMap from_pairs(const std::vector<std::pair<std::string, int>>& pairs) {
        WeightMap m;
        for (const auto& [name, w] : pairs) {
            m = m.with_weight(signals::signal_from_name(name), w);
        }
        return m;
    }

    WeightMap with_weight(SignalId id, int weight) const {
        if (weight < 0) {
            throw std::invalid_argument("negative weight for '" +
                                        std::string(signals::signal_name(id)) + "'");
        }
        WeightMap copy = *this;
        copy.weights_[signals::index_of(id)] = weight;
        return copy;
    }

    int operator[](SignalId id) const { return weights_[signals::index_of(id)]; }

    int total() const {
        int sum = 0;
        for (int w : weights_) sum += w;
        return sum;
    }

    // Signals with a non-zero weight, in enumeration order.
    std::vector<SignalId> weighted_signals() const {
        std::vector<SignalId> out;
        for (size_t i = 0; i < SIGNAL_COUNT; ++i) {
            if (weights_[i] > 0) out.push_back(signals::SIGNAL_INFO[i].id);
        }
        return out;
    }

    bool operator==(const WeightMap& other) const { return weights_ == other.weights_; }

private:
    std::array<int, SIGNAL_COUNT> weights_{};
};

// ---------------------------------------------------------------------------
// ScoringConfig — threshold and confidence blend
//
// The 0.6 / 0.4 blend and the 0.01 activity floor are empirical defaults
// and are expected to be recalibrated.
// ---------------------------------------------------------------------------
struct ScoringConfig {
    double threshold = 65.0;        // minimum confidence for a prediction
    double strength_blend = 0.6;    // weight of raw signal strength
    double direction_blend = 0.4;   // weight of directional one-sidedness
    double active_epsilon = 0.01;   // |value| above this counts as fired
};

// ---------------------------------------------------------------------------
// Weight file: one `name = weight` per line, '#' starts a comment. Names not
// listed get weight 0. The key `threshold` sets the minimum confidence.
// ---------------------------------------------------------------------------
namespace weight_io {

struct WeightFile {
    WeightMap weights;
    std::optional<double> threshold;
};

inline WeightFile parse(std::istream& in) {
    WeightFile out;
    std::vector<std::pair<std::string, int>> pairs;
    std::string line;
    int line_no = 0;
    auto trim = [](std::string s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    };

    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        std::string where = "weights line " + std::to_string(line_no) + ": ";
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error(where + "expected name=weight");
        }
        std::string name = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (name == "threshold") {
            double t = 0.0;
            try {
                t = parse_utils::to_double(value);
            } catch (const std::exception&) {
                throw std::runtime_error(where + "bad threshold '" + value + "'");
            }
            if (t < 0.0 || t > 100.0) {
                throw std::runtime_error(where + "threshold must be within [0, 100]");
            }
            out.threshold = t;
            continue;
        }

        int w = 0;
        try {
            w = parse_utils::to_int(value);
        } catch (const std::exception&) {
            throw std::runtime_error(where + "bad weight '" + value + "'");
        }
        pairs.emplace_back(name, w);
    }
    out.weights = WeightMap::from_pairs(pairs);
    return out;
}

inline WeightMap parse_weights(std::istream& in) { return parse(in).weights; }

inline WeightFile load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open weights file: " + path);
    }
    return parse(f);
}

inline WeightMap load_weight_file(const std::string& path) { return load(path).weights; }

}  // namespace weight_io
