#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Whole-string numeric parsing. The entire string must be consumed;
// "0.7abc" or "10x" throw std::invalid_argument, and values that do not fit
// throw std::out_of_range.
// ---------------------------------------------------------------------------
namespace parse_utils {

inline double to_double(const std::string& s) {
    size_t used = 0;
    double v = std::stod(s, &used);
    if (used != s.size()) {
        throw std::invalid_argument("trailing characters in number '" + s + "'");
    }
    return v;
}

inline int to_int(const std::string& s) {
    size_t used = 0;
    int v = std::stoi(s, &used);
    if (used != s.size()) {
        throw std::invalid_argument("trailing characters in integer '" + s + "'");
    }
    return v;
}

}  // namespace parse_utils
