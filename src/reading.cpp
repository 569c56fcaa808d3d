// ============================================================================
// reading.cpp — implementation for reading.hpp
// ============================================================================

#include "kamlink/reading.hpp"

#include <cmath>   // std::pow

namespace kamlink {

// Divide for negative exponents: 1234 / 100 lands on the double nearest 12.34,
// 1234 * 0.01 does not.
double Reading::value() const {
    const double mag = static_cast<double>(raw_magnitude);
    if (decimal_exponent < 0) return mag / std::pow(10.0, -decimal_exponent);
    return mag * std::pow(10.0, decimal_exponent);
}

bool ReadingCatalog::add(const Reading& r) {
    if (contains(r.command_id)) return false;
    items_.push_back(r);
    return true;
}

const Reading* ReadingCatalog::find(int command_id) const {
    for (const auto& r : items_) {
        if (r.command_id == command_id) return &r;
    }
    return nullptr;
}

} // namespace kamlink
