#pragma once
/**
 * @page kl-reading KamLink Readings
 * @file reading.hpp
 * @brief Typed register values and the ordered catalog one polling session produces.
 *
 * @details
 * A Reading is one register as the meter reported it: an integer magnitude and
 * a decimal exponent, kept apart so nothing is rounded until someone asks for
 * value(). ReadingCatalog keeps them in the order the meter answered, keyed by
 * command id, and is handed read-only to the processing step.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kamlink {

struct Reading {
    int         command_id       = 0;
    int64_t     raw_magnitude    = 0;
    int         decimal_exponent = 0;
    uint8_t     unit_code        = 0;
    std::string unit;               ///< display label; empty when the unit code is unknown

    /// raw_magnitude * 10^decimal_exponent.
    double value() const;
};

/**
 * @brief Insertion-ordered command id -> Reading map.
 *
 * Small (tens of entries), so lookups are a linear scan and iteration order is
 * exactly the order of add().
 */
class ReadingCatalog {
public:
    /// Append @p r; returns false (catalog unchanged) if its id is already present.
    bool add(const Reading& r);

    /// Pointer into the catalog, or nullptr. Valid until the next add().
    const Reading* find(int command_id) const;

    bool contains(int command_id) const { return find(command_id) != nullptr; }

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    std::vector<Reading>::const_iterator begin() const { return items_.begin(); }
    std::vector<Reading>::const_iterator end()   const { return items_.end(); }

private:
    std::vector<Reading> items_;
};

} // namespace kamlink
