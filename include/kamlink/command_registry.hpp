#pragma once
/**
 * @page kl-command-registry KamLink Command Registry
 * @file command_registry.hpp
 * @brief Register numbers, names and unit codes of the Multical 402.
 *
 * @details
 * PURPOSE
 * -------
 * The meter answers in numbers: register 0x003C, unit code 2, exponent -2.
 * This layer is the dictionary that turns those into "Heat Energy (E1)" and
 * "kWh", and renders a reading as one stable line for the console and logs.
 *
 * WHAT LIVES HERE
 * ---------------
 * - CommandDescriptor: immutable {id, name, nominal unit} record per register.
 * - CommandRegistry: the fixed table, built once, never mutated. The Multical
 *   402 table is a function-local static, so every caller shares one instance
 *   and concurrent readers are safe.
 * - unit_for(): the meter's unit-code table (0..64).
 * - to_reading()/format_reading(): glue between raw wire fields and display.
 *
 * TABLE ORDER
 * -----------
 * all() preserves table order. The diagnostic dump (`--test-meter`) prints in
 * that order, so keep related registers grouped when adding new ones.
 *
 * MAINTENANCE
 * -----------
 * - Register numbers are part of the meter's firmware contract; never renumber.
 * - Ids must be unique; the constructor of a custom table rejects duplicates.
 * - Unit codes with two entries for the same label (21/22 "kW", 25/26 "kvar")
 *   are the meter's, not typos.
 */

#include "kamlink/error.hpp"
#include "kamlink/frame_codec.hpp"
#include "kamlink/reading.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace kamlink {

struct CommandDescriptor {
    int         id = 0;
    std::string name;
    std::string unit;   ///< nominal unit; the live unit comes from the reply's unit code
};

class CommandRegistry {
public:
    /**
     * @brief Build a registry from @p table.
     *
     * Duplicate ids are a programming error in the table; the first entry wins
     * and ok() reports false so tests can catch it.
     */
    explicit CommandRegistry(std::vector<CommandDescriptor> table);

    /// The 31 registers of the Kamstrup Multical 402.
    static const CommandRegistry& multical402();

    /**
     * @brief Find the descriptor for @p id.
     * @return false with err=UnknownCommand if the id is not in the table.
     */
    bool lookup(int id, CommandDescriptor& out, Error& err) const;

    bool contains(int id) const;

    const std::vector<CommandDescriptor>& all() const { return table_; }

    /// Every id in table order; what --test-meter queries.
    std::vector<int> ids() const;

    bool ok() const { return ok_; }

private:
    std::vector<CommandDescriptor> table_;
    bool ok_ = true;
};

/**
 * @brief Label for a meter unit code ("kWh", "m3/h", ...).
 * @return false with err=UnknownUnit for codes outside the table; @p label is cleared.
 */
bool unit_for(uint8_t code, std::string& label, Error& err);

/**
 * @brief Turn a decoded wire field into a Reading.
 *
 * Unknown unit codes are advisory: the reading is still produced with an empty
 * unit label, and a warning is logged.
 */
Reading to_reading(const kmp::RawField& f);

/**
 * @brief Render @p value with as many decimals as the exponent calls for.
 *
 *   (12.34, -2) -> "12.34"      (4711, 0) -> "4711"      (1.5, -3) -> "1.500"
 */
std::string format_value(double value, int decimal_exponent);

/**
 * @brief One console line: "CommandNr   60: Heat Energy (E1)          12.34 kWh".
 *
 * Registers missing from @p reg print with an empty name.
 */
std::string format_reading(const Reading& r, const CommandRegistry& reg);

} // namespace kamlink
