// ============================================================================
// command_registry.cpp — implementation for command_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file command_registry.cpp
 */

#include "kamlink/command_registry.hpp"
#include "kamlink/log.hpp"

#include <cstdio>    // std::snprintf for the fixed-width console line
#include <sstream>   // std::ostringstream for format_value
#include <iomanip>   // std::fixed, std::setprecision
#include <utility>   // std::move

namespace kamlink {

// ============================================================================
// Unit codes
// ---------------------------------------------------------------------------
// Index == unit code as sent in the reply. Holes in the meter's list ("" at 0
// and 51) are real entries meaning "dimensionless", not unknown.
// ============================================================================
static const char* const UNITS[] = {
    "",        "Wh",       "kWh",        "MWh",     "GWh",      "j",        "kj",     "Mj",
    "Gj",      "Cal",      "kCal",       "Mcal",    "Gcal",     "varh",     "kvarh",  "Mvarh",
    "Gvarh",   "VAh",      "kVAh",       "MVAh",    "GVAh",     "kW",       "kW",     "MW",
    "GW",      "kvar",     "kvar",       "Mvar",    "Gvar",     "VA",       "kVA",    "MVA",
    "GVA",     "V",        "A",          "kV",      "kA",       "C",        "K",      "l",
    "m3",      "l/h",      "m3/h",       "m3xC",    "ton",      "ton/h",    "h",      "hh:mm:ss",
    "yy:mm:dd","yyyy:mm:dd","mm:dd",     "",        "bar",      "RTC",      "ASCII",  "m3 x 10",
    "ton x 10","GJ x 10",  "minutes",    "Bitfield","s",        "ms",       "days",   "RTC-Q",
    "Datetime"
};
static constexpr std::size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);


// ============================================================================
// Multical 402 registers
// ---------------------------------------------------------------------------
// Current values first, then monthly (_M) and yearly (_Y) extremes, then the
// volume-weighted temperatures and counters.
// ============================================================================
static std::vector<CommandDescriptor> multical402_table() {
    return {
        {0x003C, "Heat Energy (E1)", "kWh"},
        {0x0050, "Power",            "kW"},
        {0x0056, "Temp1",            "C"},
        {0x0057, "Temp2",            "C"},
        {0x0059, "Tempdiff",         "K"},
        {0x004A, "Flow",             "l/h"},
        {0x0044, "Volume",           "m3"},

        {0x008D, "MinFlow_M",        "l/h"},
        {0x008B, "MaxFlow_M",        "l/h"},
        {0x008C, "MinFlowDate_M",    "yy:mm:dd"},
        {0x008A, "MaxFlowDate_M",    "yy:mm:dd"},
        {0x0091, "MinPower_M",       "kW"},
        {0x008F, "MaxPower_M",       "kW"},
        {0x0095, "AvgTemp1_M",       "C"},
        {0x0096, "AvgTemp2_M",       "C"},
        {0x0090, "MinPowerDate_M",   "yy:mm:dd"},
        {0x008E, "MaxPowerDate_M",   "yy:mm:dd"},

        {0x007E, "MinFlow_Y",        "l/h"},
        {0x007C, "MaxFlow_Y",        "l/h"},
        {0x007D, "MinFlowDate_Y",    "yy:mm:dd"},
        {0x007B, "MaxFlowDate_Y",    "yy:mm:dd"},
        {0x0082, "MinPower_Y",       "kW"},
        {0x0080, "MaxPower_Y",       "kW"},
        {0x0092, "AvgTemp1_Y",       "C"},
        {0x0093, "AvgTemp2_Y",       "C"},
        {0x0081, "MinPowerDate_Y",   "yy:mm:dd"},
        {0x007F, "MaxPowerDate_Y",   "yy:mm:dd"},

        {0x0061, "Temp1xm3",         "m3xC"},
        {0x006E, "Temp2xm3",         "m3xC"},
        {0x0071, "Infoevent",        ""},
        {0x03EC, "HourCounter",      "h"},
    };
}


// ============================================================================
// CommandRegistry
// ============================================================================

CommandRegistry::CommandRegistry(std::vector<CommandDescriptor> table) {
    table_.reserve(table.size());
    for (auto& d : table) {
        bool dup = false;
        for (const auto& seen : table_) {
            if (seen.id == d.id) { dup = true; break; }
        }
        if (dup) {
            ok_ = false;
            log_warn("reason=duplicate_command id=" + std::to_string(d.id));
            continue;
        }
        table_.push_back(std::move(d));
    }
}

const CommandRegistry& CommandRegistry::multical402() {
    static const CommandRegistry reg(multical402_table());   // built once, never mutated
    return reg;
}

bool CommandRegistry::lookup(int id, CommandDescriptor& out, Error& err) const {
    for (const auto& d : table_) {
        if (d.id == id) {
            out = d;
            return true;
        }
    }
    err = Error::UnknownCommand;
    return false;
}

bool CommandRegistry::contains(int id) const {
    for (const auto& d : table_) {
        if (d.id == id) return true;
    }
    return false;
}

std::vector<int> CommandRegistry::ids() const {
    std::vector<int> out;
    out.reserve(table_.size());
    for (const auto& d : table_) out.push_back(d.id);
    return out;
}


// ============================================================================
// Units / conversion / formatting
// ============================================================================

bool unit_for(uint8_t code, std::string& label, Error& err) {
    if (code >= UNIT_COUNT) {
        label.clear();
        err = Error::UnknownUnit;
        return false;
    }
    label = UNITS[code];
    return true;
}

Reading to_reading(const kmp::RawField& f) {
    Reading r;
    r.command_id       = f.command_id;
    r.raw_magnitude    = f.raw_magnitude;
    r.decimal_exponent = f.decimal_exponent;
    r.unit_code        = f.unit_code;

    Error err = Error::None;
    if (!unit_for(f.unit_code, r.unit, err)) {
        log_warn(std::string("reason=") + error_reason(err)
                 + " code=" + std::to_string(f.unit_code)
                 + " command=" + std::to_string(f.command_id));
    }
    return r;
}

std::string format_value(double value, int decimal_exponent) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(decimal_exponent < 0 ? -decimal_exponent : 0) << value;
    return os.str();
}

std::string format_reading(const Reading& r, const CommandRegistry& reg) {
    CommandDescriptor d;
    Error err = Error::None;
    if (!reg.lookup(r.command_id, d, err)) d.name.clear();

    char head[64];
    std::snprintf(head, sizeof(head), "CommandNr %4d: %-25s ", r.command_id, d.name.c_str());

    std::string line(head);
    line += format_value(r.value(), r.decimal_exponent);
    if (!r.unit.empty()) {
        line += ' ';
        line += r.unit;
    }
    return line;
}

} // namespace kamlink
