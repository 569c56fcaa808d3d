#pragma once
/**
 * @file value_store.hpp
 * @brief Abstract key-value view of the reporting backend (device id -> number).
 *
 * The processor and runner only need a few things from the home-automation
 * side: read a device's current number, write a new one, name a device for the
 * report, and list devices for diagnostics. Keeping that behind an interface lets tests use an in-memory map
 * and keeps HTTP out of the core entirely.
 */

#include "kamlink/error.hpp"

#include <string>
#include <vector>

namespace kamlink {

struct DeviceInfo {
    int         id = 0;
    std::string name;
    std::string data;   ///< backend's display string, e.g. "12.34 kWh"
};

class ValueStore {
public:
    virtual ~ValueStore() = default;

    /// Current numeric value of @p device_id. DeviceNotFound / ValueUnavailable / TransportFailure.
    virtual bool get_value(int device_id, double& out, Error& err) = 0;

    /// Persist @p value for @p device_id. SinkFailure / TransportFailure.
    virtual bool set_value(int device_id, double value, Error& err) = 0;

    /// Full record for one device; the name shows up in report lines. DeviceNotFound / TransportFailure.
    virtual bool get_device(int device_id, DeviceInfo& out, Error& err) = 0;

    virtual bool list_devices(std::vector<DeviceInfo>& out, Error& err) = 0;
};

} // namespace kamlink
