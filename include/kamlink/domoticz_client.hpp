#pragma once
/**
 * @page kl-domoticz KamLink Domoticz Client
 * @file domoticz_client.hpp
 * @brief ValueStore over the Domoticz JSON API (libcurl for HTTP, nlohmann/json for bodies).
 *
 * @details
 * ENDPOINTS
 * ---------
 *   read   GET /json.htm?type=devices&rid=<idx>
 *          -> {"status":"OK","result":[{"idx":"89","Name":"...","Data":"12.34 kWh"}]}
 *   write  GET /json.htm?type=command&param=udevice&idx=<idx>&svalue=<v>
 *          -> {"status":"OK", ...}
 *   list   GET /json.htm?type=devices
 *
 * The numeric value of a device is the first whitespace-separated token of its
 * Data field. Domoticz sends idx as a string; a bare number is accepted too.
 *
 * SPLIT
 * -----
 * Everything that touches a body or a URL lives in namespace kamlink::domoticz as
 * free functions, so tests can feed canned JSON without a server. DomoticzClient
 * only adds the HTTP round trip and the error mapping:
 *
 *   curl failure, non-2xx, unparsable JSON   -> TransportFailure
 *   empty/missing result for rid=<idx>       -> DeviceNotFound
 *   Data without a leading number            -> ValueUnavailable
 *   write answered with status != OK         -> SinkFailure
 *
 * Values are written with two decimals, matching what the dashboard displays.
 */

#include "kamlink/error.hpp"
#include "kamlink/value_store.hpp"

#include <string>
#include <vector>

namespace kamlink {

struct DomoticzConfig {
    std::string host = "localhost";
    int         port = 8080;
    long        connect_timeout_s  = 5;
    long        transfer_timeout_s = 10;
};

namespace domoticz {

std::string base_url(const std::string& host, int port);
std::string device_path(int device_id);
std::string update_path(int device_id, double value);
std::string list_path();

/// Value as written to svalue: fixed, two decimals ("3.50").
std::string format_svalue(double value);

/// First token of a Data string ("12.34 kWh" -> 12.34). False if none.
bool parse_data_number(const std::string& data, double& out);

bool parse_device(const std::string& body, DeviceInfo& out, Error& err);
bool parse_device_value(const std::string& body, double& out, Error& err);
bool parse_update_status(const std::string& body, Error& err);
bool parse_device_list(const std::string& body, std::vector<DeviceInfo>& out, Error& err);

} // namespace domoticz

class DomoticzClient : public ValueStore {
public:
    explicit DomoticzClient(DomoticzConfig cfg = DomoticzConfig());

    bool get_value(int device_id, double& out, Error& err) override;
    bool set_value(int device_id, double value, Error& err) override;
    bool get_device(int device_id, DeviceInfo& out, Error& err) override;
    bool list_devices(std::vector<DeviceInfo>& out, Error& err) override;

    const std::string& base() const { return base_; }

private:
    bool http_get(const std::string& path, std::string& body, Error& err);

    DomoticzConfig cfg_;
    std::string    base_;
};

} // namespace kamlink
