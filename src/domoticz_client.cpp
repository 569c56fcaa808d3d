// ============================================================================
// domoticz_client.cpp — implementation for domoticz_client.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file domoticz_client.cpp
 */

#include "kamlink/domoticz_client.hpp"
#include "kamlink/log.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>    // std::snprintf
#include <cstdlib>   // std::strtod
#include <mutex>     // std::call_once
#include <utility>

using nlohmann::json;

namespace kamlink {
namespace domoticz {

std::string base_url(const std::string& host, int port) {
    return "http://" + host + ":" + std::to_string(port);
}

std::string device_path(int device_id) {
    return "/json.htm?type=devices&rid=" + std::to_string(device_id);
}

std::string update_path(int device_id, double value) {
    return "/json.htm?type=command&param=udevice&idx=" + std::to_string(device_id) +
           "&svalue=" + format_svalue(value);
}

std::string list_path() {
    return "/json.htm?type=devices";
}

std::string format_svalue(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string s(buf);
    if (s == "-0.00") s = "0.00";
    return s;
}

bool parse_data_number(const std::string& data, double& out) {
    std::size_t i = 0;
    while (i < data.size() && std::isspace(static_cast<unsigned char>(data[i]))) ++i;
    std::size_t j = i;
    while (j < data.size() && !std::isspace(static_cast<unsigned char>(data[j]))) ++j;
    if (i == j) return false;

    const std::string token = data.substr(i, j - i);
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (errno != 0 || end == token.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

// ---------------------------------------------------------------------------
// Body helpers
// ---------------------------------------------------------------------------

static bool parse_body(const std::string& body, json& j, Error& err) {
    j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        err = Error::TransportFailure;
        return false;
    }
    return true;
}

// idx comes as "89" from Domoticz; accept 89 as well. Must fit 0..INT_MAX.
static bool read_idx(const json& rec, int& out) {
    auto it = rec.find("idx");
    if (it == rec.end()) return false;
    if (it->is_number_unsigned()) {
        const std::uint64_t v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(INT_MAX)) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
        errno = 0;
        char* end = nullptr;
        long v = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || v > INT_MAX) return false;
        out = static_cast<int>(v);
        return true;
    }
    return false;
}

static bool read_record(const json& rec, DeviceInfo& out) {
    if (!rec.is_object()) return false;
    DeviceInfo d;
    if (!read_idx(rec, d.id)) return false;
    auto name = rec.find("Name");
    if (name != rec.end() && name->is_string()) d.name = name->get<std::string>();
    auto data = rec.find("Data");
    if (data != rec.end() && data->is_string()) d.data = data->get<std::string>();
    out = std::move(d);
    return true;
}

bool parse_device(const std::string& body, DeviceInfo& out, Error& err) {
    json j;
    if (!parse_body(body, j, err)) return false;

    auto res = j.find("result");
    if (res == j.end() || !res->is_array() || res->empty()) {
        err = Error::DeviceNotFound;
        return false;
    }
    if (!read_record((*res)[0], out)) {
        err = Error::TransportFailure;
        return false;
    }
    err = Error::None;
    return true;
}

bool parse_device_value(const std::string& body, double& out, Error& err) {
    DeviceInfo d;
    if (!parse_device(body, d, err)) return false;
    if (!parse_data_number(d.data, out)) {
        err = Error::ValueUnavailable;
        return false;
    }
    err = Error::None;
    return true;
}

bool parse_update_status(const std::string& body, Error& err) {
    json j;
    if (!parse_body(body, j, err)) return false;

    std::string status;
    auto st = j.find("status");
    if (st != j.end() && st->is_string()) status = st->get<std::string>();
    for (auto& c : status) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (status != "ok") {
        err = Error::SinkFailure;
        return false;
    }
    err = Error::None;
    return true;
}

bool parse_device_list(const std::string& body, std::vector<DeviceInfo>& out, Error& err) {
    json j;
    if (!parse_body(body, j, err)) return false;

    std::vector<DeviceInfo> list;
    auto res = j.find("result");
    if (res != j.end()) {
        if (!res->is_array()) {
            err = Error::TransportFailure;
            return false;
        }
        for (const auto& rec : *res) {
            DeviceInfo d;
            if (!read_record(rec, d)) {
                err = Error::TransportFailure;
                return false;
            }
            list.push_back(std::move(d));
        }
    }
    out = std::move(list);
    err = Error::None;
    return true;
}

} // namespace domoticz


// ============================================================================
// DomoticzClient
// ============================================================================

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

DomoticzClient::DomoticzClient(DomoticzConfig cfg)
    : cfg_(std::move(cfg)),
      base_(domoticz::base_url(cfg_.host, cfg_.port)) {}

bool DomoticzClient::http_get(const std::string& path, std::string& body, Error& err) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CURL* curl = curl_easy_init();
    if (!curl) {
        log_error("reason=transport_failure op=curl_easy_init");
        err = Error::TransportFailure;
        return false;
    }

    const std::string url = base_ + path;
    body.clear();
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, cfg_.connect_timeout_s > 0 ? cfg_.connect_timeout_s : 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, cfg_.transfer_timeout_s > 0 ? cfg_.transfer_timeout_s : 10L);

    log_debug("op=http_get url=" + url);
    const CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        log_error(std::string("reason=transport_failure url=") + url + " curl=\"" +
                  (errbuf[0] ? errbuf : curl_easy_strerror(res)) + "\"");
        err = Error::TransportFailure;
        return false;
    }
    return true;
}

bool DomoticzClient::get_device(int device_id, DeviceInfo& out, Error& err) {
    std::string body;
    if (!http_get(domoticz::device_path(device_id), body, err)) return false;
    if (!domoticz::parse_device(body, out, err)) {
        log_warn(std::string("reason=") + error_reason(err) + " device=" + std::to_string(device_id));
        return false;
    }
    return true;
}

bool DomoticzClient::get_value(int device_id, double& out, Error& err) {
    std::string body;
    if (!http_get(domoticz::device_path(device_id), body, err)) return false;
    if (!domoticz::parse_device_value(body, out, err)) {
        log_warn(std::string("reason=") + error_reason(err) + " device=" + std::to_string(device_id));
        return false;
    }
    log_debug("op=get_value device=" + std::to_string(device_id) + " value=" + std::to_string(out));
    return true;
}

bool DomoticzClient::set_value(int device_id, double value, Error& err) {
    std::string body;
    if (!http_get(domoticz::update_path(device_id, value), body, err)) return false;
    if (!domoticz::parse_update_status(body, err)) {
        log_error(std::string("reason=") + error_reason(err) + " device=" + std::to_string(device_id));
        return false;
    }
    log_info("op=set_value device=" + std::to_string(device_id) +
             " value=" + domoticz::format_svalue(value));
    return true;
}

bool DomoticzClient::list_devices(std::vector<DeviceInfo>& out, Error& err) {
    std::string body;
    if (!http_get(domoticz::list_path(), body, err)) return false;
    if (!domoticz::parse_device_list(body, out, err)) {
        log_error(std::string("reason=") + error_reason(err) + " op=list_devices");
        return false;
    }
    log_info("op=list_devices count=" + std::to_string(out.size()));
    return true;
}

} // namespace kamlink
