#include "bactopo/core/scan_config.hpp"

#include <array>
#include <fstream>
#include <limits>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

namespace {

using nlohmann::json;

constexpr std::array<std::string_view, 7> kLogLevels {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

std::int64_t read_int(const json& j, const char* key, std::int64_t lo, std::int64_t hi) {
  const auto& v = j.at(key);
  if (!v.is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
  auto n = v.get<std::int64_t>();
  if (n < lo || n > hi) {
    throw ConfigError(std::string(key) + " out of range [" + std::to_string(lo) + ", " +
                      std::to_string(hi) + "]: " + std::to_string(n));
  }
  return n;
}

std::string read_string(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_string()) throw ConfigError(std::string(key) + " must be a string");
  return v.get<std::string>();
}

std::vector<std::string> read_string_list(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_array()) throw ConfigError(std::string(key) + " must be a list of strings");
  std::vector<std::string> out;
  for (const auto& item : v) {
    if (!item.is_string()) throw ConfigError(std::string(key) + " must be a list of strings");
    out.push_back(item.get<std::string>());
  }
  return out;
}

template <class Fn>
auto as_config_error(const std::string& key, Fn&& fn) {
  try {
    return fn();
  } catch (const ConfigError&) {
    throw;
  } catch (const ValueError& e) {
    throw ConfigError(key + ": " + e.what());
  }
}

} // namespace

void ScanConfig::validate() const {
  if (high_limit > kMaxInstance) throw ConfigError("high_limit exceeds " + std::to_string(kMaxInstance));
  if (low_limit > high_limit) throw ConfigError("low_limit is greater than high_limit");
  if (batch_broadcast_size == 0) throw ConfigError("batch_broadcast_size must be positive");
  if (full_step_size == 0) throw ConfigError("full_step_size must be positive");
  if (response_timeout.count() <= 0) throw ConfigError("response_timeout_ms must be positive");
  if (scan_interval_secs <= 0) throw ConfigError("scan_interval_secs must be positive");
  if (device_instance > kMaxDeviceInstance) throw ConfigError("device_instance out of range");
  if (probe_fanout == 0) throw ConfigError("probe_fanout must be positive");
  if (graph_store_limit == 0) throw ConfigError("graph_store_limit must be positive");
  bool level_ok = false;
  for (auto l : kLogLevels) level_ok = level_ok || l == log_level;
  if (!level_ok) throw ConfigError("unknown log_level '" + log_level + "'");
  (void)agent();
  (void)broadcast();
}

AgentAddress ScanConfig::agent() const {
  return as_config_error("agent_address", [this] { return parse_agent_address(agent_address); });
}

IpEndpoint ScanConfig::broadcast() const {
  auto a = agent();
  if (broadcast_address.empty()) return a.subnet.broadcast(a.endpoint.port);
  return as_config_error("broadcast_address", [this] { return parse_ip_endpoint(broadcast_address); });
}

ScanConfig scan_config_from_json(const json& j) {
  if (!j.is_object()) throw ConfigError("configuration must be a JSON object");
  ScanConfig c;
  if (j.contains("low_limit")) c.low_limit = static_cast<std::uint32_t>(read_int(j, "low_limit", 0, kMaxInstance));
  if (j.contains("high_limit")) c.high_limit = static_cast<std::uint32_t>(read_int(j, "high_limit", 0, kMaxInstance));
  if (j.contains("batch_broadcast_size")) {
    c.batch_broadcast_size = static_cast<std::uint32_t>(read_int(j, "batch_broadcast_size", 1, kMaxInstance + 1));
  }
  if (j.contains("full_step_size")) {
    c.full_step_size = static_cast<std::uint32_t>(read_int(j, "full_step_size", 1, kMaxInstance + 1));
  }
  if (j.contains("response_timeout_ms")) {
    c.response_timeout = std::chrono::milliseconds(read_int(j, "response_timeout_ms", 1, 3'600'000));
  }
  if (j.contains("scan_interval_secs")) {
    c.scan_interval_secs = read_int(j, "scan_interval_secs", 1, std::numeric_limits<std::int32_t>::max());
  }
  if (j.contains("agent_address")) c.agent_address = read_string(j, "agent_address");
  if (j.contains("broadcast_address")) c.broadcast_address = read_string(j, "broadcast_address");
  if (j.contains("device_instance")) {
    c.device_instance = static_cast<std::uint32_t>(read_int(j, "device_instance", 0, kMaxDeviceInstance));
  }
  if (j.contains("device_name")) c.device_name = read_string(j, "device_name");
  if (j.contains("vendor_id")) c.vendor_id = static_cast<std::uint16_t>(read_int(j, "vendor_id", 0, 0xFFFF));
  if (j.contains("bbmds")) {
    for (const auto& s : read_string_list(j, "bbmds")) {
      c.bbmds.push_back(as_config_error("bbmds", [&s] { return parse_ip_endpoint(s); }));
    }
  }
  if (j.contains("subnets")) {
    for (const auto& s : read_string_list(j, "subnets")) {
      c.subnets.push_back(as_config_error("subnets", [&s] { return parse_subnet(s); }));
    }
  }
  if (j.contains("probe_fanout")) c.probe_fanout = static_cast<std::size_t>(read_int(j, "probe_fanout", 1, 1024));
  if (j.contains("probe_all_devices_for_bdt")) {
    const auto& v = j.at("probe_all_devices_for_bdt");
    if (!v.is_boolean()) throw ConfigError("probe_all_devices_for_bdt must be a boolean");
    c.probe_all_devices_for_bdt = v.get<bool>();
  }
  if (j.contains("graph_store_limit")) {
    c.graph_store_limit = static_cast<std::size_t>(read_int(j, "graph_store_limit", 1, 100000));
  }
  if (j.contains("log_level")) c.log_level = read_string(j, "log_level");
  c.validate();
  return c;
}

ScanConfig parse_scan_config(std::string_view text) {
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("invalid configuration JSON: ") + e.what());
  }
  return scan_config_from_json(j);
}

ScanConfig load_scan_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("configuration file " + path + " does not exist");
  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return scan_config_from_json(j);
}

json to_json(const ScanConfig& c) {
  json j;
  j["low_limit"] = c.low_limit;
  j["high_limit"] = c.high_limit;
  j["batch_broadcast_size"] = c.batch_broadcast_size;
  j["full_step_size"] = c.full_step_size;
  j["response_timeout_ms"] = c.response_timeout.count();
  j["scan_interval_secs"] = c.scan_interval_secs;
  j["agent_address"] = c.agent_address;
  j["broadcast_address"] = c.broadcast_address;
  j["device_instance"] = c.device_instance;
  j["device_name"] = c.device_name;
  j["vendor_id"] = c.vendor_id;
  j["bbmds"] = json::array();
  for (const auto& b : c.bbmds) j["bbmds"].push_back(b.to_string());
  j["subnets"] = json::array();
  for (const auto& s : c.subnets) j["subnets"].push_back(s.to_string());
  j["probe_fanout"] = c.probe_fanout;
  j["probe_all_devices_for_bdt"] = c.probe_all_devices_for_bdt;
  j["graph_store_limit"] = c.graph_store_limit;
  j["log_level"] = c.log_level;
  return j;
}

} // namespace bactopo::core
