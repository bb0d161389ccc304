#include <gtest/gtest.h>
#include <fstream>
#include "bactopo/core/error.hpp"
#include "bactopo/core/log.hpp"
#include "bactopo/core/scan_config.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::test;

TEST(ScanConfig, Defaults) {
  ScanConfig c;
  EXPECT_NO_THROW(c.validate());
  EXPECT_EQ(c.low_limit, 0u);
  EXPECT_EQ(c.high_limit, kMaxInstance);
  EXPECT_EQ(c.batch_broadcast_size, 10000u);
  EXPECT_EQ(c.full_step_size, 100u);
  EXPECT_EQ(c.response_timeout.count(), 3000);
  EXPECT_EQ(c.scan_interval_secs, 86400);
  EXPECT_EQ(c.agent().endpoint.to_string(), "192.168.1.12");
  EXPECT_EQ(c.broadcast().to_string(), "192.168.1.255");
}

TEST(ScanConfig, EmptyDocumentKeepsDefaults) {
  auto c = parse_scan_config("{}");
  EXPECT_EQ(c.batch_broadcast_size, 10000u);
  EXPECT_EQ(c.log_level, "info");
}

TEST(ScanConfig, ParsesAllKeys) {
  auto c = parse_scan_config(R"({
    "low_limit": 10, "high_limit": 5000, "batch_broadcast_size": 250,
    "full_step_size": 20,
    "response_timeout_ms": 1500, "scan_interval_secs": 3600,
    "agent_address": "10.0.5.2/16:47809", "broadcast_address": "10.0.255.255:47809",
    "device_instance": 77, "device_name": "probe", "vendor_id": 12,
    "bbmds": ["10.1.0.1", "10.2.0.1:47810"], "subnets": ["10.1.0.0/24"],
    "probe_fanout": 4, "probe_all_devices_for_bdt": false,
    "graph_store_limit": 5, "log_level": "debug", "unknown_key": [1, 2]
  })");
  EXPECT_EQ(c.low_limit, 10u);
  EXPECT_EQ(c.high_limit, 5000u);
  EXPECT_EQ(c.batch_broadcast_size, 250u);
  EXPECT_EQ(c.full_step_size, 20u);
  EXPECT_EQ(c.response_timeout.count(), 1500);
  EXPECT_EQ(c.agent().subnet.to_string(), "10.0.0.0/16");
  EXPECT_EQ(c.broadcast().to_string(), "10.0.255.255:47809");
  EXPECT_EQ(c.device_instance, 77u);
  ASSERT_EQ(c.bbmds.size(), 2u);
  EXPECT_EQ(c.bbmds[1].port, 47810);
  ASSERT_EQ(c.subnets.size(), 1u);
  EXPECT_EQ(c.probe_fanout, 4u);
  EXPECT_FALSE(c.probe_all_devices_for_bdt);
  EXPECT_EQ(c.graph_store_limit, 5u);
}

TEST(ScanConfig, WrongTypesAreRejected) {
  EXPECT_THROW((void)parse_scan_config(R"({"low_limit": "0"})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"agent_address": 12})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"bbmds": "10.0.0.1"})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"bbmds": [1]})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"probe_all_devices_for_bdt": 1})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"response_timeout_ms": 2.5})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config("[]"), ConfigError);
  EXPECT_THROW((void)parse_scan_config("{"), ConfigError);
}

TEST(ScanConfig, InvalidValuesAreRejected) {
  EXPECT_THROW((void)parse_scan_config(R"({"high_limit": 4194304})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"low_limit": 10, "high_limit": 5})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"batch_broadcast_size": 0})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"full_step_size": 0})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"agent_address": "10.0.0/24"})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"bbmds": ["10.0.0.300"]})"), ConfigError);
  EXPECT_THROW((void)parse_scan_config(R"({"log_level": "loud"})"), ConfigError);
}

TEST(ScanConfig, JsonRoundTrip) {
  ScanConfig c;
  c.bbmds = {ip("10.1.0.1")};
  c.subnets = {parse_subnet("10.1.0.0/24")};
  c.probe_fanout = 3;
  auto back = scan_config_from_json(to_json(c));
  EXPECT_EQ(back.bbmds, c.bbmds);
  EXPECT_EQ(back.subnets, c.subnets);
  EXPECT_EQ(back.probe_fanout, 3u);
  EXPECT_EQ(to_json(back), to_json(c));
}

TEST(ScanConfig, LoadFromFile) {
  TempDir dir("config");
  const auto path = (dir.path() / "config.json").string();
  std::ofstream(path) << R"({"batch_broadcast_size": 500})";
  auto c = load_scan_config(path);
  EXPECT_EQ(c.batch_broadcast_size, 500u);
  EXPECT_THROW((void)load_scan_config((dir.path() / "absent.json").string()), ConfigError);
}

TEST(Logging, LevelNames) {
  EXPECT_NO_THROW(set_log_level("debug"));
  EXPECT_NO_THROW(set_log_level("off"));
  EXPECT_THROW(set_log_level("verbose"), ConfigError);
  set_log_level("warn");
  EXPECT_EQ(logger()->level(), spdlog::level::warn);
}
