#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "bactopo/core/bacnet_codec.hpp"
#include "bactopo/core/error.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::bacnet;
using bactopo::core::test::ip;

TEST(BacnetCodec, WhoIsWireBytes) {
  auto frame = encode_who_is(0u, 99u);
  const std::vector<std::uint8_t> expected {
      0x81, 0x0B, 0x00, 0x10,              // BVLC Original-Broadcast-NPDU, length 16
      0x01, 0x20, 0xFF, 0xFF, 0x00, 0xFF,  // NPDU to DNET 0xFFFF, hop count 255
      0x10, 0x08,                          // Who-Is
      0x09, 0x00, 0x19, 0x63};             // [0] 0, [1] 99
  EXPECT_EQ(frame, expected);
}

TEST(BacnetCodec, WhoIsLocalWithoutRange) {
  auto frame = encode_who_is(std::nullopt, std::nullopt, false);
  const std::vector<std::uint8_t> expected {0x81, 0x0B, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08};
  EXPECT_EQ(frame, expected);
  auto msg = decode_frame(frame, ip("10.0.0.1"));
  const auto* who = std::get_if<WhoIs>(&msg);
  ASSERT_NE(who, nullptr);
  EXPECT_FALSE(who->low.has_value());
}

TEST(BacnetCodec, WhoIsRejectsBadRanges) {
  EXPECT_THROW((void)encode_who_is(5u, std::nullopt), ValueError);
  EXPECT_THROW((void)encode_who_is(10u, 5u), ValueError);
  EXPECT_THROW((void)encode_who_is(0u, kMaxInstance + 1), ValueError);
}

TEST(BacnetCodec, WhoIsDecodesWideLimits) {
  auto msg = decode_frame(encode_who_is(70000u, kMaxInstance), ip("10.0.0.1"));
  const auto* who = std::get_if<WhoIs>(&msg);
  ASSERT_NE(who, nullptr);
  EXPECT_EQ(who->low, 70000u);
  EXPECT_EQ(who->high, kMaxInstance);
}

TEST(BacnetCodec, LocalIAm) {
  auto frame = encode_i_am(1234, 42, 480, 0);
  auto msg = decode_frame(frame, ip("192.168.1.20"));
  const auto* iam = std::get_if<IAm>(&msg);
  ASSERT_NE(iam, nullptr);
  EXPECT_EQ(iam->device_instance, 1234u);
  EXPECT_EQ(iam->vendor_id, 42);
  EXPECT_EQ(iam->max_apdu, 480u);
  EXPECT_EQ(iam->segmentation, 0);
  EXPECT_TRUE(iam->source.is_local());
  EXPECT_EQ(iam->source.to_string(), "192.168.1.20");
}

TEST(BacnetCodec, RoutedIAmCarriesSourceNetwork) {
  const std::vector<std::uint8_t> mac {0x0a};
  auto frame = encode_i_am(2001, 8, 1476, 3, 2001, mac);
  auto msg = decode_frame(frame, ip("192.168.1.1"));
  const auto* iam = std::get_if<IAm>(&msg);
  ASSERT_NE(iam, nullptr);
  EXPECT_EQ(iam->source.net, 2001);
  EXPECT_EQ(iam->source.mac, mac);
}

TEST(BacnetCodec, ForwardedIAmUsesOriginatingAddress) {
  auto frame = encode_forwarded(encode_i_am(77, 1), ip("10.1.1.9"));
  auto msg = decode_frame(frame, ip("192.168.1.50"));
  const auto* iam = std::get_if<IAm>(&msg);
  ASSERT_NE(iam, nullptr);
  EXPECT_EQ(iam->source.to_string(), "10.1.1.9");
}

TEST(BacnetCodec, RouterMessages) {
  auto query = decode_frame(encode_who_is_router_to_network(std::uint16_t{5}), ip("10.0.0.1"));
  const auto* who = std::get_if<WhoIsRouterToNetwork>(&query);
  ASSERT_NE(who, nullptr);
  EXPECT_EQ(who->network, 5);

  const std::vector<std::uint16_t> nets {5, 6, 700};
  auto reply = decode_frame(encode_i_am_router_to_network(nets), ip("10.0.0.2"));
  const auto* iam = std::get_if<IAmRouterToNetwork>(&reply);
  ASSERT_NE(iam, nullptr);
  EXPECT_EQ(iam->networks, nets);
  EXPECT_EQ(iam->source.to_string(), "10.0.0.2");
}

TEST(BacnetCodec, ReadBdtAckEntries) {
  std::vector<BdtEntry> entries {BdtEntry{ip("10.0.0.5")}, BdtEntry{ip("10.0.1.5:47809"), {255, 255, 255, 0}}};
  auto frame = encode_read_bdt_ack(entries);
  EXPECT_EQ(frame.size(), 4u + 20u);
  auto msg = decode_frame(frame, ip("10.0.0.5"));
  const auto* ack = std::get_if<ReadBdtAck>(&msg);
  ASSERT_NE(ack, nullptr);
  ASSERT_EQ(ack->entries.size(), 2u);
  EXPECT_EQ(ack->entries[1].address.port, 47809);
  EXPECT_EQ(ack->entries[1].mask[3], 0);
}

TEST(BacnetCodec, BvlcResultAndReadBdt) {
  auto nak = decode_frame(encode_bvlc_result(kResultReadBdtNak), ip("10.0.0.7"));
  ASSERT_TRUE(std::holds_alternative<BvlcResult>(nak));
  EXPECT_EQ(std::get<BvlcResult>(nak).code, kResultReadBdtNak);
  auto req = decode_frame(encode_read_bdt(), ip("10.0.0.7"));
  EXPECT_TRUE(std::holds_alternative<ReadBdt>(req));
}

TEST(BacnetCodec, UnknownFunctionIsIgnored) {
  const std::vector<std::uint8_t> fdt {0x81, 0x06, 0x00, 0x04};
  auto msg = decode_frame(fdt, ip("10.0.0.7"));
  ASSERT_TRUE(std::holds_alternative<Ignored>(msg));
  EXPECT_EQ(std::get<Ignored>(msg).bvlc_function, 0x06);
}

TEST(BacnetCodec, MalformedFramesThrow) {
  const auto from = ip("10.0.0.7");
  EXPECT_THROW((void)decode_frame(std::vector<std::uint8_t>{0x81, 0x0B}, from), DecodeError);
  EXPECT_THROW((void)decode_frame(std::vector<std::uint8_t>{0x82, 0x0B, 0x00, 0x04}, from), DecodeError);
  // Length field larger than the datagram.
  EXPECT_THROW((void)decode_frame(std::vector<std::uint8_t>{0x81, 0x0B, 0x00, 0x20, 0x01, 0x00}, from),
               DecodeError);
  // I-Am truncated after the object identifier.
  auto iam = encode_i_am(1, 1);
  iam.resize(13);
  iam[3] = 13;
  EXPECT_THROW((void)decode_frame(iam, from), DecodeError);
  // Read-BDT-Ack with a partial entry.
  EXPECT_THROW((void)decode_frame(std::vector<std::uint8_t>{0x81, 0x03, 0x00, 0x07, 10, 0, 0}, from),
               DecodeError);
}

TEST(BacnetCodec, NonDeviceIAmIsRejected) {
  auto frame = encode_i_am(5, 1);
  // Object identifier follows its tag at byte 8; rewrite the type to analog-input.
  frame[9] = 0x00;
  EXPECT_THROW((void)decode_frame(frame, ip("10.0.0.7")), DecodeError);
}
