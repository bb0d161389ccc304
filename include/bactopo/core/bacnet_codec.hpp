/* BACnet/IP wire codec: the BVLL, NPDU and APDU subset discovery needs. */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "bactopo/core/address.hpp"

namespace bactopo::core::bacnet {

// BVLC function codes (ASHRAE 135 Annex J).
enum class BvlcFunction : std::uint8_t {
  Result = 0x00,
  WriteBdt = 0x01,
  ReadBdt = 0x02,
  ReadBdtAck = 0x03,
  ForwardedNpdu = 0x04,
  RegisterForeignDevice = 0x05,
  ReadFdt = 0x06,
  ReadFdtAck = 0x07,
  DistributeBroadcastToNetwork = 0x09,
  OriginalUnicastNpdu = 0x0A,
  OriginalBroadcastNpdu = 0x0B
};

inline constexpr std::uint8_t kBvlcType = 0x81;
inline constexpr std::uint16_t kGlobalNetwork = 0xFFFF;
inline constexpr std::uint16_t kObjectTypeDevice = 8;

// BVLC-Result codes answering Read-BDT.
inline constexpr std::uint16_t kResultSuccess = 0x0000;
inline constexpr std::uint16_t kResultReadBdtNak = 0x0020;

struct IAm {
  std::uint32_t device_instance {0};
  std::uint32_t max_apdu {0};
  std::uint8_t segmentation {3};
  std::uint16_t vendor_id {0};
  BacnetAddress source {};
};

struct IAmRouterToNetwork {
  std::vector<std::uint16_t> networks;
  IpEndpoint source {};
};

struct WhoIsRouterToNetwork {
  std::optional<std::uint16_t> network;
  IpEndpoint source {};
};

struct WhoIs {
  std::optional<std::uint32_t> low;
  std::optional<std::uint32_t> high;
  IpEndpoint source {};
};

struct BdtEntry {
  IpEndpoint address {};
  std::array<std::uint8_t, 4> mask { 0xFF, 0xFF, 0xFF, 0xFF };
};

struct ReadBdtAck {
  std::vector<BdtEntry> entries;
  IpEndpoint source {};
};

struct ReadBdt {
  IpEndpoint source {};
};

struct BvlcResult {
  std::uint16_t code {0};
  IpEndpoint source {};
};

// Well-formed frame that discovery has no use for.
struct Ignored {
  std::uint8_t bvlc_function {0};
};

using Message = std::variant<IAm, IAmRouterToNetwork, ReadBdtAck, BvlcResult,
                             WhoIs, WhoIsRouterToNetwork, ReadBdt, Ignored>;

// Requests sent by the scanner.
// global: address Who-Is to DNET 0xFFFF so routers forward it to every network.
[[nodiscard]] std::vector<std::uint8_t> encode_who_is(std::optional<std::uint32_t> low,
                                                      std::optional<std::uint32_t> high,
                                                      bool global = true);
[[nodiscard]] std::vector<std::uint8_t> encode_who_is_router_to_network(std::optional<std::uint16_t> network);
[[nodiscard]] std::vector<std::uint8_t> encode_read_bdt();

// Responses, used by simulators and tests to play the field-device side.
// A non-zero source_net adds an NPDU source specifier (device behind a router).
[[nodiscard]] std::vector<std::uint8_t> encode_i_am(std::uint32_t device_instance,
                                                    std::uint16_t vendor_id,
                                                    std::uint32_t max_apdu = 1476,
                                                    std::uint8_t segmentation = 3,
                                                    std::uint16_t source_net = 0,
                                                    std::span<const std::uint8_t> source_mac = {});
[[nodiscard]] std::vector<std::uint8_t> encode_i_am_router_to_network(std::span<const std::uint16_t> networks);
[[nodiscard]] std::vector<std::uint8_t> encode_read_bdt_ack(std::span<const BdtEntry> entries);
[[nodiscard]] std::vector<std::uint8_t> encode_bvlc_result(std::uint16_t code);
// Wraps an NPDU+APDU frame produced above into Forwarded-NPDU from `origin`.
[[nodiscard]] std::vector<std::uint8_t> encode_forwarded(std::span<const std::uint8_t> frame,
                                                         const IpEndpoint& origin);

// Decodes one datagram received from `from`. Throws DecodeError for
// truncated or inconsistent bytes; returns Ignored for valid frames of other
// message types. The reported source is the NPDU SNET/SADR when present,
// else the Forwarded-NPDU originating address, else `from`.
[[nodiscard]] Message decode_frame(std::span<const std::uint8_t> data, const IpEndpoint& from);

} // namespace bactopo::core::bacnet
