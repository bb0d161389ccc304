/*
  BACnet/IP codec.

  Layout of a datagram:
    BVLC   0x81 | function | length(2)          [Forwarded-NPDU: + origin(6)]
    NPDU   0x01 | control | [DNET DLEN DADR] [SNET SLEN SADR] [hop count]
    body   network message (control bit 7) or APDU

  Every read is bounds-checked against the BVLC length; anything that does
  not fit raises DecodeError so the caller can log and skip the frame.
*/
#include "bactopo/core/bacnet_codec.hpp"

#include <string>

#include "bactopo/core/error.hpp"

namespace bactopo::core::bacnet {

namespace {

// NPDU control bits
constexpr std::uint8_t kNetworkMessage = 0x80;
constexpr std::uint8_t kDestinationPresent = 0x20;
constexpr std::uint8_t kSourcePresent = 0x08;

// Network layer message types
constexpr std::uint8_t kWhoIsRouterToNetwork = 0x00;
constexpr std::uint8_t kIAmRouterToNetwork = 0x01;

// APDU
constexpr std::uint8_t kUnconfirmedRequest = 0x10;
constexpr std::uint8_t kServiceIAm = 0x00;
constexpr std::uint8_t kServiceWhoIs = 0x08;

// Application tag numbers
constexpr std::uint8_t kTagUnsigned = 2;
constexpr std::uint8_t kTagEnumerated = 9;
constexpr std::uint8_t kTagObjectId = 12;

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put_ip(std::vector<std::uint8_t>& out, const IpEndpoint& ip) {
  out.insert(out.end(), ip.octets.begin(), ip.octets.end());
  put_u16(out, ip.port);
}

std::uint8_t unsigned_len(std::uint32_t v) noexcept {
  if (v <= 0xFF) return 1;
  if (v <= 0xFFFF) return 2;
  if (v <= 0xFFFFFF) return 3;
  return 4;
}

void put_unsigned_bytes(std::vector<std::uint8_t>& out, std::uint32_t v, std::uint8_t len) {
  for (int shift = (len - 1) * 8; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
  }
}

void put_context_unsigned(std::vector<std::uint8_t>& out, std::uint8_t tag, std::uint32_t v) {
  auto len = unsigned_len(v);
  out.push_back(static_cast<std::uint8_t>((tag << 4) | 0x08 | len));
  put_unsigned_bytes(out, v, len);
}

void put_app_unsigned(std::vector<std::uint8_t>& out, std::uint8_t tag, std::uint32_t v) {
  auto len = unsigned_len(v);
  out.push_back(static_cast<std::uint8_t>((tag << 4) | len));
  put_unsigned_bytes(out, v, len);
}

std::vector<std::uint8_t> wrap_bvlc(BvlcFunction fn, const std::vector<std::uint8_t>& body) {
  std::vector<std::uint8_t> out;
  out.reserve(body.size() + 4);
  out.push_back(kBvlcType);
  out.push_back(static_cast<std::uint8_t>(fn));
  put_u16(out, static_cast<std::uint16_t>(body.size() + 4));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

// Bounds-checked cursor over one datagram.
class Reader {
public:
  Reader(std::span<const std::uint8_t> data, std::size_t pos, std::size_t end)
      : data_(data), pos_(pos), end_(end) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return end_ - pos_; }

  std::uint8_t u8(const char* what) {
    need(1, what);
    return data_[pos_++];
  }
  std::uint16_t u16(const char* what) {
    need(2, what);
    auto v = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }
  std::uint32_t uN(std::size_t n, const char* what) {
    need(n, what);
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < n; ++i) v = (v << 8) | data_[pos_ + i];
    pos_ += n;
    return v;
  }
  std::vector<std::uint8_t> bytes(std::size_t n, const char* what) {
    need(n, what);
    std::vector<std::uint8_t> v(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return v;
  }
  IpEndpoint ip(const char* what) {
    need(6, what);
    IpEndpoint e;
    e.octets = {data_[pos_], data_[pos_ + 1], data_[pos_ + 2], data_[pos_ + 3]};
    pos_ += 4;
    e.port = u16(what);
    return e;
  }

  // Application-tagged unsigned/enumerated with a 1..4 byte value.
  std::uint32_t app_unsigned(std::uint8_t expected_tag, const char* what) {
    auto tag = u8(what);
    if ((tag >> 4) != expected_tag || (tag & 0x08) != 0) {
      throw DecodeError(std::string("unexpected tag for ") + what);
    }
    auto len = static_cast<std::size_t>(tag & 0x07);
    if (len < 1 || len > 4) throw DecodeError(std::string("bad length for ") + what);
    return uN(len, what);
  }

  // Context-tagged unsigned with a 1..4 byte value.
  std::uint32_t context_unsigned(std::uint8_t expected_tag, const char* what) {
    auto tag = u8(what);
    if ((tag >> 4) != expected_tag || (tag & 0x08) == 0) {
      throw DecodeError(std::string("unexpected context tag for ") + what);
    }
    auto len = static_cast<std::size_t>(tag & 0x07);
    if (len < 1 || len > 4) throw DecodeError(std::string("bad length for ") + what);
    return uN(len, what);
  }

private:
  void need(std::size_t n, const char* what) const {
    if (pos_ + n > end_) throw DecodeError(std::string("truncated frame reading ") + what);
  }

  std::span<const std::uint8_t> data_;
  std::size_t pos_;
  std::size_t end_;
};

Message decode_i_am(Reader& r, BacnetAddress source) {
  auto tag = r.u8("I-Am object identifier");
  if (tag != ((kTagObjectId << 4) | 4)) throw DecodeError("I-Am without object identifier");
  auto oid = r.uN(4, "I-Am object identifier");
  if ((oid >> 22) != kObjectTypeDevice) throw DecodeError("I-Am for a non-device object");
  IAm msg;
  msg.device_instance = oid & 0x3FFFFF;
  msg.max_apdu = r.app_unsigned(kTagUnsigned, "I-Am max APDU");
  auto seg = r.app_unsigned(kTagEnumerated, "I-Am segmentation");
  if (seg > 3) throw DecodeError("I-Am segmentation out of range");
  msg.segmentation = static_cast<std::uint8_t>(seg);
  auto vendor = r.app_unsigned(kTagUnsigned, "I-Am vendor id");
  if (vendor > 0xFFFF) throw DecodeError("I-Am vendor id out of range");
  msg.vendor_id = static_cast<std::uint16_t>(vendor);
  msg.source = std::move(source);
  return msg;
}

Message decode_who_is(Reader& r, const IpEndpoint& origin) {
  WhoIs msg;
  msg.source = origin;
  if (r.remaining() == 0) return msg;
  msg.low = r.context_unsigned(0, "Who-Is low limit");
  msg.high = r.context_unsigned(1, "Who-Is high limit");
  return msg;
}

Message decode_npdu(Reader& r, const IpEndpoint& origin) {
  if (r.u8("NPDU version") != 0x01) throw DecodeError("unsupported NPDU version");
  auto ctrl = r.u8("NPDU control");
  bool has_dest = (ctrl & kDestinationPresent) != 0;
  if (has_dest) {
    (void)r.u16("DNET");
    auto dlen = r.u8("DLEN");
    (void)r.bytes(dlen, "DADR");
  }
  std::optional<BacnetAddress> remote;
  if (ctrl & kSourcePresent) {
    BacnetAddress a;
    a.net = r.u16("SNET");
    auto slen = r.u8("SLEN");
    if (a.net == 0 || a.net == kGlobalNetwork || slen == 0) throw DecodeError("invalid NPDU source specifier");
    a.mac = r.bytes(slen, "SADR");
    remote = std::move(a);
  }
  if (has_dest) (void)r.u8("hop count");

  if (ctrl & kNetworkMessage) {
    auto type = r.u8("network message type");
    if (type >= 0x80) (void)r.u16("vendor id");
    if (type == kWhoIsRouterToNetwork) {
      WhoIsRouterToNetwork msg;
      msg.source = origin;
      if (r.remaining() >= 2) msg.network = r.u16("network number");
      return msg;
    }
    if (type == kIAmRouterToNetwork) {
      if (r.remaining() == 0 || r.remaining() % 2 != 0) {
        throw DecodeError("I-Am-Router-To-Network with odd network list");
      }
      IAmRouterToNetwork msg;
      msg.source = origin;
      while (r.remaining() > 0) msg.networks.push_back(r.u16("network number"));
      return msg;
    }
    return Ignored{static_cast<std::uint8_t>(BvlcFunction::OriginalUnicastNpdu)};
  }

  auto pdu_type = r.u8("APDU type");
  if ((pdu_type & 0xF0) != kUnconfirmedRequest) {
    return Ignored{static_cast<std::uint8_t>(BvlcFunction::OriginalUnicastNpdu)};
  }
  auto service = r.u8("APDU service choice");
  if (service == kServiceIAm) {
    return decode_i_am(r, remote ? std::move(*remote) : BacnetAddress::from_ip(origin));
  }
  if (service == kServiceWhoIs) return decode_who_is(r, origin);
  return Ignored{static_cast<std::uint8_t>(BvlcFunction::OriginalUnicastNpdu)};
}

} // namespace

std::vector<std::uint8_t> encode_who_is(std::optional<std::uint32_t> low,
                                        std::optional<std::uint32_t> high,
                                        bool global) {
  if (low.has_value() != high.has_value()) {
    throw ValueError("Who-Is needs both range limits or neither");
  }
  if (low && (*low > *high || *high > kMaxInstance)) {
    throw ValueError("Who-Is range [" + std::to_string(*low) + ", " + std::to_string(*high) + "] is invalid");
  }
  std::vector<std::uint8_t> body {0x01, static_cast<std::uint8_t>(global ? kDestinationPresent : 0x00)};
  if (global) {
    put_u16(body, kGlobalNetwork);
    body.push_back(0x00);  // DLEN 0: broadcast on DNET
    body.push_back(0xFF);  // hop count
  }
  body.push_back(kUnconfirmedRequest);
  body.push_back(kServiceWhoIs);
  if (low) {
    put_context_unsigned(body, 0, *low);
    put_context_unsigned(body, 1, *high);
  }
  return wrap_bvlc(BvlcFunction::OriginalBroadcastNpdu, body);
}

std::vector<std::uint8_t> encode_who_is_router_to_network(std::optional<std::uint16_t> network) {
  std::vector<std::uint8_t> body {0x01, kNetworkMessage, kWhoIsRouterToNetwork};
  if (network) put_u16(body, *network);
  return wrap_bvlc(BvlcFunction::OriginalBroadcastNpdu, body);
}

std::vector<std::uint8_t> encode_read_bdt() {
  return wrap_bvlc(BvlcFunction::ReadBdt, {});
}

std::vector<std::uint8_t> encode_i_am(std::uint32_t device_instance,
                                      std::uint16_t vendor_id,
                                      std::uint32_t max_apdu,
                                      std::uint8_t segmentation,
                                      std::uint16_t source_net,
                                      std::span<const std::uint8_t> source_mac) {
  if (device_instance > kMaxDeviceInstance) throw ValueError("device instance out of range");
  std::vector<std::uint8_t> body {0x01, static_cast<std::uint8_t>(source_net ? kSourcePresent : 0x00)};
  if (source_net) {
    if (source_mac.empty() || source_mac.size() > 0xFF) throw ValueError("remote I-Am needs a source MAC");
    put_u16(body, source_net);
    body.push_back(static_cast<std::uint8_t>(source_mac.size()));
    body.insert(body.end(), source_mac.begin(), source_mac.end());
  }
  body.push_back(kUnconfirmedRequest);
  body.push_back(kServiceIAm);
  body.push_back((kTagObjectId << 4) | 4);
  put_u32(body, (static_cast<std::uint32_t>(kObjectTypeDevice) << 22) | device_instance);
  put_app_unsigned(body, kTagUnsigned, max_apdu);
  put_app_unsigned(body, kTagEnumerated, segmentation);
  put_app_unsigned(body, kTagUnsigned, vendor_id);
  return wrap_bvlc(BvlcFunction::OriginalBroadcastNpdu, body);
}

std::vector<std::uint8_t> encode_i_am_router_to_network(std::span<const std::uint16_t> networks) {
  std::vector<std::uint8_t> body {0x01, kNetworkMessage, kIAmRouterToNetwork};
  for (auto n : networks) put_u16(body, n);
  return wrap_bvlc(BvlcFunction::OriginalBroadcastNpdu, body);
}

std::vector<std::uint8_t> encode_read_bdt_ack(std::span<const BdtEntry> entries) {
  std::vector<std::uint8_t> body;
  for (const auto& e : entries) {
    put_ip(body, e.address);
    body.insert(body.end(), e.mask.begin(), e.mask.end());
  }
  return wrap_bvlc(BvlcFunction::ReadBdtAck, body);
}

std::vector<std::uint8_t> encode_bvlc_result(std::uint16_t code) {
  std::vector<std::uint8_t> body;
  put_u16(body, code);
  return wrap_bvlc(BvlcFunction::Result, body);
}

std::vector<std::uint8_t> encode_forwarded(std::span<const std::uint8_t> frame, const IpEndpoint& origin) {
  if (frame.size() < 6 || frame[0] != kBvlcType ||
      (frame[1] != static_cast<std::uint8_t>(BvlcFunction::OriginalUnicastNpdu) &&
       frame[1] != static_cast<std::uint8_t>(BvlcFunction::OriginalBroadcastNpdu))) {
    throw ValueError("only original unicast/broadcast frames can be forwarded");
  }
  std::vector<std::uint8_t> body;
  put_ip(body, origin);
  body.insert(body.end(), frame.begin() + 4, frame.end());
  return wrap_bvlc(BvlcFunction::ForwardedNpdu, body);
}

Message decode_frame(std::span<const std::uint8_t> data, const IpEndpoint& from) {
  if (data.size() < 4) throw DecodeError("datagram shorter than a BVLC header");
  if (data[0] != kBvlcType) throw DecodeError("not a BACnet/IP BVLC frame");
  const auto fn = data[1];
  const std::size_t length = static_cast<std::size_t>((data[2] << 8) | data[3]);
  if (length < 4 || length > data.size()) throw DecodeError("BVLC length does not match datagram");
  Reader r(data, 4, length);

  switch (static_cast<BvlcFunction>(fn)) {
    case BvlcFunction::Result: {
      BvlcResult res;
      res.code = r.u16("BVLC result code");
      res.source = from;
      return res;
    }
    case BvlcFunction::ReadBdt:
      return ReadBdt{from};
    case BvlcFunction::ReadBdtAck: {
      if (r.remaining() % 10 != 0) throw DecodeError("Read-BDT-Ack length is not a multiple of 10");
      ReadBdtAck ack;
      ack.source = from;
      while (r.remaining() > 0) {
        BdtEntry e;
        e.address = r.ip("BDT entry address");
        auto mask = r.uN(4, "BDT entry mask");
        e.mask = IpEndpoint::from_u32(mask).octets;
        ack.entries.push_back(e);
      }
      return ack;
    }
    case BvlcFunction::ForwardedNpdu: {
      auto origin = r.ip("forwarded origin");
      return decode_npdu(r, origin);
    }
    case BvlcFunction::OriginalUnicastNpdu:
    case BvlcFunction::OriginalBroadcastNpdu:
    case BvlcFunction::DistributeBroadcastToNetwork:
      return decode_npdu(r, from);
    default:
      return Ignored{fn};
  }
}

} // namespace bactopo::core::bacnet
