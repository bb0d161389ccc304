/*
  Address parsing and formatting.

  Parsing is strict about syntax (four decimal octets, optional port/prefix)
  and lenient about subnet host bits, which are masked off the way the
  configuration store has always accepted "192.168.1.12/24".
*/
#include "bactopo/core/address.hpp"

#include <charconv>
#include <cstdio>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

namespace {
template <typename T>
bool parse_uint(std::string_view s, T max_value, T& out) {
  if (s.empty() || s.size() > 10) return false;
  unsigned long long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return false;
  if (v > static_cast<unsigned long long>(max_value)) return false;
  out = static_cast<T>(v);
  return true;
}

std::array<std::uint8_t, 4> parse_octets(std::string_view text, std::string_view whole) {
  std::array<std::uint8_t, 4> out {};
  std::size_t pos = 0;
  for (int i = 0; i < 4; ++i) {
    std::size_t dot = (i < 3) ? text.find('.', pos) : text.size();
    if (dot == std::string_view::npos) {
      throw ValueError("invalid IPv4 address '" + std::string(whole) + "'");
    }
    std::uint8_t octet = 0;
    if (!parse_uint<std::uint8_t>(text.substr(pos, dot - pos), 255, octet)) {
      throw ValueError("invalid IPv4 address '" + std::string(whole) + "'");
    }
    out[static_cast<std::size_t>(i)] = octet;
    pos = dot + 1;
  }
  return out;
}

std::uint16_t parse_port(std::string_view s, std::string_view whole) {
  std::uint16_t port = 0;
  if (!parse_uint<std::uint16_t>(s, 65535, port) || port == 0) {
    throw ValueError("invalid port in '" + std::string(whole) + "'");
  }
  return port;
}

std::uint8_t parse_prefix(std::string_view s, std::string_view whole) {
  std::uint8_t prefix = 0;
  if (!parse_uint<std::uint8_t>(s, 32, prefix)) {
    throw ValueError("invalid prefix length in '" + std::string(whole) + "'");
  }
  return prefix;
}
} // namespace

std::uint32_t IpEndpoint::to_u32() const noexcept {
  return (static_cast<std::uint32_t>(octets[0]) << 24) |
         (static_cast<std::uint32_t>(octets[1]) << 16) |
         (static_cast<std::uint32_t>(octets[2]) << 8) |
         static_cast<std::uint32_t>(octets[3]);
}

IpEndpoint IpEndpoint::from_u32(std::uint32_t addr, std::uint16_t port) noexcept {
  IpEndpoint ip;
  ip.octets = {static_cast<std::uint8_t>(addr >> 24), static_cast<std::uint8_t>(addr >> 16),
               static_cast<std::uint8_t>(addr >> 8), static_cast<std::uint8_t>(addr)};
  ip.port = port;
  return ip;
}

std::string IpEndpoint::host_string() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", octets[0], octets[1], octets[2], octets[3]);
  return buf;
}

std::string IpEndpoint::to_string() const {
  if (port == kDefaultBacnetPort) return host_string();
  return host_string() + ":" + std::to_string(port);
}

IpEndpoint parse_ip_endpoint(std::string_view text) {
  IpEndpoint ip;
  auto colon = text.find(':');
  std::string_view host = text.substr(0, colon);
  ip.octets = parse_octets(host, text);
  if (colon != std::string_view::npos) {
    ip.port = parse_port(text.substr(colon + 1), text);
  }
  return ip;
}

std::uint32_t Ipv4Subnet::mask() const noexcept {
  if (prefix_len == 0) return 0;
  return ~std::uint32_t{0} << (32 - prefix_len);
}

bool Ipv4Subnet::contains(const IpEndpoint& ip) const noexcept {
  IpEndpoint net_ip;
  net_ip.octets = network;
  return (ip.to_u32() & mask()) == net_ip.to_u32();
}

IpEndpoint Ipv4Subnet::broadcast(std::uint16_t port) const noexcept {
  IpEndpoint net_ip;
  net_ip.octets = network;
  return IpEndpoint::from_u32(net_ip.to_u32() | ~mask(), port);
}

std::string Ipv4Subnet::to_string() const {
  IpEndpoint net_ip;
  net_ip.octets = network;
  return net_ip.host_string() + "/" + std::to_string(prefix_len);
}

Ipv4Subnet make_subnet(const IpEndpoint& ip, std::uint8_t prefix_len) {
  if (prefix_len > 32) throw ValueError("prefix length must be <= 32");
  Ipv4Subnet s;
  s.prefix_len = prefix_len;
  auto masked = IpEndpoint::from_u32(ip.to_u32() & s.mask());
  s.network = masked.octets;
  return s;
}

Ipv4Subnet parse_subnet(std::string_view text) {
  auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    throw ValueError("subnet '" + std::string(text) + "' has no prefix length");
  }
  IpEndpoint ip;
  ip.octets = parse_octets(text.substr(0, slash), text);
  return make_subnet(ip, parse_prefix(text.substr(slash + 1), text));
}

AgentAddress parse_agent_address(std::string_view text) {
  // a.b.c.d[/n][:port]
  AgentAddress out;
  auto colon = text.find(':');
  std::string_view host_part = text.substr(0, colon);
  auto slash = host_part.find('/');
  out.endpoint.octets = parse_octets(host_part.substr(0, slash), text);
  if (colon != std::string_view::npos) {
    out.endpoint.port = parse_port(text.substr(colon + 1), text);
  }
  std::uint8_t prefix = 24;
  if (slash != std::string_view::npos) {
    prefix = parse_prefix(host_part.substr(slash + 1), text);
  }
  out.subnet = make_subnet(out.endpoint, prefix);
  return out;
}

BacnetAddress BacnetAddress::from_ip(const IpEndpoint& ip) {
  BacnetAddress a;
  a.net = 0;
  a.mac = {ip.octets[0], ip.octets[1], ip.octets[2], ip.octets[3],
           static_cast<std::uint8_t>(ip.port >> 8), static_cast<std::uint8_t>(ip.port & 0xFF)};
  return a;
}

std::optional<IpEndpoint> BacnetAddress::ip() const noexcept {
  if (net != 0 || mac.size() != 6) return std::nullopt;
  IpEndpoint ip;
  ip.octets = {mac[0], mac[1], mac[2], mac[3]};
  ip.port = static_cast<std::uint16_t>((mac[4] << 8) | mac[5]);
  return ip;
}

std::string BacnetAddress::to_string() const {
  if (auto addr = ip()) return addr->to_string();
  std::string out = std::to_string(net) + ":";
  static constexpr char kHex[] = "0123456789abcdef";
  for (auto b : mac) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace bactopo::core
