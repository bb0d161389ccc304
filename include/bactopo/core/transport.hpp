/*
  Transport interface: datagram send/receive for the discovery engine.

  The engine speaks BACnet/IP through this seam only. make_udp_transport()
  returns the POSIX socket implementation; tests substitute a scripted
  in-memory transport.
*/
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "bactopo/core/address.hpp"

namespace bactopo::core {

struct Datagram {
  IpEndpoint source {};
  std::vector<std::uint8_t> payload {};
};

class Transport {
public:
  using Clock = std::chrono::steady_clock;

  virtual ~Transport() noexcept = default;

  // Throws TransportError when the datagram cannot be handed to the network.
  virtual void send(const IpEndpoint& dest, std::span<const std::uint8_t> payload) = 0;

  // Next datagram received before `deadline`, nullopt once it passes.
  [[nodiscard]] virtual std::optional<Datagram> receive(Clock::time_point deadline) = 0;

  [[nodiscard]] virtual IpEndpoint local_endpoint() const noexcept = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

// Binds a broadcast-capable UDP socket. Throws TransportError.
[[nodiscard]] TransportPtr make_udp_transport(const IpEndpoint& bind_address);

} // namespace bactopo::core
