/*
  UDP transport: one non-connected IPv4 socket bound to the agent address.
*/
#include "bactopo/core/transport.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "bactopo/core/error.hpp"
#include "bactopo/core/log.hpp"

namespace bactopo::core {

namespace {

sockaddr_in to_sockaddr(const IpEndpoint& ep) noexcept {
  sockaddr_in sa {};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(ep.port);
  sa.sin_addr.s_addr = htonl(ep.to_u32());
  return sa;
}

IpEndpoint from_sockaddr(const sockaddr_in& sa) noexcept {
  return IpEndpoint::from_u32(ntohl(sa.sin_addr.s_addr), ntohs(sa.sin_port));
}

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

class UdpTransport final : public Transport {
public:
  explicit UdpTransport(const IpEndpoint& bind_address) : local_(bind_address) {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) throw TransportError(errno_text("socket"));

    int one = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 ||
        ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) != 0) {
      auto msg = errno_text("setsockopt");
      ::close(fd_);
      throw TransportError(msg);
    }
    // Bind to INADDR_ANY so subnet broadcasts are received as well.
    sockaddr_in sa = to_sockaddr(IpEndpoint::from_u32(0, bind_address.port));
    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)) != 0) {
      auto msg = errno_text("bind");
      ::close(fd_);
      throw TransportError(msg + " (" + bind_address.to_string() + ")");
    }
    logger()->debug("udp transport bound on {}", bind_address.to_string());
  }

  ~UdpTransport() noexcept override {
    if (fd_ >= 0) ::close(fd_);
  }

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  void send(const IpEndpoint& dest, std::span<const std::uint8_t> payload) override {
    sockaddr_in sa = to_sockaddr(dest);
    auto n = ::sendto(fd_, payload.data(), payload.size(), 0,
                      reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
    if (n < 0 || static_cast<std::size_t>(n) != payload.size()) {
      throw TransportError(errno_text("sendto") + " (" + dest.to_string() + ")");
    }
  }

  std::optional<Datagram> receive(Clock::time_point deadline) override {
    std::vector<std::uint8_t> buf(kMaxDatagram);
    for (;;) {
      auto now = Clock::now();
      if (now >= deadline) return std::nullopt;
      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
      pollfd pfd {fd_, POLLIN, 0};
      int rc = ::poll(&pfd, 1, static_cast<int>(wait > 0 ? wait : 1));
      if (rc < 0) {
        if (errno == EINTR) continue;
        throw TransportError(errno_text("poll"));
      }
      if (rc == 0) continue;

      sockaddr_in from {};
      socklen_t len = sizeof(from);
      auto n = ::recvfrom(fd_, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&from), &len);
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        throw TransportError(errno_text("recvfrom"));
      }
      auto source = from_sockaddr(from);
      if (source == local_) continue;  // our own broadcast
      buf.resize(static_cast<std::size_t>(n));
      return Datagram{source, std::move(buf)};
    }
  }

  IpEndpoint local_endpoint() const noexcept override { return local_; }

private:
  static constexpr std::size_t kMaxDatagram = 1500;

  int fd_ {-1};
  IpEndpoint local_ {};
};

} // namespace

TransportPtr make_udp_transport(const IpEndpoint& bind_address) {
  return std::make_shared<UdpTransport>(bind_address);
}

} // namespace bactopo::core
