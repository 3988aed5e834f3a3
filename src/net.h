#pragma once

#include "yeelight/cancel.h"
#include "yeelight/error.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace yeelight {
namespace internal {

/// Granularity of socket waits that honor a CancelToken.
constexpr std::chrono::milliseconds kWaitSlice{50};

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);
std::string AddrToString(const sockaddr_in& addr);
bool IsValidIpv4(const std::string& address);
/// "<what> failed: <strerror(errno)>".
std::string ErrnoMessage(const std::string& what);

enum class WaitResult {
  kReady,
  kTimeout,
  kCancelled,
  kError,
};

/// Wait until `fd` is readable (or writable), polling `cancel` between slices.
WaitResult WaitReadable(int fd, std::chrono::milliseconds timeout,
                        const CancelToken* cancel);
WaitResult WaitWritable(int fd, std::chrono::milliseconds timeout,
                        const CancelToken* cancel);

// UDP socket wrapper with multicast membership support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  /// Port 0 binds an ephemeral port. `reuse_port` also sets SO_REUSEPORT so
  /// other responders on the host can share a well-known port.
  bool Open(uint16_t port, const std::string& bind_address, bool reuse_port);
  void Close();

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }
  uint16_t local_port() const;

  bool JoinMulticast(const std::string& group, const std::string& interface_address);
  bool SetMulticastInterface(const std::string& interface_address);
  bool SetMulticastTtl(int ttl);

  ssize_t SendTo(const void* data, size_t length, const sockaddr_in& addr);
  ssize_t SendTo(const std::string& data, const sockaddr_in& addr) {
    return SendTo(data.data(), data.size(), addr);
  }
  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
    return SendTo(data.data(), data.size(), addr);
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len);

 private:
  int fd_ = -1;
  std::string last_error_;
};

// Blocking TCP stream with a bounded, cancellable connect.
class TcpConnection {
 public:
  TcpConnection() = default;
  ~TcpConnection() { Close(); }

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  bool Connect(const std::string& ip, uint16_t port,
               std::chrono::milliseconds timeout, Error* error,
               const CancelToken* cancel = nullptr);
  /// Wake a blocked reader; the descriptor stays valid until Close().
  void Shutdown();
  void Close();

  bool is_open() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  bool SendAll(const std::string& data, Error* error);
  /// recv() passthrough: >0 bytes read, 0 on EOF, <0 on error.
  ssize_t Recv(char* buffer, size_t length);

 private:
  int fd_ = -1;
};

}  // namespace internal
}  // namespace yeelight
