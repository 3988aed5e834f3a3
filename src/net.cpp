#include "net.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

namespace yeelight {
namespace internal {
namespace {

WaitResult WaitFd(int fd, bool for_write, std::chrono::milliseconds timeout,
                  const CancelToken* cancel) {
  if (fd < 0) {
    return WaitResult::kError;
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (IsCancelled(cancel)) {
      return WaitResult::kCancelled;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return WaitResult::kTimeout;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto slice = std::min(remaining, kWaitSlice);

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd, &fds);
    timeval tv{};
    tv.tv_sec = static_cast<long>(slice.count() / 1000);
    tv.tv_usec = static_cast<long>((slice.count() % 1000) * 1000);
    const int rc = for_write ? ::select(fd + 1, nullptr, &fds, nullptr, &tv)
                             : ::select(fd + 1, &fds, nullptr, nullptr, &tv);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return WaitResult::kError;
    }
    if (rc > 0) {
      return WaitResult::kReady;
    }
  }
}

bool SetNonBlocking(int fd, bool enabled) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, updated) == 0;
}

}  // namespace

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

std::string ErrnoMessage(const std::string& what) {
  return what + " failed: " + std::strerror(errno);
}

WaitResult WaitReadable(int fd, std::chrono::milliseconds timeout,
                        const CancelToken* cancel) {
  return WaitFd(fd, false, timeout, cancel);
}

WaitResult WaitWritable(int fd, std::chrono::milliseconds timeout,
                        const CancelToken* cancel) {
  return WaitFd(fd, true, timeout, cancel);
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address, bool reuse_port) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = ErrnoMessage("socket()");
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    last_error_ = ErrnoMessage("setsockopt(SO_REUSEADDR)");
    Close();
    return false;
  }
#ifdef SO_REUSEPORT
  if (reuse_port &&
      ::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
    last_error_ = ErrnoMessage("setsockopt(SO_REUSEPORT)");
    Close();
    return false;
  }
#endif
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpSocket::local_port() const {
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool UdpSocket::JoinMulticast(const std::string& group,
                              const std::string& interface_address) {
  ip_mreq mreq{};
  if (inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1) {
    last_error_ = "invalid multicast group: " + group;
    return false;
  }
  mreq.imr_interface = MakeSockaddr(interface_address, 0).sin_addr;
  if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
    last_error_ = ErrnoMessage("setsockopt(IP_ADD_MEMBERSHIP)");
    return false;
  }
  return true;
}

bool UdpSocket::SetMulticastInterface(const std::string& interface_address) {
  in_addr iface = MakeSockaddr(interface_address, 0).sin_addr;
  if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) < 0) {
    last_error_ = ErrnoMessage("setsockopt(IP_MULTICAST_IF)");
    return false;
  }
  return true;
}

bool UdpSocket::SetMulticastTtl(int ttl) {
  const unsigned char value = static_cast<unsigned char>(std::clamp(ttl, 1, 255));
  if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) < 0) {
    last_error_ = ErrnoMessage("setsockopt(IP_MULTICAST_TTL)");
    return false;
  }
  return true;
}

ssize_t UdpSocket::SendTo(const void* data, size_t length, const sockaddr_in& addr) {
  return ::sendto(fd_, data, length, 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ssize_t UdpSocket::RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                            socklen_t* addr_len) {
  return ::recvfrom(fd_, buffer, length, 0,
                    reinterpret_cast<sockaddr*>(addr), addr_len);
}

bool TcpConnection::Connect(const std::string& ip, uint16_t port,
                            std::chrono::milliseconds timeout, Error* error,
                            const CancelToken* cancel) {
  Close();
  if (!IsValidIpv4(ip)) {
    return SetError(error, ErrorCode::kInvalidArgument, "invalid device ip: " + ip);
  }
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    return SetError(error, ErrorCode::kSocketError, ErrnoMessage("socket()"));
  }
  if (!SetNonBlocking(fd_, true)) {
    const std::string message = ErrnoMessage("fcntl(O_NONBLOCK)");
    Close();
    return SetError(error, ErrorCode::kSocketError, message);
  }

  const sockaddr_in addr = MakeSockaddr(ip, port);
  const std::string target = ip + ":" + std::to_string(port);
  if (::connect(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (errno != EINPROGRESS) {
      const bool refused = errno == ECONNREFUSED;
      const std::string message = ErrnoMessage("connect(" + target + ")");
      Close();
      return SetError(error,
                      refused ? ErrorCode::kConnectionRefused : ErrorCode::kSocketError,
                      message);
    }
    switch (WaitWritable(fd_, timeout, cancel)) {
      case WaitResult::kReady:
        break;
      case WaitResult::kTimeout:
        Close();
        return SetError(error, ErrorCode::kConnectTimeout,
                        "connect(" + target + ") timed out");
      case WaitResult::kCancelled:
        Close();
        return SetError(error, ErrorCode::kCancelled, "connect cancelled");
      case WaitResult::kError: {
        const std::string message = ErrnoMessage("select()");
        Close();
        return SetError(error, ErrorCode::kSocketError, message);
      }
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      const std::string message = ErrnoMessage("getsockopt(SO_ERROR)");
      Close();
      return SetError(error, ErrorCode::kSocketError, message);
    }
    if (so_error != 0) {
      Close();
      std::string message = "connect(" + target + ") failed: ";
      message += std::strerror(so_error);
      return SetError(error,
                      so_error == ECONNREFUSED ? ErrorCode::kConnectionRefused
                                               : ErrorCode::kSocketError,
                      message);
    }
  }
  if (!SetNonBlocking(fd_, false)) {
    const std::string message = ErrnoMessage("fcntl(~O_NONBLOCK)");
    Close();
    return SetError(error, ErrorCode::kSocketError, message);
  }
  return true;
}

void TcpConnection::Shutdown() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void TcpConnection::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool TcpConnection::SendAll(const std::string& data, Error* error) {
  if (fd_ < 0) {
    return SetError(error, ErrorCode::kNotConnected, "socket is closed");
  }
  size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t rc = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return SetError(error, ErrorCode::kConnectionLost, ErrnoMessage("send()"));
    }
    sent += static_cast<size_t>(rc);
  }
  return true;
}

ssize_t TcpConnection::Recv(char* buffer, size_t length) {
  while (true) {
    const ssize_t rc = ::recv(fd_, buffer, length, 0);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    return rc;
  }
}

}  // namespace internal
}  // namespace yeelight
