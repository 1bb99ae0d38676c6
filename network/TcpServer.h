#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mc {
namespace network {

class TcpServer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_STATE = 1;
  static constexpr int32_t E_SOCKET = 2;
  static constexpr int32_t E_WOULD_BLOCK = 3;
  static constexpr int32_t E_TIMEOUT = 4;

  TcpServer() = default;
  ~TcpServer();

  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  // Bind and listen; port 0 picks an ephemeral port (see getPort())
  Roe<void> listen(const IpEndpoint &endpoint, int backlog = 16);

  // Accept a pending connection (non-blocking, E_WOULD_BLOCK when none)
  Roe<TcpConnection> accept();

  // Wait for incoming connections (timeout in milliseconds, -1 for infinite)
  Roe<void> waitForEvents(int timeoutMs = -1);

  void stop();

  bool isListening() const { return listening_; }

  // Actual bound port
  uint16_t getPort() const { return endpoint_.port; }

  const IpEndpoint &getEndpoint() const { return endpoint_; }

private:
  Roe<void> fail(const std::string &message);

  int socketFd_{ -1 };
  int epollFd_{ -1 };
  bool listening_{ false };
  IpEndpoint endpoint_;
};

} // namespace network
} // namespace mc
