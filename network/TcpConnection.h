#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mc {
namespace network {

/**
 * Owned, connected stream socket.
 * shutdown() may be called from any thread to unblock a pending receive();
 * close() must only be called by the owner.
 */
class TcpConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CLOSED = 1;
  static constexpr int32_t E_SEND = 2;
  static constexpr int32_t E_RECEIVE = 3;
  static constexpr int32_t E_PEER_CLOSED = 4;
  static constexpr int32_t E_TIMEOUT = 5;
  static constexpr int32_t E_SOCKET_OPTION = 6;

  explicit TcpConnection(int socketFd);
  ~TcpConnection();

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  TcpConnection(TcpConnection &&other) noexcept;
  TcpConnection &operator=(TcpConnection &&other) noexcept;

  // Single send call, may be partial
  Roe<size_t> send(const void *data, size_t length);

  // Send everything or fail
  Roe<void> sendAll(const void *data, size_t length);
  Roe<void> sendAll(const std::string &message);

  // Receive up to maxLength bytes; a graceful close is E_PEER_CLOSED
  Roe<size_t> receive(void *buffer, size_t maxLength);

  // Set socket send/receive timeout (0 = no timeout)
  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  // Shut down both directions without releasing the descriptor
  void shutdown();

  void close();

  bool isOpen() const { return socketFd_ >= 0; }

  const IpEndpoint &getPeerEndpoint() const { return peer_; }

private:
  std::atomic<int> socketFd_;
  IpEndpoint peer_;
};

} // namespace network
} // namespace mc
