#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mc {
namespace network {

class TcpClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_STATE = 1;
  static constexpr int32_t E_RESOLVE = 2;
  static constexpr int32_t E_CONNECT = 3;

  TcpClient() = default;
  ~TcpClient();

  TcpClient(const TcpClient &) = delete;
  TcpClient &operator=(const TcpClient &) = delete;

  TcpClient(TcpClient &&other) noexcept = default;
  TcpClient &operator=(TcpClient &&other) noexcept = default;

  // Resolve and connect to a server (IPv4)
  Roe<void> connect(const IpEndpoint &endpoint);

  // Hand the connected socket over to the caller
  Roe<TcpConnection> release();

  void close();

  bool isConnected() const;

private:
  std::optional<TcpConnection> connection_;
};

} // namespace network
} // namespace mc
