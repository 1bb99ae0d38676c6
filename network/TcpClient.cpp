#include "TcpClient.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mc {
namespace network {

TcpClient::~TcpClient() { close(); }

TcpClient::Roe<void> TcpClient::connect(const IpEndpoint &endpoint) {
  if (isConnected()) {
    return Error(E_STATE, "Already connected");
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *result = nullptr;
  std::string service = std::to_string(endpoint.port);
  int rc = getaddrinfo(endpoint.address.c_str(), service.c_str(), &hints,
                       &result);
  if (rc != 0 || result == nullptr) {
    return Error(E_RESOLVE, "Failed to resolve hostname: " + endpoint.address +
                                " (" + gai_strerror(rc) + ")");
  }

  std::string lastError = "no address";
  for (struct addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastError = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      freeaddrinfo(result);
      connection_.emplace(fd);
      return {};
    }
    lastError = std::strerror(errno);
    ::close(fd);
  }

  freeaddrinfo(result);
  return Error(E_CONNECT,
               "Failed to connect to " + endpoint.ltsToString() + ": " + lastError);
}

TcpClient::Roe<TcpConnection> TcpClient::release() {
  if (!isConnected()) {
    return Error(E_STATE, "Not connected");
  }
  TcpConnection connection(std::move(*connection_));
  connection_.reset();
  return connection;
}

void TcpClient::close() { connection_.reset(); }

bool TcpClient::isConnected() const {
  return connection_.has_value() && connection_->isOpen();
}

} // namespace network
} // namespace mc
