#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace mc {
namespace network {

TcpConnection::TcpConnection(int socketFd) : socketFd_(socketFd) {
  struct sockaddr_in peerAddr;
  socklen_t addrLen = sizeof(peerAddr);
  if (getpeername(socketFd, (struct sockaddr *)&peerAddr, &addrLen) == 0 &&
      peerAddr.sin_family == AF_INET) {
    char addrStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peerAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
    peer_.address = addrStr;
    peer_.port = ntohs(peerAddr.sin_port);
  }
}

TcpConnection::~TcpConnection() { close(); }

TcpConnection::TcpConnection(TcpConnection &&other) noexcept
    : socketFd_(other.socketFd_.exchange(-1)), peer_(std::move(other.peer_)) {
  other.peer_ = {};
}

TcpConnection &TcpConnection::operator=(TcpConnection &&other) noexcept {
  if (this != &other) {
    close();
    socketFd_ = other.socketFd_.exchange(-1);
    peer_ = std::move(other.peer_);
    other.peer_ = {};
  }
  return *this;
}

TcpConnection::Roe<size_t> TcpConnection::send(const void *data,
                                               size_t length) {
  int fd = socketFd_;
  if (fd < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  // MSG_NOSIGNAL: a vanished peer must not raise SIGPIPE
  ssize_t sent = ::send(fd, data, length, MSG_NOSIGNAL);
  if (sent < 0) {
    return Error(E_SEND,
                 "Failed to send data: " + std::string(std::strerror(errno)));
  }

  return static_cast<size_t>(sent);
}

TcpConnection::Roe<void> TcpConnection::sendAll(const void *data,
                                                size_t length) {
  const char *bytes = static_cast<const char *>(data);
  size_t offset = 0;
  while (offset < length) {
    auto result = send(bytes + offset, length - offset);
    if (!result) {
      return result.error();
    }
    offset += *result;
  }
  return {};
}

TcpConnection::Roe<void> TcpConnection::sendAll(const std::string &message) {
  return sendAll(message.data(), message.size());
}

TcpConnection::Roe<size_t> TcpConnection::receive(void *buffer,
                                                  size_t maxLength) {
  int fd = socketFd_;
  if (fd < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  ssize_t received = recv(fd, buffer, maxLength, 0);
  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_TIMEOUT, "Receive timeout (no data within socket timeout)");
    }
    return Error(E_RECEIVE,
                 "Failed to receive data: " + std::string(std::strerror(errno)));
  }
  if (received == 0) {
    return Error(E_PEER_CLOSED, "Connection closed by peer");
  }

  return static_cast<size_t>(received);
}

TcpConnection::Roe<void>
TcpConnection::setTimeout(std::chrono::milliseconds timeout) {
  int fd = socketFd_;
  if (fd < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_SOCKET_OPTION, "Failed to set receive timeout: " +
                                      std::string(std::strerror(errno)));
  }
  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_SOCKET_OPTION, "Failed to set send timeout: " +
                                      std::string(std::strerror(errno)));
  }

  return {};
}

void TcpConnection::shutdown() {
  int fd = socketFd_;
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

void TcpConnection::close() {
  int fd = socketFd_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
}

} // namespace network
} // namespace mc
