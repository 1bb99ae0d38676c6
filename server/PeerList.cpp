#include "PeerList.h"

#include <algorithm>

namespace mc {

Peer::Peer(network::TcpConnection conn, bool isOutbound)
    : endpoint(conn.getPeerEndpoint()), outbound(isOutbound),
      connection(std::move(conn)) {}

network::TcpConnection::Roe<void> Peer::sendLine(const std::string &line) {
  std::lock_guard<std::mutex> lock(writeMutex_);
  return connection.sendAll(line);
}

PeerList::PeerList() : Module("mc.peers") {}

bool PeerList::add(const PeerPtr &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  peers_.push_back(peer);
  log().info << "Peer " << peer->endpoint << " connected ("
             << (peer->outbound ? "outbound" : "inbound") << "), "
             << peers_.size() << " total";
  return true;
}

void PeerList::remove(const PeerPtr &peer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(peers_.begin(), peers_.end(), peer);
    if (it != peers_.end()) {
      peers_.erase(it);
      log().info << "Peer " << peer->endpoint << " removed, " << peers_.size()
                 << " left";
    }
  }
  peer->shutdown();
}

size_t PeerList::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::vector<network::IpEndpoint> PeerList::endpoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<network::IpEndpoint> result;
  result.reserve(peers_.size());
  for (const auto &peer : peers_) {
    result.push_back(peer->endpoint);
  }
  return result;
}

size_t PeerList::broadcast(const std::string &line,
                           const network::IpEndpoint *exclude) {
  std::vector<PeerPtr> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = peers_;
  }

  size_t sent = 0;
  for (const auto &peer : targets) {
    if (exclude && peer->endpoint == *exclude) {
      continue;
    }
    auto result = peer->sendLine(line);
    if (!result) {
      log().warning << "Send to " << peer->endpoint
                    << " failed: " << result.error().message;
      remove(peer);
      continue;
    }
    ++sent;
  }
  return sent;
}

void PeerList::shutdownAll() {
  std::vector<PeerPtr> peers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    peers.swap(peers_);
  }
  for (const auto &peer : peers) {
    peer->shutdown();
  }
}

void PeerList::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

} // namespace mc
