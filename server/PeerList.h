#ifndef MINICHAIN_PEER_LIST_H
#define MINICHAIN_PEER_LIST_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mc {

/**
 * A live connection to another node, inbound or outbound.
 * Writes are serialized per peer so that lines never interleave.
 */
struct Peer {
  Peer(network::TcpConnection conn, bool isOutbound);

  network::TcpConnection::Roe<void> sendLine(const std::string &line);

  // Wake the reader; the descriptor is released with the last reference
  void shutdown() { connection.shutdown(); }

  network::IpEndpoint endpoint;
  bool outbound;
  network::TcpConnection connection;

private:
  std::mutex writeMutex_;
};

using PeerPtr = std::shared_ptr<Peer>;

/**
 * Set of connected peers shared by the accept loop, the dialers,
 * the per-peer readers and the miner.
 */
class PeerList : public Module {
public:
  PeerList();
  ~PeerList() override = default;

  // False once shutdownAll() has run
  bool add(const PeerPtr &peer);

  // Drop the peer and shut its socket down
  void remove(const PeerPtr &peer);

  size_t size() const;
  std::vector<network::IpEndpoint> endpoints() const;

  /**
   * Send line to every peer except the one at exclude.
   * Peers whose send fails are removed.
   * @return number of peers the line reached
   */
  size_t broadcast(const std::string &line,
                   const network::IpEndpoint *exclude = nullptr);

  // Shut every peer down and refuse further additions until open()
  void shutdownAll();
  void open();

private:
  mutable std::mutex mutex_;
  std::vector<PeerPtr> peers_;
  bool closed_{ false };
};

} // namespace mc

#endif // MINICHAIN_PEER_LIST_H
