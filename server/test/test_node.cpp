#include "BlockCodec.h"
#include "LineFramer.h"
#include "Message.h"
#include "Node.h"
#include "TcpClient.h"
#include "TcpServer.h"
#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <thread>

using namespace mc;
using namespace mc::network;
using namespace std::chrono_literals;

namespace {

const uint64_t GENESIS_TIME = 1672531200;

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

Block minedGenesis(uint32_t difficulty) {
  Block genesis = BlockChain::createGenesis(
      "Hello, Chain!", { { "Alice", "Bob", 100 } }, GENESIS_TIME);
  ProofOfWork::mine(genesis, difficulty);
  return genesis;
}

Block minedNext(const std::string &payload, const Block &predecessor,
                uint32_t difficulty) {
  Block block = BlockChain::createNext(payload, predecessor);
  ProofOfWork::mine(block, difficulty);
  return block;
}

Node::Config loopbackConfig(uint32_t difficulty) {
  Node::Config config;
  config.endpoint = { "127.0.0.1", 0 };
  config.difficulty = difficulty;
  config.reconnectDelay = 100ms;
  return config;
}

std::unique_ptr<TcpConnection> connectTo(uint16_t port) {
  TcpClient client;
  auto connected = client.connect({ "127.0.0.1", port });
  EXPECT_TRUE(connected.isOk());
  if (!connected) {
    return nullptr;
  }
  auto released = client.release();
  EXPECT_TRUE(released.isOk());
  if (!released) {
    return nullptr;
  }
  return std::make_unique<TcpConnection>(std::move(released.value()));
}

// Reads one byte at a time so nothing past the line is consumed
std::string readLine(TcpConnection &conn,
                     std::chrono::milliseconds timeout = 5000ms) {
  EXPECT_TRUE(conn.setTimeout(timeout).isOk());
  LineFramer framer;
  std::deque<std::string> lines;
  char byte;
  while (lines.empty()) {
    auto received = conn.receive(&byte, 1);
    if (!received) {
      return "";
    }
    auto framed = framer.append(&byte, 1, [&lines](const std::string &line) {
      lines.push_back(line);
    });
    if (!framed) {
      return "";
    }
  }
  return lines.front();
}

} // namespace

// ============================================================================
// Config
// ============================================================================

TEST(NodeConfigTest, Defaults) {
  Node::Config config;
  EXPECT_EQ(config.endpoint.port, Node::DEFAULT_PORT);
  EXPECT_EQ(config.difficulty, 2u);
  EXPECT_EQ(config.reconnectDelay, 5000ms);
  EXPECT_EQ(config.maxMessageBytes, 4096u);
  EXPECT_FALSE(config.mineGenesis);
  EXPECT_TRUE(config.peers.empty());
}

TEST(NodeConfigTest, LoadsEveryField) {
  nlohmann::json jd = {
    { "host", "127.0.0.1" },
    { "port", 9100 },
    { "peers", { "10.0.0.2:9000", "localhost:9001" } },
    { "difficulty", 3 },
    { "reconnectDelayMs", 250 },
    { "maxMessageBytes", 8192 },
    { "mineGenesis", true },
    { "genesisData", "start" },
    { "comment", "ignored" },
  };

  Node::Config config;
  auto loaded = config.ltsFromJson(jd);
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(config.endpoint.address, "127.0.0.1");
  EXPECT_EQ(config.endpoint.port, 9100);
  ASSERT_EQ(config.peers.size(), 2u);
  EXPECT_EQ(config.peers[0], (IpEndpoint{ "10.0.0.2", 9000 }));
  EXPECT_EQ(config.peers[1], (IpEndpoint{ "localhost", 9001 }));
  EXPECT_EQ(config.difficulty, 3u);
  EXPECT_EQ(config.reconnectDelay, 250ms);
  EXPECT_EQ(config.maxMessageBytes, 8192u);
  EXPECT_TRUE(config.mineGenesis);
  EXPECT_EQ(config.genesisData, "start");

  Node::Config reloaded;
  ASSERT_TRUE(reloaded.ltsFromJson(config.ltsToJson()).isOk());
  EXPECT_EQ(reloaded.ltsToJson(), config.ltsToJson());
}

TEST(NodeConfigTest, MissingFieldsKeepDefaults) {
  Node::Config config;
  ASSERT_TRUE(config.ltsFromJson(nlohmann::json::object()).isOk());
  EXPECT_EQ(config.endpoint.address, Node::DEFAULT_HOST);
  EXPECT_EQ(config.difficulty, Node::DEFAULT_DIFFICULTY);
}

TEST(NodeConfigTest, RejectsWrongTypes) {
  Node::Config config;
  auto notObject = config.ltsFromJson(nlohmann::json::array());
  ASSERT_TRUE(notObject.isError());
  EXPECT_EQ(notObject.error().code, Node::E_CONFIG);

  auto badPort = config.ltsFromJson({ { "port", "80" } });
  ASSERT_TRUE(badPort.isError());
  EXPECT_NE(badPort.error().message.find("'port'"), std::string::npos);

  auto bigPort = config.ltsFromJson({ { "port", 70000 } });
  EXPECT_TRUE(bigPort.isError());

  auto badPeer = config.ltsFromJson({ { "peers", { "no-port" } } });
  ASSERT_TRUE(badPeer.isError());
  EXPECT_NE(badPeer.error().message.find("peers"), std::string::npos);

  auto badDifficulty = config.ltsFromJson({ { "difficulty", 33 } });
  EXPECT_TRUE(badDifficulty.isError());

  auto badFlag = config.ltsFromJson({ { "mineGenesis", 1 } });
  EXPECT_TRUE(badFlag.isError());

  EXPECT_TRUE(config.ltsFromJson({ { "port", -1 } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "difficulty", -2 } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "reconnectDelayMs", 1.5 } }).isError());
  EXPECT_TRUE(config.ltsFromJson({ { "maxMessageBytes", -4096 } }).isError());
}

TEST(NodeConfigTest, AcceptsSignedIntegerStorage) {
  // Built in code these are signed ints, from a file they parse unsigned
  nlohmann::json built = {
    { "port", int64_t{ 9100 } },
    { "difficulty", int64_t{ 3 } },
    { "reconnectDelayMs", int64_t{ 250 } },
    { "maxMessageBytes", int64_t{ 8192 } },
  };
  ASSERT_TRUE(built["port"].is_number_integer());
  ASSERT_FALSE(built["port"].is_number_unsigned());

  Node::Config fromCode;
  auto loaded = fromCode.ltsFromJson(built);
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;

  Node::Config fromText;
  ASSERT_TRUE(fromText.ltsFromJson(nlohmann::json::parse(built.dump())).isOk());
  EXPECT_EQ(fromText.ltsToJson(), fromCode.ltsToJson());
  EXPECT_EQ(fromCode.endpoint.port, 9100);
  EXPECT_EQ(fromCode.difficulty, 3u);
  EXPECT_EQ(fromCode.reconnectDelay, 250ms);
  EXPECT_EQ(fromCode.maxMessageBytes, 8192u);
}

// ============================================================================
// Node
// ============================================================================

TEST(NodeTest, InitOnlyWhileStopped) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  ASSERT_TRUE(node.start().isOk());
  EXPECT_NE(node.getListenPort(), 0);

  auto reinit = node.init(loopbackConfig(2));
  ASSERT_TRUE(reinit.isError());
  EXPECT_EQ(reinit.error().code, Node::E_STATE);
  node.stop();
}

TEST(NodeTest, GetChainStreamsBlocksThenCompletion) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  Block genesis = minedGenesis(1);
  Block next = minedNext("second", genesis, 1);
  ASSERT_TRUE(node.getChain().append(genesis).isOk());
  ASSERT_TRUE(node.getChain().append(next).isOk());
  ASSERT_TRUE(node.start().isOk());

  auto conn = connectTo(node.getListenPort());
  ASSERT_TRUE(conn);
  ASSERT_TRUE(conn->sendAll(Message::getChainLine()).isOk());

  EXPECT_EQ(readLine(*conn) + "\n", Message::blockLine(genesis));
  EXPECT_EQ(readLine(*conn) + "\n", Message::blockLine(next));
  EXPECT_EQ(readLine(*conn), Message::CHAIN_SYNC_COMPLETE);
  node.stop();
}

TEST(NodeTest, DialerSyncsGenesisFromPeer) {
  Node nodeA;
  ASSERT_TRUE(nodeA.init(loopbackConfig(1)).isOk());
  Block genesis = minedGenesis(1);
  EXPECT_EQ(genesis.nonce, 261u);
  ASSERT_TRUE(nodeA.getChain().append(genesis).isOk());
  ASSERT_TRUE(nodeA.start().isOk());

  Node nodeB;
  Node::Config configB = loopbackConfig(1);
  configB.peers.push_back({ "127.0.0.1", nodeA.getListenPort() });
  ASSERT_TRUE(nodeB.init(configB).isOk());
  ASSERT_TRUE(nodeB.start().isOk());

  ASSERT_TRUE(waitFor([&] { return nodeB.getChain().height() == 1; }, 5000ms));
  auto blockB = nodeB.getChain().get(0);
  ASSERT_TRUE(blockB.has_value());
  EXPECT_EQ(*blockB, genesis);
  EXPECT_EQ(nodeA.getChain().snapshot(), nodeB.getChain().snapshot());

  EXPECT_TRUE(waitFor([&] { return nodeA.getPeers().size() == 1; }, 2000ms));
  EXPECT_EQ(nodeB.getPeers().size(), 1u);

  nodeB.stop();
  nodeA.stop();
}

TEST(NodeTest, RejectsBlockWithMismatchedHash) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  Block genesis = minedGenesis(1);
  ASSERT_TRUE(node.getChain().append(genesis).isOk());
  ASSERT_TRUE(node.start().isOk());

  Block forged = minedNext("honest", genesis, 1);
  forged.data = "forged";

  auto conn = connectTo(node.getListenPort());
  ASSERT_TRUE(conn);
  ASSERT_TRUE(conn->sendAll(Message::blockLine(forged)).isOk());
  ASSERT_TRUE(conn->sendAll(Message::getChainLine()).isOk());

  // Still connected, and only genesis comes back
  EXPECT_EQ(readLine(*conn) + "\n", Message::blockLine(genesis));
  EXPECT_EQ(readLine(*conn), Message::CHAIN_SYNC_COMPLETE);
  EXPECT_EQ(node.getChain().height(), 1u);
  node.stop();
}

TEST(NodeTest, BadLinesDoNotCloseConnection) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  ASSERT_TRUE(node.start().isOk());

  auto conn = connectTo(node.getListenPort());
  ASSERT_TRUE(conn);
  ASSERT_TRUE(conn->sendAll("BLOCK:not json\n").isOk());
  ASSERT_TRUE(conn->sendAll("BLOCK:{\"hash\":\"abc\"}\n").isOk());
  ASSERT_TRUE(conn->sendAll("HELLO\r\n\n").isOk());
  ASSERT_TRUE(conn->sendAll(Message::getChainLine()).isOk());

  EXPECT_EQ(readLine(*conn), Message::CHAIN_SYNC_COMPLETE);
  EXPECT_EQ(node.getChain().height(), 0u);
  node.stop();
}

TEST(NodeTest, OversizedMessageClosesConnection) {
  Node node;
  Node::Config config = loopbackConfig(1);
  config.maxMessageBytes = 64;
  ASSERT_TRUE(node.init(config).isOk());
  ASSERT_TRUE(node.start().isOk());

  auto conn = connectTo(node.getListenPort());
  ASSERT_TRUE(conn);
  ASSERT_TRUE(waitFor([&] { return node.getPeers().size() == 1; }, 2000ms));
  ASSERT_TRUE(conn->sendAll(std::string(200, 'x')).isOk());

  EXPECT_TRUE(waitFor([&] { return node.getPeers().empty(); }, 2000ms));
  EXPECT_EQ(readLine(*conn, 2000ms), "");
  node.stop();
}

TEST(NodeTest, RelaysBlockToEveryPeerButSender) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  Block genesis = minedGenesis(1);
  ASSERT_TRUE(node.getChain().append(genesis).isOk());
  ASSERT_TRUE(node.start().isOk());

  auto p = connectTo(node.getListenPort());
  auto q = connectTo(node.getListenPort());
  auto r = connectTo(node.getListenPort());
  ASSERT_TRUE(p && q && r);
  ASSERT_TRUE(waitFor([&] { return node.getPeers().size() == 3; }, 2000ms));

  Block next = minedNext("from P", genesis, 1);
  ASSERT_TRUE(p->sendAll(Message::blockLine(next)).isOk());
  ASSERT_TRUE(p->sendAll(Message::getChainLine()).isOk());

  EXPECT_EQ(readLine(*q) + "\n", Message::blockLine(next));
  EXPECT_EQ(readLine(*r) + "\n", Message::blockLine(next));

  // P sees only the chain it asked for, starting at genesis
  EXPECT_EQ(readLine(*p) + "\n", Message::blockLine(genesis));
  EXPECT_EQ(readLine(*p) + "\n", Message::blockLine(next));
  EXPECT_EQ(readLine(*p), Message::CHAIN_SYNC_COMPLETE);
  EXPECT_EQ(node.getChain().height(), 2u);
  node.stop();
}

TEST(NodeTest, QueuesMinedBlockUntilPeerConnects) {
  Node node;
  ASSERT_TRUE(node.init(loopbackConfig(1)).isOk());
  ASSERT_TRUE(node.start().isOk());

  node.submitData("queued");
  ASSERT_TRUE(waitFor([&] { return node.getPendingCount() == 1; }, 10000ms));
  EXPECT_EQ(node.getChain().height(), 1u);

  auto conn = connectTo(node.getListenPort());
  ASSERT_TRUE(conn);
  std::string line = readLine(*conn);
  auto message = Message::parse(line);
  ASSERT_EQ(message.type, Message::Type::BLOCK);
  auto block = BlockCodec::decode(message.payload);
  ASSERT_TRUE(block.isOk());
  EXPECT_EQ(block.value().data, "queued");
  EXPECT_EQ(block.value(), *node.getChain().tip());
  EXPECT_TRUE(waitFor([&] { return node.getPendingCount() == 0; }, 2000ms));
  node.stop();
}

TEST(NodeTest, MinesGenesisOnStartWhenAsked) {
  Node node;
  Node::Config config = loopbackConfig(1);
  config.mineGenesis = true;
  config.genesisData = "first light";
  ASSERT_TRUE(node.init(config).isOk());
  ASSERT_TRUE(node.start().isOk());

  ASSERT_TRUE(waitFor([&] { return node.getChain().height() == 1; }, 10000ms));
  EXPECT_EQ(node.getChain().get(0)->data, "first light");
  node.stop();
}

TEST(NodeTest, AdoptsLongerChainFromPeer) {
  Node nodeA;
  ASSERT_TRUE(nodeA.init(loopbackConfig(1)).isOk());
  Block genesisA = minedGenesis(1);
  Block a1 = minedNext("a1", genesisA, 1);
  Block a2 = minedNext("a2", a1, 1);
  ASSERT_TRUE(nodeA.getChain().append(genesisA).isOk());
  ASSERT_TRUE(nodeA.getChain().append(a1).isOk());
  ASSERT_TRUE(nodeA.getChain().append(a2).isOk());
  ASSERT_TRUE(nodeA.start().isOk());

  Node nodeB;
  Node::Config configB = loopbackConfig(1);
  configB.peers.push_back({ "127.0.0.1", nodeA.getListenPort() });
  ASSERT_TRUE(nodeB.init(configB).isOk());
  Block genesisB =
      BlockChain::createGenesis("other", {}, GENESIS_TIME + 1);
  ProofOfWork::mine(genesisB, 1);
  ASSERT_TRUE(nodeB.getChain().append(genesisB).isOk());
  ASSERT_TRUE(nodeB.start().isOk());

  ASSERT_TRUE(waitFor([&] { return nodeB.getChain().height() == 3; }, 5000ms));
  EXPECT_EQ(nodeB.getChain().snapshot(), nodeA.getChain().snapshot());

  nodeB.stop();
  nodeA.stop();
}

TEST(NodeTest, KeepsRetryingUntilPeerAppears) {
  uint16_t port = 0;
  {
    TcpServer portFinder;
    ASSERT_TRUE(portFinder.listen({ "127.0.0.1", 0 }).isOk());
    port = portFinder.getPort();
  }

  Node nodeB;
  Node::Config configB = loopbackConfig(1);
  configB.reconnectDelay = 50ms;
  configB.peers.push_back({ "127.0.0.1", port });
  ASSERT_TRUE(nodeB.init(configB).isOk());
  ASSERT_TRUE(nodeB.start().isOk());

  // Several failed dials
  std::this_thread::sleep_for(300ms);
  EXPECT_TRUE(nodeB.getPeers().empty());

  Node nodeA;
  Node::Config configA = loopbackConfig(1);
  configA.endpoint.port = port;
  ASSERT_TRUE(nodeA.init(configA).isOk());
  Block genesis = minedGenesis(1);
  ASSERT_TRUE(nodeA.getChain().append(genesis).isOk());
  ASSERT_TRUE(nodeA.start().isOk());

  ASSERT_TRUE(waitFor([&] { return nodeB.getChain().height() == 1; }, 5000ms));
  EXPECT_EQ(*nodeB.getChain().tip(), genesis);

  nodeA.stop();
  nodeB.stop();
}

TEST(NodeTest, StopInterruptsReconnectDelay) {
  uint16_t port = 0;
  {
    TcpServer portFinder;
    ASSERT_TRUE(portFinder.listen({ "127.0.0.1", 0 }).isOk());
    port = portFinder.getPort();
  }

  Node node;
  Node::Config config = loopbackConfig(1);
  config.reconnectDelay = 60000ms;
  config.peers.push_back({ "127.0.0.1", port });
  ASSERT_TRUE(node.init(config).isOk());
  ASSERT_TRUE(node.start().isOk());
  std::this_thread::sleep_for(100ms);

  auto started = std::chrono::steady_clock::now();
  node.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
