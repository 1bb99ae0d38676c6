#include "BlockChain.h"
#include "BlockCodec.h"
#include "Message.h"
#include <gtest/gtest.h>

using namespace mc;

TEST(MessageTest, ParsesBlockWithPayload) {
  auto message = Message::parse("BLOCK:{\"index\":3}");
  EXPECT_EQ(message.type, Message::Type::BLOCK);
  EXPECT_EQ(message.payload, "{\"index\":3}");
}

TEST(MessageTest, ParsesEmptyBlockPayload) {
  auto message = Message::parse("BLOCK:");
  EXPECT_EQ(message.type, Message::Type::BLOCK);
  EXPECT_TRUE(message.payload.empty());
}

TEST(MessageTest, ParsesGetChainByPrefix) {
  EXPECT_EQ(Message::parse("GET_CHAIN").type, Message::Type::GET_CHAIN);
  EXPECT_EQ(Message::parse("GET_CHAIN please").type, Message::Type::GET_CHAIN);
}

TEST(MessageTest, ParsesSyncComplete) {
  auto message = Message::parse("CHAIN_SYNC_COMPLETE");
  EXPECT_EQ(message.type, Message::Type::CHAIN_SYNC_COMPLETE);
  EXPECT_TRUE(message.payload.empty());
}

TEST(MessageTest, AnythingElseIsUnknown) {
  auto message = Message::parse("HELLO there");
  EXPECT_EQ(message.type, Message::Type::UNKNOWN);
  EXPECT_EQ(message.payload, "HELLO there");

  EXPECT_EQ(Message::parse("block:{}").type, Message::Type::UNKNOWN);
  EXPECT_EQ(Message::parse("BLOCK").type, Message::Type::UNKNOWN);
}

TEST(MessageTest, BlockLineCarriesEncodedBlock) {
  Block genesis = BlockChain::createGenesis("Hello, Chain!",
                                            { { "Alice", "Bob", 100 } },
                                            1672531200);
  std::string line = Message::blockLine(genesis);

  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  EXPECT_EQ(line.find('\n'), line.size() - 1);

  auto message = Message::parse(line.substr(0, line.size() - 1));
  ASSERT_EQ(message.type, Message::Type::BLOCK);
  auto decoded = BlockCodec::decode(message.payload);
  ASSERT_TRUE(decoded.isOk()) << decoded.error().message;
  EXPECT_EQ(decoded.value(), genesis);
}

TEST(MessageTest, ControlLines) {
  EXPECT_EQ(Message::getChainLine(), "GET_CHAIN\n");
  EXPECT_EQ(Message::syncCompleteLine(), "CHAIN_SYNC_COMPLETE\n");
}

TEST(MessageTest, TypeNames) {
  EXPECT_STREQ(Message::typeName(Message::Type::BLOCK), "BLOCK");
  EXPECT_STREQ(Message::typeName(Message::Type::GET_CHAIN), "GET_CHAIN");
  EXPECT_STREQ(Message::typeName(Message::Type::UNKNOWN), "UNKNOWN");
}
