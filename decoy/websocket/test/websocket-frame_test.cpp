#include "decoy/websocket-frame.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

namespace {

constexpr MaskingKey kMask{0x37, 0xfa, 0x21, 0x3d};

std::string Bytes(std::initializer_list<int> bytes) {
  std::string ret;
  for (int byte : bytes) {
    ret.push_back(static_cast<char>(byte));
  }
  return ret;
}

}  // namespace

TEST(WebSocketFrame, UnmaskedSingleFrameText) {
  std::string out;
  AppendFrame(out, Opcode::Text, "Hello");
  EXPECT_EQ(out, Bytes({0x81, 0x05, 'H', 'e', 'l', 'l', 'o'}));
}

TEST(WebSocketFrame, MaskedSingleFrameText) {
  std::string out;
  AppendFrame(out, Opcode::Text, "Hello", true, &kMask);
  EXPECT_EQ(out, Bytes({0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58}));
}

TEST(WebSocketFrame, ExtendedPayloadLengths) {
  std::string out;
  AppendFrame(out, Opcode::Binary, std::string(256, 'x'));
  ASSERT_EQ(out.size(), 4U + 256U);
  EXPECT_EQ(out.substr(0, 4), Bytes({0x82, 0x7E, 0x01, 0x00}));

  out.clear();
  AppendFrame(out, Opcode::Binary, std::string(65536, 'y'));
  ASSERT_EQ(out.size(), 10U + 65536U);
  EXPECT_EQ(out.substr(0, 10), Bytes({0x82, 0x7F, 0, 0, 0, 0, 0, 0x01, 0, 0}));
}

TEST(WebSocketFrame, ClosePayload) {
  std::string out;
  AppendCloseFrame(out, CloseCode::GoingAway, "bye");
  EXPECT_EQ(out, Bytes({0x88, 0x05, 0x03, 0xE9, 'b', 'y', 'e'}));

  const auto closePayload = ParseClosePayload(std::string_view(out).substr(2));
  EXPECT_EQ(closePayload.code, CloseCode::GoingAway);
  EXPECT_EQ(closePayload.reason, "bye");

  EXPECT_EQ(ParseClosePayload("").code, CloseCode::NoStatusReceived);
  EXPECT_EQ(ParseClosePayload("x").code, CloseCode::ProtocolError);

  out.clear();
  AppendCloseFrame(out, CloseCode::NoStatusReceived);
  EXPECT_EQ(out, Bytes({0x88, 0x00}));
}

TEST(WebSocketFrame, CloseReasonIsTruncated) {
  std::string out;
  AppendCloseFrame(out, CloseCode::Normal, std::string(200, 'r'));
  ASSERT_EQ(out.size(), 2U + kMaxControlFramePayload);
}

TEST(FrameDecoder, DecodesMaskedClientFrame) {
  FrameDecoder decoder;
  decoder.feed(Bytes({0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58}));
  auto message = decoder.next();
  ASSERT_TRUE(message);
  EXPECT_EQ(*message, Message::Text("Hello"));
  EXPECT_FALSE(decoder.next());
  EXPECT_EQ(decoder.bufferedBytes(), 0U);
}

TEST(FrameDecoder, WaitsForCompleteFrames) {
  std::string frames;
  AppendFrame(frames, Opcode::Binary, std::string(300, 'b'), true, &kMask);
  AppendFrame(frames, Opcode::Text, "next", true, &kMask);

  FrameDecoder decoder;
  std::size_t pos = 0;
  int nbMessages = 0;
  // feed byte by byte
  while (pos < frames.size()) {
    decoder.feed(std::string_view(frames).substr(pos++, 1));
    while (auto message = decoder.next()) {
      ++nbMessages;
      if (nbMessages == 1) {
        EXPECT_TRUE(message->isBinary());
        EXPECT_EQ(message->payload, std::string(300, 'b'));
      } else {
        EXPECT_EQ(*message, Message::Text("next"));
      }
    }
  }
  EXPECT_EQ(nbMessages, 2);
}

TEST(FrameDecoder, ReassemblesFragmentsAroundControlFrames) {
  std::string frames;
  AppendFrame(frames, Opcode::Text, "Hel", false, &kMask);
  AppendFrame(frames, Opcode::Ping, "p", true, &kMask);
  AppendFrame(frames, Opcode::Continuation, "lo", true, &kMask);

  FrameDecoder decoder;
  decoder.feed(frames);
  auto ping = decoder.next();
  ASSERT_TRUE(ping);
  EXPECT_EQ(ping->opcode, Opcode::Ping);
  EXPECT_EQ(ping->payload, "p");

  auto message = decoder.next();
  ASSERT_TRUE(message);
  EXPECT_EQ(*message, Message::Text("Hello"));
  EXPECT_FALSE(decoder.next());
}

TEST(FrameDecoder, ClientSideExpectsUnmaskedFrames) {
  std::string frames;
  AppendFrame(frames, Opcode::Text, "from server");
  FrameDecoder decoder(false);
  decoder.feed(frames);
  auto message = decoder.next();
  ASSERT_TRUE(message);
  EXPECT_EQ(message->payload, "from server");
}

TEST(FrameDecoder, RejectsUnmaskedClientFrame) {
  FrameDecoder decoder;
  decoder.feed(Bytes({0x81, 0x01, 'a'}));
  EXPECT_THROW((void)decoder.next(), std::invalid_argument);
}

TEST(FrameDecoder, RejectsReservedBitsAndOpcodes) {
  FrameDecoder rsv(false);
  rsv.feed(Bytes({0xC1, 0x00}));
  EXPECT_THROW((void)rsv.next(), std::invalid_argument);

  FrameDecoder reservedOpcode(false);
  reservedOpcode.feed(Bytes({0x83, 0x00}));
  EXPECT_THROW((void)reservedOpcode.next(), std::invalid_argument);
}

TEST(FrameDecoder, RejectsFragmentedControlFrame) {
  FrameDecoder decoder(false);
  decoder.feed(Bytes({0x09, 0x00}));
  EXPECT_THROW((void)decoder.next(), std::invalid_argument);
}

TEST(FrameDecoder, RejectsOrphanContinuation) {
  FrameDecoder decoder(false);
  decoder.feed(Bytes({0x80, 0x01, 'x'}));
  EXPECT_THROW((void)decoder.next(), std::invalid_argument);
}

TEST(FrameDecoder, RejectsInterleavedDataMessages) {
  std::string frames;
  AppendFrame(frames, Opcode::Text, "a", false);
  AppendFrame(frames, Opcode::Text, "b", true);
  FrameDecoder decoder(false);
  decoder.feed(frames);
  EXPECT_THROW((void)decoder.next(), std::invalid_argument);
}

TEST(FrameDecoder, EnforcesMaxMessageSize) {
  std::string frames;
  AppendFrame(frames, Opcode::Binary, "12345", false);
  AppendFrame(frames, Opcode::Continuation, "67890", true);
  FrameDecoder decoder(false, 8);
  decoder.feed(frames);
  EXPECT_THROW((void)decoder.next(), std::invalid_argument);
}

TEST(WebSocketFrame, MaskIsItsOwnInverse) {
  std::string data("masked payload");
  ApplyMask(data.data(), data.size(), kMask);
  EXPECT_NE(data, "masked payload");
  ApplyMask(data.data(), data.size(), kMask);
  EXPECT_EQ(data, "masked payload");
}

}  // namespace decoy::websocket
