#include <gtest/gtest.h>

#include "mux/frame.hpp"

using namespace kuberde;
using namespace kuberde::mux;

namespace {

const uint8_t* bytes(const std::string& s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

}  // namespace

// --- FrameTest ---

TEST(FrameTest, HeaderLayoutIsBigEndian) {
  FrameHeader header{kProtocolVersion, FrameType::WindowUpdate, kFlagSyn | kFlagFin, 0x01020304, 0x0A0B0C0D};
  auto encoded = encode_frame(header);
  ASSERT_EQ(encoded.size(), kHeaderSize);
  EXPECT_EQ(encoded, std::string("\x00\x01\x00\x05\x01\x02\x03\x04\x0A\x0B\x0C\x0D", 12));
}

TEST(FrameTest, DataFrameCarriesPayload) {
  FrameHeader header{kProtocolVersion, FrameType::Data, 0, 3, 5};
  auto encoded = encode_frame(header, "hello");
  ASSERT_EQ(encoded.size(), kHeaderSize + 5);
  EXPECT_EQ(encoded.substr(kHeaderSize), "hello");

  auto decoded = decode_header(bytes(encoded));
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.value->type, FrameType::Data);
  EXPECT_EQ(decoded.value->stream_id, 3u);
  EXPECT_EQ(decoded.value->length, 5u);
  EXPECT_FALSE(decoded.value->has(kFlagSyn));
}

TEST(FrameTest, ControlFramesDropPayload) {
  FrameHeader ping{kProtocolVersion, FrameType::Ping, kFlagSyn, 0, 42};
  EXPECT_EQ(encode_frame(ping, "ignored").size(), kHeaderSize);

  auto decoded = decode_header(bytes(encode_frame(ping)));
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.value->type, FrameType::Ping);
  EXPECT_TRUE(decoded.value->has(kFlagSyn));
  EXPECT_FALSE(decoded.value->has(kFlagAck));
  EXPECT_EQ(decoded.value->length, 42u);
}

TEST(FrameTest, RejectsUnknownVersionAndType) {
  std::string bad_version("\x01\x00\x00\x00\x00\x00\x00\x01\x00\x00\x00\x00", 12);
  EXPECT_EQ(decode_header(bytes(bad_version)).code(), ErrorCode::InvalidArgument);

  std::string bad_type("\x00\x04\x00\x00\x00\x00\x00\x01\x00\x00\x00\x00", 12);
  EXPECT_EQ(decode_header(bytes(bad_type)).code(), ErrorCode::InvalidArgument);
}

TEST(FrameTest, TypeNames) {
  EXPECT_EQ(to_string(FrameType::Data), "Data");
  EXPECT_EQ(to_string(FrameType::GoAway), "GoAway");
}
