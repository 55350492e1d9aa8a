#pragma once

#include <cstdint>
#include <string>

#include "core/types.hpp"

namespace kuberde::mux {

// yamux-compatible framing: 12-byte big-endian header
//   version(1) type(1) flags(2) stream_id(4) length(4)
// For Data frames length is the payload size; for WindowUpdate it is the window delta,
// for Ping the opaque value and for GoAway the error code.

constexpr uint8_t kProtocolVersion = 0;
constexpr size_t kHeaderSize = 12;
constexpr uint32_t kInitialWindow = 256 * 1024;
constexpr uint32_t kMaxFramePayload = 64 * 1024;

enum class FrameType : uint8_t {
  Data = 0,
  WindowUpdate = 1,
  Ping = 2,
  GoAway = 3,
};

enum FrameFlag : uint16_t {
  kFlagSyn = 0x1,
  kFlagAck = 0x2,
  kFlagFin = 0x4,
  kFlagRst = 0x8,
};

enum class GoAwayCode : uint32_t {
  Normal = 0,
  ProtocolError = 1,
  InternalError = 2,
};

struct FrameHeader {
  uint8_t version = kProtocolVersion;
  FrameType type = FrameType::Data;
  uint16_t flags = 0;
  uint32_t stream_id = 0;
  uint32_t length = 0;

  bool has(FrameFlag flag) const {
    return (flags & flag) != 0;
  }
};

std::string to_string(FrameType type);

void encode_header(const FrameHeader& header, uint8_t* out);

// Header followed by payload (payload only for Data frames)
std::string encode_frame(const FrameHeader& header, const std::string& payload = {});

// Rejects unknown versions and frame types
Result<FrameHeader> decode_header(const uint8_t* in);

}  // namespace kuberde::mux
