#include "mux/frame.hpp"

namespace kuberde::mux {

std::string to_string(FrameType type) {
  switch (type) {
    case FrameType::Data:
      return "Data";
    case FrameType::WindowUpdate:
      return "WindowUpdate";
    case FrameType::Ping:
      return "Ping";
    case FrameType::GoAway:
      return "GoAway";
  }
  return "Unknown";
}

void encode_header(const FrameHeader& header, uint8_t* out) {
  out[0] = header.version;
  out[1] = static_cast<uint8_t>(header.type);
  out[2] = static_cast<uint8_t>(header.flags >> 8);
  out[3] = static_cast<uint8_t>(header.flags);
  out[4] = static_cast<uint8_t>(header.stream_id >> 24);
  out[5] = static_cast<uint8_t>(header.stream_id >> 16);
  out[6] = static_cast<uint8_t>(header.stream_id >> 8);
  out[7] = static_cast<uint8_t>(header.stream_id);
  out[8] = static_cast<uint8_t>(header.length >> 24);
  out[9] = static_cast<uint8_t>(header.length >> 16);
  out[10] = static_cast<uint8_t>(header.length >> 8);
  out[11] = static_cast<uint8_t>(header.length);
}

std::string encode_frame(const FrameHeader& header, const std::string& payload) {
  std::string out(kHeaderSize, '\0');
  encode_header(header, reinterpret_cast<uint8_t*>(&out[0]));
  if (header.type == FrameType::Data) {
    out += payload;
  }
  return out;
}

Result<FrameHeader> decode_header(const uint8_t* in) {
  FrameHeader header;
  header.version = in[0];
  if (header.version != kProtocolVersion) {
    return Result<FrameHeader>::failure(ErrorCode::InvalidArgument, "unsupported mux version " + std::to_string(header.version));
  }
  if (in[1] > static_cast<uint8_t>(FrameType::GoAway)) {
    return Result<FrameHeader>::failure(ErrorCode::InvalidArgument, "unknown frame type " + std::to_string(in[1]));
  }
  header.type = static_cast<FrameType>(in[1]);
  header.flags = static_cast<uint16_t>((in[2] << 8) | in[3]);
  header.stream_id = (uint32_t(in[4]) << 24) | (uint32_t(in[5]) << 16) | (uint32_t(in[6]) << 8) | uint32_t(in[7]);
  header.length = (uint32_t(in[8]) << 24) | (uint32_t(in[9]) << 16) | (uint32_t(in[10]) << 8) | uint32_t(in[11]);
  return Result<FrameHeader>::success(header);
}

}  // namespace kuberde::mux
