#include "ediam/header.hpp"

#include "ediam/io.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace ediam {

namespace {

struct CommandEntry {
  uint32_t code;
  const char* name;
  const char* abbrev;
};

constexpr CommandEntry kCommandTable[] = {
    {274, "Abort-Session", "AS"},
    {271, "Accounting", "AC"},
    {257, "Capabilities-Exchange", "CE"},
    {280, "Device-Watchdog", "DW"},
    {282, "Disconnect-Peer", "DP"},
    {258, "Re-Auth", "RA"},
    {275, "Session-Termination", "ST"},
};

inline uint32_t load_u24(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) |
         static_cast<uint32_t>(p[2]);
}

inline uint32_t load_u32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void store_u24(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>(v & 0xFF);
}

inline void store_u32(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[3] = static_cast<uint8_t>(v & 0xFF);
}

}  // namespace

expected<Header, ErrorCode> Header::decode(const uint8_t* data, size_t len) {
  if (data == nullptr || len < kHeaderLength) {
    return expected<Header, ErrorCode>::error(ErrorCode::kInvalidLength);
  }
  if (data[0] != kVersion) {
    return expected<Header, ErrorCode>::error(ErrorCode::kInvalidVersion);
  }

  Header hdr;
  hdr.version = data[0];
  hdr.message_length = load_u24(data + 1);
  hdr.command_flags = data[4];
  hdr.command_code = load_u24(data + 5);
  hdr.application_id = load_u32(data + 8);
  hdr.hop_by_hop_id = load_u32(data + 12);
  hdr.end_to_end_id = load_u32(data + 16);
  return expected<Header, ErrorCode>::success(hdr);
}

expected<Header, ErrorCode> Header::read_from(Reader& reader) {
  uint8_t raw[kHeaderLength];
  auto n = read_full(reader, raw, sizeof(raw));
  if (!n.has_value()) {
    return expected<Header, ErrorCode>::error(n.get_error());
  }
  return decode(raw, sizeof(raw));
}

void Header::encode(uint8_t* out) const {
  out[0] = version;
  store_u24(out + 1, message_length & kMaxUint24);
  out[4] = command_flags;
  store_u24(out + 5, command_code & kMaxUint24);
  store_u32(out + 8, application_id);
  store_u32(out + 12, hop_by_hop_id);
  store_u32(out + 16, end_to_end_id);
}

std::array<uint8_t, kHeaderLength> Header::encode() const {
  std::array<uint8_t, kHeaderLength> out{};
  encode(out.data());
  return out;
}

Command Header::command_name() const {
  for (const auto& entry : kCommandTable) {
    if (entry.code == command_code) {
      if (is_request()) {
        return Command{std::string(entry.name) + "-Request", std::string(entry.abbrev) + "R"};
      }
      return Command{std::string(entry.name) + "-Answer", std::string(entry.abbrev) + "A"};
    }
  }
  return Command{"Unknown", "?"};
}

std::string Header::to_string() const {
  Command cmd = command_name();
  char buf[320];
  int len = snprintf(buf, sizeof(buf),
                     "%s (%s) Header{Code=%" PRIu32 ",Version=%u,MessageLength=%" PRIu32
                     ",CommandFlags={r=%s,p=%s,e=%s,t=%s},ApplicationId=%" PRIu32
                     ",HopByHopId=%#" PRIx32 ",EndToEndId=%#" PRIx32 "}",
                     cmd.name.c_str(), cmd.abbrev.c_str(), command_code,
                     static_cast<unsigned>(version), message_length,
                     is_request() ? "true" : "false", is_proxiable() ? "true" : "false",
                     is_error() ? "true" : "false", is_retransmitted() ? "true" : "false",
                     application_id, hop_by_hop_id, end_to_end_id);
  if (len <= 0) {
    return {};
  }
  return std::string(buf, std::min(static_cast<size_t>(len), sizeof(buf) - 1));
}

bool Header::operator==(const Header& other) const {
  return version == other.version && message_length == other.message_length &&
         command_flags == other.command_flags && command_code == other.command_code &&
         application_id == other.application_id && hop_by_hop_id == other.hop_by_hop_id &&
         end_to_end_id == other.end_to_end_id;
}

}  // namespace ediam
