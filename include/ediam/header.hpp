#ifndef EDIAM_HEADER_HPP_
#define EDIAM_HEADER_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>

namespace ediam {

class Reader;

// ============================================================================
// Wire constants
// ============================================================================

static constexpr uint8_t kVersion = 1;
static constexpr size_t kHeaderLength = 20;
static constexpr uint16_t kDefaultPort = 3868;
static constexpr uint32_t kMaxUint24 = 0xFFFFFF;

// Command flags
static constexpr uint8_t kRequestFlag = 0x80;
static constexpr uint8_t kProxiableFlag = 0x40;
static constexpr uint8_t kErrorFlag = 0x20;
static constexpr uint8_t kRetransmittedFlag = 0x10;

// Display name of a command, e.g. {"Capabilities-Exchange-Request", "CER"}.
struct Command {
  std::string name;
  std::string abbrev;

  bool operator==(const Command& other) const {
    return name == other.name && abbrev == other.abbrev;
  }
};

// ============================================================================
// Header (fixed 20-byte message header, big-endian)
// ============================================================================
//
//  0       1               4       5               8
//  +-------+---------------+-------+---------------+
//  |version| message length| flags | command code  |
//  +-------+---------------+-------+---------------+
//  |                application id                 |  8..11
//  |                hop-by-hop id                  | 12..15
//  |                end-to-end id                  | 16..19
//
struct Header {
  uint8_t version = kVersion;
  uint32_t message_length = kHeaderLength;  // 24 bits on the wire
  uint8_t command_flags = 0;
  uint32_t command_code = 0;                // 24 bits on the wire
  uint32_t application_id = 0;
  uint32_t hop_by_hop_id = 0;
  uint32_t end_to_end_id = 0;

  // Decode from a buffer holding at least kHeaderLength bytes.
  // Returns kInvalidLength on a short buffer, kInvalidVersion if version != 1.
  static expected<Header, ErrorCode> decode(const uint8_t* data, size_t len);

  // Read exactly kHeaderLength bytes and decode them.
  static expected<Header, ErrorCode> read_from(Reader& reader);

  // Writes kHeaderLength bytes. Fields are written as they are; callers set
  // the length with set_message_length() first.
  void encode(uint8_t* out) const;
  std::array<uint8_t, kHeaderLength> encode() const;

  void set_message_length(uint32_t payload_length) {
    message_length = static_cast<uint32_t>(kHeaderLength) + payload_length;
  }

  uint32_t payload_length() const {
    return message_length > kHeaderLength ? message_length - static_cast<uint32_t>(kHeaderLength) : 0;
  }

  bool is_request() const { return (command_flags & kRequestFlag) != 0; }
  bool is_proxiable() const { return (command_flags & kProxiableFlag) != 0; }
  bool is_error() const { return (command_flags & kErrorFlag) != 0; }
  bool is_retransmitted() const { return (command_flags & kRetransmittedFlag) != 0; }

  void set_request(bool request) {
    command_flags = request ? static_cast<uint8_t>(command_flags | kRequestFlag)
                            : static_cast<uint8_t>(command_flags & ~kRequestFlag);
  }

  // Human readable command name from the well-known command table.
  // Unknown codes yield {"Unknown", "?"} whatever the flags.
  Command command_name() const;

  std::string to_string() const;

  bool operator==(const Header& other) const;
  bool operator!=(const Header& other) const { return !(*this == other); }
};

}  // namespace ediam

#endif  // EDIAM_HEADER_HPP_
