#ifndef EDIAM_MESSAGE_HPP_
#define EDIAM_MESSAGE_HPP_

#include "dictionary.hpp"
#include "header.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

namespace ediam {

class Reader;

// ============================================================================
// Message (header + opaque AVP payload)
// ============================================================================

class Message {
 public:
  Message(const Header& header, std::vector<uint8_t> payload, DictionaryPtr dictionary)
      : header(header), payload_(std::move(payload)), dictionary_(std::move(dictionary)) {}

  Header header;

  const std::vector<uint8_t>& payload() const { return payload_; }
  void set_payload(std::vector<uint8_t> payload) { payload_ = std::move(payload); }

  // Dictionary the message was decoded against.
  const DictionaryPtr& dictionary() const { return dictionary_; }

  // Header followed by the payload. The length field is recomputed from
  // the payload size.
  std::vector<uint8_t> serialize() const;

  // Answer skeleton: same command, application and ids, Request bit
  // cleared, empty payload.
  std::shared_ptr<Message> make_answer() const;

  std::string to_string() const;

 private:
  std::vector<uint8_t> payload_;
  DictionaryPtr dictionary_;
};

using MessagePtr = std::shared_ptr<Message>;

// Reads one message. When the header decoded but the body could not be
// read, *partial (if given) receives the message identified by that header
// with an empty payload.
expected<MessagePtr, ErrorCode> read_message(Reader& reader, const DictionaryPtr& dictionary,
                                             MessagePtr* partial = nullptr);

}  // namespace ediam

#endif  // EDIAM_MESSAGE_HPP_
