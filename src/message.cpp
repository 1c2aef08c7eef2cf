#include "ediam/message.hpp"

#include "ediam/io.hpp"

#include <cstring>

namespace ediam {

std::vector<uint8_t> Message::serialize() const {
  Header hdr = header;
  hdr.set_message_length(static_cast<uint32_t>(payload_.size()));

  std::vector<uint8_t> out(kHeaderLength + payload_.size());
  hdr.encode(out.data());
  if (!payload_.empty()) {
    std::memcpy(out.data() + kHeaderLength, payload_.data(), payload_.size());
  }
  return out;
}

std::shared_ptr<Message> Message::make_answer() const {
  Header hdr = header;
  hdr.set_request(false);
  hdr.set_message_length(0);
  return std::make_shared<Message>(hdr, std::vector<uint8_t>(), dictionary_);
}

std::string Message::to_string() const {
  return header.to_string() + " payload=" + std::to_string(payload_.size()) + "B";
}

expected<MessagePtr, ErrorCode> read_message(Reader& reader, const DictionaryPtr& dictionary,
                                             MessagePtr* partial) {
  auto hdr = Header::read_from(reader);
  if (!hdr.has_value()) {
    return expected<MessagePtr, ErrorCode>::error(hdr.get_error());
  }

  const Header& header = hdr.value();
  if (header.message_length < kHeaderLength) {
    if (partial != nullptr) {
      *partial = std::make_shared<Message>(header, std::vector<uint8_t>(), dictionary);
    }
    return expected<MessagePtr, ErrorCode>::error(ErrorCode::kInvalidLength);
  }

  std::vector<uint8_t> payload(header.payload_length());
  if (!payload.empty()) {
    auto n = read_full(reader, payload.data(), payload.size());
    if (!n.has_value()) {
      if (partial != nullptr) {
        *partial = std::make_shared<Message>(header, std::vector<uint8_t>(), dictionary);
      }
      // The header already arrived, so any end of stream is mid-message.
      ErrorCode err = n.get_error() == ErrorCode::kEndOfStream ? ErrorCode::kUnexpectedEof
                                                               : n.get_error();
      return expected<MessagePtr, ErrorCode>::error(err);
    }
  }

  return expected<MessagePtr, ErrorCode>::success(
      std::make_shared<Message>(header, std::move(payload), dictionary));
}

}  // namespace ediam
