#include "ediam/dictionary.hpp"

namespace ediam {

StaticDictionary& StaticDictionary::add(uint32_t application_id, uint32_t code,
                                        std::string name, std::string short_name) {
  DictCommand cmd;
  cmd.application_id = application_id;
  cmd.code = code;
  cmd.name = std::move(name);
  cmd.short_name = std::move(short_name);
  commands_[std::make_pair(application_id, code)] = std::move(cmd);
  return *this;
}

expected<DictCommand, ErrorCode> StaticDictionary::find_command(uint32_t application_id,
                                                               uint32_t code) const {
  auto it = commands_.find(std::make_pair(application_id, code));
  if (it == commands_.end() && application_id != kBaseApplicationId) {
    it = commands_.find(std::make_pair(kBaseApplicationId, code));
  }
  if (it == commands_.end()) {
    return expected<DictCommand, ErrorCode>::error(ErrorCode::kCommandNotFound);
  }
  return expected<DictCommand, ErrorCode>::success(it->second);
}

std::shared_ptr<const Dictionary> Dictionary::base() {
  static const std::shared_ptr<const Dictionary> instance = []() {
    auto dict = std::make_shared<StaticDictionary>();
    dict->add(0, 257, "Capabilities-Exchange", "CE")
        .add(0, 280, "Device-Watchdog", "DW")
        .add(0, 282, "Disconnect-Peer", "DP")
        .add(0, 258, "Re-Auth", "RA")
        .add(0, 275, "Session-Termination", "ST")
        .add(0, 274, "Abort-Session", "AS")
        .add(3, 271, "Accounting", "AC");
    return std::shared_ptr<const Dictionary>(std::move(dict));
  }();
  return instance;
}

}  // namespace ediam
