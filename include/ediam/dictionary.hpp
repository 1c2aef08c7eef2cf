#ifndef EDIAM_DICTIONARY_HPP_
#define EDIAM_DICTIONARY_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace ediam {

static constexpr uint32_t kBaseApplicationId = 0;

// One command entry, e.g. {0, 257, "Capabilities-Exchange", "CE"}.
struct DictCommand {
  uint32_t application_id = 0;
  uint32_t code = 0;
  std::string name;
  std::string short_name;
};

// ============================================================================
// Dictionary (command schema lookup)
// ============================================================================

class Dictionary {
 public:
  virtual ~Dictionary() = default;

  // Returns kCommandNotFound when the schema has no entry.
  virtual expected<DictCommand, ErrorCode> find_command(uint32_t application_id,
                                                       uint32_t code) const = 0;

  // Shared, immutable dictionary of the base protocol commands.
  static std::shared_ptr<const Dictionary> base();
};

using DictionaryPtr = std::shared_ptr<const Dictionary>;

// ============================================================================
// StaticDictionary (in-memory command table)
// ============================================================================

/**
 * @brief Command table filled at configuration time.
 *
 * A lookup that misses for the requested application is retried against
 * the base application (id 0), which defines the commands every
 * application shares.
 */
class StaticDictionary final : public Dictionary {
 public:
  StaticDictionary() = default;

  StaticDictionary& add(uint32_t application_id, uint32_t code, std::string name,
                        std::string short_name);

  expected<DictCommand, ErrorCode> find_command(uint32_t application_id,
                                               uint32_t code) const override;

  size_t size() const { return commands_.size(); }

 private:
  std::map<std::pair<uint32_t, uint32_t>, DictCommand> commands_;
};

}  // namespace ediam

#endif  // EDIAM_DICTIONARY_HPP_
