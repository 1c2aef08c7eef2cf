#ifndef EDIAM_SERVE_MUX_HPP_
#define EDIAM_SERVE_MUX_HPP_

#include "handler.hpp"
#include "sync.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ediam {

// What handle() does when the key is already registered.
enum class DuplicatePolicy : uint8_t {
  kReplace = 0,  // overwrite the previous handler
  kReject = 1    // keep the previous handler, fail with kDuplicateHandler
};

// ============================================================================
// ServeMux (command multiplexer)
// ============================================================================

/**
 * @brief Routes messages to handlers by dictionary short name.
 *
 * The key is the command's short name followed by "R" for requests or "A"
 * for answers, e.g. "CER" or "CCA". Messages the dictionary cannot resolve
 * go to the catch-all key "ALL". A message with no handler produces an
 * ErrorReport with kUnhandledMessage on the mux's report mailbox.
 *
 * Registration takes an exclusive lock; dispatch takes a shared lock only
 * for the lookup and runs the handler outside of it.
 */
class ServeMux final : public Handler, public ErrorReporter {
 public:
  static constexpr const char* kCatchAll = "ALL";

  explicit ServeMux(DuplicatePolicy policy = DuplicatePolicy::kReplace);

  // kNullHandler leaves the table untouched.
  expected<void, ErrorCode> handle(const std::string& cmd, HandlerPtr handler);
  expected<void, ErrorCode> handle_func(const std::string& cmd, HandlerFunc::Func fn);

  bool remove(const std::string& cmd);
  bool has_handler(const std::string& cmd) const;
  std::vector<std::string> registered_commands() const;
  size_t size() const;

  DuplicatePolicy duplicate_policy() const { return policy_; }

  void serve_message(const ConnPtr& conn, const MessagePtr& msg) override;

  void report_error(const ErrorReport& report) override;
  MailboxReceiver<ErrorReport> error_reports() const override;

  // Reports lost because the mailbox was full.
  uint64_t dropped_reports() const { return reports_->dropped(); }

 private:
  HandlerPtr find(const std::string& key) const;

  DuplicatePolicy policy_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, HandlerPtr> handlers_;
  std::shared_ptr<Mailbox<ErrorReport>> reports_;
};

using ServeMuxPtr = std::shared_ptr<ServeMux>;

inline ServeMuxPtr make_serve_mux(DuplicatePolicy policy = DuplicatePolicy::kReplace) {
  return std::make_shared<ServeMux>(policy);
}

// Dispatch key for a message: short name + "R"/"A", or "ALL" when the
// dictionary has no entry.
std::string dispatch_key(const Message& msg);

}  // namespace ediam

#endif  // EDIAM_SERVE_MUX_HPP_
