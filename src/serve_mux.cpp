#include "ediam/serve_mux.hpp"

#include "ediam/log.hpp"

#include <algorithm>
#include <mutex>

namespace ediam {

std::string dispatch_key(const Message& msg) {
  const DictionaryPtr& dict = msg.dictionary() ? msg.dictionary() : Dictionary::base();
  auto cmd = dict->find_command(msg.header.application_id, msg.header.command_code);
  if (!cmd.has_value()) {
    return ServeMux::kCatchAll;
  }
  return cmd.value().short_name + (msg.header.is_request() ? "R" : "A");
}

ServeMux::ServeMux(DuplicatePolicy policy)
    : policy_(policy), reports_(std::make_shared<Mailbox<ErrorReport>>()) {}

expected<void, ErrorCode> ServeMux::handle(const std::string& cmd, HandlerPtr handler) {
  if (!handler) {
    EDIAM_LOG_ERROR("Refusing nil handler for " + cmd);
    return expected<void, ErrorCode>::error(ErrorCode::kNullHandler);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = handlers_.find(cmd);
  if (it != handlers_.end()) {
    if (policy_ == DuplicatePolicy::kReject) {
      return expected<void, ErrorCode>::error(ErrorCode::kDuplicateHandler);
    }
    it->second = std::move(handler);
    return expected<void, ErrorCode>::success();
  }
  handlers_.emplace(cmd, std::move(handler));
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> ServeMux::handle_func(const std::string& cmd, HandlerFunc::Func fn) {
  return handle(cmd, make_handler(std::move(fn)));
}

bool ServeMux::remove(const std::string& cmd) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return handlers_.erase(cmd) > 0;
}

bool ServeMux::has_handler(const std::string& cmd) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return handlers_.find(cmd) != handlers_.end();
}

std::vector<std::string> ServeMux::registered_commands() const {
  std::vector<std::string> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
      out.push_back(entry.first);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t ServeMux::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return handlers_.size();
}

HandlerPtr ServeMux::find(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = handlers_.find(key);
  return it == handlers_.end() ? nullptr : it->second;
}

void ServeMux::serve_message(const ConnPtr& conn, const MessagePtr& msg) {
  std::string key = dispatch_key(*msg);
  HandlerPtr handler = find(key);
  if (!handler) {
    EDIAM_LOG_DEBUG("No handler for " + key + " from " + (conn ? conn->remote_address() : ""));
    report_error(ErrorReport{conn, msg, ErrorCode::kUnhandledMessage});
    return;
  }
  handler->serve_message(conn, msg);
}

void ServeMux::report_error(const ErrorReport& report) {
  if (!reports_->try_send(report)) {
    EDIAM_LOG_DEBUG(std::string("Dropped error report: ") + report.what());
  }
}

MailboxReceiver<ErrorReport> ServeMux::error_reports() const {
  return MailboxReceiver<ErrorReport>(reports_);
}

}  // namespace ediam
