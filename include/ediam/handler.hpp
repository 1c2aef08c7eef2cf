#ifndef EDIAM_HANDLER_HPP_
#define EDIAM_HANDLER_HPP_

#include "message.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ediam {

// ============================================================================
// Conn (handler-facing connection handle)
// ============================================================================

class Conn {
 public:
  virtual ~Conn() = default;

  // Writes raw bytes under the connection's write lock. Errors are returned
  // to the caller; the connection stays open.
  virtual expected<size_t, ErrorCode> write(const uint8_t* data, size_t len) = 0;

  expected<size_t, ErrorCode> write_message(const Message& msg) {
    std::vector<uint8_t> wire = msg.serialize();
    return write(wire.data(), wire.size());
  }

  virtual void close() = 0;

  virtual std::string local_address() const = 0;
  virtual std::string remote_address() const = 0;

  // Negotiated TLS parameters, empty for plain TCP.
  virtual optional<TlsState> tls() const = 0;

  // Per-connection application value. Empty until set.
  virtual std::any context() const = 0;
  virtual void set_context(std::any value) = 0;
};

using ConnPtr = std::shared_ptr<Conn>;

// Optional capability of a Conn: a one-shot signal fired when the peer goes
// away while the handler is still running.
class CloseNotifier {
 public:
  virtual ~CloseNotifier() = default;

  virtual const Event& close_notify() = 0;
};

// ============================================================================
// Handler
// ============================================================================

class Handler {
 public:
  virtual ~Handler() = default;

  // Called once per inbound message, on the connection's serving thread.
  // Returning means done with this message.
  virtual void serve_message(const ConnPtr& conn, const MessagePtr& msg) = 0;
};

using HandlerPtr = std::shared_ptr<Handler>;

// Adapts a plain function to the Handler interface.
class HandlerFunc final : public Handler {
 public:
  using Func = std::function<void(const ConnPtr&, const MessagePtr&)>;

  explicit HandlerFunc(Func fn) : fn_(std::move(fn)) {}

  void serve_message(const ConnPtr& conn, const MessagePtr& msg) override { fn_(conn, msg); }

 private:
  Func fn_;
};

inline HandlerPtr make_handler(HandlerFunc::Func fn) {
  if (!fn) {
    return nullptr;
  }
  return std::make_shared<HandlerFunc>(std::move(fn));
}

// ============================================================================
// Error reporting
// ============================================================================

// A failure attributable to one peer and, when known, one inbound message.
struct ErrorReport {
  ConnPtr conn;
  MessagePtr message;  // may be null
  ErrorCode error = ErrorCode::kOk;

  const char* what() const { return error_string(error); }
};

// Optional capability of a Handler, detected at serve time.
class ErrorReporter {
 public:
  virtual ~ErrorReporter() = default;

  // Never blocks.
  virtual void report_error(const ErrorReport& report) = 0;

  virtual MailboxReceiver<ErrorReport> error_reports() const = 0;
};

}  // namespace ediam

#endif  // EDIAM_HANDLER_HPP_
