#ifndef EDIAM_CONNECTION_HPP_
#define EDIAM_CONNECTION_HPP_

#include "dictionary.hpp"
#include "handler.hpp"
#include "io.hpp"
#include "stats.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ediam {

enum class ConnectionState : uint8_t {
  kAccepted,     // transport accepted, nothing read yet
  kHandshaking,  // TLS handshake in progress
  kServing,      // read / dispatch loop
  kClosed        // transport closed
};

const char* state_name(ConnectionState state);

struct ConnectionOptions {
  HandlerPtr handler;            // null: a fresh ServeMux
  DictionaryPtr dictionary;      // null: Dictionary::base()
  std::chrono::milliseconds read_timeout{0};   // zero: no deadline
  std::chrono::milliseconds write_timeout{0};  // zero: no deadline
  std::shared_ptr<ServerStats> stats;          // null: private counters
};

// ============================================================================
// Connection (one accepted peer: handshake, read loop, write path)
// ============================================================================

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(TransportPtr transport, ConnectionOptions options);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Runs the connection on the calling thread until the peer goes away, a
  // read fails or a handler throws. The transport is closed on return.
  // The object must be owned by a shared_ptr.
  void serve();

  // Buffered write and flush under the write lock. Never retried, never
  // closes the connection.
  expected<size_t, ErrorCode> write(const uint8_t* data, size_t len);

  // Shuts the transport down; a blocked read in serve() returns.
  void close();

  // First call interposes a pipe between the transport and the message
  // reader and starts a copier thread. The copier starts reading once the
  // connection is serving (after any TLS handshake). The event fires once
  // its source reaches end of stream or fails.
  const Event& close_notify();

  bool client_gone() const { return client_gone_.load(std::memory_order_acquire); }

  uint64_t get_id() const { return id_; }

  ConnectionState get_state() const { return state_.load(std::memory_order_acquire); }

  std::string local_address() const { return local_address_; }
  std::string remote_address() const { return remote_address_; }

  // Set once after a successful handshake.
  optional<TlsState> tls_state() const;

  const HandlerPtr& handler() const { return options_.handler; }
  const DictionaryPtr& dictionary() const { return options_.dictionary; }

 private:
  void transition_to_state(ConnectionState state);
  void handle_read_error(const ConnPtr& conn, const MessagePtr& partial, ErrorCode err);
  void copy_loop(Reader* source);
  void notify_client_gone();
  void finish();

  uint64_t id_;
  TransportPtr transport_;
  ConnectionOptions options_;
  std::string local_address_;
  std::string remote_address_;
  std::atomic<ConnectionState> state_{ConnectionState::kAccepted};
  Event serving_;  // set on reaching kServing, or on teardown

  // Read side: transport (or pipe) -> live_reader_ -> reader_
  LiveSwitchReader live_reader_;
  BufferedReader reader_;

  // Write side, guarded by write_mutex_
  std::mutex write_mutex_;
  BufferedWriter writer_;

  // Guards shutdown/close of the transport
  std::mutex close_mutex_;
  bool transport_closed_ = false;

  // Close notification, also guards tls_state_
  mutable std::mutex notify_mutex_;
  bool notify_armed_ = false;
  std::unique_ptr<Pipe> pipe_;
  std::thread copier_;
  Event close_event_;
  std::atomic<bool> client_gone_{false};

  optional<TlsState> tls_state_;
  std::atomic<bool> finished_{false};
};

using ConnectionPtr = std::shared_ptr<Connection>;

// ============================================================================
// Response (the Conn handed to handlers)
// ============================================================================

class Response final : public Conn, public CloseNotifier {
 public:
  explicit Response(ConnectionPtr conn) : conn_(std::move(conn)) {}

  expected<size_t, ErrorCode> write(const uint8_t* data, size_t len) override {
    return conn_->write(data, len);
  }

  void close() override { conn_->close(); }

  std::string local_address() const override { return conn_->local_address(); }
  std::string remote_address() const override { return conn_->remote_address(); }

  optional<TlsState> tls() const override { return conn_->tls_state(); }

  std::any context() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
  }

  void set_context(std::any value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    context_ = std::move(value);
  }

  const Event& close_notify() override { return conn_->close_notify(); }

  const ConnectionPtr& connection() const { return conn_; }

 private:
  ConnectionPtr conn_;
  mutable std::mutex mutex_;  // guards context_
  std::any context_;
};

}  // namespace ediam

#endif  // EDIAM_CONNECTION_HPP_
