#include "ediam/connection.hpp"

#include "ediam/log.hpp"
#include "ediam/serve_mux.hpp"
#include "ediam/stack_trace.hpp"

#include <exception>

namespace ediam {

static std::atomic<uint64_t> g_next_conn_id{1};

const char* state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kAccepted:
      return "accepted";
    case ConnectionState::kHandshaking:
      return "handshaking";
    case ConnectionState::kServing:
      return "serving";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "unknown";
}

Connection::Connection(TransportPtr transport, ConnectionOptions options)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      local_address_(transport_->local_address()),
      remote_address_(transport_->remote_address()),
      live_reader_(transport_.get()),
      reader_(live_reader_),
      writer_(*transport_) {
  if (!options_.handler) {
    options_.handler = make_serve_mux();
  }
  if (!options_.dictionary) {
    options_.dictionary = Dictionary::base();
  }
  if (!options_.stats) {
    options_.stats = std::make_shared<ServerStats>();
  }
}

Connection::~Connection() {
  finish();
}

optional<TlsState> Connection::tls_state() const {
  std::lock_guard<std::mutex> lock(notify_mutex_);
  return tls_state_;
}

void Connection::transition_to_state(ConnectionState state) {
  ConnectionState previous = state_.exchange(state, std::memory_order_acq_rel);
  EDIAM_LOG_DEBUG("conn " + std::to_string(id_) + " " + state_name(previous) + " -> " +
                  state_name(state));
}

// ============================================================================
// Serving loop
// ============================================================================

void Connection::serve() {
  // Handlers may outlive this call through the Response they were given.
  ConnectionPtr self = shared_from_this();
  ScopeGuard guard([this]() { finish(); });

  auto response = std::make_shared<Response>(self);
  ConnPtr conn = response;
  ServerStats& stats = *options_.stats;

  if (transport_->is_tls()) {
    transition_to_state(ConnectionState::kHandshaking);
    if (options_.read_timeout.count() > 0) {
      transport_->set_read_timeout(options_.read_timeout);
    }
    if (options_.write_timeout.count() > 0) {
      transport_->set_write_timeout(options_.write_timeout);
    }
    auto handshake = transport_->handshake();
    if (!handshake.has_value()) {
      stats.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      EDIAM_LOG_WARN("TLS handshake error from " + remote_address_ + ": " +
                     error_string(handshake.get_error()));
      return;
    }
    std::lock_guard<std::mutex> lock(notify_mutex_);
    tls_state_ = transport_->tls_state();
  }

  transition_to_state(ConnectionState::kServing);
  serving_.set();

  try {
    while (true) {
      if (options_.read_timeout.count() > 0) {
        reader_.set_read_timeout(options_.read_timeout);
      }

      MessagePtr partial;
      auto msg = read_message(reader_, options_.dictionary, &partial);
      if (!msg.has_value()) {
        close();
        handle_read_error(conn, partial, msg.get_error());
        return;
      }

      stats.messages_in.fetch_add(1, std::memory_order_relaxed);
      // Strictly sequential: the next message is not read until this returns.
      options_.handler->serve_message(conn, msg.value());
    }
  } catch (const std::exception& e) {
    stats.handler_faults.fetch_add(1, std::memory_order_relaxed);
    const StackTrace* thrown = thrown_at(e);
    if (thrown != nullptr) {
      EDIAM_LOG_ERROR("panic serving " + remote_address_ + ": " + e.what() + "\nthrown at:\n" +
                      format_stack(*thrown));
    } else {
      EDIAM_LOG_ERROR("panic serving " + remote_address_ + ": " + e.what() +
                      "\nno throw-site trace (use throw_with_trace), caught at:\n" + stack_trace());
    }
  } catch (...) {
    stats.handler_faults.fetch_add(1, std::memory_order_relaxed);
    EDIAM_LOG_ERROR("panic serving " + remote_address_ + ": unknown exception\ncaught at:\n" +
                    stack_trace());
  }
}

void Connection::handle_read_error(const ConnPtr& conn, const MessagePtr& partial, ErrorCode err) {
  // Peer hung up, at a message boundary or inside one.
  if (err == ErrorCode::kEndOfStream || err == ErrorCode::kUnexpectedEof) {
    EDIAM_LOG_DEBUG("conn " + std::to_string(id_) + " " + remote_address_ + ": " + error_string(err));
    return;
  }

  options_.stats->read_errors.fetch_add(1, std::memory_order_relaxed);

  auto* reporter = dynamic_cast<ErrorReporter*>(options_.handler.get());
  if (reporter == nullptr) {
    EDIAM_LOG_WARN("Read error from " + remote_address_ + ": " + error_string(err));
    return;
  }
  reporter->report_error(ErrorReport{conn, partial, err});
}

// ============================================================================
// Write path
// ============================================================================

expected<size_t, ErrorCode> Connection::write(const uint8_t* data, size_t len) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (finished_.load(std::memory_order_acquire)) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  if (options_.write_timeout.count() > 0) {
    writer_.set_write_timeout(options_.write_timeout);
  }

  auto n = writer_.write(data, len);
  if (!n.has_value()) {
    return n;
  }
  auto flushed = writer_.flush();
  if (!flushed.has_value()) {
    return expected<size_t, ErrorCode>::error(flushed.get_error());
  }

  options_.stats->bytes_out.fetch_add(n.value(), std::memory_order_relaxed);
  return n;
}

void Connection::close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (!transport_closed_) {
    transport_->shutdown();
  }
}

// ============================================================================
// Close notification
// ============================================================================

const Event& Connection::close_notify() {
  std::lock_guard<std::mutex> lock(notify_mutex_);
  if (notify_armed_) {
    return close_event_;
  }
  notify_armed_ = true;

  // Already torn down: there is no stream left to watch.
  if (finished_.load(std::memory_order_acquire)) {
    client_gone_.store(true, std::memory_order_release);
    close_event_.set();
    return close_event_;
  }

  pipe_ = std::make_unique<Pipe>();
  Reader* source = live_reader_.swap(pipe_.get());
  // The copier blocks on the transport; read timeouts armed from now on
  // apply to the pipe.
  source->set_read_timeout(std::chrono::milliseconds(0));
  copier_ = std::thread(&Connection::copy_loop, this, source);
  return close_event_;
}

void Connection::copy_loop(Reader* source) {
  // The transport is not readable before the handshake completes.
  serving_.wait();

  uint8_t buf[4096];
  ErrorCode reason = ErrorCode::kEndOfStream;
  while (true) {
    auto n = source->read(buf, sizeof(buf));
    if (!n.has_value()) {
      reason = n.get_error();
      break;
    }
    auto written = write_all(*pipe_, buf, n.value());
    if (!written.has_value()) {
      reason = written.get_error();
      break;
    }
  }
  pipe_->close_write(reason);
  notify_client_gone();
}

void Connection::notify_client_gone() {
  if (!client_gone_.exchange(true, std::memory_order_acq_rel)) {
    EDIAM_LOG_DEBUG("conn " + std::to_string(id_) + " peer gone");
  }
  close_event_.set();
}

// ============================================================================
// Teardown
// ============================================================================

void Connection::finish() {
  if (finished_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  close();
  serving_.set();

  std::thread copier;
  {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    if (pipe_) {
      pipe_->close_read();
    }
    copier = std::move(copier_);
  }
  if (copier.joinable()) {
    copier.join();
  }

  {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    transport_->close();
    transport_closed_ = true;
  }

  transition_to_state(ConnectionState::kClosed);
}

}  // namespace ediam
