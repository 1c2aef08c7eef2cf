#ifndef EDIAM_SERVER_HPP_
#define EDIAM_SERVER_HPP_

#include "connection.hpp"
#include "dictionary.hpp"
#include "executor.hpp"
#include "handler.hpp"
#include "stats.hpp"
#include "tls.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ediam {

// ============================================================================
// AcceptBackoff (delay between retries of temporary accept errors)
// ============================================================================

class AcceptBackoff {
 public:
  static constexpr std::chrono::milliseconds kInitialDelay{5};
  static constexpr std::chrono::milliseconds kMaxDelay{1000};

  // 5ms on the first failure, doubled on each consecutive one, capped at 1s.
  std::chrono::milliseconds next() {
    if (delay_.count() == 0) {
      delay_ = kInitialDelay;
    } else {
      delay_ *= 2;
    }
    if (delay_ > kMaxDelay) {
      delay_ = kMaxDelay;
    }
    return delay_;
  }

  void reset() { delay_ = std::chrono::milliseconds(0); }

  std::chrono::milliseconds current() const { return delay_; }

 private:
  std::chrono::milliseconds delay_{0};
};

// ============================================================================
// Server configuration
// ============================================================================

struct ServerConfig {
  std::string address;                         // "" means ":3868"
  HandlerPtr handler;                          // null: make_serve_mux()
  DictionaryPtr dictionary;                    // null: Dictionary::base()
  std::chrono::milliseconds read_timeout{0};   // zero: no deadline
  std::chrono::milliseconds write_timeout{0};  // zero: no deadline
  TlsConfig tls;                               // used by listen_and_serve_tls only
  TcpTuning tcp_tuning;
  ExecutorPtr executor;                        // null: ThreadPerConnection

  // kInvalidConfig for negative timeouts, kInvalidAddress for an
  // unparsable address.
  expected<void, ErrorCode> validate() const;
};

// ============================================================================
// Server (accept loop, one Connection per peer)
// ============================================================================

class Server {
 public:
  explicit Server(ServerConfig config = ServerConfig());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accepts on listener until a permanent error or stop(). Temporary accept
  // errors are retried with AcceptBackoff. The listener is closed on return.
  expected<void, ErrorCode> serve(Listener& listener);

  // Binds config().address over plain TCP and serves.
  expected<void, ErrorCode> listen_and_serve();

  // Loads the certificate and key (overriding config().tls paths when
  // non-empty) before binding. kTlsConfigError leaves nothing bound.
  expected<void, ErrorCode> listen_and_serve_tls(const std::string& cert_file,
                                                 const std::string& key_file);

  // Closes the active listener; serve() then returns success. Connections
  // already accepted keep running.
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  const ServerConfig& config() const { return config_; }

  // Performance monitoring
  const ServerStats& stats() const { return *stats_; }
  void reset_stats() { stats_->reset(); }

  // Callbacks
  std::function<void(std::chrono::milliseconds)> on_accept_retry;
  std::function<void(const ConnectionPtr&)> on_connect;

 private:
  void wait_before_retry(std::chrono::milliseconds delay);

  ServerConfig config_;
  std::shared_ptr<ServerStats> stats_;

  std::mutex mutex_;
  std::condition_variable stop_cv_;
  Listener* listener_ = nullptr;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
};

// ============================================================================
// Entry points
// ============================================================================

expected<void, ErrorCode> serve(Listener& listener, HandlerPtr handler);

// address "" means ":3868".
expected<void, ErrorCode> listen_and_serve(const std::string& address, HandlerPtr handler,
                                           DictionaryPtr dictionary);

expected<void, ErrorCode> listen_and_serve_tls(const std::string& address,
                                               const std::string& cert_file,
                                               const std::string& key_file, HandlerPtr handler,
                                               DictionaryPtr dictionary);

}  // namespace ediam

#endif  // EDIAM_SERVER_HPP_
