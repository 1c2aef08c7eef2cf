#ifndef EDIAM_TLS_HPP_
#define EDIAM_TLS_HPP_

// ============================================================================
// TLS Configuration and Abstraction Layer
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option EDIAM_WITH_TLS=ON.
// When disabled, TlsContext::init fails with kTlsUnavailable and the TLS
// entry points refuse to start.
//
// Usage:
//   ediam::TlsConfig tls;
//   tls.cert_path = "/path/to/cert.pem";
//   tls.key_path = "/path/to/key.pem";
//   auto ctx = ediam::TlsContext::create(tls);
//

#include "transport.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#ifdef EDIAM_WITH_TLS

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#endif  // EDIAM_WITH_TLS

namespace ediam {

// ============================================================================
// TLS Configuration
// ============================================================================

struct TlsConfig {
  std::string cert_path;          // Server certificate (PEM)
  std::string key_path;           // Server private key (PEM)
  std::string ca_path;            // CA certificate for client auth (optional)
  bool require_client_cert = false;

  // 0 = TLS 1.2 minimum, 1 = TLS 1.3 only
  int min_tls_version = 0;
};

#ifdef EDIAM_WITH_TLS

// ============================================================================
// TLS Context (one per server, manages certificates and config)
// ============================================================================

class TlsContext {
 public:
  TlsContext();
  ~TlsContext();

  // Non-copyable
  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  // Loads the certificate material and builds the server config.
  // Returns 0 on success, mbedtls error code on failure
  int init(const TlsConfig& config);

  bool is_initialized() const { return initialized_; }

  const mbedtls_ssl_config* config() const { return &conf_; }

  // init() with logging. kTlsConfigError when the material does not load.
  static expected<std::shared_ptr<TlsContext>, ErrorCode> create(const TlsConfig& config);

 private:
  mbedtls_ssl_config conf_;
  mbedtls_x509_crt srvcert_;
  mbedtls_x509_crt cacert_;
  mbedtls_pk_context pkey_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  bool initialized_ = false;
};

// ============================================================================
// TLS Session (one per connection)
// ============================================================================

// Record layer over an already connected socket. The session does not own
// the transport and is not thread-safe. Input is non-blocking: when the
// socket has nothing to read, handshake/read/write return
// MBEDTLS_ERR_SSL_WANT_READ and the caller waits, then calls again.
class TlsSession {
 public:
  TlsSession();
  ~TlsSession();

  // Non-copyable
  TlsSession(const TlsSession&) = delete;
  TlsSession& operator=(const TlsSession&) = delete;

  // Setup session with context and the underlying byte stream
  int setup(const TlsContext& ctx, TcpTransport* lower);

  // One handshake step; 0 once complete
  int handshake();

  // Read decrypted data
  int read(uint8_t* buf, size_t len);

  // Write data (encrypted), blocking on the socket
  int write(const uint8_t* buf, size_t len);

  // Close TLS session
  int close_notify();

  TlsState state() const;

  // True for the return code that asks the caller to wait for input.
  static bool want_read(int ret) { return ret == MBEDTLS_ERR_SSL_WANT_READ; }

 private:
  static int bio_send(void* ctx, const unsigned char* buf, size_t len);
  static int bio_recv(void* ctx, unsigned char* buf, size_t len);

  mbedtls_ssl_context ssl_;
};

#else  // !EDIAM_WITH_TLS

// ============================================================================
// Stub implementations when TLS is disabled
// ============================================================================

class TlsContext {
 public:
  int init(const TlsConfig& /* config */) { return -1; }
  bool is_initialized() const { return false; }

  static expected<std::shared_ptr<TlsContext>, ErrorCode> create(const TlsConfig& /* config */) {
    return expected<std::shared_ptr<TlsContext>, ErrorCode>::error(ErrorCode::kTlsUnavailable);
  }
};

class TlsSession {
 public:
  int setup(const TlsContext& /* ctx */, TcpTransport* /* lower */) { return -1; }
  int handshake() { return -1; }
  int read(uint8_t* /* buf */, size_t /* len */) { return -1; }
  int write(const uint8_t* /* buf */, size_t /* len */) { return -1; }
  int close_notify() { return -1; }
  TlsState state() const { return TlsState(); }
  static bool want_read(int /* ret */) { return false; }
};

#endif  // EDIAM_WITH_TLS

// Renders an mbedtls error code, or "tls disabled" without TLS support.
std::string tls_error_string(int ret);

// ============================================================================
// TlsTransport / TlsListener
// ============================================================================

// Thread-safe: one reader and any number of writers may use the transport
// at once. Every session call runs under one mutex, which is released
// while a reader waits for input.
class TlsTransport final : public Transport {
 public:
  TlsTransport(std::unique_ptr<TcpTransport> lower, std::shared_ptr<const TlsContext> context);
  ~TlsTransport() override;

  TlsTransport(const TlsTransport&) = delete;
  TlsTransport& operator=(const TlsTransport&) = delete;

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;
  void set_read_timeout(std::chrono::milliseconds timeout) override;
  void set_write_timeout(std::chrono::milliseconds timeout) override;

  bool is_tls() const override { return true; }

  // Runs the handshake once and captures the negotiated state.
  expected<void, ErrorCode> handshake() override;
  optional<TlsState> tls_state() const override;

  std::string local_address() const override { return lower_->local_address(); }
  std::string remote_address() const override { return lower_->remote_address(); }

  void shutdown() override { lower_->shutdown(); }
  void close() override;
  bool is_open() const override { return lower_->is_open(); }

 private:
  // Blocks until the socket is readable; kTimeout after `timeout` (zero
  // waits without limit).
  expected<void, ErrorCode> wait_for_input(std::chrono::milliseconds timeout);

  std::unique_ptr<TcpTransport> lower_;
  std::shared_ptr<const TlsContext> context_;

  std::mutex session_mutex_;  // guards session_
  TlsSession session_;
  bool session_ready_ = false;

  std::atomic<bool> handshake_done_{false};
  optional<TlsState> state_;  // written before handshake_done_ is set

  std::atomic<int64_t> read_timeout_ms_{0};
  std::atomic<int64_t> write_timeout_ms_{0};
};

class TlsListener final : public Listener {
 public:
  TlsListener(std::unique_ptr<TcpListener> lower, std::shared_ptr<const TlsContext> context)
      : lower_(std::move(lower)), context_(std::move(context)) {}

  // The handshake is deferred to the connection's serving thread.
  expected<TransportPtr, ErrorCode> accept() override;

  void close() override { lower_->close(); }
  std::string address() const override { return lower_->address(); }
  uint16_t port() const { return lower_->port(); }

 private:
  std::unique_ptr<TcpListener> lower_;
  std::shared_ptr<const TlsContext> context_;
};

}  // namespace ediam

#endif  // EDIAM_TLS_HPP_
