#include "ediam/tls.hpp"

#include "ediam/log.hpp"

#include <cstdio>
#include <cstring>

#ifdef EDIAM_WITH_TLS
#include <mbedtls/error.h>
#include <psa/crypto.h>
#endif

namespace ediam {

#ifdef EDIAM_WITH_TLS

std::string tls_error_string(int ret) {
  char buf[160];
  mbedtls_strerror(ret, buf, sizeof(buf));
  char out[192];
  snprintf(out, sizeof(out), "%s (-0x%04X)", buf, static_cast<unsigned>(-ret));
  return out;
}

// ============================================================================
// TlsContext
// ============================================================================

TlsContext::TlsContext() {
  mbedtls_ssl_config_init(&conf_);
  mbedtls_x509_crt_init(&srvcert_);
  mbedtls_x509_crt_init(&cacert_);
  mbedtls_pk_init(&pkey_);
  mbedtls_entropy_init(&entropy_);
  mbedtls_ctr_drbg_init(&ctr_drbg_);
}

TlsContext::~TlsContext() {
  mbedtls_ssl_config_free(&conf_);
  mbedtls_x509_crt_free(&srvcert_);
  mbedtls_x509_crt_free(&cacert_);
  mbedtls_pk_free(&pkey_);
  mbedtls_entropy_free(&entropy_);
  mbedtls_ctr_drbg_free(&ctr_drbg_);
}

int TlsContext::init(const TlsConfig& config) {
  const char* pers = "ediam_tls";

  // TLS 1.3 key schedule runs on PSA
  psa_status_t status = psa_crypto_init();
  if (status != PSA_SUCCESS) return MBEDTLS_ERR_SSL_BAD_CONFIG;

  // Seed RNG
  int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func,
                                   &entropy_,
                                   reinterpret_cast<const unsigned char*>(pers),
                                   strlen(pers));
  if (ret != 0) return ret;

  // Load certificate
  ret = mbedtls_x509_crt_parse_file(&srvcert_, config.cert_path.c_str());
  if (ret != 0) return ret;

  // Load CA if provided
  if (!config.ca_path.empty()) {
    ret = mbedtls_x509_crt_parse_file(&cacert_, config.ca_path.c_str());
    if (ret != 0) return ret;
  }

  // Load private key
  ret = mbedtls_pk_parse_keyfile(&pkey_, config.key_path.c_str(),
                                  nullptr, mbedtls_ctr_drbg_random,
                                  &ctr_drbg_);
  if (ret != 0) return ret;

  // Setup SSL config
  ret = mbedtls_ssl_config_defaults(&conf_,
                                     MBEDTLS_SSL_IS_SERVER,
                                     MBEDTLS_SSL_TRANSPORT_STREAM,
                                     MBEDTLS_SSL_PRESET_DEFAULT);
  if (ret != 0) return ret;

  mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
  ret = mbedtls_ssl_conf_own_cert(&conf_, &srvcert_, &pkey_);
  if (ret != 0) return ret;

  // Client authentication
  if (!config.ca_path.empty()) {
    mbedtls_ssl_conf_ca_chain(&conf_, &cacert_, nullptr);
  }
  if (config.require_client_cert) {
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_REQUIRED);
  } else if (!config.ca_path.empty()) {
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_OPTIONAL);
  } else {
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_NONE);
  }

  if (config.min_tls_version >= 1) {
    mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_3);
  } else {
    mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_2);
  }

  initialized_ = true;
  return 0;
}

expected<std::shared_ptr<TlsContext>, ErrorCode> TlsContext::create(const TlsConfig& config) {
  using Result = expected<std::shared_ptr<TlsContext>, ErrorCode>;

  if (config.cert_path.empty() || config.key_path.empty()) {
    EDIAM_LOG_ERROR("TLS requires both a certificate and a key");
    return Result::error(ErrorCode::kTlsConfigError);
  }

  auto ctx = std::make_shared<TlsContext>();
  int ret = ctx->init(config);
  if (ret != 0) {
    EDIAM_LOG_ERROR("Failed to load TLS material (" + config.cert_path + ", " + config.key_path +
                    "): " + tls_error_string(ret));
    return Result::error(ErrorCode::kTlsConfigError);
  }
  return Result::success(std::move(ctx));
}

// ============================================================================
// TlsSession
// ============================================================================

TlsSession::TlsSession() { mbedtls_ssl_init(&ssl_); }

TlsSession::~TlsSession() { mbedtls_ssl_free(&ssl_); }

int TlsSession::setup(const TlsContext& ctx, TcpTransport* lower) {
  int ret = mbedtls_ssl_setup(&ssl_, ctx.config());
  if (ret != 0) return ret;

  mbedtls_ssl_set_bio(&ssl_, lower, &TlsSession::bio_send, &TlsSession::bio_recv, nullptr);
  return 0;
}

int TlsSession::handshake() {
  int ret;
  do {
    ret = mbedtls_ssl_handshake(&ssl_);
  } while (ret == MBEDTLS_ERR_SSL_WANT_WRITE);
  return ret;
}

int TlsSession::read(uint8_t* buf, size_t len) {
  int ret;
  do {
    ret = mbedtls_ssl_read(&ssl_, buf, len);
  } while (ret == MBEDTLS_ERR_SSL_WANT_WRITE);
  return ret;
}

int TlsSession::write(const uint8_t* buf, size_t len) {
  int ret;
  do {
    ret = mbedtls_ssl_write(&ssl_, buf, len);
  } while (ret == MBEDTLS_ERR_SSL_WANT_WRITE);
  return ret;
}

int TlsSession::close_notify() {
  return mbedtls_ssl_close_notify(&ssl_);
}

TlsState TlsSession::state() const {
  TlsState state;
  const char* version = mbedtls_ssl_get_version(&ssl_);
  state.version = version != nullptr ? version : "";
  const char* suite = mbedtls_ssl_get_ciphersuite(&ssl_);
  state.cipher_suite = suite != nullptr ? suite : "";

  const mbedtls_x509_crt* peer = mbedtls_ssl_get_peer_cert(&ssl_);
  if (peer != nullptr) {
    char subject[256];
    int n = mbedtls_x509_dn_gets(subject, sizeof(subject), &peer->subject);
    if (n > 0) {
      state.peer_subject.assign(subject, static_cast<size_t>(n));
    }
    state.peer_verified = mbedtls_ssl_get_verify_result(&ssl_) == 0;
  }
  return state;
}

int TlsSession::bio_send(void* ctx, const unsigned char* buf, size_t len) {
  auto* lower = static_cast<TcpTransport*>(ctx);
  auto n = lower->write(buf, len);
  if (!n.has_value()) {
    return n.get_error() == ErrorCode::kTimeout ? MBEDTLS_ERR_SSL_TIMEOUT
                                                : MBEDTLS_ERR_SSL_INTERNAL_ERROR;
  }
  return static_cast<int>(n.value());
}

int TlsSession::bio_recv(void* ctx, unsigned char* buf, size_t len) {
  auto* lower = static_cast<TcpTransport*>(ctx);
  // Never block inside the session; the caller waits with the session free.
  auto ready = lower->wait_readable(std::chrono::milliseconds(0));
  if (!ready.has_value()) {
    return MBEDTLS_ERR_SSL_INTERNAL_ERROR;
  }
  if (!ready.value()) {
    return MBEDTLS_ERR_SSL_WANT_READ;
  }

  auto n = lower->read(buf, len);
  if (!n.has_value()) {
    switch (n.get_error()) {
      case ErrorCode::kEndOfStream:
        return 0;
      case ErrorCode::kTimeout:
        return MBEDTLS_ERR_SSL_WANT_READ;
      default:
        return MBEDTLS_ERR_SSL_INTERNAL_ERROR;
    }
  }
  return static_cast<int>(n.value());
}

#else  // !EDIAM_WITH_TLS

std::string tls_error_string(int /* ret */) { return "tls disabled"; }

#endif  // EDIAM_WITH_TLS

// ============================================================================
// TlsTransport
// ============================================================================

TlsTransport::TlsTransport(std::unique_ptr<TcpTransport> lower,
                           std::shared_ptr<const TlsContext> context)
    : lower_(std::move(lower)), context_(std::move(context)) {
  int ret = session_.setup(*context_, lower_.get());
  if (ret != 0) {
    EDIAM_LOG_ERROR("TLS session setup failed for " + lower_->remote_address() + ": " +
                    tls_error_string(ret));
  } else {
    session_ready_ = true;
  }
}

TlsTransport::~TlsTransport() = default;

void TlsTransport::set_read_timeout(std::chrono::milliseconds timeout) {
  read_timeout_ms_.store(timeout.count(), std::memory_order_relaxed);
  lower_->set_read_timeout(timeout);
}

void TlsTransport::set_write_timeout(std::chrono::milliseconds timeout) {
  write_timeout_ms_.store(timeout.count(), std::memory_order_relaxed);
  lower_->set_write_timeout(timeout);
}

expected<void, ErrorCode> TlsTransport::wait_for_input(std::chrono::milliseconds timeout) {
  auto ready = lower_->wait_readable(timeout.count() > 0 ? timeout : std::chrono::milliseconds(-1));
  if (!ready.has_value()) {
    return expected<void, ErrorCode>::error(ready.get_error());
  }
  if (!ready.value()) {
    return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> TlsTransport::handshake() {
  // Held throughout: reads and writes are refused until the handshake is done.
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (handshake_done_.load(std::memory_order_acquire)) {
    return expected<void, ErrorCode>::success();
  }
  if (!session_ready_) {
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }

  while (true) {
    int ret = session_.handshake();
    if (ret == 0) {
      break;
    }
    if (!TlsSession::want_read(ret)) {
      EDIAM_LOG_DEBUG("TLS handshake with " + lower_->remote_address() + " failed: " +
                      tls_error_string(ret));
      return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
    auto ready = wait_for_input(std::chrono::milliseconds(read_timeout_ms_.load(std::memory_order_relaxed)));
    if (!ready.has_value()) {
      EDIAM_LOG_DEBUG("TLS handshake with " + lower_->remote_address() + " stalled: " +
                      error_string(ready.get_error()));
      return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
  }

  state_ = optional<TlsState>(session_.state());
  handshake_done_.store(true, std::memory_order_release);
  return expected<void, ErrorCode>::success();
}

optional<TlsState> TlsTransport::tls_state() const {
  if (!handshake_done_.load(std::memory_order_acquire)) {
    return optional<TlsState>();
  }
  return state_;
}

expected<size_t, ErrorCode> TlsTransport::read(uint8_t* buf, size_t len) {
  using Result = expected<size_t, ErrorCode>;

  if (!handshake_done_.load(std::memory_order_acquire)) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  int ret;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      ret = session_.read(buf, len);
    }
    if (!TlsSession::want_read(ret)) {
      break;
    }
    auto ready = wait_for_input(std::chrono::milliseconds(read_timeout_ms_.load(std::memory_order_relaxed)));
    if (!ready.has_value()) {
      return Result::error(ready.get_error());
    }
  }

  if (ret > 0) {
    return Result::success(static_cast<size_t>(ret));
  }
#ifdef EDIAM_WITH_TLS
  if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || ret == MBEDTLS_ERR_SSL_CONN_EOF) {
    return Result::error(ErrorCode::kEndOfStream);
  }
  if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
    return Result::error(ErrorCode::kTimeout);
  }
#endif
  EDIAM_LOG_DEBUG("TLS read from " + lower_->remote_address() + " failed: " + tls_error_string(ret));
  return Result::error(ErrorCode::kTlsError);
}

expected<size_t, ErrorCode> TlsTransport::write(const uint8_t* buf, size_t len) {
  using Result = expected<size_t, ErrorCode>;

  if (!handshake_done_.load(std::memory_order_acquire)) {
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  int ret;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      ret = session_.write(buf, len);
    }
    if (!TlsSession::want_read(ret)) {
      break;
    }
    auto ready = wait_for_input(std::chrono::milliseconds(write_timeout_ms_.load(std::memory_order_relaxed)));
    if (!ready.has_value()) {
      return Result::error(ready.get_error());
    }
  }

  if (ret >= 0) {
    return Result::success(static_cast<size_t>(ret));
  }
#ifdef EDIAM_WITH_TLS
  if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
    return Result::error(ErrorCode::kTimeout);
  }
#endif
  EDIAM_LOG_DEBUG("TLS write to " + lower_->remote_address() + " failed: " + tls_error_string(ret));
  return Result::error(ErrorCode::kTlsError);
}

void TlsTransport::close() {
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (handshake_done_.load(std::memory_order_acquire) && lower_->is_open()) {
      int ret = session_.close_notify();
      if (ret != 0) {
        EDIAM_LOG_DEBUG("TLS close_notify to " + lower_->remote_address() + " failed: " +
                        tls_error_string(ret));
      }
    }
  }
  lower_->close();
}

// ============================================================================
// TlsListener
// ============================================================================

expected<TransportPtr, ErrorCode> TlsListener::accept() {
  auto tcp = lower_->accept_tcp();
  if (!tcp.has_value()) {
    return expected<TransportPtr, ErrorCode>::error(tcp.get_error());
  }
  return expected<TransportPtr, ErrorCode>::success(
      std::make_unique<TlsTransport>(std::move(tcp.value()), context_));
}

}  // namespace ediam
