#include "ediam.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ediam;

#ifdef EDIAM_WITH_TLS

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <psa/crypto.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace {

// ============================================================================
// Minimal TLS Diameter test client (mbedTLS client over a plain socket)
// ============================================================================

class TlsTestClient {
 public:
  TlsTestClient() {
    mbedtls_net_init(&net_);
    mbedtls_ssl_init(&ssl_);
    mbedtls_ssl_config_init(&conf_);
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&ctr_drbg_);
  }

  ~TlsTestClient() {
    disconnect();
    mbedtls_ssl_free(&ssl_);
    mbedtls_ssl_config_free(&conf_);
    mbedtls_ctr_drbg_free(&ctr_drbg_);
    mbedtls_entropy_free(&entropy_);
  }

  TlsTestClient(const TlsTestClient&) = delete;
  TlsTestClient& operator=(const TlsTestClient&) = delete;

  bool connect(uint16_t port) {
    const char* pers = "ediam_test_client";
    if (psa_crypto_init() != PSA_SUCCESS)
      return false;
    if (mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                              reinterpret_cast<const unsigned char*>(pers), strlen(pers)) != 0)
      return false;

    std::string port_str = std::to_string(port);
    if (mbedtls_net_connect(&net_, "127.0.0.1", port_str.c_str(), MBEDTLS_NET_PROTO_TCP) != 0)
      return false;
    connected_ = true;

    if (mbedtls_ssl_config_defaults(&conf_, MBEDTLS_SSL_IS_CLIENT, MBEDTLS_SSL_TRANSPORT_STREAM,
                                    MBEDTLS_SSL_PRESET_DEFAULT) != 0)
      return false;
    // Self-signed test certificate
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_NONE);
    mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
    mbedtls_ssl_conf_read_timeout(&conf_, 5000);

    if (mbedtls_ssl_setup(&ssl_, &conf_) != 0)
      return false;
    mbedtls_ssl_set_bio(&ssl_, &net_, mbedtls_net_send, nullptr, mbedtls_net_recv_timeout);

    int ret;
    do {
      ret = mbedtls_ssl_handshake(&ssl_);
    } while (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE);
    return ret == 0;
  }

  bool send_raw(const std::vector<uint8_t>& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
      int n = mbedtls_ssl_write(&ssl_, bytes.data() + sent, bytes.size() - sent);
      if (n == MBEDTLS_ERR_SSL_WANT_READ || n == MBEDTLS_ERR_SSL_WANT_WRITE)
        continue;
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  bool recv_message(Header* out_header, std::vector<uint8_t>* out_payload) {
    uint8_t raw[kHeaderLength];
    if (!recv_exact(raw, sizeof(raw)))
      return false;
    auto hdr = Header::decode(raw, sizeof(raw));
    if (!hdr.has_value())
      return false;
    *out_header = hdr.value();

    out_payload->assign(hdr.value().payload_length(), 0);
    return out_payload->empty() || recv_exact(out_payload->data(), out_payload->size());
  }

  void disconnect() {
    if (connected_) {
      mbedtls_ssl_close_notify(&ssl_);
      mbedtls_net_free(&net_);
      connected_ = false;
    }
  }

 private:
  bool recv_exact(uint8_t* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
      int n = mbedtls_ssl_read(&ssl_, buf + got, len - got);
      if (n == MBEDTLS_ERR_SSL_WANT_READ || n == MBEDTLS_ERR_SSL_WANT_WRITE)
        continue;
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
      if (n == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET)
        continue;
#endif
      if (n <= 0)
        return false;
      got += static_cast<size_t>(n);
    }
    return true;
  }

  mbedtls_net_context net_;
  mbedtls_ssl_context ssl_;
  mbedtls_ssl_config conf_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  bool connected_ = false;
};

std::unique_ptr<TlsListener> make_tls_listener() {
  TlsConfig tls;
  tls.cert_path = std::string(EDIAM_TEST_DATA_DIR) + "/server.crt";
  tls.key_path = std::string(EDIAM_TEST_DATA_DIR) + "/server.key";
  auto ctx = TlsContext::create(tls);
  if (!ctx.has_value()) {
    return nullptr;
  }
  auto tcp = TcpListener::listen("127.0.0.1:0");
  if (!tcp.has_value()) {
    return nullptr;
  }
  return std::make_unique<TlsListener>(std::move(tcp.value()), ctx.value());
}

ServerConfig tls_config(HandlerPtr handler, ExecutorPtr executor) {
  ServerConfig config;
  config.handler = std::move(handler);
  config.executor = std::move(executor);
  config.read_timeout = std::chrono::seconds(5);
  config.write_timeout = std::chrono::seconds(5);
  return config;
}

}  // namespace

// ============================================================================
// TLS loopback
// ============================================================================

TEST_CASE("TLS - handler answers after arming close_notify", "[tls][integration]") {
  auto mux = make_serve_mux();
  std::atomic<const Event*> gone{nullptr};
  std::mutex mutex;
  ConnPtr held;  // keeps the event alive past the connection
  REQUIRE(mux->handle_func("CER", [&](const ConnPtr& conn, const MessagePtr& msg) {
                auto* notifier = dynamic_cast<CloseNotifier*>(conn.get());
                if (notifier != nullptr) {
                  {
                    std::lock_guard<std::mutex> lock(mutex);
                    held = conn;
                  }
                  gone.store(&notifier->close_notify());
                }
                // The copier is reading the session while this writes
                auto written = conn->write_message(*msg->make_answer());
                if (!written.has_value()) {
                  conn->close();
                }
              }).has_value());
  REQUIRE(mux->handle_func("DWR", [](const ConnPtr& conn, const MessagePtr& msg) {
                auto written = conn->write_message(*msg->make_answer());
                if (!written.has_value()) {
                  conn->close();
                }
              }).has_value());

  auto executor = std::make_shared<ThreadPerConnection>();
  Server server(tls_config(mux, executor));
  auto listener = make_tls_listener();
  REQUIRE(listener != nullptr);
  uint16_t port = listener->port();

  expected<void, ErrorCode> result = expected<void, ErrorCode>::error(ErrorCode::kInternalError);
  std::thread serving([&server, &listener, &result]() { result = server.serve(*listener); });

  {
    TlsTestClient client;
    REQUIRE(client.connect(port));

    Header hdr;
    std::vector<uint8_t> body;
    REQUIRE(client.send_raw(test::cer(0x10)));
    REQUIRE(client.recv_message(&hdr, &body));
    REQUIRE(hdr.command_code == 257);
    REQUIRE(!hdr.is_request());
    REQUIRE(hdr.hop_by_hop_id == 0x10);
    REQUIRE(gone.load() != nullptr);

    // Later messages travel through the close_notify pipe
    for (uint32_t hbh = 0x20; hbh < 0x30; ++hbh) {
      REQUIRE(client.send_raw(test::wire_message(0, 280, true, {}, hbh)));
      REQUIRE(client.recv_message(&hdr, &body));
      REQUIRE(hdr.command_code == 280);
      REQUIRE(hdr.hop_by_hop_id == hbh);
    }
    REQUIRE(!gone.load()->is_set());
  }

  REQUIRE(gone.load()->wait_for(std::chrono::seconds(5)));
  REQUIRE(executor->wait_idle(std::chrono::seconds(5)));
  server.stop();
  serving.join();

  REQUIRE(result.has_value());
  REQUIRE(server.stats().handshake_errors.load() == 0);
  REQUIRE(server.stats().messages_in.load() == 17);
  REQUIRE(!mux->error_reports().try_receive().has_value());

  std::lock_guard<std::mutex> lock(mutex);
  held.reset();
}

TEST_CASE("TLS - writers run while the loop waits for input", "[tls][integration]") {
  auto mux = make_serve_mux();
  std::mutex mutex;
  ConnPtr peer;
  Event registered;
  REQUIRE(mux->handle_func("CER", [&](const ConnPtr& conn, const MessagePtr& msg) {
                auto written = conn->write_message(*msg->make_answer());
                if (!written.has_value()) {
                  conn->close();
                  return;
                }
                std::lock_guard<std::mutex> lock(mutex);
                peer = conn;
                registered.set();
              }).has_value());

  auto executor = std::make_shared<ThreadPerConnection>();
  Server server(tls_config(mux, executor));
  auto listener = make_tls_listener();
  REQUIRE(listener != nullptr);
  uint16_t port = listener->port();

  expected<void, ErrorCode> result = expected<void, ErrorCode>::error(ErrorCode::kInternalError);
  std::thread serving([&server, &listener, &result]() { result = server.serve(*listener); });

  {
    TlsTestClient client;
    REQUIRE(client.connect(port));
    REQUIRE(client.send_raw(test::cer(1)));

    Header hdr;
    std::vector<uint8_t> body;
    REQUIRE(client.recv_message(&hdr, &body));
    REQUIRE(hdr.command_code == 257);
    REQUIRE(registered.wait_for(std::chrono::seconds(5)));

    ConnPtr conn;
    {
      std::lock_guard<std::mutex> lock(mutex);
      conn = peer;
    }

    // Two watchdog senders; the serving loop is blocked reading meanwhile
    constexpr uint32_t kPerWriter = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> writers;
    for (uint32_t w = 0; w < 2; ++w) {
      writers.emplace_back([&conn, &failures, w]() {
        for (uint32_t i = 0; i < kPerWriter; ++i) {
          Message dwr(test::make_header(0, 280, true, (w << 16) | i),
                      std::vector<uint8_t>(64, static_cast<uint8_t>(w)), Dictionary::base());
          if (!conn->write_message(dwr).has_value()) {
            failures.fetch_add(1);
          }
        }
      });
    }

    std::vector<uint32_t> next(2, 0);
    for (uint32_t n = 0; n < 2 * kPerWriter; ++n) {
      REQUIRE(client.recv_message(&hdr, &body));
      REQUIRE(hdr.command_code == 280);
      REQUIRE(hdr.is_request());
      uint32_t w = hdr.hop_by_hop_id >> 16;
      REQUIRE(w < 2);
      // Each writer's messages arrive whole and in its order
      REQUIRE((hdr.hop_by_hop_id & 0xFFFF) == next[w]);
      ++next[w];
      REQUIRE(body == std::vector<uint8_t>(64, static_cast<uint8_t>(w)));
    }
    for (auto& t : writers) {
      t.join();
    }
    REQUIRE(failures.load() == 0);

    // The loop still answers after the concurrent writes
    REQUIRE(client.send_raw(test::cer(2)));
    REQUIRE(client.recv_message(&hdr, &body));
    REQUIRE(hdr.command_code == 257);
    REQUIRE(hdr.hop_by_hop_id == 2);
  }

  {
    std::lock_guard<std::mutex> lock(mutex);
    peer.reset();
  }
  REQUIRE(executor->wait_idle(std::chrono::seconds(5)));
  server.stop();
  serving.join();
  REQUIRE(result.has_value());
}

#else  // !EDIAM_WITH_TLS

TEST_CASE("TLS - listener refuses to start without TLS support", "[tls]") {
  TlsConfig tls;
  tls.cert_path = std::string(EDIAM_TEST_DATA_DIR) + "/server.crt";
  tls.key_path = std::string(EDIAM_TEST_DATA_DIR) + "/server.key";
  auto ctx = TlsContext::create(tls);
  REQUIRE(!ctx.has_value());
  REQUIRE(ctx.get_error() == ErrorCode::kTlsUnavailable);
}

#endif  // EDIAM_WITH_TLS
