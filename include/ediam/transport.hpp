#ifndef EDIAM_TRANSPORT_HPP_
#define EDIAM_TRANSPORT_HPP_

#include "io.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>
#include <string>

namespace ediam {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;     // Disable Nagle algorithm
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;    // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;      // Max probes before dropping connection
};

// Negotiated TLS parameters, captured once after a successful handshake.
struct TlsState {
  std::string version;        // e.g. "TLSv1.3"
  std::string cipher_suite;
  std::string peer_subject;   // empty when the peer sent no certificate
  bool peer_verified = false;
};

// ============================================================================
// Address parsing
// ============================================================================

struct HostPort {
  std::string host;  // empty means all interfaces
  uint16_t port = 0;
};

// Accepts "host:port", ":port", "host" and "". A missing port means the
// well-known port 3868.
expected<HostPort, ErrorCode> parse_address(const std::string& address);

// True for accept() errno values worth retrying after a delay.
bool is_temporary_accept_error(int err);

// ============================================================================
// Transport (one connected byte stream)
// ============================================================================

class Transport : public Reader, public Writer {
 public:
  ~Transport() override = default;

  virtual bool is_tls() const { return false; }

  // No-op for plain transports.
  virtual expected<void, ErrorCode> handshake() { return expected<void, ErrorCode>::success(); }

  virtual optional<TlsState> tls_state() const { return optional<TlsState>(); }

  virtual std::string local_address() const = 0;
  virtual std::string remote_address() const = 0;

  // Shuts both directions down so blocked reads and writes return. The
  // descriptor stays allocated until close().
  virtual void shutdown() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

// ============================================================================
// TcpTransport
// ============================================================================

class TcpTransport final : public Transport {
 public:
  explicit TcpTransport(sockpp::tcp_socket&& sock);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;
  void set_read_timeout(std::chrono::milliseconds timeout) override;
  void set_write_timeout(std::chrono::milliseconds timeout) override;

  std::string local_address() const override { return local_address_; }
  std::string remote_address() const override { return remote_address_; }

  void shutdown() override;
  void close() override;
  bool is_open() const override { return socket_.is_open(); }

  void apply_tuning(const TcpTuning& tuning);

  // Waits until a read would not block: data, end of stream or a pending
  // error. false on timeout; a negative timeout waits without limit.
  expected<bool, ErrorCode> wait_readable(std::chrono::milliseconds timeout);

  int get_fd() const { return socket_.handle(); }

 private:
  sockpp::tcp_socket socket_;
  std::string local_address_;
  std::string remote_address_;
};

// ============================================================================
// Listener
// ============================================================================

class Listener {
 public:
  virtual ~Listener() = default;

  // Blocks for the next connection. kAcceptTemporary marks errors the
  // caller may retry; anything else is permanent.
  virtual expected<TransportPtr, ErrorCode> accept() = 0;

  // Unblocks a pending accept(). Safe to call from any thread, more than once.
  virtual void close() = 0;

  virtual std::string address() const = 0;
};

class TcpListener final : public Listener {
 public:
  static constexpr int kBacklog = 128;

  // Binds and listens. Port 0 picks an ephemeral port, see port().
  static expected<std::unique_ptr<TcpListener>, ErrorCode> listen(
      const std::string& address, const TcpTuning& tuning = TcpTuning());

  ~TcpListener() override;

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  expected<TransportPtr, ErrorCode> accept() override;

  // accept() without the Transport upcast.
  expected<std::unique_ptr<TcpTransport>, ErrorCode> accept_tcp();

  void close() override;
  std::string address() const override { return address_; }
  uint16_t port() const { return port_; }

 private:
  TcpListener(sockpp::tcp_acceptor&& acceptor, const TcpTuning& tuning);

  sockpp::tcp_acceptor acceptor_;
  TcpTuning tuning_;
  std::string address_;
  uint16_t port_ = 0;
  std::atomic<bool> closed_{false};
};

}  // namespace ediam

#endif  // EDIAM_TRANSPORT_HPP_
