#include "ediam/transport.hpp"

#include "ediam/header.hpp"
#include "ediam/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <exception>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sockpp/inet_address.h>
#include <sys/socket.h>

namespace ediam {

namespace {

std::string format_address(const sockpp::sock_address_any& addr) {
  if (addr.family() != AF_INET) {
    return "";
  }
  return sockpp::inet_address(addr).to_string();
}

expected<uint16_t, ErrorCode> parse_port(const std::string& text) {
  if (text.empty() || text.size() > 5) {
    return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidAddress);
  }
  unsigned long value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidAddress);
    }
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  if (value > 65535) {
    return expected<uint16_t, ErrorCode>::error(ErrorCode::kInvalidAddress);
  }
  return expected<uint16_t, ErrorCode>::success(static_cast<uint16_t>(value));
}

}  // namespace

expected<HostPort, ErrorCode> parse_address(const std::string& address) {
  HostPort hp;
  hp.port = kDefaultPort;

  size_t colon = address.rfind(':');
  if (colon == std::string::npos) {
    hp.host = address;
    return expected<HostPort, ErrorCode>::success(hp);
  }

  hp.host = address.substr(0, colon);
  if (hp.host.find(':') != std::string::npos) {
    return expected<HostPort, ErrorCode>::error(ErrorCode::kInvalidAddress);
  }
  auto port = parse_port(address.substr(colon + 1));
  if (!port.has_value()) {
    return expected<HostPort, ErrorCode>::error(port.get_error());
  }
  hp.port = port.value();
  return expected<HostPort, ErrorCode>::success(hp);
}

bool is_temporary_accept_error(int err) {
  switch (err) {
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
    case ECONNABORTED:
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EPROTO:
    case EPERM:
      return true;
    default:
      return false;
  }
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {
  local_address_ = format_address(socket_.address());
  remote_address_ = format_address(socket_.peer_address());
}

TcpTransport::~TcpTransport() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<size_t, ErrorCode> TcpTransport::read(uint8_t* buf, size_t len) {
  while (true) {
    ssize_t n = ::recv(socket_.handle(), buf, len, 0);
    if (n > 0) {
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    }
    if (n == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kEndOfStream);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    // SO_RCVTIMEO expiry
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    EDIAM_LOG_DEBUG("recv error on " + remote_address_ + ": " + std::string(strerror(err)));
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

expected<size_t, ErrorCode> TcpTransport::write(const uint8_t* buf, size_t len) {
  while (true) {
    ssize_t n = ::send(socket_.handle(), buf, len, MSG_NOSIGNAL);
    if (n >= 0) {
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
    EDIAM_LOG_DEBUG("send error on " + remote_address_ + ": " + std::string(strerror(err)));
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

void TcpTransport::set_read_timeout(std::chrono::milliseconds timeout) {
  if (!socket_.read_timeout(std::chrono::microseconds(timeout))) {
    EDIAM_LOG_WARN("Failed to set read timeout: " + socket_.last_error_str());
  }
}

void TcpTransport::set_write_timeout(std::chrono::milliseconds timeout) {
  if (!socket_.write_timeout(std::chrono::microseconds(timeout))) {
    EDIAM_LOG_WARN("Failed to set write timeout: " + socket_.last_error_str());
  }
}

void TcpTransport::shutdown() {
  if (socket_.is_open()) {
    socket_.shutdown(SHUT_RDWR);
  }
}

void TcpTransport::close() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

void TcpTransport::apply_tuning(const TcpTuning& tuning) {
  int opt = 1;

  if (tuning.tcp_nodelay) {
    socket_.set_option(IPPROTO_TCP, TCP_NODELAY, opt);
  }

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack) {
    socket_.set_option(IPPROTO_TCP, TCP_QUICKACK, opt);
  }
#endif

  if (tuning.so_keepalive) {
    socket_.set_option(SOL_SOCKET, SO_KEEPALIVE, opt);

#ifdef TCP_KEEPIDLE
    socket_.set_option(IPPROTO_TCP, TCP_KEEPIDLE, tuning.keepalive_idle_s);
#endif
#ifdef TCP_KEEPINTVL
    socket_.set_option(IPPROTO_TCP, TCP_KEEPINTVL, tuning.keepalive_interval_s);
#endif
#ifdef TCP_KEEPCNT
    socket_.set_option(IPPROTO_TCP, TCP_KEEPCNT, tuning.keepalive_count);
#endif
  }
}

expected<bool, ErrorCode> TcpTransport::wait_readable(std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = socket_.handle();
  pfd.events = POLLIN;
  int wait_ms = timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());

  while (true) {
    int n = ::poll(&pfd, 1, wait_ms);
    if (n > 0) {
      if ((pfd.revents & POLLNVAL) != 0) {
        return expected<bool, ErrorCode>::error(ErrorCode::kConnectionClosed);
      }
      // POLLHUP and POLLERR make the next recv() return at once
      return expected<bool, ErrorCode>::success(true);
    }
    if (n == 0) {
      return expected<bool, ErrorCode>::success(false);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    EDIAM_LOG_DEBUG("poll error on " + remote_address_ + ": " + std::string(strerror(err)));
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

// ============================================================================
// TcpListener
// ============================================================================

expected<std::unique_ptr<TcpListener>, ErrorCode> TcpListener::listen(const std::string& address,
                                                                    const TcpTuning& tuning) {
  using Result = expected<std::unique_ptr<TcpListener>, ErrorCode>;

  auto hp = parse_address(address);
  if (!hp.has_value()) {
    return Result::error(hp.get_error());
  }

  sockpp::initialize();

  sockpp::inet_address bind_addr;
  try {
    bind_addr = hp.value().host.empty() ? sockpp::inet_address(hp.value().port)
                                        : sockpp::inet_address(hp.value().host, hp.value().port);
  } catch (const std::exception& e) {
    EDIAM_LOG_ERROR("Failed to resolve " + address + ": " + e.what());
    return Result::error(ErrorCode::kInvalidAddress);
  }

  sockpp::tcp_acceptor acceptor(bind_addr, kBacklog);
  if (!acceptor) {
    EDIAM_LOG_ERROR("Failed to listen on " + bind_addr.to_string() + ": " + acceptor.last_error_str());
    return Result::error(ErrorCode::kListenFailed);
  }

  return Result::success(std::unique_ptr<TcpListener>(new TcpListener(std::move(acceptor), tuning)));
}

TcpListener::TcpListener(sockpp::tcp_acceptor&& acceptor, const TcpTuning& tuning)
    : acceptor_(std::move(acceptor)), tuning_(tuning) {
  sockpp::inet_address bound(acceptor_.address());
  address_ = bound.to_string();
  port_ = bound.port();
}

TcpListener::~TcpListener() {
  close();
  if (acceptor_.is_open()) {
    acceptor_.close();
  }
}

expected<TransportPtr, ErrorCode> TcpListener::accept() {
  auto tcp = accept_tcp();
  if (!tcp.has_value()) {
    return expected<TransportPtr, ErrorCode>::error(tcp.get_error());
  }
  return expected<TransportPtr, ErrorCode>::success(TransportPtr(std::move(tcp.value())));
}

expected<std::unique_ptr<TcpTransport>, ErrorCode> TcpListener::accept_tcp() {
  using Result = expected<std::unique_ptr<TcpTransport>, ErrorCode>;

  if (closed_.load(std::memory_order_acquire)) {
    return Result::error(ErrorCode::kConnectionClosed);
  }

  sockpp::tcp_socket sock = acceptor_.accept();
  if (!sock) {
    int err = acceptor_.last_error();
    if (closed_.load(std::memory_order_acquire)) {
      return Result::error(ErrorCode::kConnectionClosed);
    }
    if (is_temporary_accept_error(err)) {
      return Result::error(ErrorCode::kAcceptTemporary);
    }
    EDIAM_LOG_ERROR("Accept error on " + address_ + ": " + std::string(strerror(err)));
    return Result::error(ErrorCode::kSocketError);
  }

  auto transport = std::make_unique<TcpTransport>(std::move(sock));
  transport->apply_tuning(tuning_);
  return Result::success(std::move(transport));
}

void TcpListener::close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  // Wakes a thread blocked in accept(); the descriptor is released in the
  // destructor.
  if (acceptor_.is_open()) {
    ::shutdown(acceptor_.handle(), SHUT_RDWR);
  }
}

}  // namespace ediam
