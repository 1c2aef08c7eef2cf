#include "ediam/server.hpp"

#include "ediam/header.hpp"
#include "ediam/log.hpp"
#include "ediam/serve_mux.hpp"

namespace ediam {

expected<void, ErrorCode> ServerConfig::validate() const {
  if (read_timeout.count() < 0 || write_timeout.count() < 0) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
  }
  auto hp = parse_address(address);
  if (!hp.has_value()) {
    return expected<void, ErrorCode>::error(hp.get_error());
  }
  return expected<void, ErrorCode>::success();
}

Server::Server(ServerConfig config) : config_(std::move(config)), stats_(std::make_shared<ServerStats>()) {
  if (config_.address.empty()) {
    config_.address = ":" + std::to_string(kDefaultPort);
  }
  if (!config_.handler) {
    config_.handler = make_serve_mux();
  }
  if (!config_.dictionary) {
    config_.dictionary = Dictionary::base();
  }
  if (!config_.executor) {
    config_.executor = std::make_shared<ThreadPerConnection>();
  }
}

Server::~Server() {
  stop();
}

void Server::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_requested_ = true;
  if (listener_ != nullptr) {
    listener_->close();
  }
  stop_cv_.notify_all();
}

void Server::wait_before_retry(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  stop_cv_.wait_for(lock, delay, [this]() { return stop_requested_; });
}

expected<void, ErrorCode> Server::serve(Listener& listener) {
  auto valid = config_.validate();
  if (!valid.has_value()) {
    listener.close();
    return valid;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
      stop_requested_ = false;
      listener.close();
      return expected<void, ErrorCode>::success();
    }
    listener_ = &listener;
  }
  running_.store(true, std::memory_order_release);

  ScopeGuard guard([this, &listener]() {
    listener.close();
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = nullptr;
    stop_requested_ = false;
    running_.store(false, std::memory_order_release);
  });

  EDIAM_LOG_INFO("Server accepting on " + listener.address());

  ConnectionOptions options;
  options.handler = config_.handler;
  options.dictionary = config_.dictionary;
  options.read_timeout = config_.read_timeout;
  options.write_timeout = config_.write_timeout;
  options.stats = stats_;

  AcceptBackoff backoff;
  while (true) {
    auto accepted = listener.accept();
    if (!accepted.has_value()) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
          EDIAM_LOG_INFO("Server stopped");
          return expected<void, ErrorCode>::success();
        }
      }

      stats_->accept_errors.fetch_add(1, std::memory_order_relaxed);
      ErrorCode err = accepted.get_error();
      if (err == ErrorCode::kAcceptTemporary) {
        std::chrono::milliseconds delay = backoff.next();
        EDIAM_LOG_WARN("Accept error: " + std::string(error_string(err)) + "; retrying in " +
                       std::to_string(delay.count()) + "ms");
        if (on_accept_retry) {
          on_accept_retry(delay);
        }
        wait_before_retry(delay);
        continue;
      }

      EDIAM_LOG_ERROR("Accept failed on " + listener.address() + ": " + error_string(err));
      return expected<void, ErrorCode>::error(err);
    }
    backoff.reset();

    auto conn = std::make_shared<Connection>(std::move(accepted.value()), options);
    stats_->total_connections.fetch_add(1, std::memory_order_relaxed);
    stats_->active_connections.fetch_add(1, std::memory_order_relaxed);
    if (on_connect) {
      on_connect(conn);
    }

    std::shared_ptr<ServerStats> stats = stats_;
    bool admitted = config_.executor->submit([conn, stats]() {
      conn->serve();
      stats->active_connections.fetch_sub(1, std::memory_order_relaxed);
    });
    if (!admitted) {
      stats_->rejected_connections.fetch_add(1, std::memory_order_relaxed);
      stats_->active_connections.fetch_sub(1, std::memory_order_relaxed);
      EDIAM_LOG_WARN("Rejected connection from " + conn->remote_address());
      conn->close();
    }
  }
}

expected<void, ErrorCode> Server::listen_and_serve() {
  auto valid = config_.validate();
  if (!valid.has_value()) {
    return valid;
  }

  auto listener = TcpListener::listen(config_.address, config_.tcp_tuning);
  if (!listener.has_value()) {
    return expected<void, ErrorCode>::error(listener.get_error());
  }
  return serve(*listener.value());
}

expected<void, ErrorCode> Server::listen_and_serve_tls(const std::string& cert_file,
                                                       const std::string& key_file) {
  auto valid = config_.validate();
  if (!valid.has_value()) {
    return valid;
  }

  TlsConfig tls = config_.tls;
  if (!cert_file.empty()) {
    tls.cert_path = cert_file;
  }
  if (!key_file.empty()) {
    tls.key_path = key_file;
  }

  auto context = TlsContext::create(tls);
  if (!context.has_value()) {
    return expected<void, ErrorCode>::error(context.get_error());
  }

  auto tcp = TcpListener::listen(config_.address, config_.tcp_tuning);
  if (!tcp.has_value()) {
    return expected<void, ErrorCode>::error(tcp.get_error());
  }

  TlsListener listener(std::move(tcp.value()), context.value());
  return serve(listener);
}

// ============================================================================
// Entry points
// ============================================================================

expected<void, ErrorCode> serve(Listener& listener, HandlerPtr handler) {
  ServerConfig config;
  config.handler = std::move(handler);
  Server server(std::move(config));
  return server.serve(listener);
}

expected<void, ErrorCode> listen_and_serve(const std::string& address, HandlerPtr handler,
                                           DictionaryPtr dictionary) {
  ServerConfig config;
  config.address = address;
  config.handler = std::move(handler);
  config.dictionary = std::move(dictionary);
  Server server(std::move(config));
  return server.listen_and_serve();
}

expected<void, ErrorCode> listen_and_serve_tls(const std::string& address,
                                               const std::string& cert_file,
                                               const std::string& key_file, HandlerPtr handler,
                                               DictionaryPtr dictionary) {
  ServerConfig config;
  config.address = address;
  config.handler = std::move(handler);
  config.dictionary = std::move(dictionary);
  Server server(std::move(config));
  return server.listen_and_serve_tls(cert_file, key_file);
}

}  // namespace ediam
