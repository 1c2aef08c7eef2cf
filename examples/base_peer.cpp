#include "ediam.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// Minimal base-protocol peer: answers CER, DWR and DPR, prints error reports.
//
//   ediam_base_peer [address] [cert.pem key.pem]

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int /* sig */) { g_stop = 1; }

static ediam::HandlerFunc::Func answer(const char* label) {
  return [label](const ediam::ConnPtr& conn, const ediam::MessagePtr& msg) {
    std::cout << label << " from " << conn->remote_address() << ": " << msg->to_string()
              << std::endl;
    // Bare answer header; Result-Code and identity AVPs belong to the codec layer.
    auto written = conn->write_message(*msg->make_answer());
    if (!written.has_value()) {
      std::cerr << "Failed to answer " << label << ": " << ediam::error_string(written.get_error())
                << std::endl;
    }
  };
}

int main(int argc, char* argv[]) {
  std::string address = argc > 1 ? argv[1] : ":3868";

  auto mux = ediam::make_serve_mux(ediam::DuplicatePolicy::kReject);
  bool registered = mux->handle_func("CER", answer("CER")).has_value() &&
                    mux->handle_func("DWR", answer("DWR")).has_value() &&
                    mux->handle_func("DPR", [](const ediam::ConnPtr& conn, const ediam::MessagePtr& msg) {
                      auto written = conn->write_message(*msg->make_answer());
                      if (!written.has_value()) {
                        std::cerr << "Failed to answer DPR: "
                                  << ediam::error_string(written.get_error()) << std::endl;
                      }
                      conn->close();
                    }).has_value();
  if (!registered) {
    std::cerr << "Error: handler registration failed" << std::endl;
    return 1;
  }

  ediam::ServerConfig config;
  config.address = address;
  config.handler = mux;
  config.read_timeout = std::chrono::seconds(30);
  config.write_timeout = std::chrono::seconds(5);
  config.tcp_tuning.tcp_nodelay = true;

  ediam::Server server(config);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  // Drains error reports and turns a signal into server.stop().
  std::atomic<bool> running{true};
  std::thread monitor([&running, &server, reports = mux->error_reports()]() {
    while (running.load()) {
      if (g_stop != 0) {
        server.stop();
      }
      auto report = reports.receive_for(std::chrono::milliseconds(200));
      if (!report.has_value()) {
        continue;
      }
      const ediam::ErrorReport& r = report.value();
      std::cerr << "Error from " << (r.conn ? r.conn->remote_address() : std::string("?")) << ": "
                << r.what();
      if (r.message) {
        std::cerr << " (" << r.message->to_string() << ")";
      }
      std::cerr << std::endl;
    }
  });

  ediam::expected<void, ediam::ErrorCode> result =
      argc > 3 ? server.listen_and_serve_tls(argv[2], argv[3]) : server.listen_and_serve();

  running = false;
  monitor.join();

  if (!result.has_value()) {
    std::cerr << "Error: " << ediam::error_string(result.get_error()) << std::endl;
    return 1;
  }
  return 0;
}
