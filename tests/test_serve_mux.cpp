#include "ediam/serve_mux.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ediam;

namespace {

// Conn that only remembers what it was asked to write.
class StubConn final : public Conn {
 public:
  expected<size_t, ErrorCode> write(const uint8_t* /* data */, size_t len) override {
    written_ += len;
    return expected<size_t, ErrorCode>::success(len);
  }
  void close() override {}
  std::string local_address() const override { return "127.0.0.1:3868"; }
  std::string remote_address() const override { return "127.0.0.1:50000"; }
  optional<TlsState> tls() const override { return optional<TlsState>(); }
  std::any context() const override { return context_; }
  void set_context(std::any value) override { context_ = std::move(value); }

  size_t written() const { return written_; }

 private:
  size_t written_ = 0;
  std::any context_;
};

DictionaryPtr credit_control_dictionary() {
  auto dict = std::make_shared<StaticDictionary>();
  dict->add(0, 257, "Capabilities-Exchange", "CE").add(4, 272, "Credit-Control", "CC");
  return dict;
}

MessagePtr make_message(uint32_t app, uint32_t code, bool request,
                        DictionaryPtr dict = Dictionary::base()) {
  return std::make_shared<Message>(test::make_header(app, code, request), std::vector<uint8_t>(),
                                   std::move(dict));
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("ServeMux - dispatch key", "[mux]") {
  REQUIRE(dispatch_key(*make_message(0, 257, true)) == "CER");
  REQUIRE(dispatch_key(*make_message(0, 257, false)) == "CEA");
  REQUIRE(dispatch_key(*make_message(3, 271, true)) == "ACR");
  REQUIRE(dispatch_key(*make_message(4, 272, true)) == ServeMux::kCatchAll);
  REQUIRE(dispatch_key(*make_message(4, 272, false, credit_control_dictionary())) == "CCA");
}

TEST_CASE("ServeMux - request reaches its handler exactly once", "[mux]") {
  ServeMux mux;
  int ccr_calls = 0;
  int cca_calls = 0;
  REQUIRE(mux.handle_func("CCR", [&ccr_calls](const ConnPtr&, const MessagePtr&) { ++ccr_calls; })
              .has_value());
  REQUIRE(mux.handle_func("CCA", [&cca_calls](const ConnPtr&, const MessagePtr&) { ++cca_calls; })
              .has_value());

  auto conn = std::make_shared<StubConn>();
  mux.serve_message(conn, make_message(4, 272, true, credit_control_dictionary()));

  REQUIRE(ccr_calls == 1);
  REQUIRE(cca_calls == 0);
  REQUIRE(!mux.error_reports().try_receive().has_value());
}

TEST_CASE("ServeMux - handler receives the same conn and message", "[mux]") {
  ServeMux mux;
  ConnPtr seen_conn;
  MessagePtr seen_msg;
  REQUIRE(mux.handle_func("DWR", [&seen_conn, &seen_msg](const ConnPtr& c, const MessagePtr& m) {
                seen_conn = c;
                seen_msg = m;
              }).has_value());

  auto conn = std::make_shared<StubConn>();
  auto msg = make_message(0, 280, true);
  mux.serve_message(conn, msg);

  REQUIRE(seen_conn == conn);
  REQUIRE(seen_msg == msg);
}

TEST_CASE("ServeMux - unhandled message is reported once", "[mux]") {
  ServeMux mux;
  REQUIRE(mux.handle_func("CER", [](const ConnPtr&, const MessagePtr&) {}).has_value());

  auto conn = std::make_shared<StubConn>();
  auto msg = make_message(0, 280, true);
  mux.serve_message(conn, msg);

  auto reports = mux.error_reports();
  auto report = reports.try_receive();
  REQUIRE(report.has_value());
  REQUIRE(std::string(report.value().what()) == "unhandled message");
  REQUIRE(report.value().error == ErrorCode::kUnhandledMessage);
  REQUIRE(report.value().conn == conn);
  REQUIRE(report.value().message == msg);
  REQUIRE(!reports.try_receive().has_value());

  // No answer is generated
  REQUIRE(conn->written() == 0);
}

TEST_CASE("ServeMux - unknown command goes to the catch-all", "[mux]") {
  ServeMux mux;
  int all_calls = 0;
  REQUIRE(mux.handle_func(ServeMux::kCatchAll,
                          [&all_calls](const ConnPtr&, const MessagePtr&) { ++all_calls; })
              .has_value());

  auto conn = std::make_shared<StubConn>();
  mux.serve_message(conn, make_message(4, 272, true));
  mux.serve_message(conn, make_message(4, 272, false));
  REQUIRE(all_calls == 2);
  REQUIRE(!mux.error_reports().try_receive().has_value());

  // A resolved command with no handler does not fall through to ALL
  mux.serve_message(conn, make_message(0, 257, true));
  REQUIRE(all_calls == 2);
  REQUIRE(mux.error_reports().try_receive().has_value());
}

TEST_CASE("ServeMux - unknown command without catch-all", "[mux]") {
  ServeMux mux;
  auto conn = std::make_shared<StubConn>();
  auto msg = make_message(4, 272, true);
  mux.serve_message(conn, msg);

  auto report = mux.error_reports().try_receive();
  REQUIRE(report.has_value());
  REQUIRE(report.value().message == msg);
}

TEST_CASE("ServeMux - report mailbox drops when full", "[mux]") {
  ServeMux mux;
  auto conn = std::make_shared<StubConn>();
  mux.serve_message(conn, make_message(0, 257, true));
  mux.serve_message(conn, make_message(0, 280, true));

  REQUIRE(mux.dropped_reports() == 1);
  auto report = mux.error_reports().try_receive();
  REQUIRE(report.has_value());
  REQUIRE(report.value().message->header.command_code == 257);
  REQUIRE(!mux.error_reports().try_receive().has_value());
}

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("ServeMux - nil handler is rejected", "[mux]") {
  ServeMux mux;
  int calls = 0;
  REQUIRE(mux.handle_func("CER", [&calls](const ConnPtr&, const MessagePtr&) { ++calls; })
              .has_value());

  auto result = mux.handle("CER", nullptr);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kNullHandler);

  result = mux.handle_func("CER", HandlerFunc::Func());
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kNullHandler);

  // The earlier registration is untouched
  mux.serve_message(std::make_shared<StubConn>(), make_message(0, 257, true));
  REQUIRE(calls == 1);
  REQUIRE(mux.size() == 1);
}

TEST_CASE("ServeMux - duplicate key replaces by default", "[mux]") {
  ServeMux mux;
  REQUIRE(mux.duplicate_policy() == DuplicatePolicy::kReplace);

  int first = 0;
  int second = 0;
  REQUIRE(mux.handle_func("CER", [&first](const ConnPtr&, const MessagePtr&) { ++first; })
              .has_value());
  REQUIRE(mux.handle_func("CER", [&second](const ConnPtr&, const MessagePtr&) { ++second; })
              .has_value());

  mux.serve_message(std::make_shared<StubConn>(), make_message(0, 257, true));
  REQUIRE(first == 0);
  REQUIRE(second == 1);
  REQUIRE(mux.size() == 1);
}

TEST_CASE("ServeMux - duplicate key can be rejected", "[mux]") {
  ServeMux mux(DuplicatePolicy::kReject);

  int first = 0;
  int second = 0;
  REQUIRE(mux.handle_func("CER", [&first](const ConnPtr&, const MessagePtr&) { ++first; })
              .has_value());
  auto result = mux.handle_func("CER", [&second](const ConnPtr&, const MessagePtr&) { ++second; });
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kDuplicateHandler);

  mux.serve_message(std::make_shared<StubConn>(), make_message(0, 257, true));
  REQUIRE(first == 1);
  REQUIRE(second == 0);
}

TEST_CASE("ServeMux - registered commands and remove", "[mux]") {
  auto mux = make_serve_mux();
  auto noop = [](const ConnPtr&, const MessagePtr&) {};
  REQUIRE(mux->handle_func("DWR", noop).has_value());
  REQUIRE(mux->handle_func("CER", noop).has_value());
  REQUIRE(mux->handle_func("ALL", noop).has_value());

  REQUIRE(mux->registered_commands() == std::vector<std::string>({"ALL", "CER", "DWR"}));
  REQUIRE(mux->has_handler("CER"));

  REQUIRE(mux->remove("CER"));
  REQUIRE(!mux->remove("CER"));
  REQUIRE(!mux->has_handler("CER"));
  REQUIRE(mux->size() == 2);
}

TEST_CASE("ServeMux - concurrent dispatch", "[mux]") {
  auto mux = make_serve_mux();
  std::atomic<int> calls{0};
  REQUIRE(mux->handle_func("DWR", [&calls](const ConnPtr&, const MessagePtr&) { calls.fetch_add(1); })
              .has_value());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&mux]() {
      auto conn = std::make_shared<StubConn>();
      for (int i = 0; i < 250; ++i) {
        mux->serve_message(conn, make_message(0, 280, true));
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(calls.load() == 1000);
}

TEST_CASE("ServeMux - handler may register while dispatching", "[mux]") {
  auto mux = make_serve_mux();
  bool registered = false;
  REQUIRE(mux->handle_func("CER", [&mux, &registered](const ConnPtr&, const MessagePtr&) {
                registered = mux->handle_func("DWR", [](const ConnPtr&, const MessagePtr&) {})
                                 .has_value();
              }).has_value());

  mux->serve_message(std::make_shared<StubConn>(), make_message(0, 257, true));
  REQUIRE(registered);
  REQUIRE(mux->has_handler("DWR"));
}
