#include "ediam/stack_trace.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace ediam;

namespace {

volatile int g_unwound = 0;

// Not a tail call, so every level keeps its frame.
[[gnu::noinline]] void throw_from_depth(int depth) {
  if (depth == 0) {
    throw_with_trace(std::runtime_error("deep"));
  }
  throw_from_depth(depth - 1);
  g_unwound = g_unwound + depth;
}

}  // namespace

TEST_CASE("throw_with_trace - records the stack where it was thrown", "[stacktrace]") {
  const std::size_t catch_depth = StackTrace().size();
  bool caught = false;
  try {
    throw_from_depth(8);
  } catch (const std::exception& e) {
    caught = true;
    REQUIRE(std::string(e.what()) == "deep");

    const StackTrace* thrown = thrown_at(e);
    REQUIRE(thrown != nullptr);
    // The throwing frames are below the catch site
    REQUIRE(thrown->size() > catch_depth + 4);
    REQUIRE(format_stack(*thrown).find("#8 ") != std::string::npos);
  }
  REQUIRE(caught);
}

TEST_CASE("throw_with_trace - keeps the exception type", "[stacktrace]") {
  bool caught = false;
  try {
    throw_with_trace(std::invalid_argument("bad AVP"));
  } catch (const std::invalid_argument& e) {
    caught = true;
    REQUIRE(thrown_at(e) != nullptr);
  }
  REQUIRE(caught);
}

TEST_CASE("thrown_at - plain exceptions carry no stack", "[stacktrace]") {
  std::runtime_error plain("plain");
  REQUIRE(thrown_at(plain) == nullptr);
}

TEST_CASE("stack_trace - renders the calling thread", "[stacktrace]") {
  std::string trace = stack_trace();
  REQUIRE(!trace.empty());
  REQUIRE(trace.find("#0 ") != std::string::npos);

  REQUIRE(format_stack(StackTrace(0, 0)) == "(no stack trace available)\n");
}
