#include "ediam/io.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace ediam;

namespace {

// Reader that hands out at most `chunk` bytes per call from a fixed buffer.
class ChunkedReader final : public Reader {
 public:
  ChunkedReader(std::string data, size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override {
    ++calls_;
    if (pos_ >= data_.size()) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kEndOfStream);
    }
    size_t n = std::min(std::min(len, chunk_), data_.size() - pos_);
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return expected<size_t, ErrorCode>::success(n);
  }

  size_t calls() const { return calls_; }

 private:
  std::string data_;
  size_t chunk_;
  size_t pos_ = 0;
  size_t calls_ = 0;
};

// Writer that records every call and can be told to fail.
class RecordingWriter final : public Writer {
 public:
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override {
    ++calls_;
    if (fail_) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
    }
    data_.append(reinterpret_cast<const char*>(buf), len);
    return expected<size_t, ErrorCode>::success(len);
  }

  const std::string& data() const { return data_; }
  size_t calls() const { return calls_; }
  void fail(bool on) { fail_ = on; }

 private:
  std::string data_;
  size_t calls_ = 0;
  bool fail_ = false;
};

std::string read_string(Reader& reader, size_t len) {
  std::string out(len, '\0');
  auto n = read_full(reader, reinterpret_cast<uint8_t*>(&out[0]), len);
  if (!n.has_value()) {
    return std::string("error: ") + error_string(n.get_error());
  }
  return out;
}

}  // namespace

// ============================================================================
// read_full / write_all
// ============================================================================

TEST_CASE("read_full - assembles short reads", "[io]") {
  ChunkedReader reader("abcdefghij", 3);
  REQUIRE(read_string(reader, 10) == "abcdefghij");
  REQUIRE(reader.calls() == 4);
}

TEST_CASE("read_full - end of stream before and inside", "[io]") {
  ChunkedReader empty("", 4);
  uint8_t buf[4];
  auto n = read_full(empty, buf, 4);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kEndOfStream);

  ChunkedReader short_stream("ab", 4);
  n = read_full(short_stream, buf, 4);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kUnexpectedEof);
}

TEST_CASE("write_all - propagates errors", "[io]") {
  RecordingWriter writer;
  const uint8_t data[] = {1, 2, 3};
  REQUIRE(write_all(writer, data, 3).has_value());
  REQUIRE(writer.data().size() == 3);

  writer.fail(true);
  auto result = write_all(writer, data, 3);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kSocketError);
}

// ============================================================================
// Pipe
// ============================================================================

TEST_CASE("Pipe - bytes in order", "[io][pipe]") {
  Pipe pipe;
  const char* text = "diameter";
  REQUIRE(write_all(pipe, reinterpret_cast<const uint8_t*>(text), 8).has_value());
  REQUIRE(pipe.buffered() == 8);
  REQUIRE(read_string(pipe, 8) == "diameter");
  REQUIRE(pipe.buffered() == 0);
}

TEST_CASE("Pipe - close_write drains then reports the reason", "[io][pipe]") {
  Pipe pipe;
  const uint8_t data[] = {1, 2};
  REQUIRE(write_all(pipe, data, 2).has_value());
  pipe.close_write(ErrorCode::kSocketError);
  REQUIRE(pipe.write_closed());

  uint8_t buf[4];
  auto n = pipe.read(buf, sizeof(buf));
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 2);

  n = pipe.read(buf, sizeof(buf));
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kSocketError);

  // Writing after close_write fails
  auto w = pipe.write(data, 2);
  REQUIRE(!w.has_value());
}

TEST_CASE("Pipe - close_write defaults to end of stream", "[io][pipe]") {
  Pipe pipe;
  pipe.close_write();
  pipe.close_write(ErrorCode::kSocketError);  // first reason wins

  uint8_t buf[1];
  auto n = pipe.read(buf, 1);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kEndOfStream);
}

TEST_CASE("Pipe - close_read fails pending writers", "[io][pipe]") {
  Pipe pipe;
  std::vector<uint8_t> big(Pipe::kCapacity + 1024, 0x5A);

  expected<void, ErrorCode> result = expected<void, ErrorCode>::success();
  std::thread writer([&pipe, &big, &result]() { result = write_all(pipe, big.data(), big.size()); });

  // Writer fills the pipe and then blocks
  while (pipe.buffered() < Pipe::kCapacity) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  pipe.close_read();
  writer.join();

  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kConnectionClosed);

  uint8_t buf[1];
  auto n = pipe.read(buf, 1);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("Pipe - read timeout", "[io][pipe]") {
  Pipe pipe;
  pipe.set_read_timeout(std::chrono::milliseconds(20));

  auto start = std::chrono::steady_clock::now();
  uint8_t buf[1];
  auto n = pipe.read(buf, 1);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kTimeout);
  REQUIRE(elapsed >= std::chrono::milliseconds(15));
}

TEST_CASE("Pipe - blocked reader wakes on write", "[io][pipe]") {
  Pipe pipe;
  std::string got;
  std::thread reader([&pipe, &got]() { got = read_string(pipe, 3); });

  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  const char* text = "abc";
  REQUIRE(write_all(pipe, reinterpret_cast<const uint8_t*>(text), 3).has_value());
  reader.join();
  REQUIRE(got == "abc");
}

// ============================================================================
// LiveSwitchReader
// ============================================================================

TEST_CASE("LiveSwitchReader - swap source mid-stream", "[io]") {
  ChunkedReader first("12345", 8);
  ChunkedReader second("67890", 8);
  LiveSwitchReader live(&first);

  REQUIRE(live.current() == &first);
  REQUIRE(read_string(live, 5) == "12345");

  Reader* previous = live.swap(&second);
  REQUIRE(previous == &first);
  REQUIRE(live.current() == &second);
  REQUIRE(read_string(live, 5) == "67890");
}

TEST_CASE("LiveSwitchReader - timeout goes to the current source", "[io]") {
  Pipe a;
  Pipe b;
  LiveSwitchReader live(&a);
  live.swap(&b);
  live.set_read_timeout(std::chrono::milliseconds(10));

  uint8_t buf[1];
  auto n = live.read(buf, 1);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kTimeout);
}

// ============================================================================
// BufferedReader / BufferedWriter
// ============================================================================

TEST_CASE("BufferedReader - one source read serves many small reads", "[io]") {
  ChunkedReader source("header-bytes-and-body", 64);
  BufferedReader reader(source);

  REQUIRE(read_string(reader, 7) == "header-");
  REQUIRE(reader.buffered() == 14);
  REQUIRE(read_string(reader, 14) == "bytes-and-body");
  REQUIRE(source.calls() == 1);
}

TEST_CASE("BufferedReader - end of stream after buffered bytes", "[io]") {
  ChunkedReader source("xy", 64);
  BufferedReader reader(source);

  REQUIRE(read_string(reader, 2) == "xy");
  uint8_t buf[1];
  auto n = reader.read(buf, 1);
  REQUIRE(!n.has_value());
  REQUIRE(n.get_error() == ErrorCode::kEndOfStream);
}

TEST_CASE("BufferedWriter - holds bytes until flush", "[io]") {
  RecordingWriter sink;
  BufferedWriter writer(sink);

  const char* text = "answer";
  auto n = writer.write(reinterpret_cast<const uint8_t*>(text), 6);
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 6);
  REQUIRE(sink.data().empty());
  REQUIRE(writer.buffered() == 6);

  REQUIRE(writer.flush().has_value());
  REQUIRE(sink.data() == "answer");
  REQUIRE(writer.buffered() == 0);
}

TEST_CASE("BufferedWriter - large write goes straight through", "[io]") {
  RecordingWriter sink;
  BufferedWriter writer(sink);

  std::vector<uint8_t> big(BufferedWriter::kBufferSize + 10, 0x42);
  REQUIRE(writer.write(big.data(), big.size()).has_value());
  REQUIRE(sink.data().size() == big.size());
  REQUIRE(writer.buffered() == 0);
}

TEST_CASE("BufferedWriter - failed flush empties the buffer", "[io]") {
  RecordingWriter sink;
  BufferedWriter writer(sink);
  const uint8_t data[] = {1, 2, 3};
  REQUIRE(writer.write(data, 3).has_value());

  sink.fail(true);
  auto flushed = writer.flush();
  REQUIRE(!flushed.has_value());
  REQUIRE(flushed.get_error() == ErrorCode::kSocketError);
  REQUIRE(writer.buffered() == 0);

  sink.fail(false);
  REQUIRE(writer.flush().has_value());
  REQUIRE(sink.data().empty());
}
