#ifndef EDIAM_IO_HPP_
#define EDIAM_IO_HPP_

#include "ring_buffer.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ediam {

// ============================================================================
// Byte stream interfaces
// ============================================================================

// A successful read returns at least one byte. An orderly end of stream is
// reported as ErrorCode::kEndOfStream.
class Reader {
 public:
  virtual ~Reader() = default;

  virtual expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) = 0;

  // Zero disables the timeout.
  virtual void set_read_timeout(std::chrono::milliseconds /* timeout */) {}
};

class Writer {
 public:
  virtual ~Writer() = default;

  virtual expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) = 0;

  // Zero disables the timeout.
  virtual void set_write_timeout(std::chrono::milliseconds /* timeout */) {}
};

// Reads exactly len bytes. kEndOfStream when the stream ended before the
// first byte, kUnexpectedEof when it ended part way.
expected<size_t, ErrorCode> read_full(Reader& reader, uint8_t* buf, size_t len);

expected<void, ErrorCode> write_all(Writer& writer, const uint8_t* buf, size_t len);

// ============================================================================
// Pipe (bounded in-memory byte pipe)
// ============================================================================

/**
 * @brief Synchronous in-memory pipe.
 *
 * Writers block while the buffer is full, readers block while it is empty.
 * close_write() lets readers drain what is buffered and then fail with the
 * given reason. close_read() makes pending and future writes fail.
 */
class Pipe final : public Reader, public Writer {
 public:
  static constexpr size_t kCapacity = 65536;

  Pipe() = default;

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;
  void set_read_timeout(std::chrono::milliseconds timeout) override;

  void close_write(ErrorCode reason = ErrorCode::kEndOfStream);
  void close_read();

  size_t buffered() const;
  bool write_closed() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable readable_;
  std::condition_variable writable_;
  RingBuffer<uint8_t, kCapacity> buffer_;
  std::chrono::milliseconds read_timeout_{0};
  bool write_closed_ = false;
  bool read_closed_ = false;
  ErrorCode close_reason_ = ErrorCode::kEndOfStream;
};

// ============================================================================
// LiveSwitchReader
// ============================================================================

// Reader whose source may be replaced while another thread reads through it.
class LiveSwitchReader final : public Reader {
 public:
  explicit LiveSwitchReader(Reader* source) : source_(source) {}

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  void set_read_timeout(std::chrono::milliseconds timeout) override;

  // Returns the previous source.
  Reader* swap(Reader* next);

  Reader* current() const;

 private:
  mutable std::mutex mutex_;
  Reader* source_;
};

// ============================================================================
// Buffered reader / writer
// ============================================================================

class BufferedReader final : public Reader {
 public:
  static constexpr size_t kBufferSize = 4096;

  explicit BufferedReader(Reader& source) : source_(source) {}

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  void set_read_timeout(std::chrono::milliseconds timeout) override {
    source_.set_read_timeout(timeout);
  }

  size_t buffered() const { return buffer_.size(); }

 private:
  expected<void, ErrorCode> fill();

  Reader& source_;
  RingBuffer<uint8_t, kBufferSize> buffer_;
};

class BufferedWriter final : public Writer {
 public:
  static constexpr size_t kBufferSize = 8192;

  explicit BufferedWriter(Writer& sink) : sink_(sink) {}

  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;
  void set_write_timeout(std::chrono::milliseconds timeout) override {
    sink_.set_write_timeout(timeout);
  }

  // Writes everything buffered to the sink. The buffer is emptied even on
  // failure.
  expected<void, ErrorCode> flush();

  size_t buffered() const { return buffer_.size(); }

 private:
  Writer& sink_;
  RingBuffer<uint8_t, kBufferSize> buffer_;
};

}  // namespace ediam

#endif  // EDIAM_IO_HPP_
