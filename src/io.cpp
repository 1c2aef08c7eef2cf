#include "ediam/io.hpp"

namespace ediam {

expected<size_t, ErrorCode> read_full(Reader& reader, uint8_t* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    auto n = reader.read(buf + got, len - got);
    if (!n.has_value()) {
      if (n.get_error() == ErrorCode::kEndOfStream && got > 0) {
        return expected<size_t, ErrorCode>::error(ErrorCode::kUnexpectedEof);
      }
      return expected<size_t, ErrorCode>::error(n.get_error());
    }
    if (n.value() == 0) {
      return expected<size_t, ErrorCode>::error(got > 0 ? ErrorCode::kUnexpectedEof
                                                        : ErrorCode::kEndOfStream);
    }
    got += n.value();
  }
  return expected<size_t, ErrorCode>::success(got);
}

expected<void, ErrorCode> write_all(Writer& writer, const uint8_t* buf, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    auto n = writer.write(buf + sent, len - sent);
    if (!n.has_value()) {
      return expected<void, ErrorCode>::error(n.get_error());
    }
    if (n.value() == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    sent += n.value();
  }
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// Pipe
// ============================================================================

expected<size_t, ErrorCode> Pipe::read(uint8_t* buf, size_t len) {
  if (len == 0) {
    return expected<size_t, ErrorCode>::success(0);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  auto ready = [this]() { return !buffer_.empty() || write_closed_ || read_closed_; };
  if (read_timeout_.count() > 0) {
    if (!readable_.wait_for(lock, read_timeout_, ready)) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kTimeout);
    }
  } else {
    readable_.wait(lock, ready);
  }

  if (read_closed_) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  if (buffer_.empty()) {
    return expected<size_t, ErrorCode>::error(close_reason_);
  }

  size_t n = buffer_.pop(buf, len);
  writable_.notify_all();
  return expected<size_t, ErrorCode>::success(n);
}

expected<size_t, ErrorCode> Pipe::write(const uint8_t* buf, size_t len) {
  size_t sent = 0;
  std::unique_lock<std::mutex> lock(mutex_);
  while (sent < len) {
    writable_.wait(lock, [this]() { return buffer_.available() > 0 || read_closed_ || write_closed_; });
    if (read_closed_ || write_closed_) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    size_t chunk = std::min(len - sent, buffer_.available());
    buffer_.push(buf + sent, chunk);
    sent += chunk;
    readable_.notify_all();
  }
  return expected<size_t, ErrorCode>::success(sent);
}

void Pipe::set_read_timeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  read_timeout_ = timeout;
}

void Pipe::close_write(ErrorCode reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (write_closed_) {
    return;
  }
  write_closed_ = true;
  close_reason_ = reason == ErrorCode::kOk ? ErrorCode::kEndOfStream : reason;
  readable_.notify_all();
  writable_.notify_all();
}

void Pipe::close_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  read_closed_ = true;
  readable_.notify_all();
  writable_.notify_all();
}

size_t Pipe::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

bool Pipe::write_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_closed_;
}

// ============================================================================
// LiveSwitchReader
// ============================================================================

expected<size_t, ErrorCode> LiveSwitchReader::read(uint8_t* buf, size_t len) {
  Reader* source;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    source = source_;
  }
  return source->read(buf, len);
}

void LiveSwitchReader::set_read_timeout(std::chrono::milliseconds timeout) {
  Reader* source;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    source = source_;
  }
  source->set_read_timeout(timeout);
}

Reader* LiveSwitchReader::swap(Reader* next) {
  std::lock_guard<std::mutex> lock(mutex_);
  Reader* previous = source_;
  source_ = next;
  return previous;
}

Reader* LiveSwitchReader::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return source_;
}

// ============================================================================
// BufferedReader / BufferedWriter
// ============================================================================

expected<size_t, ErrorCode> BufferedReader::read(uint8_t* buf, size_t len) {
  if (len == 0) {
    return expected<size_t, ErrorCode>::success(0);
  }
  if (buffer_.empty()) {
    // Large reads bypass the buffer
    if (len >= kBufferSize) {
      return source_.read(buf, len);
    }
    auto filled = fill();
    if (!filled.has_value()) {
      return expected<size_t, ErrorCode>::error(filled.get_error());
    }
  }
  return expected<size_t, ErrorCode>::success(buffer_.pop(buf, len));
}

expected<void, ErrorCode> BufferedReader::fill() {
  uint8_t temp[kBufferSize];
  auto n = source_.read(temp, buffer_.available());
  if (!n.has_value()) {
    return expected<void, ErrorCode>::error(n.get_error());
  }
  buffer_.push(temp, n.value());
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> BufferedWriter::write(const uint8_t* buf, size_t len) {
  if (len > buffer_.available()) {
    auto flushed = flush();
    if (!flushed.has_value()) {
      return expected<size_t, ErrorCode>::error(flushed.get_error());
    }
  }

  if (len >= kBufferSize) {
    auto written = write_all(sink_, buf, len);
    if (!written.has_value()) {
      return expected<size_t, ErrorCode>::error(written.get_error());
    }
    return expected<size_t, ErrorCode>::success(len);
  }

  buffer_.push(buf, len);
  return expected<size_t, ErrorCode>::success(len);
}

expected<void, ErrorCode> BufferedWriter::flush() {
  struct iovec iov[2];
  size_t iov_count = buffer_.fill_iovec(iov, 2);

  for (size_t i = 0; i < iov_count; ++i) {
    auto written = write_all(sink_, static_cast<const uint8_t*>(iov[i].iov_base), iov[i].iov_len);
    if (!written.has_value()) {
      buffer_.clear();
      return written;
    }
  }
  buffer_.clear();
  return expected<void, ErrorCode>::success();
}

}  // namespace ediam
