#ifndef EDIAM_SYNC_HPP_
#define EDIAM_SYNC_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

namespace ediam {

// ============================================================================
// Event (one-shot broadcast signal)
// ============================================================================

class Event {
 public:
  Event() = default;

  Event(const Event&) = delete;
  Event& operator=(const Event&) = delete;

  // Fires the event. Returns true only for the call that fired it; every
  // later or concurrent call returns false.
  bool set() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (fired_) {
        return false;
      }
      fired_ = true;
    }
    cv_.notify_all();
    return true;
  }

  bool is_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return fired_; });
  }

  // Returns true if the event fired before the timeout expired.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return fired_; });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool fired_ = false;
};

// ============================================================================
// Mailbox (single-slot queue, non-blocking send, drop-on-full)
// ============================================================================

template <typename T>
class Mailbox {
 public:
  Mailbox() = default;

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  // Never blocks. A full slot drops the value and counts the drop.
  bool try_send(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (slot_.has_value()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
      slot_ = optional<T>(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  optional<T> try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_locked();
  }

  template <typename Rep, typename Period>
  optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return slot_.has_value(); })) {
      return optional<T>();
    }
    return take_locked();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !slot_.has_value();
  }

  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  optional<T> take_locked() {
    if (!slot_.has_value()) {
      return optional<T>();
    }
    optional<T> out(std::move(slot_.value()));
    slot_.reset();
    return out;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  optional<T> slot_;
  std::atomic<uint64_t> dropped_{0};
};

// Receive-only view of a Mailbox. Holders can drain reports but not send.
template <typename T>
class MailboxReceiver {
 public:
  explicit MailboxReceiver(std::shared_ptr<Mailbox<T>> mailbox) : mailbox_(std::move(mailbox)) {}

  optional<T> try_receive() const { return mailbox_->try_receive(); }

  template <typename Rep, typename Period>
  optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) const {
    return mailbox_->receive_for(timeout);
  }

  uint64_t dropped() const { return mailbox_->dropped(); }

 private:
  std::shared_ptr<Mailbox<T>> mailbox_;
};

}  // namespace ediam

#endif  // EDIAM_SYNC_HPP_
