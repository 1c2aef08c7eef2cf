#include "ediam/executor.hpp"

#include "ediam/log.hpp"

#include <exception>
#include <system_error>

namespace ediam {

// ============================================================================
// ThreadPerConnection
// ============================================================================

bool ThreadPerConnection::submit(Task task) {
  std::shared_ptr<State> state = state_;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    ++state->running;
  }

  try {
    std::thread([state, task = std::move(task)]() {
      task();
      std::lock_guard<std::mutex> lock(state->mutex);
      if (--state->running == 0) {
        state->idle.notify_all();
      }
    }).detach();
  } catch (const std::system_error& e) {
    EDIAM_LOG_ERROR(std::string("Failed to start connection thread: ") + e.what());
    std::lock_guard<std::mutex> lock(state->mutex);
    if (--state->running == 0) {
      state->idle.notify_all();
    }
    return false;
  }
  return true;
}

size_t ThreadPerConnection::active() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->running;
}

bool ThreadPerConnection::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->idle.wait_for(lock, timeout, [this]() { return state_->running == 0; });
}

// ============================================================================
// BoundedPool
// ============================================================================

BoundedPool::BoundedPool(size_t workers, size_t max_pending) : max_pending_(max_pending) {
  if (workers == 0) {
    workers = 1;
  }
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&BoundedPool::worker_loop, this);
  }
}

BoundedPool::~BoundedPool() {
  shutdown();
}

bool BoundedPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || queue_.size() >= max_pending_) {
      return false;
    }
    queue_.push_back(std::move(task));
  }
  work_ready_.notify_one();
  return true;
}

size_t BoundedPool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ + queue_.size();
}

size_t BoundedPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool BoundedPool::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, timeout, [this]() { return running_ == 0 && queue_.empty(); });
}

void BoundedPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  work_ready_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void BoundedPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_ready_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    task();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
      if (running_ == 0 && queue_.empty()) {
        idle_.notify_all();
      }
    }
  }
}

}  // namespace ediam
