#ifndef EDIAM_EXECUTOR_HPP_
#define EDIAM_EXECUTOR_HPP_

#include <cstddef>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ediam {

// ============================================================================
// ConnectionExecutor (how accepted connections get a thread)
// ============================================================================

class ConnectionExecutor {
 public:
  using Task = std::function<void()>;

  virtual ~ConnectionExecutor() = default;

  // Returns false when the task was not admitted. The caller still owns
  // whatever the task would have cleaned up.
  virtual bool submit(Task task) = 0;

  // Tasks running or queued.
  virtual size_t active() const = 0;

  // Blocks until active() drops to zero or the timeout expires.
  virtual bool wait_idle(std::chrono::milliseconds timeout) = 0;
};

using ExecutorPtr = std::shared_ptr<ConnectionExecutor>;

// One detached thread per task, no admission limit.
class ThreadPerConnection final : public ConnectionExecutor {
 public:
  ThreadPerConnection() : state_(std::make_shared<State>()) {}

  bool submit(Task task) override;
  size_t active() const override;
  bool wait_idle(std::chrono::milliseconds timeout) override;

 private:
  // Shared with the detached threads so they may outlive the executor.
  struct State {
    std::mutex mutex;
    std::condition_variable idle;
    size_t running = 0;
  };

  std::shared_ptr<State> state_;
};

/**
 * @brief Fixed worker threads with a bounded pending queue.
 *
 * submit() fails once max_pending tasks are waiting for a worker. Each
 * connection occupies a worker for its whole lifetime.
 */
class BoundedPool final : public ConnectionExecutor {
 public:
  BoundedPool(size_t workers, size_t max_pending);
  ~BoundedPool() override;

  BoundedPool(const BoundedPool&) = delete;
  BoundedPool& operator=(const BoundedPool&) = delete;

  bool submit(Task task) override;
  size_t active() const override;
  bool wait_idle(std::chrono::milliseconds timeout) override;

  size_t pending() const;
  size_t workers() const { return threads_.size(); }

  // Stops accepting tasks, runs what is queued and joins the workers.
  void shutdown();

 private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable work_ready_;
  std::condition_variable idle_;
  std::deque<Task> queue_;
  size_t max_pending_;
  size_t running_ = 0;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace ediam

#endif  // EDIAM_EXECUTOR_HPP_
