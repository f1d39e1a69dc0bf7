// Tidegraph kernel: fixed-size worker pool used for level fan-out
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tg {

using Task = std::function<void()>;

/**
 * @brief Worker threads fed from one shared queue.
 *
 * run_batch() submits a group of tasks and blocks until every one of them
 * has finished or been skipped. After the first failure the remaining
 * tasks of that batch are skipped and the failure is rethrown to the
 * caller. Batches from different callers may be in flight at once.
 */
class WorkerPool {
public:
  explicit WorkerPool(unsigned int num_workers = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void run_batch(std::vector<Task>&& tasks);

  unsigned int size() const { return num_workers_; }

private:
  struct Batch {
    std::mutex mutex;
    std::condition_variable cv_done;
    size_t remaining = 0;
    std::atomic<bool> failed{false};
    std::exception_ptr first_exception{nullptr};
  };

  void run_loop();
  void finish_one(const std::shared_ptr<Batch>& batch);

  std::vector<std::thread> workers_;
  unsigned int num_workers_{0};
  bool stopping_{false};

  std::queue<Task> queue_;
  std::mutex queue_mutex_;
  std::condition_variable cv_task_available_;
};

}  // namespace tg
