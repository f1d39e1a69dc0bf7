// Tidegraph kernel: WorkerPool implementation
#include "kernel/worker_pool.hpp"

#include <algorithm>

namespace tg {

WorkerPool::WorkerPool(unsigned int num_workers) {
    num_workers_ = num_workers ? num_workers
                               : std::max(1u, std::thread::hardware_concurrency());
    workers_.reserve(num_workers_);
    for (unsigned int i = 0; i < num_workers_; ++i) {
        workers_.emplace_back(&WorkerPool::run_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        stopping_ = true;
    }
    cv_task_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::run_loop() {
    while (true) {
        Task job;
        {
            std::unique_lock<std::mutex> lk(queue_mutex_);
            cv_task_available_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop();
        }
        // Batch wrappers capture their own exceptions.
        job();
    }
}

void WorkerPool::finish_one(const std::shared_ptr<Batch>& batch) {
    std::lock_guard<std::mutex> lk(batch->mutex);
    if (--batch->remaining == 0) {
        batch->cv_done.notify_all();
    }
}

void WorkerPool::run_batch(std::vector<Task>&& tasks) {
    if (tasks.empty()) return;

    auto batch = std::make_shared<Batch>();
    batch->remaining = tasks.size();
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        for (auto& task : tasks) {
            queue_.push([this, batch, t = std::move(task)]() {
                if (!batch->failed.load(std::memory_order_acquire)) {
                    try {
                        t();
                    } catch (...) {
                        std::lock_guard<std::mutex> elk(batch->mutex);
                        if (!batch->first_exception) {
                            batch->first_exception = std::current_exception();
                        }
                        batch->failed.store(true, std::memory_order_release);
                    }
                }
                finish_one(batch);
            });
        }
    }
    cv_task_available_.notify_all();

    std::unique_lock<std::mutex> lk(batch->mutex);
    batch->cv_done.wait(lk, [&] { return batch->remaining == 0; });
    if (batch->first_exception) {
        std::rethrow_exception(batch->first_exception);
    }
}

}  // namespace tg
