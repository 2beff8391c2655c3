#include "warden/storage/worker_pool.hpp"

namespace warden::storage {

WorkerPool::WorkerPool(const uint32_t worker_count)
    : worker_count_(worker_count == 0 ? 1 : worker_count) {
    workers_.reserve(worker_count_);
    for (uint32_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { Run(); });
    }
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Stop() {
    std::lock_guard stop_guard(stop_lock_);
    {
        std::lock_guard guard(lock_);
        stopping_ = true;
    }
    ready_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

void WorkerPool::Run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock guard(lock_);
            ready_.wait(guard, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace warden::storage
