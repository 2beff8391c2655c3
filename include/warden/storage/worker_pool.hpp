#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace warden::storage {

/// Fixed set of threads draining a FIFO task queue. Stop() runs what is
/// already queued, then joins; later submissions are refused. Stop() must
/// not be called from inside a task.
class WorkerPool {
public:
    explicit WorkerPool(uint32_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// std::nullopt once the pool is stopping.
    template<typename F>
    auto Submit(F&& task) -> std::optional<std::future<std::invoke_result_t<F>>> {
        using T = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<T()>>(std::forward<F>(task));
        std::future<T> future = packaged->get_future();
        {
            std::lock_guard guard(lock_);
            if (stopping_) {
                return std::nullopt;
            }
            tasks_.emplace([packaged]() { (*packaged)(); });
        }
        ready_.notify_one();
        return future;
    }

    void Stop();

    [[nodiscard]] uint32_t WorkerCount() const noexcept { return worker_count_; }

private:
    void Run();

    const uint32_t worker_count_;
    std::mutex stop_lock_;
    std::mutex lock_;
    std::condition_variable ready_;
    std::queue<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace warden::storage
