#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include "lv/core/util/Error.hpp"

namespace lv {

/**
 * @brief Fixed set of background threads draining a FIFO of jobs
 *
 * Each submitted callable yields a std::future. Whatever the callable throws
 * reaches the future as an lv::Error: an lv::Error passes through unchanged,
 * a filesystem error becomes Io and anything else derived from std::exception
 * becomes Task.
 */
class WorkerPool
{
public:
    /// @param threads 0 picks std::thread::hardware_concurrency()
    explicit WorkerPool(unsigned threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(fn)]() mutable -> R {
                try {
                    return fn();
                } catch (const Error&) {
                    throw;
                } catch (const std::filesystem::filesystem_error& e) {
                    throw Error::io(e.what());
                } catch (const std::exception& e) {
                    throw Error::task(e.what());
                }
            });
        auto result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    std::size_t threadCount() const { return _threads.size(); }

    /// Jobs waiting for a thread
    std::size_t pending() const;

    /// Run the queued jobs to completion and stop the threads; later submits throw
    void shutdown();

private:
    void enqueue(std::function<void()> job);
    void workerLoop();

    std::vector<std::thread> _threads;
    mutable std::mutex _queueMutex;
    std::condition_variable _queueCV;
    std::deque<std::function<void()>> _queue;
    std::atomic<bool> _shutdown{false};
};

}  // namespace lv
