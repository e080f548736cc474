#include "lv/core/util/WorkerPool.hpp"

#include <algorithm>

#include "lv/core/util/Logging.hpp"

namespace lv {

WorkerPool::WorkerPool(unsigned threads)
{
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    _threads.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        _threads.emplace_back(&WorkerPool::workerLoop, this);
    }
    Logger()->debug("worker pool started with {} threads", threads);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

std::size_t WorkerPool::pending() const
{
    std::lock_guard<std::mutex> lk(_queueMutex);
    return _queue.size();
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(_queueMutex);
        _shutdown.store(true, std::memory_order_release);
    }
    _queueCV.notify_all();

    for (auto& t : _threads) {
        if (t.joinable())
            t.join();
    }
}

void WorkerPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lk(_queueMutex);
        if (_shutdown.load(std::memory_order_acquire)) {
            throw Error::task("worker pool is shut down");
        }
        _queue.push_back(std::move(job));
    }
    _queueCV.notify_one();
}

void WorkerPool::workerLoop()
{
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lk(_queueMutex);
            _queueCV.wait(lk, [this] {
                return _shutdown.load(std::memory_order_acquire) || !_queue.empty();
            });

            // drain what was accepted before shutdown
            if (_queue.empty())
                return;

            job = std::move(_queue.front());
            _queue.pop_front();
        }

        // packaged_task stores the exception in its future
        job();
    }
}

}  // namespace lv
