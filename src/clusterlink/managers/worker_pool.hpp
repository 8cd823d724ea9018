#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <clusterlink/core/log.hpp>
#include <fmt/format.h>

namespace clusterlink {

// Fixed set of worker threads draining a FIFO task queue.
// Remote calls block, so they never run on the caller's thread.
class WorkerPool {
public:
    explicit WorkerPool(int threads) {
        if (threads < 1) threads = 1;
        for (int i = 0; i < threads; ++i) {
            workers_.emplace_back(&WorkerPool::worker, this);
        }
        cl_log(fmt::format("worker pool: started {} threads", threads));
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Joins every worker. Tasks still queued are dropped; their futures
    // report broken_promise.
    void stop() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (stopping_) return;
            stopping_ = true;
            queue_.clear();
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }

    template <typename Fn>
    auto submit(Fn fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!stopping_) {
                queue_.emplace_back([task] { (*task)(); });
            }
        }
        cv_.notify_one();
        return fut;
    }

    std::size_t size() const { return workers_.size(); }

private:
    void worker() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lk(mutex_);
                cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
                if (stopping_) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace clusterlink
