#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

#include <format>

namespace chunkzli {

ThreadPool::ThreadPool(unsigned threads, Logger& logger) : logger_(logger) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if ((stop_ && tasks_.empty()) || st.stop_requested())
                        return;
                    if (tasks_.empty())
                        continue;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                struct PendingGuard {
                    size_t &pending;
                    std::mutex &mtx;
                    std::condition_variable &cv;
                    ~PendingGuard() {
                        std::lock_guard lock(mtx);
                        if (pending > 0) --pending;
                        cv.notify_all();
                    }
                } guard{pending_, queue_mutex_, idle_cv_};
                // packaged_task stores anything the task throws in its future
                task(st);
            }
        });
    }
}

void ThreadPool::request_stop() {
    size_t discarded = 0;
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
            ++discarded;
            if (pending_ > 0) {
                pending_--;
            }
        }
    }
    if (discarded > 0) {
        logger_.log(LogLevel::Debug, std::format("Stop requested, discarded {} queued task(s)", discarded), "pool");
    }
    condition_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 && tasks_.empty();
    });
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

} // namespace chunkzli
