#include "../../include/thread_pool.hpp"

namespace qshift {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { work(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mtx_);
        closed_ = true;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    wake_.notify_all();
    workers_.clear();
}

std::optional<ThreadPool::Task> ThreadPool::next(const std::stop_token& st) {
    std::unique_lock lock(mtx_);
    wake_.wait(lock, st, [this] { return closed_ || !queue_.empty(); });
    if (st.stop_requested() || queue_.empty()) return std::nullopt;
    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

void ThreadPool::work(const std::stop_token& st) {
    // packaged_task stores the task's exceptions in its future
    while (auto task = next(st)) {
        (*task)(st);
    }
}

} // namespace qshift
