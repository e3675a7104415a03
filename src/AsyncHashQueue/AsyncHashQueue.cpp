#include "AsyncHashQueue.hpp"
#include "Logger.hpp"

#include <exception>
#include <utility>

AsyncHashQueue::AsyncHashQueue(size_t num_workers, size_t max_pending, Handler handler)
    : max_pending_(max_pending == 0 ? 1 : max_pending),
      handler_(std::move(handler)) {
    if (num_workers == 0) num_workers = 1;
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&AsyncHashQueue::worker_loop, this);
    }
}

AsyncHashQueue::~AsyncHashQueue() {
    drain_and_join();
}

// Desc: push one task, blocking while the pending bound is reached
// In: HashTask task
// Out: void
void AsyncHashQueue::enqueue(HashTask task) {
    {
        std::unique_lock<std::mutex> lk(mtx_);
        slot_cv_.wait(lk, [&]{ return pending_ < max_pending_; });
        ++pending_;
        q_.emplace_back(std::move(task));
    }
    work_cv_.notify_one();
}

// Desc: wait for and pop one task
// In: HashTask& out
// Out: bool (false once shut down and empty)
bool AsyncHashQueue::wait_dequeue(HashTask& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    work_cv_.wait(lk, [&]{ return shutdown_ || !q_.empty(); });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
}

void AsyncHashQueue::worker_loop() {
    for (;;) {
        HashTask t;
        if (!wait_dequeue(t)) break;
        try {
            handler_(t);
        } catch (const std::exception& e) {
            log_error("HashQueue", "task failed for " + t.path + ": " + e.what());
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --pending_;
        }
        slot_cv_.notify_all();
    }
}

void AsyncHashQueue::drain_and_join() {
    {
        std::unique_lock<std::mutex> lk(mtx_);
        if (shutdown_ && workers_.empty()) return;
        // workers keep popping until the queue is empty, then exit
        shutdown_ = true;
    }
    work_cv_.notify_all();
    for (auto& th : workers_) {
        if (th.joinable()) th.join();
    }
    workers_.clear();
}
