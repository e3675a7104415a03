#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct HashTask {
    std::string path; // as reached during traversal
};

// Fixed-size worker pool over a FIFO of hash tasks. enqueue() blocks while
// max_pending tasks are queued or running, so open descriptors and buffers
// stay bounded however large the tree is.
class AsyncHashQueue {
public:
    using Handler = std::function<void(const HashTask&)>;

    AsyncHashQueue(size_t num_workers, size_t max_pending, Handler handler);
    ~AsyncHashQueue();

    AsyncHashQueue(const AsyncHashQueue&) = delete;
    AsyncHashQueue& operator=(const AsyncHashQueue&) = delete;

    void enqueue(HashTask task);
    // Desc: wait until every queued task ran, then stop and join workers
    void drain_and_join();

    size_t worker_count() const { return workers_.size(); }

private:
    bool wait_dequeue(HashTask& out);
    void worker_loop();

    std::mutex              mtx_;
    std::condition_variable work_cv_;  // tasks available or shutdown
    std::condition_variable slot_cv_;  // pending count dropped
    std::deque<HashTask>    q_;
    size_t                  pending_{0};
    size_t                  max_pending_;
    bool                    shutdown_{false};
    Handler                 handler_;
    std::vector<std::thread> workers_;
};
