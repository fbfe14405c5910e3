// vidstream/include/vidstream/server/ThreadPool.h
#ifndef VIDSTREAM_SERVER_THREADPOOL_H
#define VIDSTREAM_SERVER_THREADPOOL_H

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace Vidstream {
namespace Server {

// Fixed set of workers running request handlers off the event loop
class ThreadPool {
public:
    explicit ThreadPool(size_t threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queues a task. Returns false once the pool has been shut down.
    bool enqueue(std::function<void()> task);

    // Runs the tasks already queued, then joins every worker. Idempotent.
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_;
};

} // namespace Server
} // namespace Vidstream

#endif // VIDSTREAM_SERVER_THREADPOOL_H
