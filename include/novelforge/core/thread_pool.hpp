/*
 * NovelForge C++ - Thread Pool
 *
 * Fixed set of workers draining a FIFO queue of tasks.
 */
#ifndef novelforge_CORE_THREAD_POOL_HPP
#define novelforge_CORE_THREAD_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace novelforge {

class ThreadPool {
public:
    explicit ThreadPool(size_t workers);
    ~ThreadPool();

    // Queue a task. Returns false once shutdown() has been called.
    bool enqueue(std::function<void()> task);

    // Tasks queued but not yet picked up by a worker
    size_t pending() const;
    size_t size() const { return workers_.size(); }

    // Finish queued tasks, then join the workers. Idempotent.
    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()> > tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
};

} // namespace novelforge

#endif // novelforge_CORE_THREAD_POOL_HPP
