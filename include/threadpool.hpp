#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

// Reusable pool of worker threads
// Keeps threads alive across images, avoiding the cost of creating/destroying threads for every page
class ThreadPool {
public:
    // Launch 'numThreads' worker threads (at least one)
    explicit ThreadPool(size_t numThreads);

    // Add a task to the queue. Tasks must not throw
    template<class F>
    void enqueue(F&& f);

    // Block until the queue is empty and no task is running
    void waitUntilEmpty();

    size_t size() const { return workers.size(); }

    // Stop all threads and join
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    std::vector<std::thread> workers;        // Worker threads
    std::queue<std::function<void()>> tasks; // Task queue
    std::mutex queueMutex;                   // Protect task queue and pending count
    std::condition_variable condition;       // Notify workers
    std::condition_variable emptyCondition;  // Notify waiters when everything is done
    bool stop = false;                       // Signal to stop workers
    size_t pending = 0;                      // Tasks queued or running
};

inline ThreadPool::ThreadPool(size_t numThreads) {
    if (numThreads == 0) numThreads = 1;

    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back([this]() {
            for (;;) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    condition.wait(lock, [this]() { return stop || !tasks.empty(); });

                    if (stop && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }

                task();

                {
                    // The task stays counted in 'pending' until it has finished running,
                    // so waitUntilEmpty cannot return between pop() and completion
                    std::unique_lock<std::mutex> lock(queueMutex);
                    if (--pending == 0)
                        emptyCondition.notify_all();
                }
            }
        });
    }
}

// Number of workers to use for row-parallel work
inline unsigned int workerCount() {
    unsigned int numThreads = std::thread::hardware_concurrency();
    if (numThreads == 0) numThreads = 4; // hardware_concurrency could not determine it
    return numThreads;
}

// Process-wide pool shared by the pooled backend
inline ThreadPool& getThreadPool() {
    static ThreadPool pool(workerCount());
    return pool;
}

inline void ThreadPool::waitUntilEmpty() {
    std::unique_lock<std::mutex> lock(queueMutex);
    emptyCondition.wait(lock, [this]() { return pending == 0; });
}

template<class F>
inline void ThreadPool::enqueue(F&& f) {
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        tasks.emplace(std::forward<F>(f));
        ++pending;
    }
    condition.notify_one();
}

inline ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        stop = true;
    }
    condition.notify_all();
    for (auto& t : workers)
        t.join();
}
