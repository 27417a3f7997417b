#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>

// Simple reusable ThreadPool
// Keeps threads alive across calls, so independent k-means restarts can run concurrently
// without paying for thread creation every time a palette is computed
class ThreadPool {
public:
    // Constructor: launch 'numThreads' worker threads (at least one)
    explicit ThreadPool(size_t numThreads);

    // Add a task to the queue and get a future for its result
    // Exceptions thrown by the task are rethrown by future::get()
    template<class F>
    auto submit(F&& f) -> std::future<decltype(f())>;

    // Number of worker threads
    size_t size() const { return workers.size(); }

    // Destructor: stop all threads and join
    ~ThreadPool();

private:
    std::vector<std::thread> workers;        // Worker threads
    std::queue<std::function<void()>> tasks; // Task queue
    std::mutex queueMutex;                   // Protect task queue
    std::condition_variable condition;       // Notify workers
    bool stop;                               // Signal to stop workers
};

inline ThreadPool::ThreadPool(size_t numThreads) : stop(false) {
    if (numThreads == 0) numThreads = 1;

    for (size_t i = 0; i < numThreads; ++i) {
		// Each worker runs an infinite loop, waiting for tasks to execute
        workers.emplace_back([this]() {
            for (;;) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(queueMutex);
					// Wait until there is a task or we are stopping
                    condition.wait(lock, [this]() { return stop || !tasks.empty(); });

                    // Drain the queue before exiting
                    if (stop && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }

                task();
            }
            });
    }
}

// Process-wide pool sized to the machine
// Whenever getThreadPool() is called, the same instance is returned
inline ThreadPool& getThreadPool() {
    static ThreadPool pool([]() {
        unsigned int numThreads = std::thread::hardware_concurrency();
        return numThreads == 0 ? 4u : numThreads; // default to 4 threads if hardware_concurrency cannot determine
    }());
    return pool;
}

template<class F>
inline auto ThreadPool::submit(F&& f) -> std::future<decltype(f())> {
    typedef decltype(f()) R;

	// packaged_task is move-only, std::function needs copyable callables, so share it
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> result = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        tasks.emplace([task]() { (*task)(); });
    }

	// Notify one worker thread that a new task is available
    condition.notify_one();
    return result;
}

inline ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        stop = true;
    }
	// Notify all threads to wake up and exit
    condition.notify_all();
    for (auto& t : workers)
		t.join();
}
