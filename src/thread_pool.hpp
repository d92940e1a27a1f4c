#pragma once
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <vector>

// Fixed set of workers draining a FIFO. Tasks queued here must finish on
// their own (the destructor joins); unbounded fragment code belongs in a
// BoundedRunner, not directly in the pool.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t numThreads = 1) {
        if (numThreads == 0) numThreads = 1;
        workers.reserve(numThreads);
        for (std::size_t i = 0; i < numThreads; ++i) {
            workers.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for (std::thread& worker : workers) worker.join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (stop) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks.emplace([task]() { (*task)(); });
        }
        condition.notify_one();
        return res;
    }

    std::size_t size() const { return workers.size(); }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex);
        return tasks.size();
    }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                condition.wait(lock, [this] { return stop || !tasks.empty(); });
                if (stop && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop = false;
};
