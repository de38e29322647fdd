#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace link_scope {

// Fixed-size worker pool. Tasks run in submission order as workers free up;
// exceptions thrown by a task are delivered through its future.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) {
        if(num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for(size_t i=0;i<num_threads;++i) workers_.emplace_back([this]{ worker_loop(); });
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if(stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace([task]{ (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    // Drains queued tasks, then joins every worker.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if(stop_) return;
            stop_ = true;
        }
        cv_.notify_all();
        for(auto& w : workers_) if(w.joinable()) w.join();
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop() {
        while(true){
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
                if(stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

}
