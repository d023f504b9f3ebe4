#pragma once

#include "txlog_core.hpp"
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace txlog {

// 工作线程池，执行异步的事务读取
class WorkerThreadPool {
private:
    std::atomic<bool> stop_;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
public:
    explicit WorkerThreadPool(size_t num_threads = 4);
    ~WorkerThreadPool();

    WorkerThreadPool(const WorkerThreadPool&) = delete;
    WorkerThreadPool& operator=(const WorkerThreadPool&) = delete;

    // 提交任务到线程池，线程池已停止时抛出std::runtime_error
    void enqueue(std::function<void()> task);

    // 提交有返回值的任务，异常通过future传递
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    // 停止线程池，已入队的任务会先执行完
    void stop();

    size_t size() const { return workers_.size(); }

private:
    // 工作线程函数
    void workerThread();
};

} // namespace txlog
