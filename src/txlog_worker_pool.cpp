#include "txlog_worker_pool.hpp"
#include "txlog_logger.hpp"
#include <stdexcept>

namespace txlog {

WorkerThreadPool::WorkerThreadPool(size_t num_threads)
    : stop_(false) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerThreadPool::workerThread, this);
    }

    TXLOG_LOG_DEBUGF("工作线程池已创建，线程数: {}", num_threads);
}

WorkerThreadPool::~WorkerThreadPool() {
    stop();
}

void WorkerThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_.load()) {
            throw std::runtime_error("线程池已停止，无法添加新任务");
        }
        task_queue_.push(std::move(task));
    }

    condition_.notify_one();
}

void WorkerThreadPool::stop() {
    bool already_stopped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        already_stopped = stop_.exchange(true);
    }
    condition_.notify_all();

    // 队列中剩余的读取任务执行完后线程才会退出
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (!already_stopped) {
        TXLOG_LOG_DEBUG("工作线程池已停止");
    }
}

void WorkerThreadPool::workerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return stop_.load() || !task_queue_.empty();
            });

            // 停止后仍然取完队列
            if (stop_.load() && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            // submit提交的任务通过future传递异常，这里只会遇到enqueue的任务
            TXLOG_LOG_ERROR("工作线程执行任务时出错: ", e.what());
        }
    }
}

} // namespace txlog
