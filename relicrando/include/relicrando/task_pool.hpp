#ifndef RELICRANDO_TASK_POOL_HPP
#define RELICRANDO_TASK_POOL_HPP

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace relicrando {

using Task = std::function<void()>;

/**
 * Fixed set of threads, each draining its own FIFO of tasks. Tasks are
 * pinned to the thread they were submitted to and never migrate.
 *
 * A task that throws does not take down its thread: the first escaped
 * exception is kept and re-raised by rethrow_if_failed() on the owning thread.
 */
class TaskPool {
private:
    struct WorkerThread {
        std::deque<Task> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        bool stop = false;
    };

    std::vector<std::unique_ptr<WorkerThread>> workers_;
    bool running_ = false;

    mutable std::mutex failure_mutex_;
    std::exception_ptr failure_;

    void record_failure(std::exception_ptr failure) {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        if (!failure_) {
            failure_ = failure;
        }
    }

    void worker_loop(WorkerThread* data) {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(data->mutex);
                data->cv.wait(lock, [data] { return data->stop || !data->tasks.empty(); });
                if (data->tasks.empty()) {
                    return;  // Stopped and drained
                }
                task = std::move(data->tasks.front());
                data->tasks.pop_front();
            }

            try {
                task();
            } catch (...) {
                record_failure(std::current_exception());
            }
        }
    }

public:
    explicit TaskPool(size_t num_threads) {
        if (num_threads == 0) {
            throw std::invalid_argument("TaskPool needs at least one thread");
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(std::make_unique<WorkerThread>());
        }
    }

    ~TaskPool() {
        shutdown();
    }

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    // Clears any failure left from a previous run
    void start() {
        if (running_) return;
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            failure_ = nullptr;
        }
        for (auto& worker : workers_) {
            worker->stop = false;
            WorkerThread* data = worker.get();
            worker->thread = std::thread([this, data] { worker_loop(data); });
        }
        running_ = true;
    }

    // Lets every thread finish its queued tasks, then joins them
    void shutdown() {
        if (!running_) return;
        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop = true;
            }
            worker->cv.notify_all();
        }
        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }
        running_ = false;
    }

    void submit_to_worker(size_t worker_id, Task task) {
        if (!running_) {
            throw std::runtime_error("TaskPool is not running");
        }
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }
        WorkerThread* worker = workers_[worker_id].get();
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            worker->tasks.push_back(std::move(task));
        }
        worker->cv.notify_one();
    }

    size_t num_workers() const { return workers_.size(); }
    bool is_running() const { return running_; }

    bool has_failed() const {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        return failure_ != nullptr;
    }

    void rethrow_if_failed() const {
        std::exception_ptr failure;
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            failure = failure_;
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
};

} // namespace relicrando

#endif // RELICRANDO_TASK_POOL_HPP
