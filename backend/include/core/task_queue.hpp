#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace panelsense {
namespace core {

/**
 * Scheduling class of a queued job. Detector calls run at NORMAL,
 * session close and assessment work at HIGH.
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * A unit of work handed out by TaskQueue. The sequence number is assigned
 * by the queue on admission and breaks ties between equal priorities.
 */
class Task {
public:
    Task(std::function<void()> work, TaskPriority priority, std::uint64_t sequence)
        : work_(std::move(work)), priority_(priority), sequence_(sequence) {}

    void execute() {
        if (work_) {
            work_();
        }
    }

    TaskPriority getPriority() const { return priority_; }
    std::uint64_t getSequence() const { return sequence_; }

private:
    std::function<void()> work_;
    TaskPriority priority_;
    std::uint64_t sequence_;
};

/**
 * Named, thread-safe priority queue shared between the event loop and a
 * ThreadPool. Higher priorities are served first, admission order within
 * one priority.
 */
class TaskQueue {
public:
    explicit TaskQueue(std::string name = "tasks");
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Admit a job. Returns false once the queue has been shut down; the
     * job is then dropped without running.
     */
    bool enqueue(std::function<void()> work, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Admit a job whose result (or exception) is delivered through a future.
     * A job refused after shutdown leaves the future with a broken promise.
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * Block until a job is available. After shutdown the remaining backlog
     * is still handed out; nullptr means shut down and drained.
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Non-blocking variant used when the caller drives the queue itself.
     * Returns nullptr when empty or shut down.
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;

    /// Drop pending jobs; returns how many were discarded.
    size_t clear();

    void shutdown();
    bool isShuttingDown() const;

    const std::string& name() const { return name_; }

    /// Jobs refused because the queue was already shut down.
    size_t getRejectedCount() const { return rejected_; }

private:
    struct ServeOrder {
        bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
            if (a->getPriority() != b->getPriority()) {
                return a->getPriority() < b->getPriority();
            }
            return a->getSequence() > b->getSequence();
        }
    };

    using Heap = std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, ServeOrder>;

    std::shared_ptr<Task> popLocked();

    const std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    Heap pending_;
    std::uint64_t nextSequence_ = 0;
    std::atomic<bool> shutdown_{false};
    std::atomic<size_t> rejected_{0};
};

/**
 * Fixed set of worker threads draining one TaskQueue. A job that throws is
 * counted and reported to the ErrorHandler; the worker keeps going.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::shared_ptr<TaskQueue> queue);

    /// Shuts the queue down, lets workers drain the backlog, then joins them.
    void stop();

    size_t getNumThreads() const { return numThreads_; }
    size_t getFailedTasks() const { return failedTasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();
    void recordFailure(const std::string& what);

    size_t numThreads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> queue_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> failedTasks_{0};
};

template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using Result = typename std::invoke_result<F, Args...>::type;

    auto job = std::make_shared<std::packaged_task<Result()>>(
        [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return std::apply(std::move(fn), std::move(bound));
        });
    std::future<Result> result = job->get_future();

    enqueue([job]() { (*job)(); }, priority);
    return result;
}

} // namespace core
} // namespace panelsense
