#include "core/task_queue.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace core {

TaskQueue::TaskQueue(std::string name) : name_(std::move(name)) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::function<void()> work, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            rejected_++;
            return false;
        }
        pending_.push(std::make_shared<Task>(std::move(work), priority, nextSequence_++));
    }
    available_.notify_one();
    return true;
}

std::shared_ptr<Task> TaskQueue::popLocked() {
    auto task = pending_.top();
    pending_.pop();
    return task;
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return shutdown_ || !pending_.empty(); });
    if (pending_.empty()) {
        return nullptr;
    }
    return popLocked();
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || pending_.empty()) {
        return nullptr;
    }
    return popLocked();
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty();
}

size_t TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = pending_.size();
    Heap().swap(pending_);
    return dropped;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    available_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

ThreadPool::ThreadPool(size_t numThreads) : numThreads_(numThreads == 0 ? 1 : numThreads) {
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> queue) {
    if (running_ || !queue) {
        return;
    }

    queue_ = std::move(queue);
    running_ = true;

    utils::Logger::debug("Starting " + std::to_string(numThreads_) + " workers on queue '" +
                         queue_->name() + "'");
    workers_.reserve(numThreads_);
    for (size_t i = 0; i < numThreads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

void ThreadPool::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_->shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    if (failedTasks_ > 0) {
        utils::Logger::warn("Queue '" + queue_->name() + "' stopped with " +
                            std::to_string(failedTasks_.load()) + " failed tasks");
    }
    queue_.reset();
}

void ThreadPool::workerLoop() {
    // Keep serving after stop() flips running_ so the backlog drains.
    while (auto task = queue_->dequeue()) {
        try {
            task->execute();
        } catch (const std::exception& e) {
            recordFailure(e.what());
        }
    }
}

void ThreadPool::recordFailure(const std::string& what) {
    utils::ErrorInfo info(utils::ErrorCategory::SYSTEM, utils::ErrorSeverity::ERROR,
                          "Task failed on queue '" + queue_->name() + "'", what);
    utils::ErrorHandler::getInstance().reportError(info);
    failedTasks_++;
}

} // namespace core
} // namespace panelsense
