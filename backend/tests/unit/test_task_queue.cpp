#include "core/task_queue.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace panelsense;
using namespace panelsense::core;

namespace {

template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

class TaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue_ = std::make_shared<TaskQueue>("detector");
    }

    void TearDown() override {
        queue_->shutdown();
    }

    std::vector<std::string> runAll() {
        std::vector<std::string> ran;
        while (auto task = queue_->tryDequeue()) {
            task->execute();
        }
        ran.swap(log_);
        return ran;
    }

    std::function<void()> note(const std::string& what) {
        return [this, what]() { log_.push_back(what); };
    }

    std::shared_ptr<TaskQueue> queue_;
    std::vector<std::string> log_;
};

TEST_F(TaskQueueTest, NamedQueueStartsEmpty) {
    EXPECT_EQ(queue_->name(), "detector");
    EXPECT_TRUE(queue_->empty());
    EXPECT_EQ(queue_->tryDequeue(), nullptr);
}

TEST_F(TaskQueueTest, JobRunsWhenDequeued) {
    ASSERT_TRUE(queue_->enqueue(note("facial")));
    EXPECT_EQ(queue_->size(), 1u);
    EXPECT_TRUE(log_.empty());

    EXPECT_EQ(runAll(), std::vector<std::string>{"facial"});
    EXPECT_TRUE(queue_->empty());
}

TEST_F(TaskQueueTest, CloseWorkOvertakesDetectorBacklog) {
    queue_->enqueue(note("facial-1"), TaskPriority::NORMAL);
    queue_->enqueue(note("voice-1"), TaskPriority::NORMAL);
    queue_->enqueue(note("close"), TaskPriority::HIGH);
    queue_->enqueue(note("housekeeping"), TaskPriority::LOW);
    queue_->enqueue(note("shutdown"), TaskPriority::CRITICAL);

    EXPECT_EQ(runAll(), (std::vector<std::string>{"shutdown", "close", "facial-1", "voice-1", "housekeeping"}));
}

TEST_F(TaskQueueTest, EqualPriorityKeepsAdmissionOrder) {
    // No delay between admissions: order comes from the sequence number
    for (int i = 0; i < 50; ++i) {
        queue_->enqueue(note(std::to_string(i)));
    }

    auto ran = runAll();
    ASSERT_EQ(ran.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(ran[i], std::to_string(i));
    }
}

TEST_F(TaskQueueTest, SequenceIsAssignedOnAdmission) {
    queue_->enqueue(note("a"), TaskPriority::LOW);
    queue_->enqueue(note("b"), TaskPriority::HIGH);

    auto first = queue_->tryDequeue();
    auto second = queue_->tryDequeue();
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(first->getPriority(), TaskPriority::HIGH);
    EXPECT_EQ(first->getSequence(), 1u);
    EXPECT_EQ(second->getSequence(), 0u);
}

TEST_F(TaskQueueTest, FutureDeliversResult) {
    auto label = queue_->enqueueWithFuture(TaskPriority::NORMAL, []() { return std::string("neutral"); });
    auto sum = queue_->enqueueWithFuture(TaskPriority::HIGH, [](int a, int b) { return a + b; }, 60, 40);

    runAll();

    EXPECT_EQ(sum.get(), 100);
    EXPECT_EQ(label.get(), "neutral");
}

TEST_F(TaskQueueTest, FutureDeliversException) {
    auto result = queue_->enqueueWithFuture(TaskPriority::NORMAL, []() -> double {
        throw std::runtime_error("detector failed");
    });

    runAll();

    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST_F(TaskQueueTest, RefusedAfterShutdown) {
    queue_->enqueue(note("before"));
    queue_->shutdown();
    EXPECT_TRUE(queue_->isShuttingDown());

    EXPECT_FALSE(queue_->enqueue(note("after")));
    EXPECT_FALSE(queue_->enqueue(note("after again")));
    EXPECT_EQ(queue_->getRejectedCount(), 2u);
    EXPECT_EQ(queue_->size(), 1u);

    // Callers driving the queue by hand stop at shutdown
    EXPECT_EQ(queue_->tryDequeue(), nullptr);
}

TEST_F(TaskQueueTest, RefusedFutureIsBroken) {
    queue_->shutdown();
    auto result = queue_->enqueueWithFuture(TaskPriority::HIGH, []() { return 1; });

    EXPECT_THROW(result.get(), std::future_error);
}

TEST_F(TaskQueueTest, BlockingDequeueHandsOutBacklogAfterShutdown) {
    queue_->enqueue(note("pending close"));
    queue_->shutdown();

    auto task = queue_->dequeue();
    ASSERT_NE(task, nullptr);
    task->execute();
    EXPECT_EQ(log_, std::vector<std::string>{"pending close"});

    EXPECT_EQ(queue_->dequeue(), nullptr);
}

TEST_F(TaskQueueTest, ShutdownWakesBlockedConsumer) {
    std::atomic<bool> returned{false};
    std::thread consumer([&]() {
        EXPECT_EQ(queue_->dequeue(), nullptr);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned.load());
    queue_->shutdown();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST_F(TaskQueueTest, ClearReportsDroppedJobs) {
    for (int i = 0; i < 5; ++i) {
        queue_->enqueue(note("frame"));
    }

    EXPECT_EQ(queue_->clear(), 5u);
    EXPECT_TRUE(queue_->empty());
    EXPECT_EQ(queue_->clear(), 0u);
}

TEST_F(TaskQueueTest, ConcurrentProducersAndConsumers) {
    const int producers = 4;
    const int perProducer = 100;
    std::atomic<int> executed{0};

    std::vector<std::thread> threads;
    for (int c = 0; c < 2; ++c) {
        threads.emplace_back([&]() {
            while (executed.load() < producers * perProducer) {
                if (auto task = queue_->tryDequeue()) {
                    task->execute();
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&]() {
            for (int j = 0; j < perProducer; ++j) {
                queue_->enqueue([&executed]() { executed++; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(executed.load(), producers * perProducer);
    EXPECT_TRUE(queue_->empty());
}

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::ErrorHandler::getInstance().clearErrorHistory();
        queue_ = std::make_shared<TaskQueue>("control");
        pool_ = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool_->stop();
        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    std::shared_ptr<TaskQueue> queue_;
    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.getNumThreads(), 1u);
    EXPECT_FALSE(pool.isRunning());
}

TEST_F(ThreadPoolTest, WorkersRunQueuedJobs) {
    std::atomic<int> done{0};

    pool_->start(queue_);
    EXPECT_TRUE(pool_->isRunning());
    EXPECT_EQ(pool_->getNumThreads(), 4u);

    for (int i = 0; i < 10; ++i) {
        queue_->enqueue([&done]() { done++; });
    }

    ASSERT_TRUE(eventually([&]() { return done.load() == 10; }));
}

TEST_F(ThreadPoolTest, JobsOverlapAcrossWorkers) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};

    pool_->start(queue_);
    for (int i = 0; i < 12; ++i) {
        queue_->enqueue([&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            running--;
            done++;
        });
    }

    ASSERT_TRUE(eventually([&]() { return done.load() == 12; }));
    EXPECT_GE(peak.load(), 2);
    EXPECT_LE(peak.load(), 4);
}

TEST_F(ThreadPoolTest, FailedJobIsCountedAndReported) {
    std::atomic<int> attempted{0};
    std::atomic<int> succeeded{0};

    pool_->start(queue_);
    for (int i = 0; i < 9; ++i) {
        queue_->enqueue([&, i]() {
            attempted++;
            if (i % 3 == 0) {
                throw std::runtime_error("assessment crashed");
            }
            succeeded++;
        });
    }

    ASSERT_TRUE(eventually([&]() { return pool_->getFailedTasks() == 3u && succeeded.load() == 6; }));
    EXPECT_EQ(attempted.load(), 9);
    EXPECT_TRUE(pool_->isRunning());

    auto& errors = utils::ErrorHandler::getInstance();
    EXPECT_EQ(errors.getErrorCount(utils::ErrorCategory::SYSTEM), 3u);
    auto recent = errors.getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].details, "assessment crashed");
    EXPECT_NE(recent[0].message.find("control"), std::string::npos);
}

TEST_F(ThreadPoolTest, StopDrainsBacklog) {
    std::atomic<int> done{0};
    std::atomic<bool> release{false};

    pool_ = std::make_unique<ThreadPool>(1);
    pool_->start(queue_);
    queue_->enqueue([&]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        done++;
    });
    for (int i = 0; i < 5; ++i) {
        queue_->enqueue([&done]() { done++; });
    }

    std::thread stopper([&]() { pool_->stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    release = true;
    stopper.join();

    EXPECT_EQ(done.load(), 6);
    EXPECT_FALSE(pool_->isRunning());
    EXPECT_FALSE(queue_->enqueue([]() {}));
}

TEST_F(ThreadPoolTest, RestartOnFreshQueue) {
    std::atomic<int> done{0};

    pool_->start(queue_);
    queue_->enqueue([&done]() { done++; });
    ASSERT_TRUE(eventually([&]() { return done.load() == 1; }));

    pool_->stop();
    EXPECT_FALSE(pool_->isRunning());

    queue_ = std::make_shared<TaskQueue>("control");
    pool_->start(queue_);
    EXPECT_TRUE(pool_->isRunning());

    queue_->enqueue([&done]() { done++; });
    ASSERT_TRUE(eventually([&]() { return done.load() == 2; }));
}
