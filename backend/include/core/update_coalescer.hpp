#pragma once

#include "emotion/emotion_types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace panelsense {
namespace core {

/**
 * Latest-wins delivery of snapshots to a slow consumer.
 *
 * publish() stores the snapshot and schedules at most one pending
 * delivery through the injected scheduler (the WebSocket loop's defer
 * in production). A burst of publishes before the delivery runs
 * collapses into a single send of the newest snapshot.
 */
class UpdateCoalescer : public std::enable_shared_from_this<UpdateCoalescer> {
public:
    using Sink = std::function<void(const emotion::EmotionSnapshot&)>;
    using Scheduler = std::function<void(std::function<void()>)>;

    static std::shared_ptr<UpdateCoalescer> create(Sink sink, Scheduler scheduler);

    void publish(const emotion::EmotionSnapshot& snapshot);

    uint64_t publishedCount() const { return published_; }
    uint64_t deliveredCount() const { return delivered_; }

private:
    UpdateCoalescer(Sink sink, Scheduler scheduler);

    void deliver();

    Sink sink_;
    Scheduler scheduler_;

    std::mutex mutex_;
    std::optional<emotion::EmotionSnapshot> pending_;
    bool scheduled_ = false;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
};

} // namespace core
} // namespace panelsense
