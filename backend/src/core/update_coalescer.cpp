#include "core/update_coalescer.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace core {

std::shared_ptr<UpdateCoalescer> UpdateCoalescer::create(Sink sink, Scheduler scheduler) {
    return std::shared_ptr<UpdateCoalescer>(new UpdateCoalescer(std::move(sink), std::move(scheduler)));
}

UpdateCoalescer::UpdateCoalescer(Sink sink, Scheduler scheduler)
    : sink_(std::move(sink)), scheduler_(std::move(scheduler)) {
}

void UpdateCoalescer::publish(const emotion::EmotionSnapshot& snapshot) {
    published_++;

    bool needSchedule = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = snapshot;
        if (!scheduled_) {
            scheduled_ = true;
            needSchedule = true;
        }
    }

    if (!needSchedule) {
        return;
    }

    std::weak_ptr<UpdateCoalescer> weak = shared_from_this();
    auto job = [weak]() {
        if (auto self = weak.lock()) {
            self->deliver();
        }
    };

    if (scheduler_) {
        scheduler_(std::move(job));
    } else {
        job();
    }
}

void UpdateCoalescer::deliver() {
    std::optional<emotion::EmotionSnapshot> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.swap(pending_);
        scheduled_ = false;
    }

    if (snapshot && sink_) {
        sink_(*snapshot);
        delivered_++;
    }
}

} // namespace core
} // namespace panelsense
