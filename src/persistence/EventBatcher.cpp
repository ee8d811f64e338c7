#include "flowcanvas/persistence/EventBatcher.h"
#include "flowcanvas/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace flowcanvas {

EventBatcher::EventBatcher(std::shared_ptr<IEventStore> store, std::chrono::milliseconds window)
    : store_(std::move(store))
    , window_(window) {
    if (!store_) {
        throw std::invalid_argument("EventBatcher requires an event store");
    }
}

EventBatcher::FlushResult EventBatcher::enqueue(CanvasEvent event, TimePoint now) {
    bool urgent = !shouldBatch(event);

    pending_.push_back(std::move(event));
    if (!windowStart_) {
        windowStart_ = now;
    }

    if (urgent) {
        return flush(now);
    }
    return {};
}

EventBatcher::FlushResult EventBatcher::tick(TimePoint now) {
    auto due = deadline();
    if (!due || now < *due) {
        return {};
    }
    return flush(now);
}

EventBatcher::FlushResult EventBatcher::flush(TimePoint now) {
    FlushResult result;
    if (pending_.empty()) {
        windowStart_.reset();
        return result;
    }

    std::vector<CanvasEvent> batch(pending_.begin(), pending_.end());
    pending_.clear();

    std::stable_sort(batch.begin(), batch.end(), [](const CanvasEvent& a, const CanvasEvent& b) {
        return static_cast<int>(eventPriority(a)) < static_cast<int>(eventPriority(b));
    });

    for (size_t i = 0; i < batch.size(); ++i) {
        try {
            result.persisted.push_back(store_->create(batch[i]));
        } catch (const PersistenceError& e) {
            result.success = false;
            result.reason = e.what();
            result.requeued = batch.size() - i;

            pending_.insert(pending_.begin(), batch.begin() + static_cast<std::ptrdiff_t>(i), batch.end());
            windowStart_ = now;
            lastError_ = e.what();

            LOG_ERROR("[EventBatcher] persist failed: {}", e.what());
            LOG_WARN("[EventBatcher] re-queued {} event(s) for retry", result.requeued);
            return result;
        }
    }

    LOG_TRACE("[EventBatcher] flushed {} event(s)", result.persisted.size());
    lastError_.clear();
    windowStart_.reset();
    return result;
}

std::optional<EventBatcher::TimePoint> EventBatcher::deadline() const {
    if (pending_.empty() || !windowStart_) {
        return std::nullopt;
    }
    return *windowStart_ + window_;
}

}  // namespace flowcanvas
