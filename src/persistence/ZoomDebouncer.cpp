#include "flowcanvas/persistence/ZoomDebouncer.h"

namespace flowcanvas {

ZoomDebouncer::ZoomDebouncer(std::chrono::milliseconds delay)
    : delay_(delay) {}

void ZoomDebouncer::push(float targetScale, const Point& focal, TimePoint now) {
    pending_ = Request{targetScale, focal};
    lastInput_ = now;
}

std::optional<ZoomDebouncer::Request> ZoomDebouncer::poll(TimePoint now) {
    if (!pending_ || now - lastInput_ < delay_) {
        return std::nullopt;
    }
    return takePending();
}

std::optional<ZoomDebouncer::Request> ZoomDebouncer::takePending() {
    auto request = pending_;
    pending_.reset();
    return request;
}

void ZoomDebouncer::cancel() {
    pending_.reset();
}

}  // namespace flowcanvas
