#include "common/event_channel.hpp"
#include <utility>

PipelineEvent PipelineEvent::log(const std::string& line) {
    PipelineEvent event;
    event.type = Type::Log;
    event.text = line;
    return event;
}

PipelineEvent PipelineEvent::statusText(const std::string& text) {
    PipelineEvent event;
    event.type = Type::Status;
    event.text = text;
    return event;
}

PipelineEvent PipelineEvent::stepChanged(PipelineStep step) {
    PipelineEvent event;
    event.type = Type::StepChanged;
    event.step = step;
    event.text = pipelineStepToString(step);
    return event;
}

PipelineEvent PipelineEvent::progressed(int percent) {
    PipelineEvent event;
    event.type = Type::Progress;
    event.progress = percent;
    return event;
}

PipelineEvent PipelineEvent::statusChanged(StatusCode code, const std::string& detail) {
    PipelineEvent event;
    event.type = Type::StatusChanged;
    event.status = code;
    event.text = detail;
    return event;
}

PipelineEvent PipelineEvent::finished(StatusCode code, const std::string& detail) {
    PipelineEvent event;
    event.type = Type::Finished;
    event.status = code;
    event.text = detail;
    return event;
}

EventChannel::EventChannel(size_t capacity)
    : capacity_(capacity == 0 ? kDefaultCapacity : capacity) {
}

void EventChannel::publish(PipelineEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    condition_.notify_one();
}

std::optional<PipelineEvent> EventChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    PipelineEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<PipelineEvent> EventChannel::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    PipelineEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t EventChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
