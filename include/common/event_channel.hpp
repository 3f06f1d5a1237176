#pragma once

#include "common/backup_status.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

struct PipelineEvent {
    enum class Type {
        Log,
        Status,
        StepChanged,
        Progress,
        StatusChanged,
        Finished
    };

    Type type{Type::Log};
    std::string text;
    PipelineStep step{PipelineStep::Starting};
    int progress{0};
    StatusCode status{StatusCode::Idle};

    static PipelineEvent log(const std::string& line);
    static PipelineEvent statusText(const std::string& text);
    static PipelineEvent stepChanged(PipelineStep step);
    static PipelineEvent progressed(int percent);
    static PipelineEvent statusChanged(StatusCode code, const std::string& detail);
    static PipelineEvent finished(StatusCode code, const std::string& detail);
};

// One-way queue from the pipeline to whoever presents its state. Producers
// never block; a closed channel drops further events. A channel nobody drains
// keeps only the newest `capacity` events.
class EventChannel {
public:
    static constexpr size_t kDefaultCapacity = 10000;

    explicit EventChannel(size_t capacity = kDefaultCapacity);

    void publish(PipelineEvent event);
    std::optional<PipelineEvent> tryPop();
    std::optional<PipelineEvent> waitPop(std::chrono::milliseconds timeout);
    void close();
    bool isClosed() const;
    size_t size() const;
    size_t droppedCount() const;

private:
    size_t capacity_;
    size_t dropped_{0};
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<PipelineEvent> events_;
    bool closed_{false};
};
