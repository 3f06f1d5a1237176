#pragma once

#include "common/backup_status.hpp"
#include "common/event_channel.hpp"
#include <string>
#include <memory>
#include <mutex>

// Base for work that runs on its own worker thread and reports through an
// EventChannel. Every report is also written to the Logger.
class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    explicit Job(std::shared_ptr<EventChannel> events);
    virtual ~Job() = default;

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    virtual bool start() = 0;
    virtual bool cancel() = 0;

    bool isRunning() const { return getState() == State::RUNNING; }
    bool isCompleted() const { return getState() == State::COMPLETED; }
    bool isFailed() const { return getState() == State::FAILED; }
    bool isCancelled() const { return getState() == State::CANCELLED; }

    State getState() const;
    PipelineStep getStep() const;
    int getProgress() const;
    std::string getStatus() const;
    std::string getError() const;
    std::string getId() const;
    std::shared_ptr<EventChannel> events() const { return events_; }

protected:
    void logLine(const std::string& line);
    void logWarning(const std::string& line);
    void updateProgress(int progress);
    void setError(const std::string& error);
    void setState(State state);
    void setStatus(const std::string& status);
    void setStep(PipelineStep step);
    void publishStatusCode(StatusCode code, const std::string& detail);
    std::string generateId() const;

    std::shared_ptr<EventChannel> events_;

private:
    std::string id_;
    State state_{State::PENDING};
    PipelineStep step_{PipelineStep::Starting};
    std::string status_{"pending"};
    int progress_{0};
    std::string error_;
    mutable std::mutex mutex_;
};
