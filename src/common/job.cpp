#include "common/job.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job(std::shared_ptr<EventChannel> events)
    : events_(events ? std::move(events) : std::make_shared<EventChannel>()) {
    id_ = generateId();
}

void Job::logLine(const std::string& line) {
    Logger::info(line);
    events_->publish(PipelineEvent::log(line));
}

void Job::logWarning(const std::string& line) {
    Logger::warning(line);
    events_->publish(PipelineEvent::log(line));
}

void Job::updateProgress(int progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_ = progress;
    }
    events_->publish(PipelineEvent::progressed(progress));
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Job::setStatus(const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    Logger::info(status);
    events_->publish(PipelineEvent::statusText(status));
}

void Job::setStep(PipelineStep step) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        step_ = step;
    }
    Logger::debug("Step: " + pipelineStepToString(step));
    events_->publish(PipelineEvent::stepChanged(step));
}

void Job::publishStatusCode(StatusCode code, const std::string& detail) {
    if (code == StatusCode::Complete || code == StatusCode::Running) {
        Logger::info("Status " + statusCodeToString(code) + (detail.empty() ? "" : ": " + detail));
    } else if (code != StatusCode::Stopped) {
        Logger::error("Status " + statusCodeToString(code) + (detail.empty() ? "" : ": " + detail));
    }
    events_->publish(PipelineEvent::statusChanged(code, detail));
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PipelineStep Job::getStep() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return step_;
}

int Job::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}
