#pragma once

#include <string>
#include <chrono>

// Outcome taxonomy reported to the presentation layer. Idle and Running are
// transient; every run ends with exactly one of the remaining codes.
enum class StatusCode {
    Idle,
    Running,
    Complete,
    Stopped,
    RemoteNotMounted,
    RemoteWriteFailed,
    PermissionDenied,
    DiskFull,
    NetworkError,
    VerificationFailed,
    GeneralError
};

enum class PipelineStep {
    Starting,
    CheckingMount,
    Mounting,
    Rsyncing,
    Unmounting,
    PreparingRemote,
    CopyingToRemote,
    VerifyingHash,
    Done
};

struct RunOutcome {
    StatusCode code{StatusCode::Idle};
    std::string detail;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;

    bool succeeded() const { return code == StatusCode::Complete; }
};

std::string statusCodeToString(StatusCode code);
std::string pipelineStepToString(PipelineStep step);
bool isTerminal(StatusCode code);
