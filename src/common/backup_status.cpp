#include "common/backup_status.hpp"

std::string statusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::Idle:               return "IDLE";
        case StatusCode::Running:            return "RUNNING";
        case StatusCode::Complete:           return "COMPLETE";
        case StatusCode::Stopped:            return "STOPPED";
        case StatusCode::RemoteNotMounted:   return "REMOTE_NOT_MOUNTED";
        case StatusCode::RemoteWriteFailed:  return "REMOTE_WRITE_FAILED";
        case StatusCode::PermissionDenied:   return "PERMISSION_DENIED";
        case StatusCode::DiskFull:           return "DISK_FULL";
        case StatusCode::NetworkError:       return "NETWORK_ERROR";
        case StatusCode::VerificationFailed: return "VERIFICATION_FAILED";
        case StatusCode::GeneralError:       return "GENERAL_ERROR";
    }
    return "UNKNOWN";
}

std::string pipelineStepToString(PipelineStep step) {
    switch (step) {
        case PipelineStep::Starting:        return "STARTING";
        case PipelineStep::CheckingMount:   return "CHECKING_MOUNT";
        case PipelineStep::Mounting:        return "MOUNTING";
        case PipelineStep::Rsyncing:        return "RSYNCING";
        case PipelineStep::Unmounting:      return "UNMOUNTING";
        case PipelineStep::PreparingRemote: return "PREPARING_REMOTE";
        case PipelineStep::CopyingToRemote: return "COPYING_TO_REMOTE";
        case PipelineStep::VerifyingHash:   return "VERIFYING_HASH";
        case PipelineStep::Done:            return "DONE";
    }
    return "UNKNOWN";
}

bool isTerminal(StatusCode code) {
    return code != StatusCode::Idle && code != StatusCode::Running;
}
