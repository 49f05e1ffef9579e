#include "swarmbed/error.hpp"
#include <sstream>

namespace swarmbed {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidFormat: return "Invalid format";

        case ErrorCode::AlreadyRunning: return "Already running";
        case ErrorCode::NotRunning: return "Not running";
        case ErrorCode::LaunchFailed: return "Launch failed";
        case ErrorCode::PersistFailed: return "Persist failed";
        case ErrorCode::CorruptState: return "Corrupt state";
        case ErrorCode::SignalFailed: return "Signal delivery failed";
        case ErrorCode::ShutdownTimeout: return "Shutdown timed out";
        case ErrorCode::PidFileRemoveFailed: return "PID file removal failed";

        case ErrorCode::ReadinessTimeout: return "Readiness timed out";
        case ErrorCode::CommandFailed: return "Command failed";
        case ErrorCode::IdentityMissing: return "Peer identity missing";
        case ErrorCode::UnknownAttribute: return "Unknown attribute";
        case ErrorCode::ShellNotFound: return "Shell not found";

        case ErrorCode::ConfigReadFailed: return "Config read failed";
        case ErrorCode::ConfigWriteFailed: return "Config write failed";
        case ErrorCode::RegistryLoadFailed: return "Registry load failed";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace swarmbed
