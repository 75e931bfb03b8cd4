#include "sidecar_error.hpp"

#include <utility>

namespace sidecar {

namespace {

std::string format_message(ErrorKind kind, const std::string& detail, const std::string& raw_output) {
    std::string message;
    switch (kind) {
        case ErrorKind::InvalidPayload:
            message = "invalid sidecar payload: " + detail;
            break;
        case ErrorKind::StartFailed:
            message = "failed to start sidecar: " + detail;
            break;
        case ErrorKind::WorkerReportedFailure:
            message = "sidecar reported failure: " + detail;
            break;
        case ErrorKind::InvalidOutput:
            message = "invalid sidecar output: " + detail + ". stdout=" + raw_output;
            break;
        case ErrorKind::Timeout:
            message = "sidecar timed out: " + detail;
            break;
        case ErrorKind::Cancelled:
            message = "sidecar call cancelled: " + detail;
            break;
    }
    return message;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPayload:
            return "InvalidPayload";
        case ErrorKind::StartFailed:
            return "StartFailed";
        case ErrorKind::WorkerReportedFailure:
            return "WorkerReportedFailure";
        case ErrorKind::InvalidOutput:
            return "InvalidOutput";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

SidecarError::SidecarError(ErrorKind kind, std::string detail, std::string raw_output)
    : std::runtime_error(format_message(kind, detail, raw_output)),
      kind_(kind),
      detail_(std::move(detail)),
      raw_output_(std::move(raw_output)) {}

} // namespace sidecar
