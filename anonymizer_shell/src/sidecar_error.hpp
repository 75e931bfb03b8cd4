#pragma once

#include <stdexcept>
#include <string>

namespace sidecar {

enum class ErrorKind {
    InvalidPayload,
    StartFailed,
    WorkerReportedFailure,
    InvalidOutput,
    Timeout,
    Cancelled,
};

const char* to_string(ErrorKind kind);

/**
 * Terminal failure of a single sidecar invocation.
 *
 * detail() holds the text that caused the failure (OS error, worker stderr, the
 * worker's error field, parse error). raw_output() is only set for InvalidOutput.
 */
class SidecarError : public std::runtime_error {
public:
    SidecarError(ErrorKind kind, std::string detail, std::string raw_output = "");

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    const std::string& raw_output() const { return raw_output_; }

private:
    ErrorKind kind_;
    std::string detail_;
    std::string raw_output_;
};

} // namespace sidecar
