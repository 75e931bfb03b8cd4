#pragma once

#include <atomic>

namespace sidecar {

/**
 * Caller-owned cancellation trigger for in-flight sidecar calls.
 *
 * cancel() may be called from any thread. Once triggered the token stays
 * triggered; fd() becomes readable and remains readable, so one token can
 * cancel several concurrent calls.
 */
class CancellationToken {
public:
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    /// eventfd polled by the process runner
    int fd() const { return event_fd_; }

private:
    int event_fd_ = -1;
    std::atomic<bool> cancelled_{false};
};

} // namespace sidecar
