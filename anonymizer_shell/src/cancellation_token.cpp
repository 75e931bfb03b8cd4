#include "cancellation_token.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <system_error>

namespace sidecar {

CancellationToken::CancellationToken() {
    event_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (event_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

CancellationToken::~CancellationToken() {
    if (event_fd_ >= 0) {
        ::close(event_fd_);
    }
}

void CancellationToken::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }

    // The counter is never read back, so the fd stays readable.
    uint64_t one = 1;
    ssize_t written;
    do {
        written = ::write(event_fd_, &one, sizeof(one));
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd write");
    }
}

} // namespace sidecar
