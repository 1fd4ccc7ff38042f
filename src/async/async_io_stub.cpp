// Synchronous fallback for AsyncIOContext when io_uring is not available

#include "csvsplit/async_io.hpp"

#ifndef CSVSPLIT_ENABLE_ASYNC_IO

#include <cerrno>
#include <unistd.h>

namespace csvsplit {

AsyncIOContext::AsyncIOContext(const AsyncIOConfig& config)
    : queue_depth_(config.queue_depth) {
    init(config);
}

AsyncIOContext::AsyncIOContext(uint32_t queue_depth)
    : queue_depth_(queue_depth) {
    AsyncIOConfig config;
    config.queue_depth = queue_depth;
    init(config);
}

void AsyncIOContext::init(const AsyncIOConfig& config) {
    ready_.reserve(config.queue_depth);
}

AsyncIOContext::~AsyncIOContext() = default;

void AsyncIOContext::queue_writev(int fd, const iovec* iov, unsigned iovcnt, off_t offset,
                                  uint64_t user_data, bool linked) {
    // Writes are performed immediately, so ordering is already total
    (void)linked;

    ssize_t result;
    do {
        result = pwritev(fd, iov, static_cast<int>(iovcnt), offset);
    } while (result < 0 && errno == EINTR);

    ready_.push_back(IOCompletion{user_data, result < 0 ? -errno : static_cast<int>(result)});
    queued_++;
}

int AsyncIOContext::submit_queued() {
    int submitted = queued_;
    pending_ += queued_;
    queued_ = 0;
    return submitted;
}

int AsyncIOContext::wait_completions(int min_complete, std::vector<IOCompletion>* completions) {
    (void)min_complete;

    // Only report what has been submitted; queued writes stay queued
    const size_t available = static_cast<size_t>(pending_);
    if (available == 0) {
        return 0;
    }

    if (completions) {
        completions->insert(completions->end(), ready_.begin(), ready_.begin() + available);
    }
    ready_.erase(ready_.begin(), ready_.begin() + available);
    pending_ = 0;

    return static_cast<int>(available);
}

void AsyncIOContext::flush() {
    submit_queued();
    wait_completions(pending_, nullptr);
}

}  // namespace csvsplit

#endif  // !CSVSPLIT_ENABLE_ASYNC_IO
