#include "csvsplit/async_io.hpp"

#ifdef CSVSPLIT_ENABLE_ASYNC_IO

#include <cerrno>
#include <cstring>
#include <iostream>
#include <liburing.h>
#include <stdexcept>
#include <string>

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
    ring_ = new io_uring;

    struct io_uring_params params = {};
    if (config.use_sqpoll) {
        // Kernel thread polls the submission queue; saves the submit syscall
        params.flags |= IORING_SETUP_SQPOLL;
        params.sq_thread_idle = 2000;
    }

    int ret = io_uring_queue_init_params(config.queue_depth,
                                         static_cast<io_uring*>(ring_),
                                         &params);
    if (ret < 0) {
        delete static_cast<io_uring*>(ring_);
        ring_ = nullptr;
        throw std::runtime_error("Failed to initialize io_uring: " + std::string(strerror(-ret)));
    }
}

AsyncIOContext::~AsyncIOContext() {
    try {
        // Buffers referenced by in-flight writes are freed right after us
        flush();
    } catch (const std::exception& e) {
        std::cerr << "Warning: io_uring flush failed during shutdown: " << e.what() << "\n";
    }

    io_uring_queue_exit(static_cast<io_uring*>(ring_));
    delete static_cast<io_uring*>(ring_);
}

void AsyncIOContext::queue_writev(int fd, const iovec* iov, unsigned iovcnt, off_t offset,
                                  uint64_t user_data, bool linked) {
    auto ring = static_cast<io_uring*>(ring_);

    struct io_uring_sqe* sqe = io_uring_get_sqe(ring);
    if (sqe == nullptr) {
        // Queue full - submit current batch first
        submit_queued();
        sqe = io_uring_get_sqe(ring);
        if (sqe == nullptr) {
            throw std::runtime_error("Failed to get submission queue entry");
        }
    }

    io_uring_prep_writev(sqe, fd, iov, iovcnt, static_cast<__u64>(offset));
    sqe->user_data = user_data;
    if (linked) {
        io_uring_sqe_set_flags(sqe, IOSQE_IO_LINK);
    }
    queued_++;
}

int AsyncIOContext::submit_queued() {
    if (queued_ == 0) return 0;

    auto ring = static_cast<io_uring*>(ring_);
    int ret;
    do {
        ret = io_uring_submit(ring);
    } while (ret == -EINTR);

    if (ret < 0) {
        throw std::runtime_error("Submit failed: " + std::string(strerror(-ret)));
    }

    pending_ += queued_;
    int submitted = queued_;
    queued_ = 0;
    return submitted;
}

int AsyncIOContext::wait_completions(int min_complete, std::vector<IOCompletion>* completions) {
    auto ring = static_cast<io_uring*>(ring_);

    if (pending_ == 0) {
        return 0;
    }

    struct io_uring_cqe* cqe = nullptr;
    const unsigned wait_nr = static_cast<unsigned>(min_complete > pending_ ? pending_ : min_complete);

    int ret;
    do {
        ret = io_uring_wait_cqe_nr(ring, &cqe, wait_nr);
    } while (ret == -EINTR);

    if (ret < 0) {
        throw std::runtime_error("Failed to wait for completions: " + std::string(strerror(-ret)));
    }

    // Consume everything that is ready, not just wait_nr
    unsigned head;
    unsigned completed = 0;
    io_uring_for_each_cqe(ring, head, cqe) {
        if (completions) {
            completions->push_back(IOCompletion{cqe->user_data, cqe->res});
        }
        completed++;
    }

    io_uring_cq_advance(ring, completed);
    pending_ -= static_cast<int>(completed);

    return static_cast<int>(completed);
}

void AsyncIOContext::flush() {
    submit_queued();
    while (pending_ > 0) {
        wait_completions(pending_, nullptr);
    }
}

}  // namespace csvsplit

#endif  // CSVSPLIT_ENABLE_ASYNC_IO
