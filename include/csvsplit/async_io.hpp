#ifndef CSVSPLIT_ASYNC_IO_HPP
#define CSVSPLIT_ASYNC_IO_HPP

#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include <sys/uio.h>
#include <vector>

namespace csvsplit {

/**
 * Configuration for AsyncIOContext.
 */
struct AsyncIOConfig {
    uint32_t queue_depth = 8;     ///< io_uring submission queue depth
    bool use_sqpoll = false;      ///< Use kernel-side polling (requires CAP_SYS_NICE)
};

/**
 * Result of one finished operation, as reported by the completion queue.
 */
struct IOCompletion {
    uint64_t user_data;  ///< Value passed to queue_writev()
    int result;          ///< Bytes written, or -errno
};

/**
 * Asynchronous vectored writes on top of Linux io_uring.
 *
 * Writes are queued into the submission ring, handed to the kernel with
 * submit_queued(), and their results collected with wait_completions().
 * The context does not interpret results: failed completions are returned
 * to the caller with a negative errno.
 *
 * Built without CSVSPLIT_ENABLE_ASYNC_IO the same interface performs each
 * write synchronously with pwritev() at queue time and reports the result
 * on the next wait_completions() call.
 */
class AsyncIOContext {
public:
    /**
     * Initialize async I/O context with configuration.
     *
     * @param config AsyncIOConfig structure for detailed tuning
     * @throws std::runtime_error if the ring cannot be created
     */
    explicit AsyncIOContext(const AsyncIOConfig& config);

    /**
     * Initialize async I/O context with queue depth.
     *
     * @param queue_depth Maximum number of pending requests
     */
    explicit AsyncIOContext(uint32_t queue_depth = 8);

    /**
     * Waits for all pending operations to complete before destruction.
     */
    ~AsyncIOContext();

    AsyncIOContext(const AsyncIOContext&) = delete;
    AsyncIOContext& operator=(const AsyncIOContext&) = delete;

    /**
     * Queue a vectored write without submitting it.
     *
     * The iovec array and the memory it points to must stay valid and
     * unmodified until the completion for user_data has been consumed.
     *
     * @param fd File descriptor to write to
     * @param iov Spans to write, in order
     * @param iovcnt Number of spans
     * @param offset File offset of the first byte
     * @param user_data Returned unchanged with the completion
     * @param linked Set IOSQE_IO_LINK; the chain only covers entries sent in the same submit_queued()
     * @throws std::runtime_error if no submission queue entry is available
     */
    void queue_writev(int fd, const iovec* iov, unsigned iovcnt, off_t offset,
                      uint64_t user_data, bool linked);

    /**
     * Submit all queued operations to the kernel.
     *
     * @return Number of operations submitted
     */
    int submit_queued();

    /**
     * Wait for completions.
     *
     * Blocks until at least min_complete operations (capped at the number
     * pending) have finished, then consumes every completion available.
     *
     * @param min_complete Minimum number of operations to wait for
     * @param completions Receives one entry per consumed completion
     * @return Number of completions consumed
     * @throws std::runtime_error if waiting fails
     */
    int wait_completions(int min_complete, std::vector<IOCompletion>* completions);

    /**
     * Get count of pending requests.
     *
     * @return Number of submitted but not yet consumed requests
     */
    int pending_count() const { return pending_; }

    /**
     * Get count of queued but not yet submitted operations.
     */
    int queued_count() const { return queued_; }

    uint32_t queue_depth() const { return queue_depth_; }

    /**
     * Submit anything queued and wait until nothing is pending.
     * Completions are discarded.
     */
    void flush();

private:
    void init(const AsyncIOConfig& config);

    uint32_t queue_depth_;
    int pending_ = 0;
    int queued_ = 0;
#ifdef CSVSPLIT_ENABLE_ASYNC_IO
    // Opaque pointer to io_uring ring structure
    // We use void* to keep liburing out of this header
    void* ring_ = nullptr;
#else
    std::vector<IOCompletion> ready_;  // finished synchronously, not yet reported
#endif
};

}  // namespace csvsplit

#endif  // CSVSPLIT_ASYNC_IO_HPP
