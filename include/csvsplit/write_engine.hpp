#ifndef CSVSPLIT_WRITE_ENGINE_HPP
#define CSVSPLIT_WRITE_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "async_io.hpp"
#include "buffer_pool.hpp"
#include "output_target.hpp"
#include "pending_write_table.hpp"
#include "record_buffer.hpp"

namespace csvsplit {

/**
 * Submission/completion engine.
 *
 * Turns filled RecordBuffers into vectored io_uring writes and gives them
 * back once the kernel is done with them. Ownership of a buffer moves into
 * the pending-write table at submit() and out of it only when its
 * completion has been consumed by drain().
 *
 * Completion handling:
 *   - full write: buffer is reclaimed
 *   - short write: the unwritten tail is resubmitted at the adjusted offset
 *   - EAGAIN, EINTR, ECANCELED: resubmitted unchanged, up to max_retries times
 *   - any other error: IoError
 */
class WriteEngine {
public:
    /**
     * @param config Ring configuration; queue_depth bounds writes in flight
     * @param max_retries Resubmissions allowed per write for transient errors
     */
    explicit WriteEngine(const AsyncIOConfig& config, int max_retries = 3);

    /**
     * Write the buffer's contents at the end of target.
     *
     * Advances the target's offset by the buffer size immediately and submits
     * one vectored write at the old offset. Each submit() is its own ring
     * submission, so writes are not ordered against each other; the explicit
     * offsets and the full-barrier drain() make that safe. Does not wait.
     *
     * @return Request id (unique, increasing, starting at 1)
     */
    uint64_t submit(OutputTarget& target, RecordBuffer buffer);

    /**
     * Full-barrier reclaim: if anything is in flight, block until every
     * outstanding write has completed and push each buffer (reset) into pool.
     *
     * @return Number of buffers returned to the pool
     * @throws IoError on a non-retryable write failure
     */
    size_t drain(BufferPool& pool);

    size_t in_flight() const { return writes_.size(); }

    /// Id the next submit() will return.
    uint64_t next_id() const { return next_id_; }

    /**
     * Apply one completion to the write it belongs to: reclaim the buffer on
     * a full write, resubmit the tail of a short write, resubmit the same
     * span after a transient error. drain() calls this for every completion.
     *
     * @return 1 if the buffer went back to pool, else 0
     * @throws IoError on a fatal error or when the write is out of retries
     * @throws EngineError for an id that is not in flight
     */
    size_t complete(const IOCompletion& completion, BufferPool& pool);

    static bool is_retryable(int error_code);

private:
    void queue(uint64_t id, PendingWrite& write);
    void retry(uint64_t id, PendingWrite& write, int error_code);

    int max_retries_;
    uint64_t next_id_ = 1;
    std::vector<IOCompletion> completions_;
    // Declared before ctx_: the context waits for in-flight writes on
    // destruction, and the buffers they reference must still exist.
    PendingWriteTable writes_;
    AsyncIOContext ctx_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_WRITE_ENGINE_HPP
