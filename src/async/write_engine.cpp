#include "csvsplit/write_engine.hpp"

#include <cerrno>
#include <string>
#include <utility>

#include "csvsplit/errors.hpp"
#include "csvsplit/performance_counters.hpp"

namespace csvsplit {

WriteEngine::WriteEngine(const AsyncIOConfig& config, int max_retries)
    : max_retries_(max_retries), ctx_(config) {
    completions_.reserve(config.queue_depth);
}

bool WriteEngine::is_retryable(int error_code) {
    return error_code == EAGAIN || error_code == EINTR || error_code == ECANCELED;
}

uint64_t WriteEngine::submit(OutputTarget& target, RecordBuffer buffer) {
    const size_t len = buffer.size();
    const off_t offset = target.advance(len);
    const uint64_t id = next_id_++;

    PendingWrite& write = writes_.insert(id, PendingWrite(std::move(buffer), &target, offset));
    write.iov = write.buffer.span();

    queue(id, write);
    ctx_.submit_queued();

    CSVSPLIT_INCREMENT_COUNTER("buffers_submitted", 1);
    CSVSPLIT_INCREMENT_COUNTER("bytes_submitted", len);
    return id;
}

void WriteEngine::queue(uint64_t id, PendingWrite& write) {
    ctx_.queue_writev(write.target->fd(), &write.iov, 1,
                      write.offset + static_cast<off_t>(write.written), id, true);
}

size_t WriteEngine::drain(BufferPool& pool) {
    size_t reclaimed = 0;

    while (!writes_.empty()) {
        if (ctx_.pending_count() == 0) {
            throw EngineError(std::to_string(writes_.size()) +
                              " writes tracked but none pending in the ring");
        }

        completions_.clear();
        ctx_.wait_completions(ctx_.pending_count(), &completions_);

        for (const auto& completion : completions_) {
            reclaimed += complete(completion, pool);
        }

        // Short writes and transient failures queued during this round
        ctx_.submit_queued();
    }

    return reclaimed;
}

size_t WriteEngine::complete(const IOCompletion& completion, BufferPool& pool) {
    const uint64_t id = completion.user_data;
    PendingWrite* write = writes_.find(id);
    if (write == nullptr) {
        throw EngineError("Completion for unknown write id " + std::to_string(id));
    }

    if (completion.result < 0) {
        retry(id, *write, -completion.result);
        return 0;
    }

    write->written += static_cast<size_t>(completion.result);
    if (write->written >= write->buffer.size()) {
        pool.push(writes_.remove(id).buffer);
        return 1;
    }

    // Short write: resubmit the tail. No progress at all counts against the retries.
    CSVSPLIT_INCREMENT_COUNTER("short_writes", 1);
    if (completion.result == 0) {
        retry(id, *write, EAGAIN);
        return 0;
    }
    write->iov = write->buffer.span_from(write->written);
    queue(id, *write);
    return 0;
}

void WriteEngine::retry(uint64_t id, PendingWrite& write, int error_code) {
    if (!is_retryable(error_code) || write.retries >= max_retries_) {
        throw IoError("Write of " + std::to_string(write.buffer.size() - write.written) +
                      " bytes at offset " +
                      std::to_string(write.offset + static_cast<off_t>(write.written)) +
                      " failed for",
                      write.target->path(), error_code);
    }

    write.retries++;
    write.iov = write.buffer.span_from(write.written);
    CSVSPLIT_INCREMENT_COUNTER("write_retries", 1);
    queue(id, write);
}

}  // namespace csvsplit
