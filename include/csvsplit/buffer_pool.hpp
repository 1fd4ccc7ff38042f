#ifndef CSVSPLIT_BUFFER_POOL_HPP
#define CSVSPLIT_BUFFER_POOL_HPP

#include <cstddef>
#include <vector>

#include "record_buffer.hpp"

namespace csvsplit {

/**
 * Bounded free-list of RecordBuffers.
 *
 * All buffers are created up front; the pool never allocates afterwards.
 * Buffers come back through push() once their write has completed.
 * LIFO order, so the most recently used (cache-warm) buffer is reused first.
 *
 * Not thread-safe: owned and driven by a single BufferCache.
 */
class BufferPool {
public:
    /**
     * @param count Number of buffers (the I/O concurrency limit)
     * @param buffer_size Capacity of each buffer in bytes
     * @param dialect CSV framing for the buffers' encoders
     */
    BufferPool(size_t count, size_t buffer_size, const CsvDialect& dialect = CsvDialect{});

    /**
     * Take a buffer out of the pool.
     *
     * @throws EngineError if the pool is empty
     */
    RecordBuffer pop();

    /**
     * Return a buffer. Its cursor is reset.
     */
    void push(RecordBuffer buffer);

    size_t size() const { return available_.size(); }
    bool empty() const { return available_.empty(); }
    size_t buffer_size() const { return buffer_size_; }

private:
    size_t buffer_size_;
    std::vector<RecordBuffer> available_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_BUFFER_POOL_HPP
