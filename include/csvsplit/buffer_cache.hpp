#ifndef CSVSPLIT_BUFFER_CACHE_HPP
#define CSVSPLIT_BUFFER_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "buffer_pool.hpp"
#include "output_target.hpp"
#include "record.hpp"
#include "record_buffer.hpp"
#include "write_engine.hpp"

namespace csvsplit {

/**
 * Configuration for BufferCache.
 */
struct BufferCacheConfig {
    size_t buffer_size = 1024 * 1024;  ///< Capacity of each RecordBuffer (1 MB default)
    uint32_t queue_depth = 8;          ///< Buffers in the pool == maximum writes in flight
    int max_retries = 3;               ///< Resubmissions per write for transient errors
    bool use_sqpoll = false;           ///< Kernel-side submission polling
    CsvDialect dialect;
};

/**
 * Asynchronous buffer-cache write engine.
 *
 * Composes a fixed BufferPool, the WriteEngine and the TargetSequence.
 * A caller pops a buffer, encodes records into it, submits it against the
 * active target and pops the next one. Memory use is fixed at construction:
 * queue_depth buffers of buffer_size bytes, whatever the input size.
 *
 * At any time free_count() + in_flight_count() + buffers held by the caller
 * equals concurrency_limit().
 *
 * Usage example:
 * ```
 * BufferCache cache(config, "out.00001.csv");
 * RecordBuffer buffer = cache.pop();
 * buffer.write_row(record);
 * buffer = cache.submit_and_pop(std::move(buffer));
 * cache.rotate("out.00002.csv");
 * ...
 * cache.submit(std::move(buffer));
 * cache.sync();
 * ```
 *
 * Single-threaded: all calls must come from the same thread.
 */
class BufferCache {
public:
    /**
     * @param config Pool and ring sizing
     * @param first_path Path of the first output target
     * @throws IoError if the first target cannot be created
     */
    BufferCache(const BufferCacheConfig& config, const std::string& first_path);

    /**
     * Take a free buffer. If the pool is empty, first waits for every
     * in-flight write to complete (the only blocking point of the engine).
     *
     * @throws EngineError if the pool is empty and nothing is in flight
     */
    RecordBuffer pop();

    /**
     * Submit the buffer against the active target.
     *
     * @return Request id of the write
     */
    uint64_t submit(RecordBuffer buffer);

    /**
     * submit() followed by pop().
     */
    RecordBuffer submit_and_pop(RecordBuffer buffer);

    /**
     * Return a buffer to the pool without writing it.
     */
    void recycle(RecordBuffer buffer);

    /**
     * Open a new output target and make it active. Later submissions
     * go to the new file, starting at offset 0.
     */
    void rotate(const std::string& path);

    /**
     * Wait for every in-flight write, then close superseded targets.
     * Afterwards all submitted data is in the files.
     */
    void sync();

    size_t free_count() const { return pool_.size(); }
    size_t in_flight_count() const { return engine_.in_flight(); }
    size_t concurrency_limit() const { return config_.queue_depth; }
    size_t buffer_size() const { return config_.buffer_size; }

    const TargetSequence& targets() const { return targets_; }
    const std::string& active_path() const { return targets_.active().path(); }

private:
    BufferCacheConfig config_;
    TargetSequence targets_;
    BufferPool pool_;
    WriteEngine engine_;  // destroyed first: waits for writes before buffers and files go away
};

}  // namespace csvsplit

#endif  // CSVSPLIT_BUFFER_CACHE_HPP
