#ifndef CSVSPLIT_ASYNC_SPLIT_WRITER_HPP
#define CSVSPLIT_ASYNC_SPLIT_WRITER_HPP

#include <cstddef>
#include <optional>

#include "buffer_cache.hpp"
#include "record_buffer.hpp"
#include "rotation_policy.hpp"
#include "trigger.hpp"
#include "writer_interface.hpp"

namespace csvsplit {

/**
 * Split writer on top of the io_uring BufferCache.
 *
 * Records are encoded straight into a pooled buffer. A full buffer is
 * submitted to the current file and replaced by a fresh one; that never
 * starts a new file. New files are started only by the RotationPolicy, so
 * a group is never split across files, whatever the buffer size.
 *
 * Output is uncompressed; use SplitWriter for compressed files.
 */
class AsyncSplitWriter : public WriterInterface {
public:
    /**
     * Create the first output file and take the first buffer.
     *
     * @param options Naming, rotation and trigger settings
     * @param cache_config Buffer size and queue depth of the engine
     */
    AsyncSplitWriter(const SplitOptions& options, const BufferCacheConfig& cache_config);

    ~AsyncSplitWriter() override;

    /**
     * @throws RecordTooLargeError if the record does not fit into an empty buffer
     * @throws IoError if a write fails
     */
    void write_record(const Record& record) override;

    void close() override;

    size_t files_written() const override { return on_file_; }
    size_t rows_written() const override { return total_rows_; }

    const BufferCache& cache() const { return cache_; }

private:
    void encode(const Record& record);
    void flush_buffer();
    void rotate();
    void file_finished(const std::string& path, size_t rows);

    SplitOptions options_;
    RotationPolicy policy_;
    std::optional<Trigger> trigger_;
    BufferCache cache_;
    RecordBuffer active_;
    size_t on_file_ = 1;
    size_t total_rows_ = 0;
    bool closed_ = false;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_ASYNC_SPLIT_WRITER_HPP
