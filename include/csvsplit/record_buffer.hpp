#ifndef CSVSPLIT_RECORD_BUFFER_HPP
#define CSVSPLIT_RECORD_BUFFER_HPP

#include <cstddef>
#include <memory>
#include <sys/uio.h>

#include "record.hpp"

namespace csvsplit {

/**
 * Fixed-capacity write buffer with an incremental CSV encoder.
 *
 * This is the unit of memory handed to the kernel: a RecordBuffer is owned
 * by exactly one component at a time (split writer, pool, or pending-write
 * table). The storage is allocated once, zero-filled, and never resized.
 * Moving a RecordBuffer transfers the storage without relocating it, so a
 * span() taken before the move stays valid for the new owner.
 */
class RecordBuffer {
public:
    /**
     * Allocate a zeroed buffer.
     *
     * @param capacity Size of the byte region
     * @param dialect CSV framing used by write_row()
     */
    explicit RecordBuffer(size_t capacity, const CsvDialect& dialect = CsvDialect{});

    RecordBuffer(RecordBuffer&& other) noexcept;
    RecordBuffer& operator=(RecordBuffer&& other) noexcept;

    RecordBuffer(const RecordBuffer&) = delete;
    RecordBuffer& operator=(const RecordBuffer&) = delete;

    size_t capacity() const { return capacity_; }

    /// Bytes encoded so far.
    size_t size() const { return pos_; }

    size_t remaining() const { return capacity_ - pos_; }

    bool empty() const { return pos_ == 0; }

    const char* data() const { return data_.get(); }

    /**
     * Number of bytes write_row() would consume for this record.
     */
    size_t encoded_size(const Record& row) const { return encoder_.encoded_size(row); }

    /**
     * Encode one record at the cursor.
     *
     * Unchecked: the caller must make sure encoded_size(row) <= remaining().
     * Writing past the end is undefined behaviour.
     *
     * @return Remaining capacity after the record
     */
    size_t write_row(const Record& row);

    /**
     * Encode one record at the cursor, or throw BufferOverflowError
     * (leaving the buffer untouched) if it does not fit.
     *
     * @return Remaining capacity after the record
     */
    size_t write_row_checked(const Record& row);

    /**
     * Kernel-visible view of the written bytes [0, size()).
     */
    iovec span() const;

    /**
     * Kernel-visible view of the written bytes starting at offset.
     * Used to resubmit the tail of a short write.
     */
    iovec span_from(size_t offset) const;

    /// Rewind the cursor. Storage and contents are kept.
    void reset() { pos_ = 0; }

private:
    std::unique_ptr<char[]> data_;
    size_t capacity_;
    size_t pos_ = 0;
    CsvEncoder encoder_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_RECORD_BUFFER_HPP
