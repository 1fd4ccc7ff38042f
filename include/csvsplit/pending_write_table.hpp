#ifndef CSVSPLIT_PENDING_WRITE_TABLE_HPP
#define CSVSPLIT_PENDING_WRITE_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include <sys/uio.h>
#include <unordered_map>
#include <utility>

#include "output_target.hpp"
#include "record_buffer.hpp"

namespace csvsplit {

/**
 * A buffer in flight to the kernel.
 *
 * The pending write owns the buffer until its completion is consumed.
 * iov points into the buffer and is what the submission queue entry
 * references, so the entry must not move while the write is outstanding.
 */
struct PendingWrite {
    RecordBuffer buffer;
    OutputTarget* target;
    off_t offset;          ///< File offset of the buffer's first byte
    size_t written = 0;    ///< Bytes confirmed by completions so far
    int retries = 0;
    iovec iov{};           ///< Span currently submitted (tail after a short write)

    PendingWrite(RecordBuffer buf, OutputTarget* tgt, off_t off)
        : buffer(std::move(buf)), target(tgt), offset(off) {}
};

/**
 * Request id -> in-flight write.
 *
 * Node-based storage: a stored PendingWrite keeps its address until it is
 * removed, which the kernel-visible iovec relies on.
 */
class PendingWriteTable {
public:
    /**
     * Store a write under a fresh id.
     *
     * @return Reference to the stored entry (stable until remove())
     * @throws EngineError if the id is already present
     */
    PendingWrite& insert(uint64_t id, PendingWrite write);

    /**
     * Take a completed write out of the table.
     *
     * @throws EngineError if the id is unknown
     */
    PendingWrite remove(uint64_t id);

    /// nullptr if the id is unknown.
    PendingWrite* find(uint64_t id);

    size_t size() const { return writes_.size(); }
    bool empty() const { return writes_.empty(); }

private:
    std::unordered_map<uint64_t, PendingWrite> writes_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_PENDING_WRITE_TABLE_HPP
