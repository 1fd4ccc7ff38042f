#include "csvsplit/buffer_pool.hpp"

#include <utility>

#include "csvsplit/errors.hpp"

namespace csvsplit {

BufferPool::BufferPool(size_t count, size_t buffer_size, const CsvDialect& dialect)
    : buffer_size_(buffer_size) {
    available_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        available_.emplace_back(buffer_size, dialect);
    }
}

RecordBuffer BufferPool::pop() {
    if (available_.empty()) {
        throw EngineError("Buffer pool is empty");
    }

    RecordBuffer buffer = std::move(available_.back());
    available_.pop_back();
    return buffer;
}

void BufferPool::push(RecordBuffer buffer) {
    buffer.reset();
    // reserve() in the constructor keeps this from reallocating
    available_.push_back(std::move(buffer));
}

}  // namespace csvsplit
