#include "csvsplit/record_buffer.hpp"

#include <utility>

#include "csvsplit/errors.hpp"

namespace csvsplit {

RecordBuffer::RecordBuffer(size_t capacity, const CsvDialect& dialect)
    : data_(new char[capacity]()), capacity_(capacity), encoder_(dialect) {}

RecordBuffer::RecordBuffer(RecordBuffer&& other) noexcept
    : data_(std::move(other.data_)),
      capacity_(std::exchange(other.capacity_, 0)),
      pos_(std::exchange(other.pos_, 0)),
      encoder_(other.encoder_) {}

RecordBuffer& RecordBuffer::operator=(RecordBuffer&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        capacity_ = std::exchange(other.capacity_, 0);
        pos_ = std::exchange(other.pos_, 0);
        encoder_ = other.encoder_;
    }
    return *this;
}

size_t RecordBuffer::write_row(const Record& row) {
    pos_ += encoder_.encode(row, data_.get() + pos_);
    return remaining();
}

size_t RecordBuffer::write_row_checked(const Record& row) {
    const size_t needed = encoder_.encoded_size(row);
    if (needed > remaining()) {
        throw BufferOverflowError(needed, remaining());
    }
    return write_row(row);
}

iovec RecordBuffer::span() const {
    return span_from(0);
}

iovec RecordBuffer::span_from(size_t offset) const {
    iovec iov;
    iov.iov_base = data_.get() + offset;
    iov.iov_len = pos_ > offset ? pos_ - offset : 0;
    return iov;
}

}  // namespace csvsplit
