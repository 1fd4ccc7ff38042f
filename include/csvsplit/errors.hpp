#ifndef CSVSPLIT_ERRORS_HPP
#define CSVSPLIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace csvsplit {

/**
 * Failure of an operating system or Arrow I/O call.
 * Carries the errno value (0 when the failure did not come with one)
 * and the path the operation was working on.
 */
class IoError : public std::runtime_error {
public:
    IoError(const std::string& message, const std::string& path, int error_code = 0);

    int error_code() const { return error_code_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int error_code_;
};

/**
 * A checked encode did not fit into the remaining buffer capacity.
 * Nothing was written.
 */
class BufferOverflowError : public std::runtime_error {
public:
    BufferOverflowError(size_t needed, size_t remaining);

    size_t needed() const { return needed_; }
    size_t remaining() const { return remaining_; }

private:
    size_t needed_;
    size_t remaining_;
};

/**
 * A single record is larger than an empty write buffer.
 * Indicates a misconfigured buffer size, not a transient fault.
 */
class RecordTooLargeError : public std::runtime_error {
public:
    RecordTooLargeError(size_t record_size, size_t buffer_size);
};

/**
 * Malformed CSV input (for example an unterminated quoted field).
 */
class CsvParseError : public std::runtime_error {
public:
    CsvParseError(const std::string& message, size_t line);

    size_t line() const { return line_; }

private:
    size_t line_;
};

/**
 * Internal bookkeeping of the write engine was violated
 * (duplicate request id, completion for an unknown id, empty pool).
 */
class EngineError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_ERRORS_HPP
