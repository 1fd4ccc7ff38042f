#include "csvsplit/errors.hpp"

#include <cstring>

namespace csvsplit {

namespace {

std::string describe_io(const std::string& message, const std::string& path, int error_code) {
    std::string what = message;
    if (!path.empty()) {
        what += " '" + path + "'";
    }
    if (error_code != 0) {
        what += ": " + std::string(strerror(error_code));
    }
    return what;
}

}  // namespace

IoError::IoError(const std::string& message, const std::string& path, int error_code)
    : std::runtime_error(describe_io(message, path, error_code)),
      path_(path),
      error_code_(error_code) {}

BufferOverflowError::BufferOverflowError(size_t needed, size_t remaining)
    : std::runtime_error("Record needs " + std::to_string(needed) +
                         " bytes but only " + std::to_string(remaining) +
                         " remain in the write buffer"),
      needed_(needed),
      remaining_(remaining) {}

RecordTooLargeError::RecordTooLargeError(size_t record_size, size_t buffer_size)
    : std::runtime_error("Record of " + std::to_string(record_size) +
                         " bytes does not fit into a " + std::to_string(buffer_size) +
                         " byte write buffer (increase --buffer-size)") {}

CsvParseError::CsvParseError(const std::string& message, size_t line)
    : std::runtime_error("CSV parse error at line " + std::to_string(line) + ": " + message),
      line_(line) {}

}  // namespace csvsplit
