#ifndef CSVSPLIT_RECORD_HPP
#define CSVSPLIT_RECORD_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace csvsplit {

/**
 * One CSV record: its fields in column order, unescaped.
 * Readers reuse the same Record (and its strings' capacity) across rows.
 */
using Record = std::vector<std::string>;

/**
 * Framing characters shared by the reader and the encoder.
 */
struct CsvDialect {
    char delimiter = ',';
    char quote = '"';
    char terminator = '\n';
};

/**
 * Serializes records as CSV without intermediate allocations.
 *
 * A field is quoted when it contains the delimiter, the quote character,
 * CR or LF, or when it is the only field of the record and is empty
 * (so the row does not read back as a blank line). Embedded quotes are doubled.
 */
class CsvEncoder {
public:
    explicit CsvEncoder(const CsvDialect& dialect = CsvDialect{}) : dialect_(dialect) {}

    /**
     * Exact number of bytes encode() will produce for the record,
     * terminator included.
     */
    size_t encoded_size(const Record& record) const;

    /**
     * Encode the record into out, which must have room for
     * encoded_size(record) bytes. No bounds checking is performed.
     *
     * @return Number of bytes written
     */
    size_t encode(const Record& record, char* out) const;

    /**
     * Append the encoded record to a growable string.
     */
    void append(const Record& record, std::string& out) const;

    const CsvDialect& dialect() const { return dialect_; }

private:
    bool needs_quoting(std::string_view field, bool only_field) const;

    CsvDialect dialect_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_RECORD_HPP
