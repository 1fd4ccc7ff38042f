#ifndef CSVSPLIT_CSV_READER_HPP
#define CSVSPLIT_CSV_READER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "compression.hpp"
#include "record.hpp"

namespace arrow {
namespace io {
class InputStream;
}  // namespace io
}  // namespace arrow

namespace csvsplit {

/**
 * Streaming CSV record reader over an Arrow input stream.
 *
 * Handles quoted fields, doubled quotes, delimiters and line breaks inside
 * quotes, LF and CRLF terminators, and a last record without terminator.
 * Blank lines are skipped.
 *
 * Usage example:
 * ```
 * auto reader = CsvReader::open("data.csv.gz", CompressionType::Detect);
 * Record record;
 * while (reader->next(record)) {
 *     ...
 * }
 * ```
 */
class CsvReader {
public:
    /**
     * Open a file, decompressing it if requested or detected.
     *
     * @param path Input file
     * @param compression None, Gzip, Bzip, or Detect (probe the magic bytes)
     * @param dialect CSV framing
     * @throws IoError if the file cannot be opened
     */
    static std::unique_ptr<CsvReader> open(const std::string& path,
                                           CompressionType compression,
                                           const CsvDialect& dialect = CsvDialect{});

    /**
     * Read standard input, decompressing it if requested or detected.
     */
    static std::unique_ptr<CsvReader> open_stdin(CompressionType compression,
                                                 const CsvDialect& dialect = CsvDialect{});

    /**
     * Read a non-seekable stream such as standard input. Detect mode peeks
     * at the first bytes through a BufferedInputStream, so nothing is lost.
     *
     * @param source Name used in error messages
     */
    static std::unique_ptr<CsvReader> open_stream(std::shared_ptr<arrow::io::InputStream> raw,
                                                  CompressionType compression,
                                                  const CsvDialect& dialect = CsvDialect{},
                                                  const std::string& source = "<stream>");

    /**
     * Wrap an already decoded stream.
     *
     * @param stream Source of CSV bytes
     * @param codec Codec the stream depends on (kept alive with the reader), may be null
     * @param dialect CSV framing
     */
    CsvReader(std::shared_ptr<arrow::io::InputStream> stream,
              std::unique_ptr<arrow::util::Codec> codec,
              const CsvDialect& dialect = CsvDialect{});

    ~CsvReader();

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    /**
     * Read the next record into record, reusing its storage.
     *
     * @return false at end of input
     * @throws CsvParseError on an unterminated quoted field
     * @throws IoError if reading fails
     */
    bool next(Record& record);

    /// Compression resolved when the reader was opened.
    CompressionType compression() const { return compression_; }

    /// Current (1-based) input line.
    size_t line() const { return line_; }

private:
    bool fill();

    std::unique_ptr<arrow::util::Codec> codec_;
    std::shared_ptr<arrow::io::InputStream> stream_;
    CsvDialect dialect_;
    CompressionType compression_ = CompressionType::None;

    std::vector<char> chunk_;
    size_t pos_ = 0;
    size_t len_ = 0;
    bool eof_ = false;
    bool skip_lf_ = false;  // previous record ended with CR
    size_t line_ = 1;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_CSV_READER_HPP
