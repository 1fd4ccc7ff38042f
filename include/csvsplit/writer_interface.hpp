#ifndef CSVSPLIT_WRITER_INTERFACE_HPP
#define CSVSPLIT_WRITER_INTERFACE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "file_naming.hpp"
#include "record.hpp"

namespace csvsplit {

/**
 * Settings shared by the split writers.
 */
struct SplitOptions {
    SplitFileNaming naming;
    size_t max_rows = 1000;
    std::optional<size_t> group_column;  ///< Runs of equal values stay in one file
    std::optional<Record> header;        ///< Written at the top of every file
    std::string trigger;                 ///< Command template run per finished file; empty for none
    size_t safety_margin = 0;            ///< Flush a buffer once its free space drops to this
    CsvDialect dialect;
    bool verbose = false;
};

/**
 * Abstract base class for split writers.
 * Implementations distribute a record stream over numbered output files.
 */
class WriterInterface {
public:
    virtual ~WriterInterface() = default;

    /**
     * Append one record, starting a new file first when the rotation
     * policy says so.
     */
    virtual void write_record(const Record& record) = 0;

    /**
     * Finish the last file and make sure everything is written.
     * Further write_record() calls are an error.
     */
    virtual void close() = 0;

    /// Output files created so far.
    virtual size_t files_written() const = 0;

    /// Data rows accepted so far (headers excluded).
    virtual size_t rows_written() const = 0;
};

using WriterPtr = std::unique_ptr<WriterInterface>;

}  // namespace csvsplit

#endif  // CSVSPLIT_WRITER_INTERFACE_HPP
