#ifndef CSVSPLIT_SPLIT_WRITER_HPP
#define CSVSPLIT_SPLIT_WRITER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "record.hpp"
#include "rotation_policy.hpp"
#include "trigger.hpp"
#include "writer_interface.hpp"

namespace arrow {
namespace io {
class OutputStream;
}  // namespace io
namespace util {
class Codec;
}  // namespace util
}  // namespace arrow

namespace csvsplit {

/**
 * Synchronous split writer using Arrow output streams.
 *
 * Same rotation policy as AsyncSplitWriter. Encoded rows are staged in a
 * small string buffer and written through an arrow::io::FileOutputStream,
 * wrapped in an arrow::io::CompressedOutputStream when the naming asks for
 * gzip or bzip2 output.
 */
class SplitWriter : public WriterInterface {
public:
    /**
     * Create the first output file.
     *
     * @throws IoError if the file cannot be created
     */
    explicit SplitWriter(const SplitOptions& options);

    ~SplitWriter() override;

    void write_record(const Record& record) override;
    void close() override;

    size_t files_written() const override { return on_file_; }
    size_t rows_written() const override { return total_rows_; }

private:
    void open_file();
    void close_file();
    void flush_staging();
    void stage(const Record& record);

    SplitOptions options_;
    RotationPolicy policy_;
    CsvEncoder encoder_;
    std::optional<Trigger> trigger_;

    std::unique_ptr<arrow::util::Codec> codec_;
    std::shared_ptr<arrow::io::OutputStream> stream_;
    std::string current_path_;
    std::string staging_;

    size_t on_file_ = 0;
    size_t total_rows_ = 0;
    bool closed_ = false;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_SPLIT_WRITER_HPP
