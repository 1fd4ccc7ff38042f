#include "csvsplit/split_writer.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <arrow/io/compressed.h>
#include <arrow/io/file.h>
#include <arrow/util/compression.h>

#include "csvsplit/compression.hpp"
#include "csvsplit/errors.hpp"

namespace csvsplit {

namespace {

constexpr size_t kStagingLimit = 256 * 1024;

}  // namespace

SplitWriter::SplitWriter(const SplitOptions& options)
    : options_(options),
      policy_(options.max_rows, options.group_column),
      encoder_(options.dialect),
      codec_(make_codec(options.naming.compression)) {
    if (!options_.trigger.empty()) {
        trigger_.emplace(options_.trigger);
    }
    staging_.reserve(kStagingLimit);
    open_file();
}

SplitWriter::~SplitWriter() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "Error: finishing " << current_path_ << " failed: " << e.what() << "\n";
    }
}

void SplitWriter::open_file() {
    current_path_ = options_.naming.path_for(++on_file_);

    auto file = arrow::io::FileOutputStream::Open(current_path_);
    if (!file.ok()) {
        throw IoError("Can't create file: " + file.status().ToString(), current_path_);
    }

    stream_ = *file;
    if (codec_) {
        auto compressed = arrow::io::CompressedOutputStream::Make(codec_.get(), stream_);
        if (!compressed.ok()) {
            throw IoError("Can't set up " + compression_name(options_.naming.compression) +
                          " encoding: " + compressed.status().ToString(), current_path_);
        }
        stream_ = *compressed;
    }

    policy_.start_file();
    if (options_.header) {
        encoder_.append(*options_.header, staging_);
    }
}

void SplitWriter::flush_staging() {
    if (staging_.empty()) {
        return;
    }

    auto status = stream_->Write(staging_.data(), static_cast<int64_t>(staging_.size()));
    if (!status.ok()) {
        throw IoError("Write failed: " + status.ToString(), current_path_);
    }
    staging_.clear();
}

void SplitWriter::close_file() {
    flush_staging();

    // Closing the compressed stream also finalizes and closes the file
    auto status = stream_->Close();
    if (!status.ok()) {
        throw IoError("Close failed: " + status.ToString(), current_path_);
    }
    stream_.reset();

    const size_t rows = policy_.rows_in_file();
    if (options_.verbose) {
        std::cout << "  Wrote " << current_path_ << " (" << rows << " rows)\n";
    }
    if (trigger_ && rows > 0) {
        trigger_->run(current_path_, rows);
    }
}

void SplitWriter::stage(const Record& record) {
    encoder_.append(record, staging_);
    if (staging_.size() >= kStagingLimit) {
        flush_staging();
    }
}

void SplitWriter::write_record(const Record& record) {
    if (closed_) {
        throw std::logic_error("write_record() called after close()");
    }

    if (policy_.needs_rotation(record)) {
        close_file();
        open_file();
    }

    stage(record);
    policy_.record_written(record);
    total_rows_++;
}

void SplitWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (stream_) {
        close_file();
    }
}

}  // namespace csvsplit
