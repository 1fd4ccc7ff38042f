#include "csvsplit/async_split_writer.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "csvsplit/errors.hpp"

namespace csvsplit {

namespace {

BufferCacheConfig with_dialect(BufferCacheConfig config, const CsvDialect& dialect) {
    config.dialect = dialect;
    return config;
}

std::optional<Trigger> make_trigger(const std::string& command_template) {
    if (command_template.empty()) {
        return std::nullopt;
    }
    return Trigger(command_template);
}

}  // namespace

AsyncSplitWriter::AsyncSplitWriter(const SplitOptions& options,
                                   const BufferCacheConfig& cache_config)
    : options_(options),
      policy_(options.max_rows, options.group_column),
      trigger_(make_trigger(options.trigger)),
      cache_(with_dialect(cache_config, options.dialect), options.naming.path_for(1)),
      active_(cache_.pop()) {
    if (options_.safety_margin >= cache_.buffer_size()) {
        throw std::invalid_argument("Safety margin must be smaller than the buffer size");
    }

    if (options_.header) {
        encode(*options_.header);
    }
}

AsyncSplitWriter::~AsyncSplitWriter() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "Error: finishing " << cache_.active_path() << " failed: " << e.what() << "\n";
    }
}

void AsyncSplitWriter::write_record(const Record& record) {
    if (closed_) {
        throw std::logic_error("write_record() called after close()");
    }

    if (policy_.needs_rotation(record)) {
        rotate();
    } else if (active_.remaining() <= options_.safety_margin) {
        flush_buffer();
    }

    encode(record);
    policy_.record_written(record);
    total_rows_++;
}

void AsyncSplitWriter::encode(const Record& record) {
    const size_t needed = active_.encoded_size(record);
    if (needed > active_.remaining()) {
        if (needed > active_.capacity()) {
            throw RecordTooLargeError(needed, active_.capacity());
        }
        flush_buffer();
    }

    // Fits: checked above, and a fresh buffer holds any record up to its capacity
    active_.write_row(record);
}

void AsyncSplitWriter::flush_buffer() {
    if (active_.empty()) {
        return;
    }
    active_ = cache_.submit_and_pop(std::move(active_));
}

void AsyncSplitWriter::rotate() {
    const std::string finished = cache_.active_path();
    const size_t rows = policy_.rows_in_file();

    // Remaining bytes belong to the file being finished
    flush_buffer();

    cache_.rotate(options_.naming.path_for(++on_file_));
    policy_.start_file();

    file_finished(finished, rows);

    if (options_.header) {
        encode(*options_.header);
    }
}

void AsyncSplitWriter::file_finished(const std::string& path, size_t rows) {
    if (options_.verbose) {
        std::cout << "  Wrote " << path << " (" << rows << " rows)\n";
    }

    if (!trigger_) {
        return;
    }

    // The trigger gets to see the complete file
    cache_.sync();
    trigger_->run(path, rows);
}

void AsyncSplitWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (active_.empty()) {
        cache_.recycle(std::move(active_));
    } else {
        cache_.submit(std::move(active_));
    }
    cache_.sync();

    if (policy_.rows_in_file() > 0) {
        file_finished(cache_.active_path(), policy_.rows_in_file());
    }
}

}  // namespace csvsplit
