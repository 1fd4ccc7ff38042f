#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "csvsplit/async_split_writer.hpp"
#include "csvsplit/background_writer.hpp"
#include "csvsplit/buffer_cache.hpp"
#include "csvsplit/csv_reader.hpp"
#include "csvsplit/file_naming.hpp"
#include "csvsplit/options.hpp"
#include "csvsplit/performance_counters.hpp"
#include "csvsplit/split_writer.hpp"
#include "csvsplit/writer_interface.hpp"

namespace {

namespace fs = std::filesystem;

std::unique_ptr<csvsplit::CsvReader> open_input(const csvsplit::Options& opts) {
    if (opts.use_stdin) {
        return csvsplit::CsvReader::open_stdin(opts.input_compression);
    }
    return csvsplit::CsvReader::open(opts.input_file, opts.input_compression);
}

csvsplit::SplitOptions make_split_options(const csvsplit::Options& opts) {
    csvsplit::SplitOptions split;
    if (opts.use_stdin) {
        split.naming.out_dir = opts.output_dir;
        split.naming.stem = "stdin";
        split.naming.extension = ".csv";
        split.naming.suffix_length = opts.suffix_length;
        split.naming.compression = opts.output_compression;
    } else {
        split.naming = csvsplit::SplitFileNaming::for_input(
            opts.input_file, opts.output_dir, opts.suffix_length, opts.output_compression);
    }
    split.max_rows = opts.max_rows;
    split.group_column = opts.group_column;
    split.trigger = opts.trigger;
    split.safety_margin = opts.safety_margin;
    split.verbose = opts.verbose;
    return split;
}

csvsplit::WriterPtr create_writer(const csvsplit::Options& opts,
                                  const csvsplit::SplitOptions& split) {
    csvsplit::WriterPtr writer;

    // The io_uring path writes raw bytes; compressed output goes through Arrow streams
    if (opts.sync || opts.output_compression != csvsplit::CompressionType::None) {
        writer = std::make_unique<csvsplit::SplitWriter>(split);
    } else {
        csvsplit::BufferCacheConfig cache_config;
        cache_config.buffer_size = opts.buffer_size;
        cache_config.queue_depth = opts.queue_depth;
        writer = std::make_unique<csvsplit::AsyncSplitWriter>(split, cache_config);
    }

    if (opts.background) {
        writer = std::make_unique<csvsplit::BackgroundWriter>(std::move(writer));
    }
    return writer;
}

const char* writer_name(const csvsplit::Options& opts) {
    if (opts.sync || opts.output_compression != csvsplit::CompressionType::None) {
        return "buffered (Arrow streams)";
    }
#ifdef CSVSPLIT_ENABLE_ASYNC_IO
    return "io_uring";
#else
    return "pwritev (io_uring disabled at build time)";
#endif
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        csvsplit::Options opts;
        try {
            opts = csvsplit::parse_args(argc, argv);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            csvsplit::print_usage(std::cerr, argv[0]);
            return 1;
        }

        if (opts.show_help) {
            csvsplit::print_usage(std::cout, argv[0]);
            return 0;
        }

        fs::create_directories(opts.output_dir);

        auto reader = open_input(opts);
        auto split = make_split_options(opts);

        if (opts.verbose) {
            std::cout << "csvsplit\n";
            std::cout << "Input: " << (opts.use_stdin ? std::string("<stdin>") : opts.input_file)
                      << " (" << csvsplit::compression_name(reader->compression()) << ")\n";
            std::cout << "Output: " << split.naming.path_for(1) << " ...\n";
            std::cout << "Rows per file: " << opts.max_rows << "\n";
            if (opts.group_column) {
                std::cout << "Group column: " << *opts.group_column << "\n";
            }
            std::cout << "Writer: " << writer_name(opts)
                      << (opts.background ? ", background thread" : "") << "\n";
        }

        csvsplit::Record record;
        if (opts.header) {
            if (!reader->next(record)) {
                throw std::runtime_error("Input is empty, no header row to read");
            }
            split.header = record;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        auto writer = create_writer(opts, split);
        while (reader->next(record)) {
            writer->write_record(record);
        }
        writer->close();

        auto end_time = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        std::cout << "\n=== Split Complete ===\n";
        std::cout << "Rows written: " << writer->rows_written() << "\n";
        std::cout << "Files written: " << writer->files_written() << "\n";
        std::cout << "Time elapsed: " << std::fixed << std::setprecision(3)
                  << (static_cast<double>(elapsed.count()) / 1000.0) << " seconds\n";

        if (writer->rows_written() > 0 && elapsed.count() > 0) {
            double throughput = (static_cast<double>(writer->rows_written()) * 1000.0) /
                                static_cast<double>(elapsed.count());
            std::cout << "Throughput: " << std::fixed << std::setprecision(0)
                      << throughput << " rows/sec\n";
        }

#ifdef CSVSPLIT_ENABLE_PERF_COUNTERS
        if (opts.verbose) {
            csvsplit::PerformanceCounters::instance().print_report(std::cout);
        }
#endif

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
