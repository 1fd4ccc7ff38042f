#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "csvsplit/async_split_writer.hpp"
#include "csvsplit/background_writer.hpp"
#include "csvsplit/buffer_cache.hpp"
#include "csvsplit/performance_counters.hpp"
#include "csvsplit/split_writer.hpp"

namespace fs = std::filesystem;

using Clock = std::chrono::high_resolution_clock;

/**
 * Synthetic order-line rows; column 0 is an order key shared by 1-7 consecutive rows.
 */
class RowGenerator {
public:
    void fill(size_t row_idx, csvsplit::Record& record) {
        if (row_idx >= next_key_at_) {
            ++order_key_;
            next_key_at_ = row_idx + 1 + (order_key_ % 7);
        }
        record.resize(6);
        record[0] = std::to_string(order_key_);
        record[1] = std::to_string((row_idx % 200000) + 1);
        record[2] = std::to_string(10 + (row_idx % 50));
        record[3] = std::to_string((row_idx % 100) * 100) + ".00";
        record[4] = row_idx % 3 == 0 ? "R" : (row_idx % 2 == 0 ? "A" : "N");
        record[5] = row_idx % 5 == 0 ? "deliver in person, \"fragile\"" : "none";
    }

private:
    size_t order_key_ = 0;
    size_t next_key_at_ = 0;
};

void run_benchmark(const std::string& name, csvsplit::WriterInterface& writer, size_t num_rows) {
    RowGenerator generator;
    csvsplit::Record record;

    auto start = Clock::now();
    for (size_t i = 0; i < num_rows; ++i) {
        generator.fill(i, record);
        writer.write_record(record);
    }
    writer.close();
    auto end = Clock::now();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    double throughput = (duration > 0)
        ? static_cast<double>(num_rows) * 1000.0 / static_cast<double>(duration) : 0.0;

    std::cout << "\n=== " << name << " ===" << std::endl;
    std::cout << "Rows: " << writer.rows_written() << std::endl;
    std::cout << "Files: " << writer.files_written() << std::endl;
    std::cout << "Time: " << duration << " ms" << std::endl;
    std::cout << "Throughput: " << static_cast<long>(throughput) << " rows/s" << std::endl;
}

csvsplit::SplitOptions make_options(const fs::path& dir) {
    fs::remove_all(dir);
    fs::create_directories(dir);

    csvsplit::SplitOptions options;
    options.naming.out_dir = dir.string();
    options.naming.stem = "orders";
    options.max_rows = 100000;
    options.group_column = 0;
    return options;
}

int main(int argc, char* argv[]) {
    const size_t num_rows = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 2000000;
    const fs::path base = fs::temp_directory_path() / "csvsplit_benchmark";

#ifdef CSVSPLIT_ENABLE_ASYNC_IO
    std::cout << "=== Split writer benchmark (io_uring enabled) ===" << std::endl;
#else
    std::cout << "=== Split writer benchmark (io_uring disabled, pwritev fallback) ===" << std::endl;
#endif

    try {
        {
            csvsplit::SplitWriter writer(make_options(base / "sync"));
            run_benchmark("Synchronous (Arrow FileOutputStream)", writer, num_rows);
        }
        {
            csvsplit::BufferCacheConfig config;
            csvsplit::AsyncSplitWriter writer(make_options(base / "async"), config);
            run_benchmark("Buffer cache (queue depth 8, 1 MB buffers)", writer, num_rows);
        }
        {
            csvsplit::BufferCacheConfig config;
            csvsplit::BackgroundWriter writer(
                std::make_unique<csvsplit::AsyncSplitWriter>(make_options(base / "background"), config));
            run_benchmark("Buffer cache on a background thread", writer, num_rows);
        }
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

#ifdef CSVSPLIT_ENABLE_PERF_COUNTERS
    csvsplit::PerformanceCounters::instance().print_report(std::cout);
#endif

    fs::remove_all(base);
    return 0;
}
