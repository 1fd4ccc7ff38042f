#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "csvsplit/async_split_writer.hpp"
#include "csvsplit/background_writer.hpp"
#include "csvsplit/buffer_cache.hpp"
#include "csvsplit/csv_reader.hpp"
#include "csvsplit/errors.hpp"
#include "csvsplit/rotation_policy.hpp"
#include "csvsplit/split_writer.hpp"

namespace csvsplit {
namespace test {

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

/// Rows "<key>,<n>,payload" for groups of the given sizes, keys g0, g1, ...
std::vector<Record> grouped_rows(const std::vector<size_t>& group_sizes) {
    std::vector<Record> rows;
    size_t n = 0;
    for (size_t g = 0; g < group_sizes.size(); ++g) {
        for (size_t i = 0; i < group_sizes[g]; ++i) {
            rows.push_back({"g" + std::to_string(g), std::to_string(n++), "payload"});
        }
    }
    return rows;
}

std::string encoded(const std::vector<Record>& rows) {
    CsvEncoder encoder;
    std::string out;
    for (const auto& row : rows) {
        encoder.append(row, out);
    }
    return out;
}

}  // namespace

// =====================================================================
// RotationPolicyTest
// =====================================================================

TEST(RotationPolicyTest, RotatesAtRowLimit) {
    RotationPolicy policy(2, std::nullopt);
    Record row = {"a"};
    EXPECT_FALSE(policy.needs_rotation(row));
    policy.record_written(row);
    policy.record_written(row);
    EXPECT_TRUE(policy.needs_rotation(row));

    policy.start_file();
    EXPECT_EQ(policy.rows_in_file(), 0u);
    EXPECT_FALSE(policy.needs_rotation(row));
}

TEST(RotationPolicyTest, RunOfEqualKeysContinues) {
    RotationPolicy policy(1, 1);
    policy.record_written({"x", "k1"});
    EXPECT_FALSE(policy.needs_rotation({"y", "k1"}));
    EXPECT_TRUE(policy.needs_rotation({"y", "k2"}));
}

TEST(RotationPolicyTest, ShortRecordsHaveNoKey) {
    RotationPolicy policy(1, 2);
    policy.record_written({"a"});
    EXPECT_TRUE(policy.needs_rotation({"a"}));
    EXPECT_TRUE(policy.needs_rotation({"a", "b", ""}));
}

TEST(RotationPolicyTest, ZeroRowsRejected) {
    EXPECT_THROW(RotationPolicy(0, std::nullopt), std::invalid_argument);
}

// =====================================================================
// SplitWriterTest: the same scenarios for every writer flavour
// =====================================================================

enum class WriterKind { Async, Sync, Background };

std::string kind_name(const ::testing::TestParamInfo<WriterKind>& info) {
    switch (info.param) {
        case WriterKind::Async: return "Async";
        case WriterKind::Sync: return "Sync";
        case WriterKind::Background: return "Background";
    }
    return "Unknown";
}

class SplitWriterTest : public ::testing::TestWithParam<WriterKind> {
protected:
    fs::path test_dir;
    SplitOptions options;
    BufferCacheConfig cache_config;

    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::replace(name.begin(), name.end(), '/', '_');
        test_dir = fs::temp_directory_path() / ("csvsplit_split_" + name);
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        options.naming.out_dir = test_dir.string();
        options.naming.stem = "data";
        options.naming.extension = ".csv";
        options.max_rows = 1000;

        // Small buffers so every scenario crosses many buffer boundaries
        cache_config.buffer_size = 256;
        cache_config.queue_depth = 4;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    WriterPtr make_writer() const {
        switch (GetParam()) {
            case WriterKind::Async:
                return std::make_unique<AsyncSplitWriter>(options, cache_config);
            case WriterKind::Sync:
                return std::make_unique<SplitWriter>(options);
            case WriterKind::Background:
                return std::make_unique<BackgroundWriter>(
                    std::make_unique<AsyncSplitWriter>(options, cache_config), 16);
        }
        return nullptr;
    }

    void write_all(const std::vector<Record>& rows, size_t expected_files) {
        auto writer = make_writer();
        for (const auto& row : rows) {
            writer->write_record(row);
        }
        writer->close();
        EXPECT_EQ(writer->rows_written(), rows.size());
        EXPECT_EQ(writer->files_written(), expected_files);
    }

    std::vector<fs::path> outputs() const {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            if (entry.path().filename().string().rfind("data.", 0) == 0) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }
};

TEST_P(SplitWriterTest, RowCountRotation) {
    write_all(grouped_rows({2500}), 3);

    auto files = outputs();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename(), "data.00001.csv");
    EXPECT_EQ(files[1].filename(), "data.00002.csv");
    EXPECT_EQ(files[2].filename(), "data.00003.csv");
    EXPECT_EQ(read_lines(files[0]).size(), 1000u);
    EXPECT_EQ(read_lines(files[1]).size(), 1000u);
    EXPECT_EQ(read_lines(files[2]).size(), 500u);
}

TEST_P(SplitWriterTest, ExactMultipleLeavesNoEmptyFile) {
    write_all(grouped_rows({2000}), 2);
    EXPECT_EQ(outputs().size(), 2u);
}

TEST_P(SplitWriterTest, GroupExtendsFilePastLimit) {
    options.group_column = 0;
    write_all(grouped_rows({4, 997, 3}), 2);

    auto files = outputs();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(read_lines(files[0]).size(), 1001u);

    auto last = read_lines(files[1]);
    ASSERT_EQ(last.size(), 3u);
    EXPECT_EQ(last[0].substr(0, 3), "g2,");
}

TEST_P(SplitWriterTest, ConservationAcrossFiles) {
    options.max_rows = 7;
    std::vector<Record> rows;
    for (int i = 0; i < 500; ++i) {
        rows.push_back({std::to_string(i), "quoted, field", "say \"hi\"", std::string(i % 40, 'x')});
    }
    write_all(rows, (500 + 6) / 7);

    std::string concatenated;
    for (const auto& file : outputs()) {
        concatenated += read_file(file);
    }
    EXPECT_EQ(concatenated, encoded(rows));
}

TEST_P(SplitWriterTest, GroupsNeverSplitAcrossFiles) {
    options.max_rows = 10;
    options.group_column = 0;
    write_all(grouped_rows({3, 12, 1, 1, 25, 9, 9, 2, 40, 5}), 5);

    std::map<std::string, std::set<std::string>> files_per_key;
    for (const auto& file : outputs()) {
        for (const auto& line : read_lines(file)) {
            files_per_key[line.substr(0, line.find(','))].insert(file.string());
        }
    }
    ASSERT_EQ(files_per_key.size(), 10u);
    for (const auto& [key, files] : files_per_key) {
        EXPECT_EQ(files.size(), 1u) << "group " << key << " was split";
    }
}

TEST_P(SplitWriterTest, HeaderInEveryFile) {
    options.max_rows = 100;
    options.header = Record{"key", "n", "text"};
    write_all(grouped_rows({250}), 3);

    auto files = outputs();
    ASSERT_EQ(files.size(), 3u);
    const size_t expected[] = {101, 101, 51};
    for (size_t i = 0; i < files.size(); ++i) {
        auto lines = read_lines(files[i]);
        ASSERT_EQ(lines.size(), expected[i]);
        EXPECT_EQ(lines[0], "key,n,text");
        EXPECT_NE(lines[1], "key,n,text");
    }
}

TEST_P(SplitWriterTest, TriggerRunsForEveryFinishedFile) {
    const fs::path log = test_dir / "trigger.log";
    options.trigger = "echo {/} {rows} $(wc -l < {}) >> '" + log.string() + "'";
    write_all(grouped_rows({2500}), 3);

    // Each file is complete when its trigger runs
    auto lines = read_lines(log);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "data.00001.csv 1000 1000");
    EXPECT_EQ(lines[1], "data.00002.csv 1000 1000");
    EXPECT_EQ(lines[2], "data.00003.csv 500 500");
}

TEST_P(SplitWriterTest, EmptyInputLeavesOneEmptyFile) {
    write_all({}, 1);
    auto files = outputs();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(read_file(files[0]).empty());
}

TEST_P(SplitWriterTest, WriteAfterCloseIsAnError) {
    auto writer = make_writer();
    writer->close();
    EXPECT_THROW(writer->write_record({"late"}), std::logic_error);
}

INSTANTIATE_TEST_SUITE_P(AllWriters, SplitWriterTest,
                         ::testing::Values(WriterKind::Async, WriterKind::Sync,
                                           WriterKind::Background),
                         kind_name);

// =====================================================================
// Writer-specific behaviour
// =====================================================================

class SplitWriterFixture : public ::testing::Test {
protected:
    fs::path test_dir;
    SplitOptions options;
    BufferCacheConfig cache_config;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("csvsplit_writer_" + std::string(
                        ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        options.naming.out_dir = test_dir.string();
        options.naming.stem = "data";
        options.max_rows = 100;
        cache_config.buffer_size = 64;
        cache_config.queue_depth = 2;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(SplitWriterFixture, RecordLargerThanBufferIsFatal) {
    AsyncSplitWriter writer(options, cache_config);
    writer.write_record({"small"});
    EXPECT_THROW(writer.write_record({std::string(100, 'x')}), RecordTooLargeError);
}

TEST_F(SplitWriterFixture, BackgroundWorkerErrorReachesProducer) {
    BackgroundWriter writer(std::make_unique<AsyncSplitWriter>(options, cache_config));
    writer.write_record({std::string(100, 'x')});
    EXPECT_THROW(writer.close(), RecordTooLargeError);
}

TEST_F(SplitWriterFixture, BackgroundErrorStillReportedByClose) {
    BackgroundWriter writer(std::make_unique<AsyncSplitWriter>(options, cache_config), 4);
    writer.write_record({std::string(100, 'x')});

    // The worker stops and closes the channel, so a later write must fail
    bool caught = false;
    for (int i = 0; i < 100000 && !caught; ++i) {
        try {
            writer.write_record({"ok"});
        } catch (const RecordTooLargeError&) {
            caught = true;
        }
    }
    ASSERT_TRUE(caught);

    EXPECT_THROW(writer.close(), RecordTooLargeError);
}

TEST_F(SplitWriterFixture, SafetyMarginMustLeaveRoom) {
    options.safety_margin = 64;
    EXPECT_THROW({ AsyncSplitWriter writer(options, cache_config); }, std::invalid_argument);
}

TEST_F(SplitWriterFixture, SafetyMarginFlushesEarly) {
    options.safety_margin = 40;
    AsyncSplitWriter writer(options, cache_config);
    for (int i = 0; i < 20; ++i) {
        writer.write_record({"0123456789"});
    }
    writer.close();

    std::string expected;
    for (int i = 0; i < 20; ++i) {
        expected += "0123456789\n";
    }
    EXPECT_EQ(read_file(test_dir / "data.00001.csv"), expected);
    EXPECT_EQ(writer.cache().free_count(), 2u);
}

TEST_F(SplitWriterFixture, CompressedOutputThroughArrowStreams) {
    options.max_rows = 50;
    options.naming.compression = CompressionType::Gzip;
    auto rows = grouped_rows({120});
    {
        SplitWriter writer(options);
        for (const auto& row : rows) {
            writer.write_record(row);
        }
        writer.close();
        EXPECT_EQ(writer.files_written(), 3u);
    }

    const fs::path first = test_dir / "data.00001.csv.gz";
    ASSERT_TRUE(fs::exists(first));
    ASSERT_TRUE(fs::exists(test_dir / "data.00003.csv.gz"));

    auto reader = CsvReader::open(first.string(), CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::Gzip);

    Record record;
    size_t count = 0;
    while (reader->next(record)) {
        EXPECT_EQ(record, rows[count]);
        count++;
    }
    EXPECT_EQ(count, 50u);
}

TEST_F(SplitWriterFixture, Bzip2OutputRoundTrip) {
    options.max_rows = 40;
    options.naming.compression = CompressionType::Bzip;
    auto rows = grouped_rows({100});
    {
        SplitWriter writer(options);
        for (const auto& row : rows) {
            writer.write_record(row);
        }
        writer.close();
        EXPECT_EQ(writer.files_written(), 3u);
    }

    size_t offset = 0;
    for (const char* name : {"data.00001.csv.bz2", "data.00002.csv.bz2", "data.00003.csv.bz2"}) {
        auto reader = CsvReader::open((test_dir / name).string(), CompressionType::Detect);
        EXPECT_EQ(reader->compression(), CompressionType::Bzip) << name;

        Record record;
        while (reader->next(record)) {
            ASSERT_LT(offset, rows.size());
            EXPECT_EQ(record, rows[offset]);
            offset++;
        }
    }
    EXPECT_EQ(offset, rows.size());
}

}  // namespace test
}  // namespace csvsplit
