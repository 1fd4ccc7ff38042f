#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/io/buffered.h>
#include <arrow/io/compressed.h>
#include <arrow/io/file.h>
#include <arrow/io/memory.h>
#include <arrow/memory_pool.h>
#include <arrow/util/compression.h>

#include "csvsplit/compression.hpp"
#include "csvsplit/csv_reader.hpp"
#include "csvsplit/errors.hpp"

namespace csvsplit {
namespace test {

namespace fs = std::filesystem;

class CsvReaderTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("csvsplit_reader_" + std::string(
                        ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& data) {
        fs::path path = test_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << data;
        return path.string();
    }

    std::string write_gzip(const std::string& name, const std::string& data) {
        fs::path path = test_dir / name;
        auto codec = make_codec(CompressionType::Gzip);
        auto file = arrow::io::FileOutputStream::Open(path.string()).ValueOrDie();
        auto stream = arrow::io::CompressedOutputStream::Make(codec.get(), file).ValueOrDie();
        EXPECT_TRUE(stream->Write(data.data(), static_cast<int64_t>(data.size())).ok());
        EXPECT_TRUE(stream->Close().ok());
        return path.string();
    }

    /// Compress data in memory with the given codec
    static std::string compress(const std::string& data, CompressionType type) {
        auto codec = make_codec(type);
        auto sink = arrow::io::BufferOutputStream::Create().ValueOrDie();
        auto stream = arrow::io::CompressedOutputStream::Make(codec.get(), sink).ValueOrDie();
        EXPECT_TRUE(stream->Write(data.data(), static_cast<int64_t>(data.size())).ok());
        EXPECT_TRUE(stream->Close().ok());
        return sink->Finish().ValueOrDie()->ToString();
    }

    static std::shared_ptr<arrow::io::InputStream> memory_stream(const std::string& data) {
        return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(data));
    }

    static std::vector<Record> read_all(CsvReader& reader) {
        std::vector<Record> records;
        Record record;
        while (reader.next(record)) {
            records.push_back(record);
        }
        return records;
    }

    /// Parse an in-memory document
    static std::vector<Record> parse(const std::string& data) {
        auto stream = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(data));
        CsvReader reader(stream, nullptr);

        std::vector<Record> records;
        Record record;
        while (reader.next(record)) {
            records.push_back(record);
        }
        return records;
    }
};

// =====================================================================
// Parsing
// =====================================================================

TEST_F(CsvReaderTest, SimpleRecords) {
    auto records = parse("a,b,c\n1,2,3\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (Record{"a", "b", "c"}));
    EXPECT_EQ(records[1], (Record{"1", "2", "3"}));
}

TEST_F(CsvReaderTest, QuotedFields) {
    auto records = parse("\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\"\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"a,b", "say \"hi\"", "two\nlines"}));
}

TEST_F(CsvReaderTest, EmptyFields) {
    auto records = parse(",,\n\"\"\nx,\n");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0], (Record{"", "", ""}));
    EXPECT_EQ(records[1], (Record{""}));
    EXPECT_EQ(records[2], (Record{"x", ""}));
}

TEST_F(CsvReaderTest, CrLfAndMissingFinalTerminator) {
    auto records = parse("a,b\r\nc,d\r\ne,f");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1], (Record{"c", "d"}));
    EXPECT_EQ(records[2], (Record{"e", "f"}));
}

TEST_F(CsvReaderTest, BlankLinesSkipped) {
    auto records = parse("\n\na\n\r\n\nb\n\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (Record{"a"}));
    EXPECT_EQ(records[1], (Record{"b"}));
}

TEST_F(CsvReaderTest, RecordStorageIsReused) {
    auto stream = std::make_shared<arrow::io::BufferReader>(
        arrow::Buffer::FromString("1,2,3,4\n5,6\n"));
    CsvReader reader(stream, nullptr);

    Record record;
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record.size(), 4u);
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record, (Record{"5", "6"}));
    EXPECT_FALSE(reader.next(record));
    EXPECT_TRUE(record.empty());
}

TEST_F(CsvReaderTest, RecordsSpanningChunks) {
    std::string data;
    std::vector<Record> expected;
    for (int i = 0; i < 20000; ++i) {
        std::string text = "line " + std::to_string(i) + ", with \"quotes\"";
        data += std::to_string(i) + ",\"" + "line " + std::to_string(i) + ", with \"\"quotes\"\"\"\n";
        expected.push_back({std::to_string(i), text});
    }
    EXPECT_EQ(parse(data), expected);
}

TEST_F(CsvReaderTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(parse("a,\"never closed\n"), CsvParseError);
}

// =====================================================================
// Files and compression
// =====================================================================

TEST_F(CsvReaderTest, MissingFileThrows) {
    EXPECT_THROW(CsvReader::open((test_dir / "nope.csv").string(), CompressionType::None),
                 IoError);
}

TEST_F(CsvReaderTest, DetectLeavesFileAtStart) {
    struct Case {
        std::string data;
        CompressionType expected;
    };
    const std::vector<Case> cases = {
        {std::string("\x1f\x8b\x08\x00", 4), CompressionType::Gzip},
        {"BZh91AY", CompressionType::Bzip},
        {"a,b\n", CompressionType::None},
        {"x", CompressionType::None},
        {"", CompressionType::None},
    };

    int n = 0;
    for (const auto& c : cases) {
        auto path = write_file("probe" + std::to_string(n++), c.data);
        auto file = arrow::io::ReadableFile::Open(path).ValueOrDie();
        EXPECT_EQ(detect_compression(*file), c.expected) << path;
        EXPECT_EQ(file->Tell().ValueOrDie(), 0);
    }
}

TEST_F(CsvReaderTest, PeekDetectConsumesNothing) {
    struct Case {
        std::string data;
        CompressionType expected;
    };
    const std::vector<Case> cases = {
        {std::string("\x1f\x8b\x08\x00\x00", 5), CompressionType::Gzip},
        {"BZh91AY&SY", CompressionType::Bzip},
        {"id,name\n1,a\n", CompressionType::None},
        {"B", CompressionType::None},
        {"", CompressionType::None},
    };

    for (const auto& c : cases) {
        auto buffered = arrow::io::BufferedInputStream::Create(
            64, arrow::default_memory_pool(), memory_stream(c.data)).ValueOrDie();

        EXPECT_EQ(detect_compression(*buffered), c.expected) << c.data;
        EXPECT_EQ(buffered->Tell().ValueOrDie(), 0);

        auto contents = buffered->Read(1024).ValueOrDie();
        EXPECT_EQ(contents->ToString(), c.data);
    }
}

TEST_F(CsvReaderTest, StreamDetectsGzip) {
    const std::string csv = "k,v\n1,\"a,b\"\n2,c\n";
    auto reader = CsvReader::open_stream(memory_stream(compress(csv, CompressionType::Gzip)),
                                         CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::Gzip);

    auto records = read_all(*reader);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0], (Record{"k", "v"}));
    EXPECT_EQ(records[1], (Record{"1", "a,b"}));
}

TEST_F(CsvReaderTest, StreamDetectsBzip2) {
    auto reader = CsvReader::open_stream(
        memory_stream(compress("x,y\n3,4\n", CompressionType::Bzip)), CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::Bzip);
    EXPECT_EQ(read_all(*reader), (std::vector<Record>{{"x", "y"}, {"3", "4"}}));
}

TEST_F(CsvReaderTest, StreamDetectKeepsPlainBytes) {
    // Without seeking back, the probed bytes must still reach the parser
    auto reader = CsvReader::open_stream(memory_stream("ab,c\n"), CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::None);
    EXPECT_EQ(read_all(*reader), (std::vector<Record>{{"ab", "c"}}));

    auto single = CsvReader::open_stream(memory_stream("z"), CompressionType::Detect);
    EXPECT_EQ(read_all(*single), (std::vector<Record>{{"z"}}));
}

TEST_F(CsvReaderTest, ReadsGzipInDetectMode) {
    auto path = write_gzip("data.csv.gz", "k,v\n1,\"a,b\"\n2,c\n");
    auto reader = CsvReader::open(path, CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::Gzip);

    Record record;
    std::vector<Record> records;
    while (reader->next(record)) {
        records.push_back(record);
    }
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1], (Record{"1", "a,b"}));
}

TEST_F(CsvReaderTest, PlainFileInDetectMode) {
    auto path = write_file("data.csv", "x,y\n");
    auto reader = CsvReader::open(path, CompressionType::Detect);
    EXPECT_EQ(reader->compression(), CompressionType::None);

    Record record;
    ASSERT_TRUE(reader->next(record));
    EXPECT_EQ(record, (Record{"x", "y"}));
}

// =====================================================================
// Compression names
// =====================================================================

TEST(CompressionTest, ParseNames) {
    EXPECT_EQ(parse_compression(""), CompressionType::None);
    EXPECT_EQ(parse_compression("none"), CompressionType::None);
    EXPECT_EQ(parse_compression("g"), CompressionType::Gzip);
    EXPECT_EQ(parse_compression("GZIP"), CompressionType::Gzip);
    EXPECT_EQ(parse_compression("b"), CompressionType::Bzip);
    EXPECT_EQ(parse_compression("bzip"), CompressionType::Bzip);
    EXPECT_EQ(parse_compression("d"), CompressionType::Detect);
    EXPECT_THROW(parse_compression("zstd"), std::invalid_argument);
}

TEST(CompressionTest, Extensions) {
    EXPECT_STREQ(compression_extension(CompressionType::None), "");
    EXPECT_STREQ(compression_extension(CompressionType::Gzip), ".gz");
    EXPECT_STREQ(compression_extension(CompressionType::Bzip), ".bz2");
    EXPECT_THROW(compression_extension(CompressionType::Detect), std::invalid_argument);
}

}  // namespace test
}  // namespace csvsplit
