#include "csvsplit/csv_reader.hpp"

#include <utility>

#include <arrow/io/buffered.h>
#include <arrow/io/compressed.h>
#include <arrow/io/file.h>
#include <arrow/io/stdio.h>
#include <arrow/memory_pool.h>
#include <arrow/util/compression.h>

#include "csvsplit/errors.hpp"

namespace csvsplit {

namespace {

constexpr size_t kChunkSize = 64 * 1024;

std::unique_ptr<CsvReader> make_reader(std::shared_ptr<arrow::io::InputStream> raw,
                                       CompressionType compression,
                                       const CsvDialect& dialect,
                                       const std::string& source) {
    auto codec = make_codec(compression);

    std::shared_ptr<arrow::io::InputStream> stream = std::move(raw);
    if (codec) {
        auto compressed = arrow::io::CompressedInputStream::Make(codec.get(), stream);
        if (!compressed.ok()) {
            throw IoError("Failed to set up " + compression_name(compression) +
                          " decoding: " + compressed.status().ToString(), source);
        }
        stream = *compressed;
    }

    return std::make_unique<CsvReader>(std::move(stream), std::move(codec), dialect);
}

}  // namespace

std::unique_ptr<CsvReader> CsvReader::open(const std::string& path,
                                           CompressionType compression,
                                           const CsvDialect& dialect) {
    auto file_result = arrow::io::ReadableFile::Open(path);
    if (!file_result.ok()) {
        throw IoError("Can't open input file: " + file_result.status().ToString(), path);
    }
    std::shared_ptr<arrow::io::ReadableFile> file = *file_result;

    CompressionType resolved = compression;
    if (compression == CompressionType::Detect) {
        resolved = detect_compression(*file);
    }

    auto reader = make_reader(file, resolved, dialect, path);
    reader->compression_ = resolved;
    return reader;
}

std::unique_ptr<CsvReader> CsvReader::open_stdin(CompressionType compression,
                                                 const CsvDialect& dialect) {
    return open_stream(std::make_shared<arrow::io::StdinStream>(), compression, dialect,
                       "<stdin>");
}

std::unique_ptr<CsvReader> CsvReader::open_stream(std::shared_ptr<arrow::io::InputStream> raw,
                                                  CompressionType compression,
                                                  const CsvDialect& dialect,
                                                  const std::string& source) {
    CompressionType resolved = compression;
    if (compression == CompressionType::Detect) {
        // The stream cannot seek back, so probe through a buffer that can peek
        auto buffered = arrow::io::BufferedInputStream::Create(
            static_cast<int64_t>(kChunkSize), arrow::default_memory_pool(), raw);
        if (!buffered.ok()) {
            throw IoError("Can't buffer input: " + buffered.status().ToString(), source);
        }
        resolved = detect_compression(**buffered);
        raw = *buffered;
    }

    auto reader = make_reader(std::move(raw), resolved, dialect, source);
    reader->compression_ = resolved;
    return reader;
}

CsvReader::CsvReader(std::shared_ptr<arrow::io::InputStream> stream,
                     std::unique_ptr<arrow::util::Codec> codec,
                     const CsvDialect& dialect)
    : codec_(std::move(codec)),
      stream_(std::move(stream)),
      dialect_(dialect),
      chunk_(kChunkSize) {}

CsvReader::~CsvReader() = default;

bool CsvReader::fill() {
    if (eof_) {
        return false;
    }

    auto result = stream_->Read(static_cast<int64_t>(chunk_.size()), chunk_.data());
    if (!result.ok()) {
        throw IoError("Read failed at line " + std::to_string(line_) + ": " +
                      result.status().ToString(), "");
    }

    pos_ = 0;
    len_ = static_cast<size_t>(*result);
    if (len_ == 0) {
        eof_ = true;
        return false;
    }
    return true;
}

bool CsvReader::next(Record& record) {
    enum class State { FieldStart, Unquoted, Quoted, QuoteInQuoted };

    const char delimiter = dialect_.delimiter;
    const char quote = dialect_.quote;

    size_t nfields = 0;
    auto open_field = [&]() -> std::string& {
        if (nfields < record.size()) {
            record[nfields].clear();
        } else {
            record.emplace_back();
        }
        return record[nfields++];
    };

    State state = State::FieldStart;
    bool started = false;  // anything besides a line break seen for this record
    std::string* field = &open_field();

    for (;;) {
        if (pos_ == len_ && !fill()) {
            if (state == State::Quoted) {
                throw CsvParseError("unterminated quoted field", line_);
            }
            if (!started) {
                record.clear();
                return false;
            }
            record.resize(nfields);
            return true;
        }

        const char c = chunk_[pos_];
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') {
                pos_++;
                continue;
            }
        }

        switch (state) {
            case State::FieldStart:
                if (c == quote) {
                    started = true;
                    state = State::Quoted;
                    pos_++;
                    break;
                }
                state = State::Unquoted;
                [[fallthrough]];

            case State::Unquoted: {
                const size_t start = pos_;
                while (pos_ < len_) {
                    const char d = chunk_[pos_];
                    if (d == delimiter || d == '\n' || d == '\r') {
                        break;
                    }
                    pos_++;
                }
                if (pos_ > start) {
                    field->append(&chunk_[start], pos_ - start);
                    started = true;
                }
                if (pos_ == len_) {
                    break;  // field continues in the next chunk
                }

                const char d = chunk_[pos_++];
                if (d == delimiter) {
                    started = true;
                    field = &open_field();
                    state = State::FieldStart;
                    break;
                }

                // Record terminator
                line_++;
                if (d == '\r') {
                    skip_lf_ = true;
                }
                if (!started) {
                    // Blank line
                    nfields = 0;
                    field = &open_field();
                    state = State::FieldStart;
                    break;
                }
                record.resize(nfields);
                return true;
            }

            case State::Quoted: {
                const size_t start = pos_;
                while (pos_ < len_ && chunk_[pos_] != quote) {
                    if (chunk_[pos_] == '\n') {
                        line_++;
                    }
                    pos_++;
                }
                field->append(&chunk_[start], pos_ - start);
                if (pos_ < len_) {
                    pos_++;
                    state = State::QuoteInQuoted;
                }
                break;
            }

            case State::QuoteInQuoted:
                if (c == quote) {
                    field->push_back(quote);
                    pos_++;
                    state = State::Quoted;
                } else {
                    // Closing quote; anything up to the next delimiter is kept verbatim
                    state = State::Unquoted;
                }
                break;
        }
    }
}

}  // namespace csvsplit
