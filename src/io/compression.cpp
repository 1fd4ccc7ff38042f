#include "csvsplit/compression.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <arrow/io/buffered.h>
#include <arrow/io/interfaces.h>
#include <arrow/util/compression.h>

#include "csvsplit/errors.hpp"

namespace csvsplit {

namespace {

constexpr uint8_t kGzipMagic[2] = {0x1F, 0x8B};
constexpr uint8_t kBzipMagic[2] = {'B', 'Z'};

CompressionType classify(const uint8_t* bytes, int64_t len) {
    if (len < 2) {
        return CompressionType::None;
    }
    if (bytes[0] == kGzipMagic[0] && bytes[1] == kGzipMagic[1]) {
        return CompressionType::Gzip;
    }
    if (bytes[0] == kBzipMagic[0] && bytes[1] == kBzipMagic[1]) {
        return CompressionType::Bzip;
    }
    return CompressionType::None;
}

}  // namespace

CompressionType parse_compression(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "none") return CompressionType::None;
    if (lower == "g" || lower == "gzip") return CompressionType::Gzip;
    if (lower == "b" || lower == "bzip" || lower == "bz2") return CompressionType::Bzip;
    if (lower == "d" || lower == "detect") return CompressionType::Detect;

    throw std::invalid_argument("Unknown compression format '" + name +
                                "': 'gzip', 'bzip', 'detect' are supported");
}

std::string compression_name(CompressionType type) {
    switch (type) {
        case CompressionType::None: return "none";
        case CompressionType::Gzip: return "gzip";
        case CompressionType::Bzip: return "bzip";
        case CompressionType::Detect: return "detect";
    }
    return "unknown";
}

const char* compression_extension(CompressionType type) {
    switch (type) {
        case CompressionType::None: return "";
        case CompressionType::Gzip: return ".gz";
        case CompressionType::Bzip: return ".bz2";
        case CompressionType::Detect: break;
    }
    throw std::invalid_argument("No file extension for compression type 'detect'");
}

std::unique_ptr<arrow::util::Codec> make_codec(CompressionType type) {
    arrow::Compression::type arrow_type;
    switch (type) {
        case CompressionType::None:
            return nullptr;
        case CompressionType::Gzip:
            arrow_type = arrow::Compression::GZIP;
            break;
        case CompressionType::Bzip:
            arrow_type = arrow::Compression::BZ2;
            break;
        default:
            throw std::invalid_argument("Compression must be resolved before creating a codec");
    }

    auto result = arrow::util::Codec::Create(arrow_type);
    if (!result.ok()) {
        throw IoError("Failed to create " + compression_name(type) + " codec: " +
                      result.status().ToString(), "");
    }
    return std::move(result).ValueOrDie();
}

CompressionType detect_compression(arrow::io::RandomAccessFile& file) {
    uint8_t bytes[2] = {0, 0};

    auto read = file.Read(2, bytes);
    if (!read.ok()) {
        throw IoError("Failed to probe input compression: " + read.status().ToString(), "");
    }

    auto status = file.Seek(0);
    if (!status.ok()) {
        throw IoError("Failed to rewind input after probe: " + status.ToString(), "");
    }

    return classify(bytes, *read);
}

CompressionType detect_compression(arrow::io::BufferedInputStream& stream) {
    auto peeked = stream.Peek(2);
    if (!peeked.ok()) {
        throw IoError("Failed to probe input compression: " + peeked.status().ToString(), "");
    }

    auto view = *peeked;
    return classify(reinterpret_cast<const uint8_t*>(view.data()),
                    static_cast<int64_t>(view.size()));
}

}  // namespace csvsplit
