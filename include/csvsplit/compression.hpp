#ifndef CSVSPLIT_COMPRESSION_HPP
#define CSVSPLIT_COMPRESSION_HPP

#include <memory>
#include <string>

namespace arrow {
namespace util {
class Codec;
}  // namespace util
namespace io {
class BufferedInputStream;
class RandomAccessFile;
}  // namespace io
}  // namespace arrow

namespace csvsplit {

enum class CompressionType {
    None,
    Gzip,
    Bzip,
    Detect,  ///< Input only: resolved from the stream's magic bytes
};

/**
 * Parse a compression name: "" / "none", "g" / "gzip", "b" / "bzip" / "bz2",
 * "d" / "detect" (case-insensitive).
 *
 * @throws std::invalid_argument for anything else
 */
CompressionType parse_compression(const std::string& name);

std::string compression_name(CompressionType type);

/**
 * File name suffix for compressed output: "", ".gz" or ".bz2".
 *
 * @throws std::invalid_argument for CompressionType::Detect
 */
const char* compression_extension(CompressionType type);

/**
 * Arrow codec for the given type, or nullptr for CompressionType::None.
 *
 * @throws std::invalid_argument for CompressionType::Detect
 * @throws IoError if Arrow was built without the codec
 */
std::unique_ptr<arrow::util::Codec> make_codec(CompressionType type);

/**
 * Resolve the compression of a file from its first two bytes:
 * 1F 8B is gzip, "BZ" is bzip2, anything else (or fewer than two bytes)
 * is uncompressed. The file is rewound to offset 0 afterwards.
 */
CompressionType detect_compression(arrow::io::RandomAccessFile& file);

/**
 * Same probe for a non-seekable stream, using Peek() so no byte is consumed.
 */
CompressionType detect_compression(arrow::io::BufferedInputStream& stream);

}  // namespace csvsplit

#endif  // CSVSPLIT_COMPRESSION_HPP
