#ifndef CSVSPLIT_OPTIONS_HPP
#define CSVSPLIT_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "compression.hpp"

namespace csvsplit {

/**
 * Command line settings of the csvsplit tool.
 */
struct Options {
    std::optional<size_t> group_column;
    size_t max_rows = 0;
    bool use_stdin = false;
    CompressionType input_compression = CompressionType::None;
    CompressionType output_compression = CompressionType::None;
    std::string trigger;
    bool header = false;
    size_t suffix_length = 5;
    bool background = false;
    bool sync = false;
    size_t buffer_size = 1024 * 1024;
    uint32_t queue_depth = 8;
    size_t safety_margin = 0;
    bool verbose = false;
    bool show_help = false;

    std::string input_file;
    std::string output_dir = ".";
};

/**
 * Parse and validate the command line.
 *
 * Usage: csvsplit -n N [options] FILE [OUT_DIR]
 *        csvsplit -n N --stdin [options] [OUT_DIR]
 *
 * @throws std::invalid_argument on unknown options, malformed numbers,
 *         a missing -n, or a wrong number of positional arguments
 */
Options parse_args(int argc, char* argv[]);

void print_usage(std::ostream& out, const char* prog);

}  // namespace csvsplit

#endif  // CSVSPLIT_OPTIONS_HPP
