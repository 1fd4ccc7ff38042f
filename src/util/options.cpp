#include "csvsplit/options.hpp"

#include <getopt.h>

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace csvsplit {

namespace {

enum LongOnly {
    kStdin = 256,
    kBackground,
    kSync,
    kBufferSize,
    kQueueDepth,
    kSafetyMargin,
};

size_t parse_size(const char* value, const char* option) {
    const std::string text(value);
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (text.empty() || text[0] == '-') {
            throw std::invalid_argument(text);
        }
        parsed = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid number for ") + option + ": '" + text + "'");
    }
    if (consumed != text.size() || parsed > std::numeric_limits<size_t>::max()) {
        throw std::invalid_argument(std::string("Invalid number for ") + option + ": '" + text + "'");
    }
    return static_cast<size_t>(parsed);
}

}  // namespace

void print_usage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog << " -n N [options] FILE [OUT_DIR]\n"
        << "       " << prog << " -n N --stdin [options] [OUT_DIR]\n"
        << "Split a CSV file into numbered files of at most N rows.\n"
        << "Options:\n"
        << "  -n, --num-rows <N>            Maximum rows per file (required); more when grouping\n"
        << "  -g, --group-col <COL>         Zero-based column whose runs of equal values stay together\n"
        << "                                (input must be sorted by it)\n"
        << "      --stdin                   Read from standard input\n"
        << "  -i, --input-compression <C>   Input is none, gzip, bzip or detect (default: none)\n"
        << "  -z, --output-compression <C>  Compress each file: none, gzip, bzip (default: none);\n"
        << "                                files get a .gz or .bz2 suffix\n"
        << "  -t, --trigger <CMD>           Run CMD via sh after each file is written;\n"
        << "                                {} = path, {/} = file name, {rows} = row count\n"
        << "  -d, --header                  Copy the first row into every file\n"
        << "  -a, --suffix-length <N>       Digits in the file number (default: 5)\n"
        << "      --background              Write on a separate thread\n"
        << "      --sync                    Use buffered synchronous writes instead of io_uring\n"
        << "      --buffer-size <BYTES>     Size of each write buffer (default: 1048576)\n"
        << "      --queue-depth <N>         Buffers in flight (default: 8)\n"
        << "      --safety-margin <BYTES>   Submit a buffer once its free space drops to this (default: 0)\n"
        << "  -v, --verbose                 Verbose output\n"
        << "  -h, --help                    Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    bool have_rows = false;

    static struct option long_options[] = {
        {"group-col", required_argument, nullptr, 'g'},
        {"num-rows", required_argument, nullptr, 'n'},
        {"stdin", no_argument, nullptr, kStdin},
        {"input-compression", required_argument, nullptr, 'i'},
        {"output-compression", required_argument, nullptr, 'z'},
        {"trigger", required_argument, nullptr, 't'},
        {"header", no_argument, nullptr, 'd'},
        {"suffix-length", required_argument, nullptr, 'a'},
        {"background", no_argument, nullptr, kBackground},
        {"sync", no_argument, nullptr, kSync},
        {"buffer-size", required_argument, nullptr, kBufferSize},
        {"queue-depth", required_argument, nullptr, kQueueDepth},
        {"safety-margin", required_argument, nullptr, kSafetyMargin},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // Allow repeated parsing in one process (tests)
    optind = 0;
    opterr = 0;

    int c;
    while ((c = getopt_long(argc, argv, ":g:n:i:z:t:da:vh", long_options, nullptr)) != -1) {
        switch (c) {
            case 'g':
                opts.group_column = parse_size(optarg, "--group-col");
                break;
            case 'n':
                opts.max_rows = parse_size(optarg, "--num-rows");
                have_rows = true;
                break;
            case kStdin:
                opts.use_stdin = true;
                break;
            case 'i':
                opts.input_compression = parse_compression(optarg);
                break;
            case 'z':
                opts.output_compression = parse_compression(optarg);
                if (opts.output_compression == CompressionType::Detect) {
                    throw std::invalid_argument("'detect' is not an output compression");
                }
                break;
            case 't':
                opts.trigger = optarg;
                break;
            case 'd':
                opts.header = true;
                break;
            case 'a':
                opts.suffix_length = parse_size(optarg, "--suffix-length");
                break;
            case kBackground:
                opts.background = true;
                break;
            case kSync:
                opts.sync = true;
                break;
            case kBufferSize:
                opts.buffer_size = parse_size(optarg, "--buffer-size");
                break;
            case kQueueDepth: {
                size_t depth = parse_size(optarg, "--queue-depth");
                if (depth > std::numeric_limits<uint32_t>::max()) {
                    throw std::invalid_argument("--queue-depth is too large");
                }
                opts.queue_depth = static_cast<uint32_t>(depth);
                break;
            }
            case kSafetyMargin:
                opts.safety_margin = parse_size(optarg, "--safety-margin");
                break;
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                opts.show_help = true;
                return opts;
            case ':':
                throw std::invalid_argument(std::string("Missing argument for ") + argv[optind - 1]);
            default:
                throw std::invalid_argument(std::string("Unknown option: ") + argv[optind - 1]);
        }
    }

    if (!have_rows) {
        throw std::invalid_argument("--num-rows is required");
    }
    if (opts.max_rows == 0) {
        throw std::invalid_argument("--num-rows must be greater than 0");
    }
    if (opts.buffer_size == 0) {
        throw std::invalid_argument("--buffer-size must be greater than 0");
    }
    if (opts.queue_depth == 0) {
        throw std::invalid_argument("--queue-depth must be greater than 0");
    }
    if (opts.safety_margin >= opts.buffer_size) {
        throw std::invalid_argument("--safety-margin must be smaller than --buffer-size");
    }

    const int positional = argc - optind;
    if (opts.use_stdin) {
        if (positional > 1) {
            throw std::invalid_argument("Only an output directory may follow --stdin");
        }
        if (positional == 1) {
            opts.output_dir = argv[optind];
        }
    } else {
        if (positional < 1) {
            throw std::invalid_argument("Missing input file");
        }
        if (positional > 2) {
            throw std::invalid_argument("Too many arguments");
        }
        opts.input_file = argv[optind];
        if (positional == 2) {
            opts.output_dir = argv[optind + 1];
        }
    }

    return opts;
}

}  // namespace csvsplit
