#ifndef CSVSPLIT_FILE_NAMING_HPP
#define CSVSPLIT_FILE_NAMING_HPP

#include <cstddef>
#include <string>

#include "compression.hpp"

namespace csvsplit {

/**
 * Names of the numbered output files.
 *
 * File n (1-based) is `<out_dir>/<stem>.<n><extension><compression suffix>`,
 * with n zero-padded to suffix_length digits, e.g. `out/data.00001.csv.gz`.
 */
struct SplitFileNaming {
    std::string out_dir = ".";
    std::string stem = "split";
    std::string extension = ".csv";   ///< Including the dot, may be empty
    size_t suffix_length = 5;
    CompressionType compression = CompressionType::None;

    /**
     * Derive stem and extension from the input path
     * ("in/data.csv" -> stem "data", extension ".csv").
     */
    static SplitFileNaming for_input(const std::string& input_path,
                                     const std::string& out_dir,
                                     size_t suffix_length,
                                     CompressionType compression);

    std::string path_for(size_t index) const;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_FILE_NAMING_HPP
