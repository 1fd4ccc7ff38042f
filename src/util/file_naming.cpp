#include "csvsplit/file_naming.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace csvsplit {

namespace fs = std::filesystem;

SplitFileNaming SplitFileNaming::for_input(const std::string& input_path,
                                           const std::string& out_dir,
                                           size_t suffix_length,
                                           CompressionType compression) {
    SplitFileNaming naming;
    naming.out_dir = out_dir;
    naming.suffix_length = suffix_length;
    naming.compression = compression;

    fs::path input(input_path);
    // "data.csv.gz": drop the compression suffix before splitting off the extension
    std::string ext = input.extension().string();
    if (ext == ".gz" || ext == ".bz2" || ext == ".bz") {
        input = input.stem();
    }

    if (!input.stem().empty()) {
        naming.stem = input.stem().string();
        naming.extension = input.extension().string();
    }
    return naming;
}

std::string SplitFileNaming::path_for(size_t index) const {
    std::ostringstream name;
    name << stem << '.' << std::setw(static_cast<int>(suffix_length)) << std::setfill('0')
         << index << extension << compression_extension(compression);

    return (fs::path(out_dir) / name.str()).string();
}

}  // namespace csvsplit
