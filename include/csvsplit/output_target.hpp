#ifndef CSVSPLIT_OUTPUT_TARGET_HPP
#define CSVSPLIT_OUTPUT_TARGET_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace csvsplit {

/**
 * One output file: descriptor, path and append offset.
 *
 * The offset is advanced when a write is submitted, not when it completes,
 * so consecutive submissions land back to back. It never moves backwards.
 */
class OutputTarget {
public:
    /**
     * Create (or truncate) the file for writing.
     *
     * @param path File path
     * @throws IoError if the file cannot be created
     */
    explicit OutputTarget(const std::string& path);

    ~OutputTarget();

    OutputTarget(const OutputTarget&) = delete;
    OutputTarget& operator=(const OutputTarget&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    off_t offset() const { return offset_; }
    bool is_open() const { return fd_ != -1; }

    /**
     * Reserve len bytes at the end of the file.
     *
     * @return Offset the reserved region starts at
     */
    off_t advance(size_t len);

    /**
     * Close the descriptor. Must not be called while writes against
     * this target are in flight.
     */
    void close();

private:
    std::string path_;
    int fd_ = -1;
    off_t offset_ = 0;
};

/**
 * Rotation history of output targets. Only the last one is active;
 * superseded targets are never written again.
 */
class TargetSequence {
public:
    explicit TargetSequence(const std::string& first_path);

    OutputTarget& active() { return *targets_.back(); }
    const OutputTarget& active() const { return *targets_.back(); }

    /**
     * Open a new target and make it the active one.
     */
    OutputTarget& rotate(const std::string& path);

    /**
     * Close the descriptors of all superseded targets.
     * Only valid when no write is in flight.
     *
     * @return Number of descriptors closed
     */
    size_t release_superseded();

    size_t size() const { return targets_.size(); }
    const OutputTarget& at(size_t index) const { return *targets_.at(index); }

private:
    // unique_ptr keeps target addresses stable for pending writes
    std::vector<std::unique_ptr<OutputTarget>> targets_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_OUTPUT_TARGET_HPP
