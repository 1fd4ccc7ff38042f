#include "csvsplit/output_target.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#include "csvsplit/errors.hpp"

namespace csvsplit {

OutputTarget::OutputTarget(const std::string& path) : path_(path) {
    fd_ = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        throw IoError("Failed to create output file", path, errno);
    }
}

OutputTarget::~OutputTarget() {
    close();
}

off_t OutputTarget::advance(size_t len) {
    const off_t start = offset_;
    offset_ += static_cast<off_t>(len);
    return start;
}

void OutputTarget::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

TargetSequence::TargetSequence(const std::string& first_path) {
    targets_.push_back(std::make_unique<OutputTarget>(first_path));
}

OutputTarget& TargetSequence::rotate(const std::string& path) {
    targets_.push_back(std::make_unique<OutputTarget>(path));
    return *targets_.back();
}

size_t TargetSequence::release_superseded() {
    size_t closed = 0;
    for (size_t i = 0; i + 1 < targets_.size(); ++i) {
        if (targets_[i]->is_open()) {
            targets_[i]->close();
            closed++;
        }
    }
    return closed;
}

}  // namespace csvsplit
