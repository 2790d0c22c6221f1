#include "mqm_collector/scratch_file.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mqm_collector {

ScratchFile::ScratchFile(const std::string& target)
    : target_(target),
      path_(target + ".tmp." + std::to_string(::getpid())) {}

ScratchFile::~ScratchFile() {
    if (created_ && !committed_) {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            spdlog::warn("Failed to remove scratch file {}: {}", path_, std::strerror(errno));
        }
    }
}

void ScratchFile::write(const std::string& content) {
    created_ = true;
    std::ofstream file(path_, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to write temporary file " + path_);
    }
    file << content;
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write temporary file " + path_);
    }

    // fsync
    int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

void ScratchFile::commit() {
    if (!created_) {
        throw std::runtime_error("Nothing written to " + path_);
    }
    if (std::rename(path_.c_str(), target_.c_str()) != 0) {
        throw std::runtime_error("Failed to rename " + path_ + " to " + target_ + ": " +
                                 std::strerror(errno));
    }
    committed_ = true;
}

} // namespace mqm_collector
