#pragma once

#include <string>

namespace mqm_collector {

// Per-invocation temporary file named "<target>.tmp.<pid>". The file is
// removed when the handle goes out of scope unless commit() moved it over
// its target first.
class ScratchFile {
public:
    explicit ScratchFile(const std::string& target);
    ~ScratchFile();

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] bool committed() const { return committed_; }

    // Write content and flush it to disk. Throws std::runtime_error.
    void write(const std::string& content);

    // Atomically rename over the target. Throws std::runtime_error.
    void commit();

private:
    std::string target_;
    std::string path_;
    bool        created_{false};
    bool        committed_{false};
};

} // namespace mqm_collector
