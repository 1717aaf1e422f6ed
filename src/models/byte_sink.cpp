#include "models/byte_sink.h"

#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>

#include "models/pipeline_error.h"

namespace modelfetch {

FileSink::FileSink(const std::filesystem::path& path, bool append, size_t high_water_mark)
    : path_(path), high_water_mark_(high_water_mark == 0 ? 1 : high_water_mark) {
    out_.open(path_, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!out_.is_open()) {
        throw FileSystemError("cannot open " + path_.string() + " for writing", std::strerror(errno));
    }
    buffer_.reserve(high_water_mark_);
}

FileSink::~FileSink() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("FileSink: {} not fully flushed: {}", path_.string(), e.what());
    }
}

bool FileSink::write(const char* data, size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
    return buffer_.size() < high_water_mark_;
}

void FileSink::drain() {
    if (buffer_.empty()) return;
    errno = 0;
    out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    out_.flush();
    if (!out_.good()) {
        const int err = errno;
        if (err == ENOSPC || err == EDQUOT) {
            throw DiskSpaceError("no space left while writing " + path_.string(), std::strerror(err));
        }
        throw FileSystemError("write failed for " + path_.string(), err ? std::strerror(err) : "stream error");
    }
    written_ += buffer_.size();
    buffer_.clear();
}

void FileSink::close() {
    if (closed_) return;
    closed_ = true;
    drain();
    out_.close();
}

}  // namespace modelfetch
