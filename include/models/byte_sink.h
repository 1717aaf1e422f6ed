#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace modelfetch {

// Destination for streamed bytes. write() always keeps the chunk; a false
// return means the sink is at its high-water mark and the producer must
// call drain() before handing over more data.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(const char* data, size_t length) = 0;
    // Flushes buffered bytes. Throws FileSystemError or DiskSpaceError.
    virtual void drain() = 0;
    virtual void close() = 0;
    virtual uint64_t bytesWritten() const = 0;
};

// Buffered writer for a partial artifact file.
class FileSink : public ByteSink {
public:
    FileSink(const std::filesystem::path& path, bool append, size_t high_water_mark);
    ~FileSink() override;

    bool write(const char* data, size_t length) override;
    void drain() override;
    void close() override;
    uint64_t bytesWritten() const override { return written_; }

    size_t buffered() const { return buffer_.size(); }
    size_t highWaterMark() const { return high_water_mark_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::vector<char> buffer_;
    size_t high_water_mark_;
    uint64_t written_{0};
    bool closed_{false};
};

}  // namespace modelfetch
