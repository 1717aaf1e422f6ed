#pragma once

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <thread>
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

namespace modelfetch {

// Best-effort cross-process lock on a sidecar file.
// flock is tried first; when that is unavailable a "<target>.lock" directory
// is used instead. With a non-zero wait the acquisition is retried until the
// deadline passes. locked() reports the outcome.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target,
                      std::chrono::milliseconds wait = std::chrono::milliseconds(0))
        : target_(target) {
        const auto deadline = std::chrono::steady_clock::now() + wait;
        while (!tryAcquire()) {
            if (std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }
    const std::filesystem::path& target() const { return target_; }

private:
    bool tryAcquire() {
        if (fd_ < 0) fd_ = ::open(target_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ >= 0) {
            if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
                locked_ = true;
                return true;
            }
            if (errno == EWOULDBLOCK) return false;
            ::close(fd_);
            fd_ = -1;
        }
        dir_lock_path_ = target_.string() + ".lock";
        std::error_code ec;
        if (std::filesystem::create_directory(dir_lock_path_, ec)) {
            locked_ = true;
            used_dir_lock_ = true;
        }
        return locked_;
    }

    void release() {
        if (fd_ >= 0) {
            if (locked_ && !used_dir_lock_) ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }
        if (locked_ && used_dir_lock_) {
            std::error_code ec;
            std::filesystem::remove(dir_lock_path_, ec);
        }
        locked_ = false;
    }

    std::filesystem::path target_;
    bool locked_{false};
    int fd_{-1};
    bool used_dir_lock_{false};
    std::filesystem::path dir_lock_path_;
};

}  // namespace modelfetch
