#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <openssl/sha.h>

namespace modelfetch {

namespace detail {

inline std::string digest_to_hex(const std::array<unsigned char, SHA256_DIGEST_LENGTH>& hash) {
    static const char* hex = "0123456789abcdef";
    std::string hexout;
    hexout.reserve(hash.size() * 2);
    for (auto b : hash) {
        hexout.push_back(hex[(b >> 4) & 0x0F]);
        hexout.push_back(hex[b & 0x0F]);
    }
    return hexout;
}

}  // namespace detail

// Incremental SHA-256. finalize() may be called once; an empty string
// means OpenSSL reported a failure.
class Sha256Stream {
public:
    Sha256Stream() { ok_ = SHA256_Init(&ctx_) == 1; }

    void update(const void* data, size_t len) {
        if (!ok_ || len == 0) return;
        ok_ = SHA256_Update(&ctx_, data, len) == 1;
    }

    std::string finalize() {
        if (!ok_) return "";
        std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
        if (SHA256_Final(hash.data(), &ctx_) != 1) return "";
        ok_ = false;
        return detail::digest_to_hex(hash);
    }

private:
    SHA256_CTX ctx_{};
    bool ok_{false};
};

inline std::string sha256_text(const std::string& text) {
    Sha256Stream stream;
    stream.update(text.data(), text.size());
    return stream.finalize();
}

// Returns "" when the file cannot be read.
inline std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    Sha256Stream stream;
    std::array<char, 64 * 1024> buf{};
    while (file) {
        file.read(buf.data(), buf.size());
        std::streamsize n = file.gcount();
        if (n > 0) stream.update(buf.data(), static_cast<size_t>(n));
    }
    if (file.bad()) return "";
    return stream.finalize();
}

}  // namespace modelfetch
