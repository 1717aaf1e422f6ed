#include "models/integrity_verifier.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/allowlist.h"
#include "utils/file_lock.h"
#include "utils/json_utils.h"
#include "utils/sha256.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace modelfetch {

namespace {

constexpr const char* kIndexFile = "quarantine.json";
constexpr uint64_t kOnnxMinSize = 32;
constexpr uint64_t kGgufMinSize = 24;
constexpr uint64_t kSafetensorsMinSize = 10;
constexpr size_t kHeaderProbeBytes = 4096;

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::vector<unsigned char> readHead(const fs::path& path, size_t max_bytes) {
    std::ifstream ifs(path, std::ios::binary);
    std::vector<unsigned char> buf(max_bytes);
    if (!ifs.is_open()) return {};
    ifs.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    buf.resize(static_cast<size_t>(ifs.gcount()));
    return buf;
}

bool readVarint(const std::vector<unsigned char>& buf, size_t& pos, uint64_t& out) {
    out = 0;
    for (int shift = 0; shift < 64; shift += 7) {
        if (pos >= buf.size()) return false;
        const unsigned char b = buf[pos++];
        out |= static_cast<uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) return true;
    }
    return false;
}

// ONNX files are ModelProto messages whose first field is ir_version (field 1, varint).
std::optional<std::string> checkOnnx(const std::vector<unsigned char>& head, uint64_t file_size) {
    if (head.empty() || head[0] != 0x08) {
        return std::string("Corrupted header: missing ONNX ir_version field");
    }
    size_t pos = 0;
    for (int field = 0; field < 2; ++field) {
        uint64_t tag = 0;
        if (!readVarint(head, pos, tag) || (tag >> 3) == 0) {
            return std::string("Corrupted header: malformed ONNX protobuf field");
        }
        uint64_t value = 0;
        switch (tag & 0x07) {
            case 0:
                if (!readVarint(head, pos, value)) return std::string("Corrupted header: truncated ONNX varint");
                break;
            case 1:
                pos += 8;
                break;
            case 2:
                if (!readVarint(head, pos, value) || pos + value > file_size) {
                    return std::string("Corrupted header: ONNX field length exceeds file size");
                }
                pos += static_cast<size_t>(value);
                break;
            case 5:
                pos += 4;
                break;
            default:
                return std::string("Corrupted header: invalid ONNX wire type");
        }
        if (pos > file_size) return std::string("Corrupted header: truncated ONNX field");
        if (pos >= head.size()) break;
    }
    return std::nullopt;
}

std::optional<std::string> checkGguf(const std::vector<unsigned char>& head) {
    static const std::array<unsigned char, 4> kMagic{'G', 'G', 'U', 'F'};
    if (head.size() < kMagic.size() || !std::equal(kMagic.begin(), kMagic.end(), head.begin())) {
        return std::string("Corrupted header: missing GGUF magic");
    }
    return std::nullopt;
}

std::optional<std::string> checkSafetensors(const std::vector<unsigned char>& head, uint64_t file_size) {
    if (head.size() < 9) return std::string("Corrupted header: truncated safetensors header");
    uint64_t header_len = 0;
    for (int i = 7; i >= 0; --i) {
        header_len = (header_len << 8) | head[static_cast<size_t>(i)];
    }
    if (header_len < 2 || header_len > file_size - 8) {
        return std::string("Corrupted header: safetensors header length out of range");
    }
    if (head[8] != '{') return std::string("Corrupted header: safetensors header is not JSON");
    return std::nullopt;
}

uint64_t minimumSize(const std::string& format) {
    if (format == "onnx") return kOnnxMinSize;
    if (format == "gguf") return kGgufMinSize;
    if (format == "safetensors") return kSafetensorsMinSize;
    return 0;
}

json entryToJson(const QuarantineEntry& e) {
    return json{{"quarantine_path", e.quarantine_path},
                {"original_path", e.original_path},
                {"reason", to_string(e.reason)},
                {"timestamp_ms", toEpochMillis(e.timestamp)},
                {"expected_checksum", e.expected_checksum},
                {"actual_checksum", e.actual_checksum},
                {"expected_size", e.expected_size},
                {"actual_size", e.actual_size},
                {"detail", e.detail}};
}

std::optional<QuarantineEntry> entryFromJson(const json& j) {
    QuarantineEntry e;
    e.quarantine_path = get_or<std::string>(j, "quarantine_path", "");
    if (e.quarantine_path.empty()) return std::nullopt;
    e.original_path = get_or<std::string>(j, "original_path", "");
    e.reason = parseQuarantineReason(get_or<std::string>(j, "reason", "")).value_or(QuarantineReason::kUnknownError);
    e.timestamp = fromEpochMillis(get_or<int64_t>(j, "timestamp_ms", 0));
    e.expected_checksum = get_or<std::string>(j, "expected_checksum", "");
    e.actual_checksum = get_or<std::string>(j, "actual_checksum", "");
    e.expected_size = get_or<uint64_t>(j, "expected_size", 0);
    e.actual_size = get_or<uint64_t>(j, "actual_size", 0);
    e.detail = get_or<std::string>(j, "detail", "");
    return e;
}

}  // namespace

IntegrityVerifier::IntegrityVerifier(std::string quarantine_dir)
    : quarantine_dir_(std::move(quarantine_dir)) {
    loadIndex();
}

bool IntegrityVerifier::isKnownFormat(const std::string& format) {
    const auto f = toLowerAscii(format);
    return f == "onnx" || f == "gguf" || f == "safetensors";
}

std::optional<std::string> IntegrityVerifier::checkFormatHeader(const fs::path& path,
                                                                const std::string& format,
                                                                uint64_t file_size) {
    const auto f = toLowerAscii(format);
    if (!isKnownFormat(f)) return std::nullopt;

    if (file_size < minimumSize(f)) {
        return "Corrupted header: file too small for " + f + " (" + std::to_string(file_size) + " bytes)";
    }
    const auto head = readHead(path, kHeaderProbeBytes);
    if (f == "onnx") return checkOnnx(head, file_size);
    if (f == "gguf") return checkGguf(head);
    return checkSafetensors(head, file_size);
}

VerificationResult IntegrityVerifier::verify(const std::string& file_path,
                                             const ArtifactDescriptor& descriptor,
                                             const VerificationOptions& options) {
    VerificationResult result;
    const fs::path path(file_path);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.errors.push_back("File not found: " + file_path);
        return result;
    }
    result.actual_size = fs::file_size(path, ec);
    if (ec) {
        result.errors.push_back("Unable to stat file: " + ec.message());
        result.failure_reason = QuarantineReason::kUnknownError;
    }

    std::optional<QuarantineReason> checksum_fail;
    std::optional<QuarantineReason> size_fail;
    std::optional<QuarantineReason> format_fail;
    std::optional<QuarantineReason> other_fail = result.failure_reason;

    if (!options.skip_checksum) {
        if (descriptor.sha256.empty()) {
            result.warnings.push_back("No expected checksum for " + descriptor.key());
        } else {
            result.actual_checksum = sha256_file(path);
            if (result.actual_checksum.empty()) {
                result.errors.push_back("Unable to read file for checksum: " + file_path);
                other_fail = QuarantineReason::kUnknownError;
            } else if (toLowerAscii(descriptor.sha256) != result.actual_checksum) {
                result.errors.push_back("Checksum mismatch: expected " + descriptor.sha256 + ", got " +
                                        result.actual_checksum);
                checksum_fail = QuarantineReason::kChecksumMismatch;
            }
        }
    }

    if (!options.skip_size && descriptor.size > 0 && result.actual_size != descriptor.size) {
        result.errors.push_back("Size mismatch: expected " + std::to_string(descriptor.size) + " bytes, got " +
                                std::to_string(result.actual_size) + " bytes");
        size_fail = QuarantineReason::kSizeMismatch;
    }

    if (!options.skip_format) {
        if (!isKnownFormat(descriptor.format)) {
            result.warnings.push_back("No header check for format '" + descriptor.format + "'");
        } else if (auto err = checkFormatHeader(path, descriptor.format, result.actual_size)) {
            result.errors.push_back(*err);
            format_fail = QuarantineReason::kCorruptedHeader;
        }
    }

    result.valid = result.errors.empty();
    if (result.valid) {
        spdlog::debug("IntegrityVerifier: {} verified ({} bytes)", descriptor.key(), result.actual_size);
        return result;
    }

    if (checksum_fail) {
        result.failure_reason = checksum_fail;
    } else if (size_fail) {
        result.failure_reason = size_fail;
    } else if (format_fail) {
        result.failure_reason = format_fail;
    } else {
        result.failure_reason = other_fail.value_or(QuarantineReason::kUnknownError);
    }

    spdlog::warn("IntegrityVerifier: {} failed verification: {}", descriptor.key(), result.errors.front());

    if (options.quarantine_on_failure) {
        QuarantineDetail detail;
        detail.message = result.errors.front();
        detail.expected_checksum = descriptor.sha256;
        detail.actual_checksum = result.actual_checksum;
        detail.expected_size = descriptor.size;
        detail.actual_size = result.actual_size;
        try {
            result.quarantine_path = quarantine(file_path, *result.failure_reason, detail);
        } catch (const FileSystemError& e) {
            result.warnings.push_back(std::string("Quarantine failed: ") + e.what());
        }
    }
    return result;
}

fs::path IntegrityVerifier::indexPath() const {
    return fs::path(quarantine_dir_) / kIndexFile;
}

fs::path IntegrityVerifier::uniqueQuarantinePath(const fs::path& source) {
    const auto now_ms = toEpochMillis(std::chrono::system_clock::now());
    std::error_code ec;
    for (;;) {
        const auto name = std::to_string(now_ms) + "_" + std::to_string(++sequence_) + "_" +
                          source.filename().string();
        auto candidate = fs::path(quarantine_dir_) / name;
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

std::string IntegrityVerifier::quarantine(const std::string& file_path,
                                          QuarantineReason reason,
                                          const QuarantineDetail& detail) {
    const fs::path source(file_path);
    std::error_code ec;
    fs::create_directories(quarantine_dir_, ec);
    if (ec) {
        throw FileSystemError("cannot create quarantine directory " + quarantine_dir_, ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path target = uniqueQuarantinePath(source);

    fs::rename(source, target, ec);
    if (ec) {
        // Different filesystem: copy then remove.
        std::error_code copy_ec;
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            throw FileSystemError("cannot move " + file_path + " into quarantine", copy_ec.message());
        }
        fs::remove(source, copy_ec);
    }

    QuarantineEntry entry;
    entry.quarantine_path = target.string();
    entry.original_path = fs::absolute(source, ec).string();
    entry.reason = reason;
    entry.timestamp = std::chrono::system_clock::now();
    entry.expected_checksum = detail.expected_checksum;
    entry.actual_checksum = detail.actual_checksum;
    entry.expected_size = detail.expected_size;
    entry.actual_size = detail.actual_size;
    entry.detail = detail.message;
    entries_[entry.quarantine_path] = entry;
    persistIndex();

    spdlog::warn("IntegrityVerifier: quarantined {} -> {} ({})", file_path, entry.quarantine_path, to_string(reason));
    return entry.quarantine_path;
}

std::vector<QuarantineEntry> IntegrityVerifier::listQuarantined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QuarantineEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const QuarantineEntry& a, const QuarantineEntry& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

void IntegrityVerifier::restore(const std::string& quarantine_path, const std::string& target_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(quarantine_path);
    if (it == entries_.end()) {
        throw FileSystemError("not a quarantined file: " + quarantine_path);
    }

    const fs::path target(target_path);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    fs::copy_file(quarantine_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw FileSystemError("cannot restore " + quarantine_path + " to " + target_path, ec.message());
    }
    fs::remove(quarantine_path, ec);
    entries_.erase(it);
    persistIndex();
    spdlog::info("IntegrityVerifier: restored {} -> {}", quarantine_path, target_path);
}

size_t IntegrityVerifier::cleanup(int max_age_days) {
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24) * std::max(0, max_age_days);
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.timestamp < cutoff) {
            std::error_code ec;
            fs::remove(it->second.quarantine_path, ec);
            if (ec) {
                spdlog::warn("IntegrityVerifier: failed to remove {}: {}", it->second.quarantine_path, ec.message());
            }
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        persistIndex();
        spdlog::info("IntegrityVerifier: removed {} quarantine entries older than {} days", removed, max_age_days);
    }
    return removed;
}

void IntegrityVerifier::loadIndex() {
    std::string err;
    auto j = read_json_file(indexPath(), &err);
    if (!j) return;
    const json* list = j->is_object() && j->contains("entries") ? &(*j)["entries"] : &(*j);
    if (!list->is_array()) {
        spdlog::warn("IntegrityVerifier: ignoring malformed {}", indexPath().string());
        return;
    }
    for (const auto& item : *list) {
        if (auto entry = entryFromJson(item)) entries_[entry->quarantine_path] = *entry;
    }
}

void IntegrityVerifier::persistIndex() {
    json list = json::array();
    for (const auto& kv : entries_) list.push_back(entryToJson(kv.second));
    FileLock lock(indexPath().string() + ".lock", std::chrono::seconds(1));
    std::string err;
    if (!write_json_atomic(indexPath(), json{{"entries", list}}, &err)) {
        spdlog::warn("IntegrityVerifier: failed to write quarantine index: {}", err);
    }
}

}  // namespace modelfetch
