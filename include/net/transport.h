#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace modelfetch {

// Immutable description of one transfer request. A range request is a GET
// with an offset; there is no free-form header map.
class TransferRequest {
public:
    static TransferRequest get(std::string url, std::optional<uint64_t> offset = std::nullopt) {
        return TransferRequest("GET", std::move(url), offset);
    }
    static TransferRequest head(std::string url) { return TransferRequest("HEAD", std::move(url), std::nullopt); }

    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }
    const std::optional<uint64_t>& offset() const { return offset_; }

    // "bytes=<offset>-" for ranged requests.
    std::optional<std::string> rangeHeader() const {
        if (!offset_ || *offset_ == 0) return std::nullopt;
        return "bytes=" + std::to_string(*offset_) + "-";
    }

private:
    TransferRequest(std::string method, std::string url, std::optional<uint64_t> offset)
        : method_(std::move(method)), url_(std::move(url)), offset_(offset) {}

    std::string method_;
    std::string url_;
    std::optional<uint64_t> offset_;
};

struct TransferResponse {
    int status{0};
    std::optional<uint64_t> content_length;
    std::string last_modified;
    bool aborted{false};  // a handler returned false
};

struct ProbeResult {
    bool reachable{false};
    int status{0};
    std::chrono::milliseconds latency{0};
    std::string error;
};

class Transport {
public:
    // Called once with the response head. Returning false aborts the body.
    using ResponseHandler = std::function<bool(const TransferResponse&)>;
    // Called per body chunk. Returning false aborts the transfer.
    using ChunkHandler = std::function<bool(const char* data, size_t length)>;

    virtual ~Transport() = default;

    // Throws NetworkError when no response is received, SecurityError on TLS failures.
    virtual TransferResponse fetch(const TransferRequest& request,
                                   const ResponseHandler& on_response,
                                   const ChunkHandler& on_chunk) = 0;

    // Lightweight reachability check. Never throws.
    virtual ProbeResult probe(const std::string& endpoint, std::chrono::milliseconds timeout) = 0;
};

}  // namespace modelfetch
