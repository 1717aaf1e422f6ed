#pragma once

#include <chrono>

#include "net/transport.h"

namespace modelfetch {

// Transport over cpp-httplib. A new client is created per request, so one
// instance may be shared by concurrent transfers.
class HttpTransport : public Transport {
public:
    HttpTransport(std::chrono::milliseconds connect_timeout = std::chrono::seconds(10),
                  std::chrono::milliseconds read_timeout = std::chrono::seconds(60));

    TransferResponse fetch(const TransferRequest& request,
                           const ResponseHandler& on_response,
                           const ChunkHandler& on_chunk) override;

    ProbeResult probe(const std::string& endpoint, std::chrono::milliseconds timeout) override;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds read_timeout_;
};

}  // namespace modelfetch
