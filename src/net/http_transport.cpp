#include "net/http_transport.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <memory>

#include "models/pipeline_error.h"
#include "utils/allowlist.h"

namespace modelfetch {

namespace {

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url,
                                            std::chrono::milliseconds connect_timeout,
                                            std::chrono::milliseconds read_timeout) {
    if (!url.valid()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.origin());
    client->set_connection_timeout(connect_timeout);
    client->set_read_timeout(read_timeout);
    client->set_write_timeout(read_timeout);
    client->set_follow_location(true);
    return client;
}

bool isTlsError(httplib::Error err) {
    return err == httplib::Error::SSLConnection || err == httplib::Error::SSLLoadingCerts ||
           err == httplib::Error::SSLServerVerification;
}

std::optional<uint64_t> parseContentLength(const httplib::Response& res) {
    if (!res.has_header("Content-Length")) return std::nullopt;
    try {
        return static_cast<uint64_t>(std::stoull(res.get_header_value("Content-Length")));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

HttpTransport::HttpTransport(std::chrono::milliseconds connect_timeout,
                             std::chrono::milliseconds read_timeout)
    : connect_timeout_(connect_timeout), read_timeout_(read_timeout) {}

TransferResponse HttpTransport::fetch(const TransferRequest& request,
                                      const ResponseHandler& on_response,
                                      const ChunkHandler& on_chunk) {
    const HttpUrl url = parseUrl(request.url());
    auto client = makeClient(url, connect_timeout_, read_timeout_);
    if (!client) {
        throw ConfigurationError("cannot create HTTP client for url: " + request.url());
    }

    httplib::Headers headers;
    if (auto range = request.rangeHeader()) {
        headers.emplace("Range", *range);
    }

    TransferResponse response;
    bool handler_aborted = false;

    auto result = client->Get(
        url.path,
        headers,
        [&](const httplib::Response& res) {
            response.status = res.status;
            response.content_length = parseContentLength(res);
            response.last_modified = res.get_header_value("Last-Modified");
            if (on_response && !on_response(response)) {
                handler_aborted = true;
                return false;
            }
            return true;
        },
        [&](const char* data, size_t data_length) {
            if (on_chunk && !on_chunk(data, data_length)) {
                handler_aborted = true;
                return false;
            }
            return true;
        });

    if (handler_aborted) {
        response.aborted = true;
        return response;
    }
    if (!result) {
        const auto err = result.error();
        const std::string detail = httplib::to_string(err);
        if (isTlsError(err)) {
            throw SecurityError("TLS failure for " + url.origin(), detail);
        }
        spdlog::debug("HttpTransport: GET {}{} failed: {}", url.origin(), url.path, detail);
        throw NetworkError("request failed (no response) for " + url.origin() + url.path, 0, detail);
    }
    response.status = result->status;
    return response;
}

ProbeResult HttpTransport::probe(const std::string& endpoint, std::chrono::milliseconds timeout) {
    ProbeResult probe;
    std::string target = endpoint;
    if (target.find("://") == std::string::npos) target = "https://" + target;

    const HttpUrl url = parseUrl(target);
    auto client = makeClient(url, timeout, timeout);
    if (!client) {
        probe.error = "unsupported endpoint: " + endpoint;
        return probe;
    }

    const auto start = std::chrono::steady_clock::now();
    auto result = client->Head(url.path);
    probe.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (!result) {
        probe.error = httplib::to_string(result.error());
        return probe;
    }
    probe.status = result->status;
    probe.reachable = result->status < 500;
    if (!probe.reachable) probe.error = "HTTP " + std::to_string(result->status);
    return probe;
}

}  // namespace modelfetch
