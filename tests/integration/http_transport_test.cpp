#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "models/pipeline_error.h"
#include "net/http_transport.h"
#include "test_support.h"

using namespace modelfetch;
using namespace modelfetch::test;

namespace {

// Loopback server that records the Range header of every artifact request.
class ArtifactServer {
public:
    explicit ArtifactServer(std::string body) : body_(std::move(body)) {
        server_.Get("/artifact", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ranges_.push_back(req.get_header_value("Range"));
            }
            res.set_content(body_, "application/octet-stream");
        });
        server_.Get("/no-range", [this](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content(body_, "application/octet-stream");
        });
        server_.Get("/missing", [](const httplib::Request&, httplib::Response& res) { res.status = 404; });
        server_.Get("/broken", [](const httplib::Request&, httplib::Response& res) { res.status = 503; });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~ArtifactServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

    std::vector<std::string> ranges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ranges_;
    }

private:
    std::string body_;
    httplib::Server server_;
    std::thread thread_;
    int port_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> ranges_;
};

struct Collected {
    TransferResponse head;
    std::string body;
};

Collected fetchAll(HttpTransport& transport, const TransferRequest& request) {
    Collected out;
    out.head = transport.fetch(
        request,
        [&](const TransferResponse& res) {
            out.head = res;
            return true;
        },
        [&](const char* data, size_t len) {
            out.body.append(data, len);
            return true;
        });
    return out;
}

}  // namespace

TEST(HttpTransportTest, FetchesWholeBody) {
    const auto body = makeBlob(300000);
    ArtifactServer server(body);
    HttpTransport transport(std::chrono::seconds(2), std::chrono::seconds(5));

    auto got = fetchAll(transport, TransferRequest::get(server.url("/artifact")));
    EXPECT_EQ(got.head.status, 200);
    EXPECT_EQ(got.body, body);
    ASSERT_EQ(server.ranges().size(), 1u);
    EXPECT_TRUE(server.ranges()[0].empty());
}

TEST(HttpTransportTest, SendsRangeForOffset) {
    const auto body = makeBlob(300000);
    ArtifactServer server(body);
    HttpTransport transport(std::chrono::seconds(2), std::chrono::seconds(5));

    auto got = fetchAll(transport, TransferRequest::get(server.url("/artifact"), 100000));
    EXPECT_EQ(got.head.status, 206);
    EXPECT_EQ(got.body, body.substr(100000));
    ASSERT_EQ(server.ranges().size(), 1u);
    EXPECT_EQ(server.ranges()[0], "bytes=100000-");
}

TEST(HttpTransportTest, HandlerCanAbort) {
    ArtifactServer server(makeBlob(1 << 20));
    HttpTransport transport(std::chrono::seconds(2), std::chrono::seconds(5));

    size_t received = 0;
    auto res = transport.fetch(
        TransferRequest::get(server.url("/artifact")), [](const TransferResponse&) { return true; },
        [&](const char*, size_t len) {
            received += len;
            return false;
        });
    EXPECT_TRUE(res.aborted);
    EXPECT_GT(received, 0u);
}

TEST(HttpTransportTest, ErrorStatusReachesResponseHandler) {
    ArtifactServer server("x");
    HttpTransport transport(std::chrono::seconds(2), std::chrono::seconds(5));

    int seen = 0;
    transport.fetch(
        TransferRequest::get(server.url("/missing")),
        [&](const TransferResponse& res) {
            seen = res.status;
            return false;
        },
        [](const char*, size_t) { return true; });
    EXPECT_EQ(seen, 404);
}

TEST(HttpTransportTest, UnreachableHostIsNetworkError) {
    HttpTransport transport(std::chrono::milliseconds(200), std::chrono::milliseconds(200));
    // Port 9 (discard) on loopback is not expected to be listening.
    EXPECT_THROW(fetchAll(transport, TransferRequest::get("http://127.0.0.1:9/x")), NetworkError);
}

TEST(HttpTransportTest, ProbeReportsReachability) {
    ArtifactServer server("x");
    HttpTransport transport(std::chrono::seconds(2), std::chrono::seconds(5));

    auto up = transport.probe(server.url("/artifact"), std::chrono::seconds(2));
    EXPECT_TRUE(up.reachable);
    EXPECT_EQ(up.status, 200);

    auto server_error = transport.probe(server.url("/broken"), std::chrono::seconds(2));
    EXPECT_FALSE(server_error.reachable);
    EXPECT_FALSE(server_error.error.empty());

    auto down = transport.probe("http://127.0.0.1:9", std::chrono::milliseconds(200));
    EXPECT_FALSE(down.reachable);
    EXPECT_FALSE(down.error.empty());
}
