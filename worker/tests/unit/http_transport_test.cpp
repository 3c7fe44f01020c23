#include <gtest/gtest.h>
#include <httplib.h>
#include "http_transport.hpp"
#include <chrono>
#include <optional>
#include <thread>

namespace {

struct TransportResult {
    std::optional<int> status_code;
    std::optional<ProbeError> error;
    int signals = 0;
};

} // namespace

// Runs the cpr transport against a local httplib server
class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/ok", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
        server_.Post("/ok", [](const httplib::Request&, httplib::Response& res) { res.status = 201; });
        server_.Put("/ok", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });
        server_.Delete("/ok", [](const httplib::Request&, httplib::Response& res) { res.status = 202; });
        server_.Get("/fail", [](const httplib::Request&, httplib::Response& res) { res.status = 503; });
        server_.Get("/moved", [](const httplib::Request&, httplib::Response& res) { res.set_redirect("/ok"); });
        server_.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            res.set_content("late", "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]() { server_.listen_after_bind(); });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ASSERT_TRUE(server_.is_running());
    }

    void TearDown() override {
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    TransportResult run(const std::string& method, const std::string& target,
                        std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        TransportResult result;
        ProbeRequest request{target, method, timeout};
        transport_.execute(
            request,
            [&result](int status_code) {
                ++result.signals;
                result.status_code = status_code;
            },
            [&result](const ProbeError& error) {
                ++result.signals;
                result.error = error;
            });
        return result;
    }

    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;
    HttpTransport transport_;
};

TEST_F(HttpTransportTest, ReportsResponseStatus) {
    TransportResult ok = run("GET", url("/ok"));
    EXPECT_EQ(ok.signals, 1);
    EXPECT_EQ(ok.status_code, 200);
    EXPECT_FALSE(ok.error.has_value());

    TransportResult failing = run("GET", url("/fail"));
    EXPECT_EQ(failing.status_code, 503);
    EXPECT_FALSE(failing.error.has_value());
}

TEST_F(HttpTransportTest, SendsEachSupportedMethod) {
    EXPECT_EQ(run("POST", url("/ok")).status_code, 201);
    EXPECT_EQ(run("PUT", url("/ok")).status_code, 204);
    EXPECT_EQ(run("DELETE", url("/ok")).status_code, 202);
}

TEST_F(HttpTransportTest, RedirectIsReportedNotFollowed) {
    TransportResult result = run("GET", url("/moved"));

    EXPECT_EQ(result.signals, 1);
    EXPECT_EQ(result.status_code, 302);
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(HttpTransportTest, SlowResponseIsATimeout) {
    TransportResult result = run("GET", url("/slow"), std::chrono::seconds(1));

    EXPECT_EQ(result.signals, 1);
    EXPECT_FALSE(result.status_code.has_value());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ProbeErrorKind::Timeout);
}

TEST_F(HttpTransportTest, RefusedConnectionIsAConnectionError) {
    // Nothing listens on port 1
    TransportResult result = run("GET", "http://127.0.0.1:1/ok");

    EXPECT_EQ(result.signals, 1);
    EXPECT_FALSE(result.status_code.has_value());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ProbeErrorKind::Connection);
    EXPECT_FALSE(result.error->detail.empty());
}

TEST_F(HttpTransportTest, UnsupportedMethodIsAConnectionError) {
    TransportResult result = run("PATCH", url("/ok"));

    EXPECT_EQ(result.signals, 1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ProbeErrorKind::Connection);
    EXPECT_NE(result.error->detail.find("PATCH"), std::string::npos);
}
