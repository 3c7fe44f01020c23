#include <gtest/gtest.h>
#include "probe_executor.hpp"
#include "../utils/mocks.hpp"
#include <stdexcept>
#include <vector>

class ProbeExecutorTest : public ::testing::Test {
protected:
    void run(ScriptedTransport transport, const Check& check) {
        ProbeExecutor executor(transport);
        executor.execute(check, [this](const Check& probed, ProbeOutcome& outcome) {
            probed_ids.push_back(probed.id);
            outcomes.push_back(outcome);
        });
    }

    std::vector<std::string> probed_ids;
    std::vector<ProbeOutcome> outcomes;
};

TEST_F(ProbeExecutorTest, BuildsRequestFromCheck) {
    Check check = make_check("chk1");
    check.method = "post";
    check.path = "/status";

    ProbeRequest request = ProbeExecutor::build_request(check);

    EXPECT_EQ(request.url, "https://example.com/status");
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.timeout, std::chrono::milliseconds(3000));
}

TEST_F(ProbeExecutorTest, ResponseYieldsCodeOnly) {
    run(ScriptedTransport::responding(204), make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(probed_ids.front(), "chk1");
    EXPECT_EQ(outcomes.front().response_code, 204);
    EXPECT_FALSE(outcomes.front().error.has_value());
    EXPECT_TRUE(outcomes.front().completed());
    EXPECT_FALSE(outcomes.front().sent);
}

TEST_F(ProbeExecutorTest, ConnectionFailureYieldsConnectionError) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler&,
                             const ProbeTransport::ErrorHandler& on_error) {
            on_error(ProbeError::connection("connection refused"));
        }),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes.front().error.has_value());
    EXPECT_EQ(outcomes.front().error->kind, ProbeErrorKind::Connection);
    EXPECT_EQ(outcomes.front().error->detail, "connection refused");
    EXPECT_FALSE(outcomes.front().response_code.has_value());
}

TEST_F(ProbeExecutorTest, TimeoutYieldsTimeoutError) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler&,
                             const ProbeTransport::ErrorHandler& on_error) { on_error(ProbeError::timeout()); }),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes.front().error.has_value());
    EXPECT_EQ(outcomes.front().error->kind, ProbeErrorKind::Timeout);
}

TEST_F(ProbeExecutorTest, SecondSignalIsDropped) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler& on_response,
                             const ProbeTransport::ErrorHandler& on_error) {
            on_response(200);
            on_error(ProbeError::connection("reset after response"));
            on_response(500);
        }),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes.front().response_code, 200);
    EXPECT_FALSE(outcomes.front().error.has_value());
}

TEST_F(ProbeExecutorTest, TransportExceptionBecomesConnectionError) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler&,
                             const ProbeTransport::ErrorHandler&) { throw std::runtime_error("dns failure"); }),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes.front().error.has_value());
    EXPECT_EQ(outcomes.front().error->kind, ProbeErrorKind::Connection);
    EXPECT_EQ(outcomes.front().error->detail, "dns failure");
}

TEST_F(ProbeExecutorTest, ExceptionAfterResponseKeepsFirstOutcome) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler& on_response,
                             const ProbeTransport::ErrorHandler&) {
            on_response(200);
            throw std::runtime_error("late failure");
        }),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes.front().response_code, 200);
}

TEST_F(ProbeExecutorTest, SilentTransportStillCompletesOnce) {
    run(ScriptedTransport([](const ProbeRequest&, const ProbeTransport::ResponseHandler&,
                             const ProbeTransport::ErrorHandler&) {}),
        make_check("chk1"));

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes.front().error.has_value());
    EXPECT_EQ(outcomes.front().error->kind, ProbeErrorKind::Connection);
}

TEST_F(ProbeExecutorTest, ThrowingContinuationDoesNotEscape) {
    ScriptedTransport transport = ScriptedTransport::responding(200);
    ProbeExecutor executor(transport);
    int calls = 0;

    EXPECT_NO_THROW(executor.execute(make_check("chk1"), [&calls](const Check&, ProbeOutcome&) {
        ++calls;
        throw std::runtime_error("processor blew up");
    }));
    EXPECT_EQ(calls, 1);
}

TEST(ProbeCompletionTest, OnlyFirstCompletionWins) {
    ProbeCompletion completion;
    EXPECT_FALSE(completion.completed());
    EXPECT_TRUE(completion.try_complete());
    EXPECT_FALSE(completion.try_complete());
    EXPECT_TRUE(completion.completed());
}
