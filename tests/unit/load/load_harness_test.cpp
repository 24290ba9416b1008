// LoadHarness: concurrent identical requests

#include <catch2/catch_test_macros.hpp>

#include <dockhand/load/load_harness.h>

#include "../../common/fake_generation_client.h"
#include "../../common/test_helpers_catch2.h"

#include <string>
#include <vector>

using namespace dockhand;
using namespace dockhand::load;
using namespace std::chrono_literals;
using dockhand::test::FakeGenerationClient;
using dockhand::test::run_awaitable;

TEST_CASE("runLoad returns one outcome per request, in index order", "[load]") {
    FakeGenerationClient client(
        [](const client::GenerateRequest& req, std::size_t) -> Result<client::GenerateResponse> {
            return FakeGenerationClient::ok(" Deep learning is", req.parameters.maxNewTokens);
        });

    auto result = run_awaitable(runLoad(client, "What is Deep Learning?", 20, 4));
    REQUIRE(result.outcomes.size() == 4);
    for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
        const auto& outcome = result.outcomes[i];
        CHECK(outcome.index == i);
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.response.value().details);
        CHECK(outcome.response.value().details->generatedTokens == 20);
    }

    REQUIRE(client.requests.size() == 4);
    for (const auto& req : client.requests) {
        CHECK(req.inputs == "What is Deep Learning?");
        CHECK(req.parameters.maxNewTokens == 20);
        CHECK(req.parameters.decoderInputDetails);
    }

    auto summary = summarize(result);
    CHECK(summary.total == 4);
    CHECK(summary.succeeded == 4);
    CHECK(summary.failed == 0);
    CHECK(summary.generatedTokens == 80);
    CHECK(summary.allSucceeded());
}

TEST_CASE("outcomes stay index-aligned when requests finish out of order", "[load]") {
    constexpr std::size_t n = 5;
    FakeGenerationClient client(
        [](const client::GenerateRequest&, std::size_t call) -> Result<client::GenerateResponse> {
            if (call == 2) {
                return Error{ErrorCode::ServerError, "HTTP 500: request 2 failed"};
            }
            return FakeGenerationClient::ok(" reply " + std::to_string(call));
        });
    // The last request finishes first
    client.setDelay([](std::size_t call) { return std::chrono::milliseconds(20 * (n - call)); });

    auto result = run_awaitable(runLoad(client, "hello", 5, n));
    REQUIRE(client.completions == std::vector<std::size_t>{4, 3, 2, 1, 0});
    REQUIRE(result.outcomes.size() == n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& outcome = result.outcomes[i];
        CHECK(outcome.index == i);
        if (i == 2) {
            REQUIRE_FALSE(outcome.succeeded());
            CHECK(outcome.response.error().message == "HTTP 500: request 2 failed");
            continue;
        }
        REQUIRE(outcome.succeeded());
        CHECK(outcome.response.value().generatedText == " reply " + std::to_string(i));
    }
    // Earlier-issued requests waited longer
    CHECK(result.outcomes[0].latency > result.outcomes[4].latency);
}

TEST_CASE("a request raising a non-standard exception still gets its outcome", "[load]") {
    FakeGenerationClient client(
        [](const client::GenerateRequest&, std::size_t call) -> Result<client::GenerateResponse> {
            if (call == 1) {
                throw 42;
            }
            return FakeGenerationClient::ok();
        },
        10ms);

    auto result = run_awaitable(runLoad(client, "hello", 5, 3));
    REQUIRE(result.outcomes.size() == 3);
    CHECK(result.outcomes[0].succeeded());
    REQUIRE_FALSE(result.outcomes[1].succeeded());
    CHECK(result.outcomes[1].response.error().code == ErrorCode::InternalError);
    CHECK(result.outcomes[2].succeeded());
}

TEST_CASE("all requests are in flight at the same time", "[load]") {
    FakeGenerationClient client({}, 100ms);

    const auto start = std::chrono::steady_clock::now();
    auto result = run_awaitable(runLoad(client, "hello", 5, 8));
    const auto wall = std::chrono::steady_clock::now() - start;

    CHECK(client.maxInFlight == 8);
    CHECK(result.outcomes.size() == 8);
    // Sequential issue would take at least 800ms
    CHECK(wall < 700ms);
    CHECK(result.wallTime >= 100ms);
    for (const auto& outcome : result.outcomes) {
        CHECK(outcome.latency >= 100ms);
    }
}

TEST_CASE("a failed request does not cancel the others", "[load]") {
    FakeGenerationClient client(
        [](const client::GenerateRequest&, std::size_t call) -> Result<client::GenerateResponse> {
            if (call == 1) {
                return Error{ErrorCode::ServerError, "HTTP 422: Input validation error"};
            }
            return FakeGenerationClient::ok();
        },
        20ms);

    auto result = run_awaitable(runLoad(client, "hello", 5, 3));
    REQUIRE(result.outcomes.size() == 3);
    CHECK(result.outcomes[0].succeeded());
    REQUIRE_FALSE(result.outcomes[1].succeeded());
    CHECK(result.outcomes[1].response.error().code == ErrorCode::ServerError);
    CHECK(result.outcomes[2].succeeded());

    auto summary = summarize(result);
    CHECK(summary.succeeded == 2);
    CHECK(summary.failed == 1);
    CHECK_FALSE(summary.allSucceeded());
}

TEST_CASE("a zero-sized batch sends nothing", "[load]") {
    FakeGenerationClient client;
    auto result = run_awaitable(runLoad(client, "hello", 5, 0));
    CHECK(result.outcomes.empty());
    CHECK(client.requests.empty());

    auto summary = summarize(result);
    CHECK(summary.total == 0);
    CHECK_FALSE(summary.allSucceeded());
}

TEST_CASE("summarize computes latency statistics over successes", "[load]") {
    LoadResult result;
    result.wallTime = 250ms;
    for (std::size_t i = 0; i < 3; ++i) {
        LoadOutcome outcome;
        outcome.index = i;
        outcome.latency = std::chrono::milliseconds(100 * (i + 1));
        outcome.response = FakeGenerationClient::ok(" x", 2);
        result.outcomes.push_back(std::move(outcome));
    }
    LoadOutcome failed;
    failed.index = 3;
    failed.latency = 5ms;
    failed.response = Error{ErrorCode::Timeout, "request timed out"};
    result.outcomes.push_back(std::move(failed));

    auto s = summarize(result);
    CHECK(s.total == 4);
    CHECK(s.succeeded == 3);
    CHECK(s.failed == 1);
    CHECK(s.minLatency == 100ms);
    CHECK(s.maxLatency == 300ms);
    CHECK(s.meanLatency == 200ms);
    CHECK(s.generatedTokens == 6);
    CHECK(s.wallTime == 250ms);
}
