#include <dockhand/load/load_harness.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>
#include <limits>

namespace dockhand::load {

namespace {

using Clock = std::chrono::steady_clock;

boost::asio::awaitable<void> issueOne(client::IGenerationClient& client,
                                      client::GenerateRequest request, LoadOutcome& slot) {
    const auto start = Clock::now();
    slot.response = co_await client.generate(std::move(request));
    slot.latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    if (!slot.response) {
        spdlog::warn("[LoadHarness] request {} failed: {}", slot.index,
                     slot.response.error().message);
    }
}

} // namespace

boost::asio::awaitable<LoadResult> runLoad(client::IGenerationClient& client, std::string prompt,
                                           std::uint32_t maxNewTokens, std::size_t concurrency) {
    using namespace boost::asio::experimental;

    LoadResult result;
    result.outcomes.resize(concurrency);
    if (concurrency == 0) {
        co_return result;
    }

    client::GenerateRequest request;
    request.inputs = std::move(prompt);
    request.parameters.maxNewTokens = maxNewTokens;
    request.parameters.decoderInputDetails = true;

    auto ex = co_await boost::asio::this_coro::executor;

    using Op = decltype(boost::asio::co_spawn(
        ex, issueOne(client, request, result.outcomes[0]), boost::asio::deferred));
    std::vector<Op> ops;
    ops.reserve(concurrency);
    for (std::size_t i = 0; i < concurrency; ++i) {
        result.outcomes[i].index = i;
        ops.push_back(boost::asio::co_spawn(ex, issueOne(client, request, result.outcomes[i]),
                                            boost::asio::deferred));
    }

    spdlog::info("[LoadHarness] sending {} concurrent requests to {}", concurrency,
                 client.baseUrl());
    const auto start = Clock::now();

    auto [order, errors] = co_await make_parallel_group(std::move(ops))
                               .async_wait(wait_for_all(), boost::asio::use_awaitable);
    (void)order;

    result.wallTime = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i]) {
            continue;
        }
        try {
            std::rethrow_exception(errors[i]);
        } catch (const std::exception& e) {
            spdlog::error("[LoadHarness] request {} raised: {}", i, e.what());
            result.outcomes[i].response = Error{ErrorCode::InternalError, e.what()};
        } catch (...) {
            spdlog::error("[LoadHarness] request {} raised a non-standard exception", i);
            result.outcomes[i].response =
                Error{ErrorCode::InternalError, "request raised a non-standard exception"};
        }
    }

    co_return result;
}

LoadSummary summarize(const LoadResult& result) {
    LoadSummary s;
    s.total = result.outcomes.size();
    s.wallTime = result.wallTime;

    std::chrono::milliseconds sum{0};
    auto minLatency = std::chrono::milliseconds::max();
    for (const auto& outcome : result.outcomes) {
        if (!outcome.succeeded()) {
            ++s.failed;
            continue;
        }
        ++s.succeeded;
        sum += outcome.latency;
        minLatency = std::min(minLatency, outcome.latency);
        s.maxLatency = std::max(s.maxLatency, outcome.latency);
        if (const auto& details = outcome.response.value().details) {
            s.generatedTokens += details->generatedTokens;
        }
    }
    if (s.succeeded > 0) {
        s.minLatency = minLatency;
        s.meanLatency = sum / static_cast<long long>(s.succeeded);
    }
    return s;
}

} // namespace dockhand::load
