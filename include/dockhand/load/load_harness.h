#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <dockhand/client/generation_client.h>
#include <dockhand/core/types.h>

namespace dockhand::load {

// Outcome of one request; index is its position in the batch
struct LoadOutcome {
    std::size_t index{0};
    Result<client::GenerateResponse> response{ErrorCode::Unknown};
    std::chrono::milliseconds latency{0};

    bool succeeded() const { return response.has_value(); }
};

struct LoadSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::chrono::milliseconds wallTime{0};
    std::chrono::milliseconds minLatency{0};
    std::chrono::milliseconds maxLatency{0};
    std::chrono::milliseconds meanLatency{0};
    std::uint64_t generatedTokens{0};

    bool allSucceeded() const { return total > 0 && failed == 0; }
};

struct LoadResult {
    // outcomes[i].index == i
    std::vector<LoadOutcome> outcomes;
    std::chrono::milliseconds wallTime{0};
};

/**
 * Issue `concurrency` identical generation requests at once and wait for all
 * of them. Every request asks for decoder input details. A failed request
 * does not cancel the others; its error is kept in its slot.
 */
boost::asio::awaitable<LoadResult> runLoad(client::IGenerationClient& client, std::string prompt,
                                           std::uint32_t maxNewTokens, std::size_t concurrency);

LoadSummary summarize(const LoadResult& result);

} // namespace dockhand::load
