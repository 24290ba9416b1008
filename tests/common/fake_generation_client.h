// Scripted IGenerationClient for tests

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <dockhand/client/generation_client.h>

namespace dockhand::test {

class FakeGenerationClient : public client::IGenerationClient {
public:
    using Responder =
        std::function<Result<client::GenerateResponse>(const client::GenerateRequest&, std::size_t)>;
    // Per-call delay, by call index; overrides the fixed delay
    using DelayFn = std::function<std::chrono::milliseconds(std::size_t)>;

    explicit FakeGenerationClient(Responder responder = {},
                                  std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : responder_(std::move(responder)), delay_(delay) {}

    boost::asio::awaitable<Result<client::GenerateResponse>>
    generate(client::GenerateRequest request) override {
        const auto call = requests.size();
        requests.push_back(request);
        ++inFlight;
        maxInFlight = std::max(maxInFlight, inFlight);

        const auto delay = delayFn_ ? delayFn_(call) : delay_;
        if (delay.count() > 0) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(delay);
            co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
        }

        --inFlight;
        completions.push_back(call);
        if (responder_) {
            co_return responder_(request, call);
        }
        co_return ok();
    }

    void setDelay(DelayFn fn) { delayFn_ = std::move(fn); }

    const std::string& serviceName() const override { return serviceName_; }
    const std::string& baseUrl() const override { return baseUrl_; }

    static Result<client::GenerateResponse> ok(std::string text = " world",
                                               std::uint32_t tokens = 1) {
        client::GenerateResponse response;
        response.generatedText = std::move(text);
        client::GenerateDetails details;
        details.finishReason = "length";
        details.generatedTokens = tokens;
        response.details = details;
        return response;
    }

    static Error refused() {
        return Error{ErrorCode::ConnectionRefused, "connect http://localhost:0: Connection refused"};
    }

    std::vector<client::GenerateRequest> requests;
    std::vector<std::size_t> completions; // call indices, in completion order
    std::size_t inFlight{0};
    std::size_t maxInFlight{0};

private:
    Responder responder_;
    std::chrono::milliseconds delay_;
    DelayFn delayFn_;
    std::string serviceName_{"fake"};
    std::string baseUrl_{"http://localhost:0"};
};

} // namespace dockhand::test
