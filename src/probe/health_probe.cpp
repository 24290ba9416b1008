#include <dockhand/probe/health_probe.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cmath>

namespace dockhand::probe {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

long long wholeSeconds(std::chrono::milliseconds d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

boost::asio::awaitable<void> sendInto(client::IGenerationClient& client,
                                      client::GenerateRequest request,
                                      std::optional<Result<client::GenerateResponse>>& out) {
    out.emplace(co_await client.generate(std::move(request)));
}

client::GenerateRequest readinessRequest() {
    client::GenerateRequest req;
    req.inputs = "test";
    req.parameters.maxNewTokens = 1;
    return req;
}

} // namespace

LogSink defaultContainerLogSink() {
    auto logger = spdlog::get("container");
    if (!logger) {
        logger = spdlog::stdout_color_mt("container");
        logger->set_pattern("[container] %v");
    }
    return [logger](std::string_view line) { logger->info("{}", line); };
}

const char* toString(ProbeState state) {
    switch (state) {
        case ProbeState::Polling:
            return "polling";
        case ProbeState::Ready:
            return "ready";
        case ProbeState::Crashed:
            return "crashed";
        case ProbeState::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

ProbeState stateOf(const ProbeResult& result) {
    if (std::holds_alternative<Ready>(result)) {
        return ProbeState::Ready;
    }
    if (std::holds_alternative<Crashed>(result)) {
        return ProbeState::Crashed;
    }
    return ProbeState::TimedOut;
}

// --- ContainerLogForwarder ---

ContainerLogForwarder::ContainerLogForwarder(runtime::IContainerRuntime& runtime, std::string ref,
                                             LogSink sink)
    : runtime_(runtime), ref_(std::move(ref)), sink_(std::move(sink)) {}

std::size_t ContainerLogForwarder::drain() {
    auto lines = runtime_.logs(ref_, watermark_);
    if (!lines) {
        spdlog::debug("[HealthProbe] could not read logs of {}: {}", ref_, lines.error().message);
        return 0;
    }

    // `since` is inclusive, so lines stamped at the watermark were sent last time.
    // Lines without a usable stamp are always new to us and are never skipped.
    const bool haveWatermark = watermark_.time_since_epoch().count() != 0;
    std::size_t forwarded = 0;
    for (const auto& line : lines.value()) {
        const bool stamped = line.timestamp.time_since_epoch().count() != 0;
        if (haveWatermark && stamped && line.timestamp <= watermark_) {
            continue;
        }
        if (sink_) {
            sink_(line.text);
        }
        watermark_ = std::max(watermark_, line.timestamp);
        ++forwarded;
    }
    return forwarded;
}

// --- HealthProbe ---

HealthProbe::HealthProbe(std::shared_ptr<runtime::IContainerRuntime> runtime)
    : runtime_(std::move(runtime)) {}

boost::asio::awaitable<Result<ProbeResult>>
HealthProbe::awaitReady(const ContainerHandle& handle, client::IGenerationClient& client,
                        ProbeOptions options) {
    using namespace boost::asio::experimental::awaitable_operators;

    state_ = ProbeState::Polling;
    attempts_ = 0;

    if (options.timeout <= std::chrono::milliseconds::zero()) {
        co_return Error{ErrorCode::InvalidArgument, "probe timeout must be positive"};
    }
    if (options.pollInterval <= std::chrono::milliseconds::zero()) {
        options.pollInterval = std::chrono::seconds(1);
    }
    if (!options.logSink) {
        options.logSink = defaultContainerLogSink();
    }

    auto ex = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer sleeper(ex);

    const auto ref = handle.runtimeRef.empty() ? handle.name : handle.runtimeRef;
    const auto start = Clock::now();
    const auto deadline = start + options.timeout;
    const auto maxAttempts = static_cast<std::size_t>(
        std::ceil(static_cast<double>(options.timeout.count()) / options.pollInterval.count()));

    ContainerLogForwarder logs(*runtime_, ref, options.logSink);

    spdlog::info("[HealthProbe] waiting for {} on port {} (timeout {}s)", handle.name, handle.port,
                 wholeSeconds(options.timeout));

    while (attempts_ < std::max<std::size_t>(maxAttempts, 1)) {
        ++attempts_;
        logs.drain();

        auto info = runtime_->get(ref);
        if (!info && info.error().code != ErrorCode::NotFound) {
            co_return Error{ErrorCode::ProbeFailed,
                            fmt::format("could not inspect {}: {}", handle.name,
                                        info.error().message)};
        }
        if (!info || !runtime::isAlive(info.value().status)) {
            auto elapsed = since(start);
            Crashed crashed;
            crashed.elapsed = elapsed;
            crashed.reason = fmt::format("Service crashed after {} seconds.", wholeSeconds(elapsed));
            if (info) {
                crashed.status = info.value().status;
                crashed.exitCode = info.value().exitCode;
            }
            logs.drain();
            state_ = ProbeState::Crashed;
            spdlog::error("[HealthProbe] {} ({}): {}", handle.name,
                          info ? runtime::toString(info.value().status) : "removed",
                          crashed.reason);
            co_return ProbeResult{std::move(crashed)};
        }

        if (Clock::now() >= deadline) {
            break;
        }

        std::optional<Result<client::GenerateResponse>> reply;
        boost::asio::steady_timer budget(ex);
        budget.expires_at(deadline);
        auto winner = co_await (sendInto(client, readinessRequest(), reply) ||
                                budget.async_wait(boost::asio::use_awaitable));
        if (winner.index() == 1 || !reply) {
            break;
        }

        if (*reply) {
            auto elapsed = since(start);
            state_ = ProbeState::Ready;
            spdlog::info("[HealthProbe] Service started after {} seconds", wholeSeconds(elapsed));
            co_return ProbeResult{Ready{elapsed}};
        }

        const auto& err = reply->error();
        if (!client::isTransientConnectionError(err)) {
            logs.drain();
            spdlog::error("[HealthProbe] Basic generation failed with: {}", err.message);
            co_return Error{ErrorCode::ProbeFailed, "Basic generation failed with: " + err.message};
        }
        spdlog::debug("[HealthProbe] {} not ready yet (attempt {}): {}", handle.name, attempts_,
                      err.message);

        const auto remaining = deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) {
            break;
        }
        sleeper.expires_after(std::min<Clock::duration>(options.pollInterval, remaining));
        co_await sleeper.async_wait(boost::asio::use_awaitable);
    }

    // A timeout is never reported before the full budget has elapsed
    if (auto remaining = deadline - Clock::now(); remaining > Clock::duration::zero()) {
        sleeper.expires_after(remaining);
        co_await sleeper.async_wait(boost::asio::use_awaitable);
    }

    logs.drain();
    auto elapsed = since(start);
    state_ = ProbeState::TimedOut;
    spdlog::error("[HealthProbe] {} not ready after {} seconds", handle.name,
                  wholeSeconds(elapsed));
    co_return ProbeResult{TimedOut{elapsed}};
}

Result<void> requireReady(const ProbeResult& result) {
    if (const auto* crashed = std::get_if<Crashed>(&result)) {
        auto message = crashed->reason;
        if (crashed->exitCode) {
            message += fmt::format(" (exit code {})", *crashed->exitCode);
        }
        return Error{ErrorCode::ServiceCrashed, std::move(message)};
    }
    if (const auto* timedOut = std::get_if<TimedOut>(&result)) {
        return Error{ErrorCode::Timeout, fmt::format("Service failed to start after {} seconds.",
                                                     wholeSeconds(timedOut->elapsed))};
    }
    return {};
}

} // namespace dockhand::probe
