#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <boost/asio/awaitable.hpp>

#include <dockhand/client/generation_client.h>
#include <dockhand/core/service_types.h>
#include <dockhand/core/types.h>
#include <dockhand/runtime/container_runtime.h>

namespace dockhand::probe {

// Receives container output, one line per call
using LogSink = std::function<void(std::string_view)>;

// Writes to the spdlog logger named "container" (created on first use)
LogSink defaultContainerLogSink();

struct Ready {
    std::chrono::milliseconds elapsed{0};
};

struct Crashed {
    std::string reason;
    std::chrono::milliseconds elapsed{0};
    runtime::ContainerStatus status{runtime::ContainerStatus::Unknown};
    std::optional<int> exitCode;
};

struct TimedOut {
    std::chrono::milliseconds elapsed{0};
};

// Terminal outcome of a probe run
using ProbeResult = std::variant<Ready, Crashed, TimedOut>;

enum class ProbeState { Polling, Ready, Crashed, TimedOut };

const char* toString(ProbeState state);
ProbeState stateOf(const ProbeResult& result);

struct ProbeOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds pollInterval{std::chrono::seconds(1)};
    LogSink logSink;
};

/**
 * Forwards container output incrementally. The watermark is the timestamp of
 * the newest line forwarded so far; each drain forwards only lines past it.
 */
class ContainerLogForwarder {
public:
    ContainerLogForwarder(runtime::IContainerRuntime& runtime, std::string ref, LogSink sink);

    // Returns the number of lines forwarded by this call
    std::size_t drain();

    runtime::LogTimestamp watermark() const { return watermark_; }

private:
    runtime::IContainerRuntime& runtime_;
    std::string ref_;
    LogSink sink_;
    runtime::LogTimestamp watermark_{};
};

/**
 * Polls a started container until it answers a minimal generation request.
 *
 * Each attempt first checks container status (a container that is neither
 * running nor created is reported Crashed at once), then sends one request.
 * Connection refused/reset/disconnected means "not yet": the probe sleeps one
 * poll interval and retries. Any other request error fails the probe with
 * ErrorCode::ProbeFailed. Wall-clock time is capped at options.timeout.
 */
class HealthProbe {
public:
    explicit HealthProbe(std::shared_ptr<runtime::IContainerRuntime> runtime);

    boost::asio::awaitable<Result<ProbeResult>> awaitReady(const ContainerHandle& handle,
                                                           client::IGenerationClient& client,
                                                           ProbeOptions options);

    ProbeState state() const { return state_; }
    std::size_t attempts() const { return attempts_; }

private:
    std::shared_ptr<runtime::IContainerRuntime> runtime_;
    ProbeState state_{ProbeState::Polling};
    std::size_t attempts_{0};
};

/**
 * Turn a probe outcome into the caller-facing error: ServiceCrashed or
 * Timeout, with the elapsed wait in the message.
 */
Result<void> requireReady(const ProbeResult& result);

} // namespace dockhand::probe
