#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <dockhand/config/harness_config.h>
#include <dockhand/core/types.h>
#include <dockhand/runtime/container_runtime.h>
#include <dockhand/supervisor/container_supervisor.h>

namespace dockhand::harness {

/**
 * Everything one test group shares: configuration, the container runtime,
 * the supervisor that owns container lifetimes, an io_context for the
 * generation clients, and the port generator.
 */
class HarnessContext {
public:
    HarnessContext(config::HarnessConfig config, std::shared_ptr<runtime::IContainerRuntime> runtime,
                   config::EnvLookup env = config::processEnvironment(),
                   std::optional<std::uint32_t> seed = std::nullopt);

    // Docker-backed context for config.runtimeHost
    static Result<std::unique_ptr<HarnessContext>>
    create(config::HarnessConfig config, config::EnvLookup env = config::processEnvironment());

    HarnessContext(const HarnessContext&) = delete;
    HarnessContext& operator=(const HarnessContext&) = delete;

    boost::asio::io_context& io() { return io_; }
    boost::asio::any_io_executor executor() { return io_.get_executor(); }

    const config::HarnessConfig& config() const { return config_; }
    const config::EnvLookup& env() const { return env_; }
    std::shared_ptr<runtime::IContainerRuntime> runtime() const { return runtime_; }
    std::shared_ptr<supervisor::ContainerSupervisor> supervisor() const { return supervisor_; }

    // Uniform in [portMin, portMax]
    std::uint16_t pickPort();

    /**
     * Run a coroutine to completion on this context's io_context. An exception
     * escaping the coroutine comes back as ErrorCode::InternalError.
     */
    template <typename T> Result<T> runSync(boost::asio::awaitable<Result<T>> task) {
        std::optional<Result<T>> out;
        std::exception_ptr failure;
        boost::asio::co_spawn(
            io_,
            [&out, task = std::move(task)]() mutable -> boost::asio::awaitable<void> {
                out.emplace(co_await std::move(task));
            },
            [&failure](std::exception_ptr e) { failure = e; });
        io_.restart();
        io_.run();

        if (failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                return Error{ErrorCode::InternalError, e.what()};
            } catch (...) {
                return Error{ErrorCode::InternalError, "task raised a non-standard exception"};
            }
        }
        if (!out) {
            return Error{ErrorCode::InternalError, "task did not complete"};
        }
        return std::move(*out);
    }

private:
    config::HarnessConfig config_;
    config::EnvLookup env_;
    std::shared_ptr<runtime::IContainerRuntime> runtime_;
    std::shared_ptr<supervisor::ContainerSupervisor> supervisor_;
    boost::asio::io_context io_;
    std::mt19937 rng_;
};

} // namespace dockhand::harness
