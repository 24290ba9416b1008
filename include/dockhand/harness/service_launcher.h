#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>

#include <dockhand/client/generation_client.h>
#include <dockhand/core/service_types.h>
#include <dockhand/core/types.h>
#include <dockhand/harness/harness_context.h>
#include <dockhand/probe/health_probe.h>
#include <dockhand/supervisor/container_supervisor.h>

namespace dockhand::harness {

struct LaunchOptions {
    // Defaults to the configured probe timeout
    std::optional<std::chrono::seconds> timeout;
    // Defaults to a random port from the configured range
    std::optional<std::uint16_t> port;
    std::chrono::milliseconds pollInterval{std::chrono::seconds(1)};
    probe::LogSink logSink;
};

/**
 * A ready service: the container lease plus a client bound to it.
 * Destroying (or close()-ing) the handle tears the container down.
 */
class ServiceHandle {
public:
    ServiceHandle(supervisor::ContainerLease lease,
                  std::shared_ptr<client::IGenerationClient> client,
                  std::chrono::milliseconds readyAfter = std::chrono::milliseconds(0));

    ServiceHandle(ServiceHandle&&) noexcept = default;
    ServiceHandle& operator=(ServiceHandle&&) noexcept = default;
    ServiceHandle(const ServiceHandle&) = delete;
    ServiceHandle& operator=(const ServiceHandle&) = delete;

    client::IGenerationClient& client() const { return *client_; }
    std::shared_ptr<client::IGenerationClient> sharedClient() const { return client_; }
    const ContainerHandle& container() const { return lease_.handle(); }
    const ImageRef& image() const { return lease_.image(); }
    bool active() const { return lease_.active(); }
    // Time the health probe waited for the service
    std::chrono::milliseconds readyAfter() const { return readyAfter_; }

    std::optional<supervisor::TeardownReport> close() { return lease_.release(); }

private:
    supervisor::ContainerLease lease_;
    std::shared_ptr<client::IGenerationClient> client_;
    std::chrono::milliseconds readyAfter_{0};
};

/**
 * Provision, start and probe one service. Any failure after the container
 * starts tears it down before the error is returned.
 */
class ServiceLauncher {
public:
    explicit ServiceLauncher(HarnessContext& context);

    boost::asio::awaitable<Result<ServiceHandle>> launch(ServiceSpec spec,
                                                         LaunchOptions options = {});

    // launch() driven to completion on the context's io_context
    Result<ServiceHandle> launchBlocking(ServiceSpec spec, LaunchOptions options = {});

private:
    HarnessContext& context_;
};

} // namespace dockhand::harness
