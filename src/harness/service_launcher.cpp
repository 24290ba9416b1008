#include <dockhand/harness/service_launcher.h>
#include <dockhand/provision/image_provisioner.h>

#include <spdlog/spdlog.h>

#include <boost/asio/this_coro.hpp>

namespace dockhand::harness {

ServiceHandle::ServiceHandle(supervisor::ContainerLease lease,
                             std::shared_ptr<client::IGenerationClient> client,
                             std::chrono::milliseconds readyAfter)
    : lease_(std::move(lease)), client_(std::move(client)), readyAfter_(readyAfter) {}

ServiceLauncher::ServiceLauncher(HarnessContext& context) : context_(context) {}

boost::asio::awaitable<Result<ServiceHandle>> ServiceLauncher::launch(ServiceSpec spec,
                                                                      LaunchOptions options) {
    const auto& cfg = context_.config();
    const auto port = options.port ? *options.port : context_.pickPort();

    spdlog::info("[ServiceLauncher] launching {} ({}) on port {}", spec.serviceName,
                 spec.modelReference, port);

    provision::ImageProvisioner provisioner(context_.runtime(), cfg.baseImage);
    auto image = provisioner.provision(spec, port);
    if (!image) {
        co_return image.error();
    }

    auto lease = context_.supervisor()->acquire(image.value(), spec, port, cfg.devices);
    if (!lease) {
        co_return lease.error();
    }

    auto ex = co_await boost::asio::this_coro::executor;
    client::TgiClientOptions clientOpts;
    clientOpts.serviceName = spec.serviceName;
    clientOpts.port = port;
    clientOpts.requestTimeout = cfg.requestTimeout;
    auto client = client::makeTgiClient(ex, std::move(clientOpts));

    probe::ProbeOptions probeOpts;
    probeOpts.timeout = options.timeout ? *options.timeout : cfg.probeTimeout;
    probeOpts.pollInterval = options.pollInterval;
    probeOpts.logSink = std::move(options.logSink);

    probe::HealthProbe probe(context_.runtime());
    auto outcome = co_await probe.awaitReady(lease.value().handle(), *client, std::move(probeOpts));
    if (!outcome) {
        co_return outcome.error();
    }
    if (auto ready = probe::requireReady(outcome.value()); !ready) {
        co_return ready.error();
    }

    const auto readyAfter = std::get<probe::Ready>(outcome.value()).elapsed;
    co_return ServiceHandle(std::move(lease).value(), std::move(client), readyAfter);
}

Result<ServiceHandle> ServiceLauncher::launchBlocking(ServiceSpec spec, LaunchOptions options) {
    return context_.runSync(launch(std::move(spec), std::move(options)));
}

} // namespace dockhand::harness
