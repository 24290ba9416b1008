#include <dockhand/harness/harness_context.h>

#include <spdlog/spdlog.h>

namespace dockhand::harness {

HarnessContext::HarnessContext(config::HarnessConfig config,
                               std::shared_ptr<runtime::IContainerRuntime> runtime,
                               config::EnvLookup env, std::optional<std::uint32_t> seed)
    : config_(std::move(config)), env_(std::move(env)), runtime_(std::move(runtime)),
      rng_(seed ? *seed : std::random_device{}()) {
    supervisor::SupervisorOptions opts;
    opts.cacheRepo = config_.cacheRepo;
    opts.shmSizeBytes = config_.shmSizeBytes;
    opts.stopTimeout = config_.stopTimeout;
    opts.env = env_;
    supervisor_ = std::make_shared<supervisor::ContainerSupervisor>(runtime_, std::move(opts));
}

Result<std::unique_ptr<HarnessContext>> HarnessContext::create(config::HarnessConfig config,
                                                               config::EnvLookup env) {
    runtime::DockerRuntimeOptions opts;
    opts.host = config.runtimeHost;
    auto runtime = runtime::makeDockerRuntime(opts);
    if (!runtime) {
        spdlog::error("[HarnessContext] cannot reach container runtime at {}: {}", opts.host,
                      runtime.error().message);
        return runtime.error();
    }
    return std::make_unique<HarnessContext>(std::move(config), std::move(runtime).value(),
                                            std::move(env));
}

std::uint16_t HarnessContext::pickPort() {
    std::uniform_int_distribution<int> dist(config_.portMin, config_.portMax);
    return static_cast<std::uint16_t>(dist(rng_));
}

} // namespace dockhand::harness
