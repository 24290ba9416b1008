#include <dockhand/supervisor/container_supervisor.h>
#include <dockhand/supervisor/environment.h>

#include <spdlog/spdlog.h>

namespace dockhand::supervisor {

ContainerSupervisor::ContainerSupervisor(std::shared_ptr<runtime::IContainerRuntime> runtime,
                                         SupervisorOptions options)
    : runtime_(std::move(runtime)), options_(std::move(options)) {}

void ContainerSupervisor::clearStaleContainer(const std::string& name) {
    auto existing = runtime_->get(name);
    if (!existing) {
        if (existing.error().code != ErrorCode::NotFound) {
            spdlog::warn("[ContainerSupervisor] could not inspect {}: {}", name,
                         existing.error().message);
        }
        return;
    }

    spdlog::warn("[ContainerSupervisor] found stale container {} ({}), removing it", name,
                 runtime::toString(existing.value().status));
    const auto& ref = existing.value().id.empty() ? name : existing.value().id;
    if (auto r = runtime_->stop(ref, options_.stopTimeout); !r && r.error() != ErrorCode::NotFound) {
        spdlog::warn("[ContainerSupervisor] stopping stale {}: {}", name, r.error().message);
    }
    if (auto r = runtime_->wait(ref, options_.stopTimeout); !r && r.error() != ErrorCode::NotFound) {
        spdlog::warn("[ContainerSupervisor] waiting for stale {}: {}", name, r.error().message);
    }
    if (auto r = runtime_->remove(ref, true); !r && r.error() != ErrorCode::NotFound) {
        spdlog::warn("[ContainerSupervisor] removing stale {}: {}", name, r.error().message);
    }
}

Result<ContainerHandle> ContainerSupervisor::start(const ImageRef& image, const ServiceSpec& spec,
                                                   std::uint16_t port,
                                                   const std::vector<std::string>& devices) {
    if (spec.serviceName.empty()) {
        return Error{ErrorCode::InvalidArgument, "service name is empty"};
    }
    if (port == 0) {
        return Error{ErrorCode::InvalidArgument, "port must be non-zero"};
    }

    const auto name = containerNameFor(spec.serviceName, port);
    clearStaleContainer(name);

    runtime::RunOptions run;
    run.image = image.tag;
    run.command = composeCommand(image, spec);
    run.name = name;
    run.environment =
        composeEnvironment(options_.env, resolveHubToken(options_.env), options_.cacheRepo,
                           spec.extraEnv);
    run.ports.push_back(runtime::PortMapping{80, "tcp", port});
    run.devices = devices;
    run.shmSizeBytes = options_.shmSizeBytes;
    run.autoRemove = false;
    run.detach = true;

    auto started = runtime_->run(run);
    if (!started) {
        spdlog::error("[ContainerSupervisor] failed to start {}: {}", name,
                      started.error().message);
        if (auto r = runtime_->remove(name, true); !r && r.error().code != ErrorCode::NotFound) {
            spdlog::warn("[ContainerSupervisor] removing half-started {}: {}", name,
                         r.error().message);
        }
        return started.error();
    }

    spdlog::info("[ContainerSupervisor] Starting {} container", name);
    ContainerHandle handle;
    handle.name = name;
    handle.port = port;
    handle.runtimeRef = started.value().id.empty() ? name : started.value().id;
    return handle;
}

Result<ContainerLease> ContainerSupervisor::acquire(const ImageRef& image, const ServiceSpec& spec,
                                                    std::uint16_t port,
                                                    const std::vector<std::string>& devices) {
    auto handle = start(image, spec, port, devices);
    if (!handle) {
        if (image.isDerived) {
            TeardownReport unused;
            removeImageQuietly(image, unused);
        }
        return handle.error();
    }
    return ContainerLease(shared_from_this(), std::move(handle).value(), image);
}

void ContainerSupervisor::removeImageQuietly(const ImageRef& image,
                                             TeardownReport& report) noexcept {
    const auto& id = image.builtImageId ? *image.builtImageId : image.tag;
    report.imageRemovalAttempted = true;
    try {
        spdlog::info("[ContainerSupervisor] Cleaning image {}", id);
        auto r = runtime_->removeImage(id, true);
        if (!r) {
            report.removeImage = r.error().code;
            if (r.error().code != ErrorCode::NotFound) {
                spdlog::error("[ContainerSupervisor] Error while removing image {}, skipping: {}",
                              id, r.error().message);
            }
        }
    } catch (const std::exception& e) {
        report.removeImage = ErrorCode::InternalError;
        spdlog::error("[ContainerSupervisor] Error while removing image {}, skipping: {}", id,
                      e.what());
    }
}

TeardownReport ContainerSupervisor::stopAndRemove(const ContainerHandle& handle,
                                                  const ImageRef& image) noexcept {
    TeardownReport report;
    const auto& ref = handle.runtimeRef.empty() ? handle.name : handle.runtimeRef;

    try {
        if (auto r = runtime_->stop(ref, options_.stopTimeout); !r) {
            report.stop = r.error().code;
            spdlog::warn("[ContainerSupervisor] Ignoring error while stopping container {}: {}",
                         handle.name, r.error().message);
        }
    } catch (const std::exception& e) {
        report.stop = ErrorCode::InternalError;
        spdlog::warn("[ContainerSupervisor] Ignoring exception while stopping container {}: {}",
                     handle.name, e.what());
    }

    try {
        if (auto r = runtime_->wait(ref, options_.stopTimeout); !r) {
            report.wait = r.error().code;
            spdlog::warn("[ContainerSupervisor] Ignoring error while waiting for container {}: {}",
                         handle.name, r.error().message);
        }
    } catch (const std::exception& e) {
        report.wait = ErrorCode::InternalError;
        spdlog::warn("[ContainerSupervisor] Ignoring exception while waiting for container {}: {}",
                     handle.name, e.what());
    }

    try {
        spdlog::info("[ContainerSupervisor] Removing container {}", handle.name);
        if (auto r = runtime_->remove(ref, true); !r) {
            report.removeContainer = r.error().code;
            if (r.error().code != ErrorCode::NotFound) {
                spdlog::error("[ContainerSupervisor] Error while removing container {}, "
                              "skipping: {}",
                              handle.name, r.error().message);
            }
        }
    } catch (const std::exception& e) {
        report.removeContainer = ErrorCode::InternalError;
        spdlog::error("[ContainerSupervisor] Error while removing container {}, skipping: {}",
                      handle.name, e.what());
    }

    if (image.isDerived) {
        removeImageQuietly(image, report);
    }
    return report;
}

// --- ContainerLease ---

ContainerLease::ContainerLease(std::shared_ptr<ContainerSupervisor> supervisor,
                               ContainerHandle handle, ImageRef image)
    : supervisor_(std::move(supervisor)), handle_(std::move(handle)), image_(std::move(image)) {}

ContainerLease::~ContainerLease() {
    release();
}

ContainerLease::ContainerLease(ContainerLease&& other) noexcept
    : supervisor_(std::move(other.supervisor_)), handle_(std::move(other.handle_)),
      image_(std::move(other.image_)) {
    other.supervisor_.reset();
}

ContainerLease& ContainerLease::operator=(ContainerLease&& other) noexcept {
    if (this != &other) {
        release();
        supervisor_ = std::move(other.supervisor_);
        handle_ = std::move(other.handle_);
        image_ = std::move(other.image_);
        other.supervisor_.reset();
    }
    return *this;
}

std::optional<TeardownReport> ContainerLease::release() noexcept {
    if (!supervisor_) {
        return std::nullopt;
    }
    auto supervisor = std::move(supervisor_);
    supervisor_.reset();
    return supervisor->stopAndRemove(handle_, image_);
}

} // namespace dockhand::supervisor
