#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <dockhand/config/config_helpers.h>
#include <dockhand/core/service_types.h>
#include <dockhand/core/types.h>
#include <dockhand/runtime/container_runtime.h>

namespace dockhand::supervisor {

struct SupervisorOptions {
    std::string cacheRepo;
    std::uint64_t shmSizeBytes{1024ull * 1024ull * 1024ull};
    // Bound for stop and for wait, applied to each separately
    std::chrono::seconds stopTimeout{60};
    // Source of forwarded variables and of the hub token
    config::EnvLookup env;
};

/**
 * Outcome of each teardown step. Diagnostic only: teardown always runs every
 * step and never reports failure to the caller. Success means the step
 * completed, NotFound that the object was already gone.
 */
struct TeardownReport {
    ErrorCode stop{ErrorCode::Success};
    ErrorCode wait{ErrorCode::Success};
    ErrorCode removeContainer{ErrorCode::Success};
    bool imageRemovalAttempted{false};
    ErrorCode removeImage{ErrorCode::Success};

    bool clean() const {
        auto ok = [](ErrorCode c) { return c == ErrorCode::Success || c == ErrorCode::NotFound; };
        return ok(stop) && ok(wait) && ok(removeContainer) && ok(removeImage);
    }
};

class ContainerLease;

/**
 * Sole owner of mutating runtime calls for the containers it starts.
 */
class ContainerSupervisor : public std::enable_shared_from_this<ContainerSupervisor> {
public:
    ContainerSupervisor(std::shared_ptr<runtime::IContainerRuntime> runtime,
                        SupervisorOptions options);

    /**
     * Start tgi-tests-{service}-{port} from image. A stale container with the
     * same name (left by an aborted run) is stopped and removed first.
     */
    Result<ContainerHandle> start(const ImageRef& image, const ServiceSpec& spec,
                                  std::uint16_t port, const std::vector<std::string>& devices);

    /**
     * start() wrapped in a lease whose destruction tears the container down.
     * On failure a derived image is removed before returning.
     */
    Result<ContainerLease> acquire(const ImageRef& image, const ServiceSpec& spec,
                                   std::uint16_t port, const std::vector<std::string>& devices);

    // Best-effort and total: stop, wait, remove container, remove derived image.
    TeardownReport stopAndRemove(const ContainerHandle& handle, const ImageRef& image) noexcept;

    runtime::IContainerRuntime& runtime() { return *runtime_; }
    const SupervisorOptions& options() const { return options_; }

private:
    void clearStaleContainer(const std::string& name);
    void removeImageQuietly(const ImageRef& image, TeardownReport& report) noexcept;

    std::shared_ptr<runtime::IContainerRuntime> runtime_;
    SupervisorOptions options_;
};

/**
 * Scope-bound ownership of a started container. Teardown runs exactly once:
 * on release() or on destruction, whichever comes first.
 */
class ContainerLease {
public:
    ContainerLease() = default;
    ContainerLease(std::shared_ptr<ContainerSupervisor> supervisor, ContainerHandle handle,
                   ImageRef image);
    ~ContainerLease();

    ContainerLease(const ContainerLease&) = delete;
    ContainerLease& operator=(const ContainerLease&) = delete;
    ContainerLease(ContainerLease&& other) noexcept;
    ContainerLease& operator=(ContainerLease&& other) noexcept;

    bool active() const noexcept { return supervisor_ != nullptr; }
    const ContainerHandle& handle() const noexcept { return handle_; }
    const ImageRef& image() const noexcept { return image_; }

    // Tear down now. Returns nothing if the lease was already released.
    std::optional<TeardownReport> release() noexcept;

private:
    std::shared_ptr<ContainerSupervisor> supervisor_;
    ContainerHandle handle_;
    ImageRef image_;
};

} // namespace dockhand::supervisor
