#pragma once

/*
 * Container runtime abstraction.
 *
 * The harness only needs a narrow slice of a container engine: build an image
 * from a context directory, run a detached container, look it up by name,
 * read its logs incrementally, and stop/wait/remove it. All calls are
 * synchronous and issued from the single controlling coroutine.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <dockhand/core/types.h>

namespace dockhand::runtime {

enum class ContainerStatus { Created, Running, Paused, Restarting, Removing, Exited, Dead, Unknown };

ContainerStatus parseContainerStatus(std::string_view status);
const char* toString(ContainerStatus status);

// A container that is running or has been created may still become ready.
inline bool isAlive(ContainerStatus status) {
    return status == ContainerStatus::Running || status == ContainerStatus::Created;
}

using LogTimestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

struct ContainerInfo {
    std::string id;
    std::string name;
    ContainerStatus status{ContainerStatus::Unknown};
    std::optional<int> exitCode;
};

struct BuildRequest {
    std::filesystem::path contextDir;
    std::string dockerfile{"Dockerfile"};
    std::string tag;
};

struct BuildOutput {
    std::string imageId;
    std::vector<std::string> logs;
};

struct PortMapping {
    std::uint16_t containerPort{80};
    std::string protocol{"tcp"};
    std::uint16_t hostPort{0};
};

struct RunOptions {
    std::string image;
    std::vector<std::string> command;
    std::string name;
    std::map<std::string, std::string> environment;
    std::vector<PortMapping> ports;
    std::vector<std::string> devices;
    std::uint64_t shmSizeBytes{0};
    bool autoRemove{false};
    bool detach{true};
};

struct LogLine {
    LogTimestamp timestamp{};
    std::string text;
};

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    /**
     * Build an image from contextDir and tag it. Fails with ProvisioningFailed
     * when the engine reports a build error.
     */
    virtual Result<BuildOutput> build(const BuildRequest& request) = 0;

    /**
     * Create and start a container. Returns the started container's info.
     */
    virtual Result<ContainerInfo> run(const RunOptions& options) = 0;

    /**
     * Inspect a container by name or id. ErrorCode::NotFound when absent.
     */
    virtual Result<ContainerInfo> get(std::string_view nameOrId) = 0;

    /**
     * Log lines (stdout and stderr) with a timestamp at or after `since`, in
     * emission order.
     */
    virtual Result<std::vector<LogLine>> logs(std::string_view ref, LogTimestamp since) = 0;

    virtual Result<void> stop(std::string_view ref, std::chrono::seconds timeout) = 0;

    /**
     * Block until the container exits or the timeout elapses. Returns the exit code.
     */
    virtual Result<int> wait(std::string_view ref, std::chrono::seconds timeout) = 0;

    virtual Result<void> remove(std::string_view ref, bool force) = 0;
    virtual Result<void> removeImage(std::string_view ref, bool force) = 0;
};

struct DockerRuntimeOptions {
    // unix:///path/to/docker.sock, tcp://host:port or http://host:port
    std::string host{"unix:///var/run/docker.sock"};
    std::chrono::seconds requestTimeout{120};
    std::chrono::seconds buildTimeout{1800};
};

/**
 * Docker Engine API adapter. Talks HTTP over the engine socket with libcurl.
 */
Result<std::shared_ptr<IContainerRuntime>> makeDockerRuntime(const DockerRuntimeOptions& options);

} // namespace dockhand::runtime
