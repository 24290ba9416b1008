#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <dockhand/cli/command.h>
#include <dockhand/core/types.h>
#include <dockhand/load/load_harness.h>

namespace dockhand::cli {

/**
 * What `dockhand launch` observed, rendered as text or JSON.
 */
struct LaunchReport {
    std::string serviceName;
    std::string model;
    std::uint16_t port{0};
    std::string containerName;
    std::string image;
    bool ready{false};
    std::chrono::milliseconds readyAfter{0};
    std::optional<load::LoadSummary> load;
    std::vector<std::string> samples;
    std::optional<Error> error;
};

nlohmann::json toJson(const LaunchReport& report);
std::string renderText(const LaunchReport& report);

// 0 only when the service became ready and every load request succeeded
int exitCodeFor(const LaunchReport& report);

std::unique_ptr<ICommand> createLaunchCommand();

} // namespace dockhand::cli
