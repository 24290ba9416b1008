#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <dockhand/config/config_helpers.h>
#include <dockhand/core/types.h>

namespace dockhand::config {

inline constexpr const char* kDefaultBaseImage = "neuronx-tgi:latest";
inline constexpr const char* kDefaultRuntimeHost = "unix:///var/run/docker.sock";
inline constexpr const char* kDefaultCacheRepo = "optimum/neuron-testing-cache";

/**
 * Resolved harness configuration.
 *
 * Resolution order for every field: environment, then config file, then the
 * defaults below.
 */
struct HarnessConfig {
    std::string baseImage{kDefaultBaseImage};
    std::string runtimeHost{kDefaultRuntimeHost};
    std::string cacheRepo{kDefaultCacheRepo};
    std::vector<std::string> devices{"/dev/neuron0"};
    std::uint64_t shmSizeBytes{1024ull * 1024ull * 1024ull};
    std::chrono::seconds stopTimeout{60};
    std::chrono::seconds probeTimeout{60};
    std::chrono::seconds requestTimeout{300};
    std::uint16_t portMin{8000};
    std::uint16_t portMax{10000};
};

/**
 * Build a HarnessConfig from the environment and an optional config file.
 * When configPath is empty, DOCKHAND_CONFIG or the standard config path is used.
 * A missing config file is not an error; a malformed value is.
 */
Result<HarnessConfig> loadHarnessConfig(const EnvLookup& env = processEnvironment(),
                                        const std::filesystem::path& configPath = {});

} // namespace dockhand::config
