#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dockhand {

/**
 * What to launch: a named test configuration and the model it serves.
 * modelReference is either a hub model id ("gpt2") or a local directory.
 */
struct ServiceSpec {
    std::string serviceName;
    std::string modelReference;
    bool trustRemoteCode{false};
    std::map<std::string, std::string> extraEnv;
};

/**
 * Image a container is started from. Derived images are built for one run and
 * removed at teardown; base images are never removed.
 */
struct ImageRef {
    std::string tag;
    bool isDerived{false};
    std::optional<std::string> builtImageId;
    // Model id passed to the launched process (--model-id)
    std::string modelId;
};

struct ContainerHandle {
    std::string name;
    std::uint16_t port{0};
    std::string runtimeRef;
};

inline std::string containerNameFor(std::string_view serviceName, std::uint16_t port) {
    return "tgi-tests-" + std::string(serviceName) + "-" + std::to_string(port);
}

inline std::string derivedImageTagFor(std::string_view serviceName, std::uint16_t port) {
    return containerNameFor(serviceName, port) + "-img";
}

} // namespace dockhand
