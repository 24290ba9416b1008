#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <dockhand/core/service_types.h>
#include <dockhand/core/types.h>
#include <dockhand/runtime/container_runtime.h>

namespace dockhand::provision {

// Directory the model is copied to inside a derived image
inline constexpr const char* kContainerModelRoot = "/data";

/**
 * Turns a model reference into a runnable image.
 *
 * Hub references run on the base image as-is. A local model directory is
 * layered into a derived image tagged tgi-tests-{service}-{port}-img, built
 * from a throwaway context directory.
 */
class ImageProvisioner {
public:
    ImageProvisioner(std::shared_ptr<runtime::IContainerRuntime> runtime, std::string baseImage);

    Result<ImageRef> provision(const ServiceSpec& spec, std::uint16_t port) const;

    static bool isLocalModel(std::string_view modelReference);

    // /data/<reference>, with the reference's root stripped
    static std::string containerModelId(std::string_view modelReference);

    static std::string dockerfileFor(std::string_view baseImage, std::string_view containerModelId);

    const std::string& baseImage() const { return baseImage_; }

private:
    std::shared_ptr<runtime::IContainerRuntime> runtime_;
    std::string baseImage_;
};

} // namespace dockhand::provision
