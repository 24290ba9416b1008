#include <dockhand/provision/image_provisioner.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace dockhand::provision {

namespace {

// Build context directory removed on scope exit, whatever the build outcome.
class TemporaryDirectory {
public:
    static Result<TemporaryDirectory> create(std::string_view prefix) {
        std::error_code ec;
        const auto base = fs::temp_directory_path(ec);
        if (ec) {
            return Error{ErrorCode::IoError, "no temporary directory: " + ec.message()};
        }
        std::mt19937_64 rng{std::random_device{}()};
        for (int attempt = 0; attempt < 16; ++attempt) {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            auto candidate = base / (std::string(prefix) + std::to_string(stamp) + "-" +
                                     std::to_string(rng() % 100000));
            if (fs::create_directory(candidate, ec)) {
                return TemporaryDirectory(std::move(candidate));
            }
        }
        return Error{ErrorCode::IoError, "could not create build context under " + base.string()};
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

    ~TemporaryDirectory() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("[ImageProvisioner] failed to remove build context {}: {}",
                         path_.string(), ec.message());
        }
    }

    const fs::path& path() const { return path_; }

private:
    explicit TemporaryDirectory(fs::path path) : path_(std::move(path)) {}
    fs::path path_;
};

} // namespace

ImageProvisioner::ImageProvisioner(std::shared_ptr<runtime::IContainerRuntime> runtime,
                                   std::string baseImage)
    : runtime_(std::move(runtime)), baseImage_(std::move(baseImage)) {}

bool ImageProvisioner::isLocalModel(std::string_view modelReference) {
    if (modelReference.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(fs::path(modelReference), ec);
}

std::string ImageProvisioner::containerModelId(std::string_view modelReference) {
    const fs::path rel = fs::path(modelReference).relative_path();
    return (fs::path(kContainerModelRoot) / rel).lexically_normal().generic_string();
}

std::string ImageProvisioner::dockerfileFor(std::string_view baseImage,
                                            std::string_view containerModelId) {
    return "FROM " + std::string(baseImage) + "\nCOPY model " + std::string(containerModelId) +
           "\n";
}

Result<ImageRef> ImageProvisioner::provision(const ServiceSpec& spec, std::uint16_t port) const {
    if (spec.modelReference.empty()) {
        return Error{ErrorCode::InvalidArgument, "model reference is empty"};
    }

    if (!isLocalModel(spec.modelReference)) {
        ImageRef ref;
        ref.tag = baseImage_;
        ref.isDerived = false;
        ref.modelId = spec.modelReference;
        return ref;
    }

    // Layer the model into its own image so the container does not depend on
    // volumes shared with the host running the tests.
    const auto tag = derivedImageTagFor(spec.serviceName, port);
    spdlog::info("[ImageProvisioner] building image derived from {}, tagged {}", baseImage_, tag);

    auto context = TemporaryDirectory::create("dockhand-build-");
    if (!context) {
        return Error{ErrorCode::ProvisioningFailed, context.error().message};
    }
    const auto& dir = context.value().path();

    std::error_code ec;
    fs::copy(spec.modelReference, dir / "model",
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        return Error{ErrorCode::ProvisioningFailed,
                     "copying model " + spec.modelReference + ": " + ec.message()};
    }

    const auto modelId = containerModelId(spec.modelReference);
    {
        std::ofstream out(dir / "Dockerfile", std::ios::binary | std::ios::trunc);
        out << dockerfileFor(baseImage_, modelId);
        out.flush();
        if (!out) {
            return Error{ErrorCode::ProvisioningFailed, "writing Dockerfile failed"};
        }
    }

    runtime::BuildRequest request;
    request.contextDir = dir;
    request.dockerfile = "Dockerfile";
    request.tag = tag;
    auto built = runtime_->build(request);
    if (!built) {
        spdlog::error("[ImageProvisioner] build of {} failed: {}", tag, built.error().message);
        return Error{ErrorCode::ProvisioningFailed, built.error().message};
    }

    spdlog::info("[ImageProvisioner] successfully built image {}", built.value().imageId);
    for (const auto& line : built.value().logs) {
        spdlog::debug("[ImageProvisioner] build: {}", line);
    }

    ImageRef ref;
    ref.tag = tag;
    ref.isDerived = true;
    ref.builtImageId = built.value().imageId;
    ref.modelId = modelId;
    return ref;
}

} // namespace dockhand::provision
