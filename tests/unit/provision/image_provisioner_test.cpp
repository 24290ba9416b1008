// ImageProvisioner: hub references vs local model directories

#include <catch2/catch_test_macros.hpp>

#include <dockhand/provision/image_provisioner.h>

#include "../../common/fake_container_runtime.h"
#include "../../common/test_helpers_catch2.h"

using namespace dockhand;
using namespace dockhand::provision;
using dockhand::test::FakeContainerRuntime;
using dockhand::test::TempDir;
using dockhand::test::write_file;

TEST_CASE("hub references run on the base image", "[provision]") {
    auto runtime = std::make_shared<FakeContainerRuntime>();
    ImageProvisioner provisioner(runtime, "neuronx-tgi:latest");

    ServiceSpec spec{"gpt2", "gpt2", false, {}};
    auto image = provisioner.provision(spec, 8123);
    REQUIRE(image);
    CHECK(image.value().tag == "neuronx-tgi:latest");
    CHECK_FALSE(image.value().isDerived);
    CHECK_FALSE(image.value().builtImageId);
    CHECK(image.value().modelId == "gpt2");
    CHECK(runtime->builds.empty());
}

TEST_CASE("local model directories get a derived image", "[provision]") {
    TempDir model("dockhand_model_");
    write_file(model.path() / "config.json", R"({"model_type": "gpt2"})");
    write_file(model.path() / "tokenizer" / "vocab.json", "{}");

    auto runtime = std::make_shared<FakeContainerRuntime>();
    ImageProvisioner provisioner(runtime, "neuronx-tgi:latest");

    ServiceSpec spec{"local-gpt2", model.path().string(), false, {}};
    auto image = provisioner.provision(spec, 8765);
    REQUIRE(image);

    const auto& ref = image.value();
    CHECK(ref.isDerived);
    CHECK(ref.tag == "tgi-tests-local-gpt2-8765-img");
    CHECK(ref.tag.find("local-gpt2") != std::string::npos);
    CHECK(ref.tag.find("8765") != std::string::npos);
    REQUIRE(ref.builtImageId);
    CHECK(ref.modelId == ImageProvisioner::containerModelId(model.path().string()));
    CHECK(ref.modelId.rfind("/data/", 0) == 0);

    REQUIRE(runtime->builds.size() == 1);
    const auto& build = runtime->builds.front();
    CHECK(build.contextExisted);
    CHECK(build.request.tag == ref.tag);
    CHECK(build.dockerfile == "FROM neuronx-tgi:latest\nCOPY model " + ref.modelId + "\n");
    CHECK(build.files.count("Dockerfile") == 1);
    CHECK(build.files.count("model/config.json") == 1);
    CHECK(build.files.count("model/tokenizer/vocab.json") == 1);

    // The build context is gone once provisioning returns
    CHECK_FALSE(std::filesystem::exists(build.request.contextDir));
}

TEST_CASE("build failures surface as ProvisioningFailed", "[provision]") {
    TempDir model("dockhand_model_");
    write_file(model.path() / "config.json", "{}");

    auto runtime = std::make_shared<FakeContainerRuntime>();
    runtime->buildError = Error{ErrorCode::ProvisioningFailed, "image build failed: no space left"};
    ImageProvisioner provisioner(runtime, "neuronx-tgi:latest");

    auto image = provisioner.provision(ServiceSpec{"svc", model.path().string(), false, {}}, 9000);
    REQUIRE_FALSE(image);
    CHECK(image.error().code == ErrorCode::ProvisioningFailed);
    CHECK(image.error().message.find("no space left") != std::string::npos);

    REQUIRE(runtime->builds.size() == 1);
    CHECK_FALSE(std::filesystem::exists(runtime->builds.front().request.contextDir));
    CHECK(runtime->runs.empty());
}

TEST_CASE("provisioner helpers", "[provision]") {
    CHECK(ImageProvisioner::containerModelId("/home/user/models/gpt2") ==
          "/data/home/user/models/gpt2");
    CHECK(ImageProvisioner::containerModelId("models/./gpt2/") == "/data/models/gpt2/");
    CHECK(ImageProvisioner::dockerfileFor("base:1", "/data/m") == "FROM base:1\nCOPY model /data/m\n");
    CHECK_FALSE(ImageProvisioner::isLocalModel("gpt2"));
    CHECK_FALSE(ImageProvisioner::isLocalModel(""));

    TempDir dir;
    CHECK(ImageProvisioner::isLocalModel(dir.path().string()));

    auto runtime = std::make_shared<FakeContainerRuntime>();
    ImageProvisioner provisioner(runtime, "base:1");
    auto empty = provisioner.provision(ServiceSpec{"svc", "", false, {}}, 9000);
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
}
