// ContainerSupervisor start/teardown and ContainerLease ownership

#include <catch2/catch_test_macros.hpp>

#include <dockhand/supervisor/container_supervisor.h>

#include "../../common/fake_container_runtime.h"
#include "../../common/test_helpers_catch2.h"

using namespace dockhand;
using namespace dockhand::supervisor;
using dockhand::test::FakeContainerRuntime;
using dockhand::test::map_env;

namespace {

struct SupervisorFixture {
    std::shared_ptr<FakeContainerRuntime> runtime = std::make_shared<FakeContainerRuntime>();
    std::shared_ptr<ContainerSupervisor> supervisor;

    explicit SupervisorFixture(config::EnvLookup env = map_env({})) {
        SupervisorOptions opts;
        opts.cacheRepo = "optimum/neuron-testing-cache";
        opts.shmSizeBytes = 1024ull * 1024ull * 1024ull;
        opts.stopTimeout = std::chrono::seconds(5);
        opts.env = std::move(env);
        supervisor = std::make_shared<ContainerSupervisor>(runtime, opts);
    }

    static ImageRef hubImage() {
        ImageRef image;
        image.tag = "neuronx-tgi:latest";
        image.modelId = "gpt2";
        return image;
    }
};

const std::vector<std::string> kDevices{"/dev/neuron0"};

} // namespace

TEST_CASE("start launches a named, port-mapped container", "[supervisor]") {
    SupervisorFixture f(map_env({{"HF_TOKEN", "tok"}, {"HF_BATCH_SIZE", "2"}}));
    ServiceSpec spec{"gpt2", "gpt2", true, {}};

    auto handle = f.supervisor->start(SupervisorFixture::hubImage(), spec, 8123, kDevices);
    REQUIRE(handle);
    CHECK(handle.value().name == "tgi-tests-gpt2-8123");
    CHECK(handle.value().port == 8123);
    CHECK_FALSE(handle.value().runtimeRef.empty());

    REQUIRE(f.runtime->runs.size() == 1);
    const auto& run = f.runtime->runs.front();
    CHECK(run.image == "neuronx-tgi:latest");
    CHECK(run.name == "tgi-tests-gpt2-8123");
    CHECK(run.command ==
          std::vector<std::string>{"--model-id", "gpt2", "--env", "--trust-remote-code"});
    REQUIRE(run.ports.size() == 1);
    CHECK(run.ports[0].containerPort == 80);
    CHECK(run.ports[0].protocol == "tcp");
    CHECK(run.ports[0].hostPort == 8123);
    CHECK(run.devices == kDevices);
    CHECK(run.shmSizeBytes == 1024ull * 1024ull * 1024ull);
    CHECK(run.detach);
    CHECK(run.environment.at("HF_TOKEN") == "tok");
    CHECK(run.environment.at("HUGGING_FACE_HUB_TOKEN") == "tok");
    CHECK(run.environment.at("HF_BATCH_SIZE") == "2");
    CHECK(run.environment.count("HF_SEQUENCE_LENGTH") == 0);
}

TEST_CASE("start clears a stale container with the same name", "[supervisor]") {
    SupervisorFixture f;
    f.runtime->addContainer("tgi-tests-gpt2-8123", runtime::ContainerStatus::Running);

    auto handle =
        f.supervisor->start(SupervisorFixture::hubImage(), ServiceSpec{"gpt2", "gpt2", false, {}},
                            8123, kDevices);
    REQUIRE(handle);
    CHECK(f.runtime->countCalls("stop:") == 1);
    CHECK(f.runtime->countCalls("wait:") == 1);
    CHECK(f.runtime->countCalls("remove:") == 1);
    CHECK(f.runtime->hasContainer("tgi-tests-gpt2-8123"));
}

TEST_CASE("start validates its inputs", "[supervisor]") {
    SupervisorFixture f;
    auto noName = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE_FALSE(noName);
    CHECK(noName.error().code == ErrorCode::InvalidArgument);

    auto noPort = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"gpt2", "gpt2", false, {}}, 0, kDevices);
    REQUIRE_FALSE(noPort);
    CHECK(f.runtime->runs.empty());
}

TEST_CASE("stopAndRemove runs every step in order", "[supervisor]") {
    SupervisorFixture f;
    auto handle = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"gpt2", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE(handle);
    f.runtime->calls.clear();

    auto report = f.supervisor->stopAndRemove(handle.value(), SupervisorFixture::hubImage());
    CHECK(report.clean());
    CHECK_FALSE(report.imageRemovalAttempted);
    CHECK_FALSE(f.runtime->hasContainer("tgi-tests-gpt2-8123"));

    REQUIRE(f.runtime->calls.size() == 3);
    CHECK(f.runtime->calls[0].rfind("stop:", 0) == 0);
    CHECK(f.runtime->calls[1].rfind("wait:", 0) == 0);
    CHECK(f.runtime->calls[2].rfind("remove:", 0) == 0);
}

TEST_CASE("teardown of an already-removed container does not throw", "[supervisor]") {
    SupervisorFixture f;
    auto handle = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"gpt2", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE(handle);
    REQUIRE(f.runtime->remove(handle.value().runtimeRef, true));

    TeardownReport report;
    REQUIRE_NOTHROW(report = f.supervisor->stopAndRemove(handle.value(),
                                                         SupervisorFixture::hubImage()));
    CHECK(report.stop == ErrorCode::NotFound);
    CHECK(report.wait == ErrorCode::NotFound);
    CHECK(report.removeContainer == ErrorCode::NotFound);
    CHECK(report.clean());
    CHECK(f.runtime->containers.empty());

    // A second teardown is just as quiet
    REQUIRE_NOTHROW(f.supervisor->stopAndRemove(handle.value(), SupervisorFixture::hubImage()));
}

TEST_CASE("teardown continues past failing steps", "[supervisor]") {
    SupervisorFixture f;
    auto handle = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"gpt2", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE(handle);
    f.runtime->stopError = Error{ErrorCode::RuntimeError, "engine hiccup"};

    auto report = f.supervisor->stopAndRemove(handle.value(), SupervisorFixture::hubImage());
    CHECK(report.stop == ErrorCode::RuntimeError);
    CHECK_FALSE(report.clean());
    CHECK(f.runtime->countCalls("wait:") == 1);
    CHECK(f.runtime->countCalls("remove:") == 1);
    CHECK_FALSE(f.runtime->hasContainer("tgi-tests-gpt2-8123"));
}

TEST_CASE("derived images are removed at teardown", "[supervisor]") {
    SupervisorFixture f;
    f.runtime->images.insert("tgi-tests-local-8123-img");

    ImageRef image;
    image.tag = "tgi-tests-local-8123-img";
    image.isDerived = true;
    image.modelId = "/data/models/local";

    auto handle = f.supervisor->start(image, ServiceSpec{"local", "/models/local", false, {}},
                                      8123, kDevices);
    REQUIRE(handle);
    auto report = f.supervisor->stopAndRemove(handle.value(), image);
    CHECK(report.imageRemovalAttempted);
    CHECK(report.removeImage == ErrorCode::Success);
    CHECK(f.runtime->images.empty());

    // Already gone: NotFound, still clean
    auto again = f.supervisor->stopAndRemove(handle.value(), image);
    CHECK(again.removeImage == ErrorCode::NotFound);
    CHECK(again.clean());
}

TEST_CASE("ContainerLease tears down exactly once", "[supervisor][lease]") {
    SupervisorFixture f;
    ServiceSpec spec{"gpt2", "gpt2", false, {}};

    SECTION("on scope exit") {
        {
            auto lease = f.supervisor->acquire(SupervisorFixture::hubImage(), spec, 8123, kDevices);
            REQUIRE(lease);
            CHECK(lease.value().active());
            CHECK(f.runtime->hasContainer("tgi-tests-gpt2-8123"));
        }
        CHECK_FALSE(f.runtime->hasContainer("tgi-tests-gpt2-8123"));
        CHECK(f.runtime->countCalls("stop:") == 1);
    }

    SECTION("explicit release, then destruction") {
        {
            auto lease = f.supervisor->acquire(SupervisorFixture::hubImage(), spec, 8123, kDevices);
            REQUIRE(lease);
            auto first = lease.value().release();
            REQUIRE(first);
            CHECK(first->clean());
            CHECK_FALSE(lease.value().active());
            CHECK_FALSE(lease.value().release());
        }
        CHECK(f.runtime->countCalls("stop:") == 1);
        CHECK(f.runtime->countCalls("remove:") == 1);
    }

    SECTION("moved leases transfer ownership") {
        {
            auto lease = f.supervisor->acquire(SupervisorFixture::hubImage(), spec, 8123, kDevices);
            REQUIRE(lease);
            ContainerLease moved = std::move(lease).value();
            CHECK(moved.active());
            CHECK(moved.handle().name == "tgi-tests-gpt2-8123");
        }
        CHECK(f.runtime->countCalls("stop:") == 1);
    }
}

TEST_CASE("acquire removes a derived image when the container fails to start", "[supervisor]") {
    SupervisorFixture f;
    f.runtime->images.insert("tgi-tests-local-9000-img");
    f.runtime->runError = Error{ErrorCode::RuntimeError, "no such device /dev/neuron0"};

    ImageRef image;
    image.tag = "tgi-tests-local-9000-img";
    image.isDerived = true;

    auto lease = f.supervisor->acquire(image, ServiceSpec{"local", "/m", false, {}}, 9000, kDevices);
    REQUIRE_FALSE(lease);
    CHECK(lease.error().code == ErrorCode::RuntimeError);
    CHECK(f.runtime->images.empty());
}

TEST_CASE("a container created but not started is removed", "[supervisor]") {
    SupervisorFixture f;
    f.runtime->startError =
        Error{ErrorCode::RuntimeError, "error gathering device information while adding custom "
                                       "device \"/dev/neuron0\": no such file or directory"};

    auto lease = f.supervisor->acquire(SupervisorFixture::hubImage(),
                                       ServiceSpec{"gpt2", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE_FALSE(lease);
    CHECK(lease.error().code == ErrorCode::RuntimeError);
    CHECK(f.runtime->countCalls("remove:") == 1);
    CHECK_FALSE(f.runtime->hasContainer("tgi-tests-gpt2-8123"));
    CHECK(f.runtime->countCalls("removeImage:") == 0);
}

TEST_CASE("a failed run with nothing created keeps the original error", "[supervisor]") {
    SupervisorFixture f;
    f.runtime->runError = Error{ErrorCode::NotFound, "no such image: neuronx-tgi:latest"};

    auto handle = f.supervisor->start(SupervisorFixture::hubImage(),
                                      ServiceSpec{"gpt2", "gpt2", false, {}}, 8123, kDevices);
    REQUIRE_FALSE(handle);
    CHECK(handle.error().code == ErrorCode::NotFound);
    CHECK(f.runtime->countCalls("remove:") == 1);
    CHECK(f.runtime->containers.empty());
}
