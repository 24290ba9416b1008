/*
 * docker_runtime.cpp
 *
 * Notes
 * - Docker Engine API adapter built on the libcurl easy API.
 * - Unix socket hosts go through CURLOPT_UNIX_SOCKET_PATH; tcp:// hosts are plain HTTP.
 * - Every call is synchronous. Timeouts are per request.
 */

#include <dockhand/runtime/container_runtime.h>
#include <dockhand/runtime/docker_stream.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string_view>

using nlohmann::json;

namespace dockhand::runtime {

ContainerStatus parseContainerStatus(std::string_view status) {
    if (status == "created")
        return ContainerStatus::Created;
    if (status == "running")
        return ContainerStatus::Running;
    if (status == "paused")
        return ContainerStatus::Paused;
    if (status == "restarting")
        return ContainerStatus::Restarting;
    if (status == "removing")
        return ContainerStatus::Removing;
    if (status == "exited")
        return ContainerStatus::Exited;
    if (status == "dead")
        return ContainerStatus::Dead;
    return ContainerStatus::Unknown;
}

const char* toString(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::Created: return "created";
        case ContainerStatus::Running: return "running";
        case ContainerStatus::Paused: return "paused";
        case ContainerStatus::Restarting: return "restarting";
        case ContainerStatus::Removing: return "removing";
        case ContainerStatus::Exited: return "exited";
        case ContainerStatus::Dead: return "dead";
        case ContainerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

namespace {

struct HttpReply {
    long status{0};
    std::string body;
};

size_t collect_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_CONNECT:
            err.code = ErrorCode::ConnectionRefused;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::RuntimeError;
            break;
    }
    return err;
}

// Engine errors come back as {"message": "..."}
std::string engineMessage(const HttpReply& reply) {
    auto j = json::parse(reply.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string()) {
        return j["message"].get<std::string>();
    }
    return reply.body.empty() ? "HTTP " + std::to_string(reply.status) : reply.body;
}

Error engineError(const HttpReply& reply, std::string_view where) {
    ErrorCode code = ErrorCode::RuntimeError;
    if (reply.status == 404) {
        code = ErrorCode::NotFound;
    } else if (reply.status == 409) {
        code = ErrorCode::Conflict;
    }
    return Error{code, std::string(where) + ": " + engineMessage(reply)};
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class DockerRuntime final : public IContainerRuntime {
public:
    DockerRuntime(docker::Endpoint endpoint, DockerRuntimeOptions options)
        : endpoint_(std::move(endpoint)), options_(std::move(options)) {}
    ~DockerRuntime() override = default;

    Result<BuildOutput> build(const BuildRequest& request) override {
        auto tar = docker::archiveDirectory(request.contextDir);
        if (!tar) {
            return Error{ErrorCode::ProvisioningFailed,
                         "build context archive failed: " + tar.error().message};
        }

        std::string path = "/build?rm=1&forcerm=1&dockerfile=" + escape(request.dockerfile);
        if (!request.tag.empty()) {
            path += "&t=" + escape(request.tag);
        }
        spdlog::debug("[DockerRuntime] POST {} ({} bytes of context)", path, tar.value().size());

        auto reply = perform("POST", path, tar.value(), "application/x-tar", options_.buildTimeout);
        if (!reply) {
            return Error{ErrorCode::ProvisioningFailed, reply.error().message};
        }
        if (reply.value().status >= 400) {
            auto err = engineError(reply.value(), "build");
            return Error{ErrorCode::ProvisioningFailed, err.message};
        }
        return docker::parseBuildStream(reply.value().body);
    }

    Result<ContainerInfo> run(const RunOptions& options) override {
        if (!options.detach) {
            return Error{ErrorCode::InvalidArgument, "attached runs are not supported"};
        }

        json env = json::array();
        for (const auto& [k, v] : options.environment) {
            env.push_back(k + "=" + v);
        }

        json exposed = json::object();
        json bindings = json::object();
        for (const auto& p : options.ports) {
            const auto key = std::to_string(p.containerPort) + "/" + p.protocol;
            exposed[key] = json::object();
            bindings[key] = json::array({{{"HostPort", std::to_string(p.hostPort)}}});
        }

        json devices = json::array();
        for (const auto& d : options.devices) {
            devices.push_back(
                {{"PathOnHost", d}, {"PathInContainer", d}, {"CgroupPermissions", "rwm"}});
        }

        json hostConfig = {{"AutoRemove", options.autoRemove},
                           {"PortBindings", bindings},
                           {"Devices", devices}};
        if (options.shmSizeBytes > 0) {
            hostConfig["ShmSize"] = options.shmSizeBytes;
        }

        json body = {{"Image", options.image},
                     {"Cmd", options.command},
                     {"Env", env},
                     {"ExposedPorts", exposed},
                     {"HostConfig", hostConfig}};

        std::string path = "/containers/create";
        if (!options.name.empty()) {
            path += "?name=" + escape(options.name);
        }
        auto created = perform("POST", path, body.dump(), "application/json", options_.requestTimeout);
        if (!created) {
            return created.error();
        }
        if (created.value().status != 201) {
            return engineError(created.value(), "create container");
        }

        auto j = json::parse(created.value().body, nullptr, false);
        if (j.is_discarded() || !j.contains("Id") || !j["Id"].is_string()) {
            return Error{ErrorCode::InvalidData, "create container: response has no Id"};
        }
        const std::string id = j["Id"].get<std::string>();
        if (j.contains("Warnings") && j["Warnings"].is_array()) {
            for (const auto& w : j["Warnings"]) {
                if (w.is_string()) {
                    spdlog::warn("[DockerRuntime] {}", w.get<std::string>());
                }
            }
        }

        auto started = perform("POST", "/containers/" + escape(id) + "/start", "", "",
                               options_.requestTimeout);
        if (!started || (started.value().status != 204 && started.value().status != 304)) {
            Error err = started ? engineError(started.value(), "start container") : started.error();
            // A created but never started container still holds its name
            if (auto r = remove(id, true); !r && r.error().code != ErrorCode::NotFound) {
                spdlog::warn("[DockerRuntime] removing unstarted container {}: {}", id,
                             r.error().message);
            }
            return err;
        }
        return get(id);
    }

    Result<ContainerInfo> get(std::string_view nameOrId) override {
        auto reply = perform("GET", "/containers/" + escape(nameOrId) + "/json", "", "",
                             options_.requestTimeout);
        if (!reply) {
            return reply.error();
        }
        if (reply.value().status != 200) {
            return engineError(reply.value(), "inspect container");
        }

        auto j = json::parse(reply.value().body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return Error{ErrorCode::InvalidData, "inspect container: invalid JSON"};
        }
        ContainerInfo info;
        info.id = j.value("Id", std::string{});
        info.name = j.value("Name", std::string{});
        if (!info.name.empty() && info.name.front() == '/') {
            info.name.erase(0, 1);
        }
        if (j.contains("State") && j["State"].is_object()) {
            const auto& state = j["State"];
            info.status = parseContainerStatus(state.value("Status", std::string{}));
            if (state.contains("ExitCode") && state["ExitCode"].is_number_integer() &&
                !isAlive(info.status)) {
                info.exitCode = state["ExitCode"].get<int>();
            }
        }
        return info;
    }

    Result<std::vector<LogLine>> logs(std::string_view ref, LogTimestamp since) override {
        std::string path = "/containers/" + escape(ref) + "/logs?stdout=1&stderr=1&timestamps=1";
        if (since.time_since_epoch().count() > 0) {
            path += "&since=" + docker::formatSince(since);
        }
        auto reply = perform("GET", path, "", "", options_.requestTimeout);
        if (!reply) {
            return reply.error();
        }
        if (reply.value().status != 200) {
            return engineError(reply.value(), "container logs");
        }

        std::vector<LogLine> out;
        for (const auto& raw : docker::demultiplexLogStream(reply.value().body)) {
            out.push_back(docker::parseTimestampedLine(raw));
        }
        return out;
    }

    Result<void> stop(std::string_view ref, std::chrono::seconds timeout) override {
        // The engine blocks for up to t seconds before killing; leave headroom.
        auto reply = perform("POST",
                             "/containers/" + escape(ref) + "/stop?t=" +
                                 std::to_string(timeout.count()),
                             "", "", timeout + options_.requestTimeout);
        if (!reply) {
            return reply.error();
        }
        // 304: already stopped
        if (reply.value().status != 204 && reply.value().status != 304) {
            return engineError(reply.value(), "stop container");
        }
        return {};
    }

    Result<int> wait(std::string_view ref, std::chrono::seconds timeout) override {
        auto reply = perform("POST", "/containers/" + escape(ref) + "/wait", "", "", timeout);
        if (!reply) {
            return reply.error();
        }
        if (reply.value().status != 200) {
            return engineError(reply.value(), "wait container");
        }
        auto j = json::parse(reply.value().body, nullptr, false);
        if (j.is_discarded() || !j.contains("StatusCode") || !j["StatusCode"].is_number_integer()) {
            return Error{ErrorCode::InvalidData, "wait container: response has no StatusCode"};
        }
        return j["StatusCode"].get<int>();
    }

    Result<void> remove(std::string_view ref, bool force) override {
        auto reply = perform("DELETE",
                             "/containers/" + escape(ref) + (force ? "?force=1" : "?force=0"), "",
                             "", options_.requestTimeout);
        if (!reply) {
            return reply.error();
        }
        if (reply.value().status != 204) {
            return engineError(reply.value(), "remove container");
        }
        return {};
    }

    Result<void> removeImage(std::string_view ref, bool force) override {
        auto reply = perform("DELETE", "/images/" + escape(ref) + (force ? "?force=1" : "?force=0"),
                             "", "", options_.requestTimeout);
        if (!reply) {
            return reply.error();
        }
        if (reply.value().status != 200) {
            return engineError(reply.value(), "remove image");
        }
        return {};
    }

private:
    static std::string escape(std::string_view raw) {
        char* escaped = curl_easy_escape(nullptr, raw.data(), static_cast<int>(raw.size()));
        if (!escaped) {
            return std::string(raw);
        }
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    Result<HttpReply> perform(const char* method, const std::string& path, const std::string& body,
                              const char* contentType, std::chrono::seconds timeout) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        const std::string url = endpoint_.baseUrl + path;
        HttpReply reply;
        curl_slist* headers = nullptr;
        if (contentType && *contentType) {
            headers = curl_slist_append(headers, (std::string("Content-Type: ") + contentType).c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (endpoint_.unixSocket) {
            curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, endpoint_.unixSocket->c_str());
        }
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
        if (std::string_view(method) == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body.size()));
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(std::chrono::milliseconds(timeout).count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);

        if (headers)
            curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            return makeCurlError(rc, std::string(method) + " " + path);
        }
        return reply;
    }

    docker::Endpoint endpoint_;
    DockerRuntimeOptions options_;
};

} // namespace

Result<std::shared_ptr<IContainerRuntime>> makeDockerRuntime(const DockerRuntimeOptions& options) {
    auto endpoint = docker::parseDockerHost(options.host);
    if (!endpoint) {
        return endpoint.error();
    }
    ensureCurlGlobalInit();
    spdlog::debug("[DockerRuntime] using engine at {}", options.host);
    return std::shared_ptr<IContainerRuntime>(
        std::make_shared<DockerRuntime>(std::move(endpoint).value(), options));
}

} // namespace dockhand::runtime
