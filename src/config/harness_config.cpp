#include <dockhand/config/harness_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>

namespace dockhand::config {

namespace {

class ValueSource {
public:
    ValueSource(const EnvLookup& env, std::filesystem::path configPath)
        : env_(env), configPath_(std::move(configPath)) {}

    std::optional<std::string> get(std::string_view envName, const std::string& section,
                                   const std::string& key) const {
        if (env_) {
            if (auto v = env_(envName)) {
                return v;
            }
        }
        if (!configPath_.empty()) {
            auto v = parse_config_value(configPath_, section, key);
            if (!v.empty()) {
                return v;
            }
        }
        return std::nullopt;
    }

private:
    const EnvLookup& env_;
    std::filesystem::path configPath_;
};

template <typename T> Result<T> parseUnsigned(const std::string& raw, const char* what) {
    std::string s = raw;
    trim(s);
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return Error{ErrorCode::InvalidArgument, std::string("invalid ") + what + ": '" + raw + "'"};
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return Error{ErrorCode::InvalidArgument, std::string(what) + " out of range: " + raw};
    }
    return static_cast<T>(v);
}

Result<std::chrono::seconds> parseSeconds(const std::string& raw, const char* what) {
    auto v = parseUnsigned<std::uint32_t>(raw, what);
    if (!v) {
        return v.error();
    }
    return std::chrono::seconds(v.value());
}

} // namespace

Result<HarnessConfig> loadHarnessConfig(const EnvLookup& env,
                                        const std::filesystem::path& configPath) {
    std::filesystem::path path = configPath;
    if (path.empty()) {
        if (env) {
            if (auto p = env("DOCKHAND_CONFIG")) {
                path = expand_tilde(*p);
            }
        }
        if (path.empty()) {
            path = get_config_path();
        }
    }

    std::error_code ec;
    if (!path.empty() && !std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] no config file at {}", path.string());
        path.clear();
    }

    ValueSource src(env, path);
    HarnessConfig cfg;

    if (auto v = src.get("DOCKER_IMAGE", "image", "base")) {
        cfg.baseImage = *v;
    }
    if (auto v = src.get("DOCKER_HOST", "runtime", "host")) {
        cfg.runtimeHost = *v;
    }
    if (auto v = src.get("DOCKHAND_CACHE_REPO", "service", "cache_repo")) {
        cfg.cacheRepo = *v;
    }
    if (auto v = src.get("DOCKHAND_DEVICES", "service", "devices")) {
        cfg.devices = parse_list(*v);
    }
    if (auto v = src.get("DOCKHAND_SHM_SIZE", "service", "shm_size")) {
        auto size = parse_byte_size(*v);
        if (!size) {
            return Error{ErrorCode::InvalidArgument, "shm_size: " + size.error().message};
        }
        cfg.shmSizeBytes = size.value();
    }
    if (auto v = src.get("DOCKHAND_STOP_TIMEOUT", "service", "stop_timeout")) {
        auto s = parseSeconds(*v, "stop_timeout");
        if (!s) {
            return s.error();
        }
        cfg.stopTimeout = s.value();
    }
    if (auto v = src.get("DOCKHAND_PROBE_TIMEOUT", "probe", "timeout")) {
        auto s = parseSeconds(*v, "probe timeout");
        if (!s) {
            return s.error();
        }
        cfg.probeTimeout = s.value();
    }
    if (auto v = src.get("DOCKHAND_REQUEST_TIMEOUT", "client", "request_timeout")) {
        auto s = parseSeconds(*v, "request_timeout");
        if (!s) {
            return s.error();
        }
        cfg.requestTimeout = s.value();
    }
    if (auto v = src.get("DOCKHAND_PORT_MIN", "service", "port_min")) {
        auto p = parseUnsigned<std::uint16_t>(*v, "port_min");
        if (!p) {
            return p.error();
        }
        cfg.portMin = p.value();
    }
    if (auto v = src.get("DOCKHAND_PORT_MAX", "service", "port_max")) {
        auto p = parseUnsigned<std::uint16_t>(*v, "port_max");
        if (!p) {
            return p.error();
        }
        cfg.portMax = p.value();
    }

    if (cfg.portMin == 0 || cfg.portMin > cfg.portMax) {
        return Error{ErrorCode::InvalidArgument, fmt::format("invalid port range [{}, {}]",
                                                             cfg.portMin, cfg.portMax)};
    }
    if (cfg.probeTimeout.count() == 0) {
        return Error{ErrorCode::InvalidArgument, "probe timeout must be positive"};
    }

    spdlog::debug("[Config] image={} host={} devices={} ports=[{}, {}]", cfg.baseImage,
                  cfg.runtimeHost, cfg.devices.size(), cfg.portMin, cfg.portMax);
    return cfg;
}

} // namespace dockhand::config
