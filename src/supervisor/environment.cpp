#include <dockhand/supervisor/environment.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dockhand::supervisor {

namespace {

std::optional<std::string> readTokenFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) {
        return std::nullopt;
    }
    config::trim(line);
    if (line.empty()) {
        return std::nullopt;
    }
    spdlog::debug("[Environment] using hub token from {}", path.string());
    return line;
}

} // namespace

std::optional<std::string> resolveHubToken(const config::EnvLookup& env) {
    if (!env) {
        return std::nullopt;
    }
    if (auto t = env("HF_TOKEN")) {
        return t;
    }
    if (auto t = env("HUGGING_FACE_HUB_TOKEN")) {
        return t;
    }

    if (auto p = env("HF_TOKEN_PATH")) {
        return readTokenFile(*p);
    }
    fs::path hfHome;
    if (auto h = env("HF_HOME")) {
        hfHome = *h;
    } else if (auto xdg = env("XDG_CACHE_HOME")) {
        hfHome = fs::path(*xdg) / "huggingface";
    } else if (auto home = env("HOME")) {
        hfHome = fs::path(*home) / ".cache" / "huggingface";
    } else {
        return std::nullopt;
    }
    return readTokenFile(hfHome / "token");
}

std::map<std::string, std::string>
composeEnvironment(const config::EnvLookup& env, const std::optional<std::string>& token,
                   const std::string& cacheRepo, const std::map<std::string, std::string>& extraEnv) {
    std::map<std::string, std::string> out;
    out[kLogLevelVariable] = kLogLevelValue;
    out[kCacheRepoVariable] = cacheRepo;

    if (token && !token->empty()) {
        for (const auto* name : kTokenVariables) {
            out[name] = *token;
        }
    }

    if (env) {
        for (const auto* name : kForwardedTuningVariables) {
            if (auto v = env(name)) {
                out[name] = *v;
            }
        }
    }

    for (const auto& [k, v] : extraEnv) {
        out[k] = v;
    }
    return out;
}

std::vector<std::string> composeCommand(const ImageRef& image, const ServiceSpec& spec) {
    std::vector<std::string> args{"--model-id", image.modelId, "--env"};
    if (spec.trustRemoteCode) {
        args.emplace_back("--trust-remote-code");
    }
    return args;
}

} // namespace dockhand::supervisor
