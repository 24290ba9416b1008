#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <dockhand/config/config_helpers.h>
#include <dockhand/core/service_types.h>

namespace dockhand::supervisor {

inline constexpr const char* kLogLevelVariable = "LOG_LEVEL";
inline constexpr const char* kLogLevelValue = "info,text_generation_router=debug";
inline constexpr const char* kCacheRepoVariable = "CUSTOM_CACHE_REPO";

// The token is exported under both names; older server images read the first.
inline constexpr std::array<const char*, 2> kTokenVariables{"HUGGING_FACE_HUB_TOKEN", "HF_TOKEN"};

// Tuning variables copied from the caller's environment when set. Nothing
// else from the host environment reaches the container.
inline constexpr std::array<const char*, 4> kForwardedTuningVariables{
    "HF_BATCH_SIZE", "HF_SEQUENCE_LENGTH", "HF_AUTO_CAST_TYPE", "HF_NUM_CORES"};

/**
 * Locate a hub access token: HF_TOKEN, HUGGING_FACE_HUB_TOKEN, then the token
 * file at $HF_TOKEN_PATH, $HF_HOME/token, $XDG_CACHE_HOME/huggingface/token or
 * ~/.cache/huggingface/token.
 */
std::optional<std::string> resolveHubToken(const config::EnvLookup& env);

std::map<std::string, std::string>
composeEnvironment(const config::EnvLookup& env, const std::optional<std::string>& token,
                   const std::string& cacheRepo,
                   const std::map<std::string, std::string>& extraEnv = {});

// --model-id <id> --env [--trust-remote-code]
std::vector<std::string> composeCommand(const ImageRef& image, const ServiceSpec& spec);

} // namespace dockhand::supervisor
