#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <dockhand/core/types.h>

namespace dockhand::client {

/**
 * Parameters accepted by the /generate route. Only maxNewTokens and the two
 * detail flags are required by the harness; the sampling knobs are passed
 * through when set.
 */
struct GenerateParameters {
    std::uint32_t maxNewTokens{20};
    bool details{true};
    bool decoderInputDetails{false};
    std::optional<bool> doSample;
    std::optional<std::uint64_t> seed;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<std::uint32_t> topK;
    std::optional<double> repetitionPenalty;
    std::vector<std::string> stop;
};

struct GenerateRequest {
    std::string inputs;
    GenerateParameters parameters;
};

struct Token {
    std::int64_t id{0};
    std::string text;
    std::optional<double> logprob;
    bool special{false};
};

struct GenerateDetails {
    std::string finishReason;
    std::uint32_t generatedTokens{0};
    std::optional<std::uint64_t> seed;
    std::vector<Token> prefill;
    std::vector<Token> tokens;
};

struct GenerateResponse {
    std::string generatedText;
    std::optional<GenerateDetails> details;
};

nlohmann::json toJson(const GenerateRequest& request);

Result<GenerateResponse> parseGenerateResponse(std::string_view body);

// Map a non-2xx reply ({"error": ..., "error_type": ...}) to an Error.
Error parseErrorResponse(unsigned status, std::string_view body);

// Connection refused, reset, or dropped before a reply: the service is not
// listening yet and the request may be retried.
inline bool isTransientConnectionError(const Error& error) {
    return error.code == ErrorCode::ConnectionRefused || error.code == ErrorCode::ConnectionReset ||
           error.code == ErrorCode::ServerDisconnected;
}

} // namespace dockhand::client
