#include <dockhand/client/generation_types.h>

using nlohmann::json;

namespace dockhand::client {

namespace {

Token parseToken(const json& j) {
    Token t;
    t.id = j.value("id", std::int64_t{0});
    t.text = j.value("text", std::string{});
    if (j.contains("logprob") && j["logprob"].is_number()) {
        t.logprob = j["logprob"].get<double>();
    }
    t.special = j.value("special", false);
    return t;
}

std::vector<Token> parseTokens(const json& details, const char* key) {
    std::vector<Token> out;
    if (!details.contains(key) || !details[key].is_array()) {
        return out;
    }
    out.reserve(details[key].size());
    for (const auto& t : details[key]) {
        if (t.is_object()) {
            out.push_back(parseToken(t));
        }
    }
    return out;
}

} // namespace

json toJson(const GenerateRequest& request) {
    const auto& p = request.parameters;
    json params = {{"max_new_tokens", p.maxNewTokens},
                   {"details", p.details},
                   {"decoder_input_details", p.decoderInputDetails}};
    if (p.doSample)
        params["do_sample"] = *p.doSample;
    if (p.seed)
        params["seed"] = *p.seed;
    if (p.temperature)
        params["temperature"] = *p.temperature;
    if (p.topP)
        params["top_p"] = *p.topP;
    if (p.topK)
        params["top_k"] = *p.topK;
    if (p.repetitionPenalty)
        params["repetition_penalty"] = *p.repetitionPenalty;
    if (!p.stop.empty())
        params["stop"] = p.stop;

    return {{"inputs", request.inputs}, {"parameters", params}};
}

Result<GenerateResponse> parseGenerateResponse(std::string_view body) {
    auto j = json::parse(body, nullptr, false);
    // Some server versions answer with a one-element array
    if (!j.is_discarded() && j.is_array() && j.size() == 1) {
        j = j[0];
    }
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "generate: response is not a JSON object"};
    }
    if (!j.contains("generated_text") || !j["generated_text"].is_string()) {
        return Error{ErrorCode::InvalidData, "generate: response has no generated_text"};
    }

    GenerateResponse out;
    out.generatedText = j["generated_text"].get<std::string>();
    if (j.contains("details") && j["details"].is_object()) {
        const auto& d = j["details"];
        GenerateDetails details;
        details.finishReason = d.value("finish_reason", std::string{});
        details.generatedTokens = d.value("generated_tokens", std::uint32_t{0});
        if (d.contains("seed") && d["seed"].is_number_unsigned()) {
            details.seed = d["seed"].get<std::uint64_t>();
        }
        details.prefill = parseTokens(d, "prefill");
        details.tokens = parseTokens(d, "tokens");
        out.details = std::move(details);
    }
    return out;
}

Error parseErrorResponse(unsigned status, std::string_view body) {
    std::string message = "HTTP " + std::to_string(status);
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error")) {
        const auto& e = j["error"];
        message += ": " + (e.is_string() ? e.get<std::string>() : e.dump());
        if (j.contains("error_type") && j["error_type"].is_string()) {
            message += " (" + j["error_type"].get<std::string>() + ")";
        }
    } else if (!body.empty()) {
        message += ": " + std::string(body.substr(0, 512));
    }
    return Error{ErrorCode::ServerError, message};
}

} // namespace dockhand::client
