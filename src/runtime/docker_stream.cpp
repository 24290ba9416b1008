#include <dockhand/runtime/docker_stream.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>

namespace dockhand::runtime::docker {

namespace {

constexpr std::size_t kFrameHeaderSize = 8;

bool looksMultiplexed(std::string_view payload) {
    if (payload.size() < kFrameHeaderSize) {
        return false;
    }
    const auto stream = static_cast<unsigned char>(payload[0]);
    return stream <= 2 && payload[1] == '\0' && payload[2] == '\0' && payload[3] == '\0';
}

void splitLines(std::string_view text, std::vector<std::string>& out) {
    while (!text.empty()) {
        auto nl = text.find('\n');
        auto line = text.substr(0, nl);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        out.emplace_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        text.remove_prefix(nl + 1);
    }
}

bool parseDigits(std::string_view s, int& out) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

Result<Endpoint> parseDockerHost(std::string_view host) {
    Endpoint ep;
    if (host.starts_with("unix://")) {
        auto path = host.substr(7);
        if (path.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty unix socket path in runtime host"};
        }
        ep.baseUrl = "http://localhost";
        ep.unixSocket = std::string(path);
        return ep;
    }
    if (host.starts_with("tcp://")) {
        ep.baseUrl = "http://" + std::string(host.substr(6));
        return ep;
    }
    if (host.starts_with("http://")) {
        ep.baseUrl = std::string(host);
        while (!ep.baseUrl.empty() && ep.baseUrl.back() == '/') {
            ep.baseUrl.pop_back();
        }
        return ep;
    }
    return Error{ErrorCode::InvalidArgument, "unsupported runtime host: " + std::string(host)};
}

std::vector<std::string> demultiplexLogStream(std::string_view payload) {
    std::vector<std::string> lines;
    if (!looksMultiplexed(payload)) {
        splitLines(payload, lines);
        return lines;
    }

    while (payload.size() >= kFrameHeaderSize) {
        const auto* h = reinterpret_cast<const unsigned char*>(payload.data());
        const std::uint32_t size = (static_cast<std::uint32_t>(h[4]) << 24) |
                                   (static_cast<std::uint32_t>(h[5]) << 16) |
                                   (static_cast<std::uint32_t>(h[6]) << 8) |
                                   static_cast<std::uint32_t>(h[7]);
        payload.remove_prefix(kFrameHeaderSize);
        if (size > payload.size()) {
            spdlog::debug("[DockerRuntime] truncated log frame ({} > {})", size, payload.size());
            splitLines(payload, lines);
            break;
        }
        splitLines(payload.substr(0, size), lines);
        payload.remove_prefix(size);
    }
    return lines;
}

std::optional<LogTimestamp> parseRfc3339(std::string_view text) {
    // 2024-05-01T12:34:56[.123456789](Z|+hh:mm|-hh:mm)
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    int y = 0, mo = 0, d = 0, hh = 0, mm = 0, ss = 0;
    if (!parseDigits(text.substr(0, 4), y) || !parseDigits(text.substr(5, 2), mo) ||
        !parseDigits(text.substr(8, 2), d) || !parseDigits(text.substr(11, 2), hh) ||
        !parseDigits(text.substr(14, 2), mm) || !parseDigits(text.substr(17, 2), ss)) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    std::chrono::minutes offset{0};
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos + 6 <= text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0;
        if (text[pos + 3] != ':' || !parseDigits(text.substr(pos + 1, 2), oh) ||
            !parseDigits(text.substr(pos + 4, 2), om)) {
            return std::nullopt;
        }
        offset = std::chrono::hours(oh) + std::chrono::minutes(om);
        if (text[pos] == '-') {
            offset = -offset;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{y},
                                          std::chrono::month{static_cast<unsigned>(mo)},
                                          std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60) {
        return std::nullopt;
    }
    auto tp = std::chrono::sys_days{ymd} + std::chrono::hours(hh) + std::chrono::minutes(mm) +
              std::chrono::seconds(ss) - offset;
    return LogTimestamp{std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()) +
                        std::chrono::nanoseconds(nanos)};
}

LogLine parseTimestampedLine(std::string_view line) {
    LogLine out;
    auto space = line.find(' ');
    if (space != std::string_view::npos) {
        if (auto ts = parseRfc3339(line.substr(0, space))) {
            out.timestamp = *ts;
            out.text = std::string(line.substr(space + 1));
            return out;
        }
    } else if (auto ts = parseRfc3339(line)) {
        out.timestamp = *ts;
        return out;
    }
    out.text = std::string(line);
    return out;
}

std::string formatSince(LogTimestamp ts) {
    const auto ns = ts.time_since_epoch().count();
    const auto secs = ns / 1'000'000'000;
    const auto frac = ns % 1'000'000'000;
    return fmt::format("{}.{:09d}", secs, frac);
}

Result<BuildOutput> parseBuildStream(std::string_view body) {
    BuildOutput out;
    std::vector<std::string> lines;
    splitLines(body, lines);

    for (const auto& raw : lines) {
        if (raw.empty()) {
            continue;
        }
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            out.logs.push_back(raw);
            continue;
        }
        if (j.contains("error")) {
            std::string message = j["error"].is_string() ? j["error"].get<std::string>()
                                                         : j["error"].dump();
            return Error{ErrorCode::ProvisioningFailed, "image build failed: " + message};
        }
        if (j.contains("stream") && j["stream"].is_string()) {
            std::string text = j["stream"].get<std::string>();
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                text.pop_back();
            }
            if (!text.empty()) {
                constexpr std::string_view kBuilt = "Successfully built ";
                if (text.starts_with(kBuilt) && out.imageId.empty()) {
                    out.imageId = text.substr(kBuilt.size());
                }
                out.logs.push_back(std::move(text));
            }
        }
        if (j.contains("aux") && j["aux"].is_object() && j["aux"].contains("ID") &&
            j["aux"]["ID"].is_string()) {
            out.imageId = j["aux"]["ID"].get<std::string>();
        }
    }

    if (out.imageId.empty()) {
        return Error{ErrorCode::ProvisioningFailed, "image build produced no image id"};
    }
    return out;
}

} // namespace dockhand::runtime::docker
