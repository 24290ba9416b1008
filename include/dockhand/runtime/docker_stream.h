#pragma once

// Wire-format helpers for the Docker Engine API adapter.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <dockhand/core/types.h>
#include <dockhand/runtime/container_runtime.h>

namespace dockhand::runtime::docker {

struct Endpoint {
    std::string baseUrl;                   // e.g. http://localhost
    std::optional<std::string> unixSocket; // set for unix:// hosts
};

Result<Endpoint> parseDockerHost(std::string_view host);

// Split a logs payload into lines. Understands the 8-byte multiplexed framing
// used for containers without a TTY and falls back to raw text otherwise.
std::vector<std::string> demultiplexLogStream(std::string_view payload);

std::optional<LogTimestamp> parseRfc3339(std::string_view text);

// Split "<RFC3339 timestamp> <message>" as emitted with timestamps=1. Lines without
// a parseable timestamp keep their full text and a zero timestamp.
LogLine parseTimestampedLine(std::string_view line);

// Engine "since" query value: "<seconds>.<nanoseconds>"
std::string formatSince(LogTimestamp ts);

// Parse the JSON-lines body of POST /build.
Result<BuildOutput> parseBuildStream(std::string_view body);

// Write a directory tree into an uncompressed tar archive held in memory.
Result<std::string> archiveDirectory(const std::filesystem::path& dir);

} // namespace dockhand::runtime::docker
