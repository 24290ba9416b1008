#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <dockhand/client/generation_types.h>
#include <dockhand/core/types.h>

namespace dockhand::client {

/**
 * Asynchronous text-generation client bound to one service endpoint.
 *
 * generate() never throws for transport or protocol failures; they come back
 * as an Error whose code distinguishes transient connection failures
 * (see isTransientConnectionError) from everything else.
 */
class IGenerationClient {
public:
    virtual ~IGenerationClient() = default;

    virtual boost::asio::awaitable<Result<GenerateResponse>> generate(GenerateRequest request) = 0;

    // Test configuration label the service was launched under
    virtual const std::string& serviceName() const = 0;

    // e.g. http://localhost:8123
    virtual const std::string& baseUrl() const = 0;
};

struct TgiClientOptions {
    std::string serviceName;
    std::string host{"localhost"};
    std::uint16_t port{0};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(300)};
};

/**
 * HTTP/1.1 client for the text-generation-inference /generate route.
 * One connection per request; requests may run concurrently on the executor.
 */
std::shared_ptr<IGenerationClient> makeTgiClient(boost::asio::any_io_executor executor,
                                                 TgiClientOptions options);

} // namespace dockhand::client
