#include <dockhand/client/generation_client.h>
#include <dockhand/version.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace dockhand::client {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;
using boost::asio::as_tuple;
using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

Error classifyTransportError(const boost::system::error_code& ec, std::string_view where) {
    std::string message = std::string(where) + ": " + ec.message();
    if (ec == beast::error::timeout) {
        return Error{ErrorCode::Timeout, message};
    }
    if (ec == boost::asio::error::connection_refused) {
        return Error{ErrorCode::ConnectionRefused, message};
    }
    if (ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe ||
        ec == boost::asio::error::connection_aborted) {
        return Error{ErrorCode::ConnectionReset, message};
    }
    if (ec == boost::asio::error::eof || ec == http::error::end_of_stream ||
        ec == http::error::partial_message) {
        return Error{ErrorCode::ServerDisconnected, message};
    }
    return Error{ErrorCode::NetworkError, message};
}

class TgiClient final : public IGenerationClient {
public:
    TgiClient(boost::asio::any_io_executor executor, TgiClientOptions options)
        : executor_(std::move(executor)), options_(std::move(options)),
          baseUrl_("http://" + options_.host + ":" + std::to_string(options_.port)) {}
    ~TgiClient() override = default;

    awaitable<Result<GenerateResponse>> generate(GenerateRequest request) override {
        tcp::resolver resolver(executor_);
        auto [rec, endpoints] = co_await resolver.async_resolve(
            options_.host, std::to_string(options_.port), as_tuple(use_awaitable));
        if (rec) {
            co_return classifyTransportError(rec, "resolve " + options_.host);
        }

        beast::tcp_stream stream(executor_);
        stream.expires_after(options_.requestTimeout);
        auto [cec, ep] = co_await stream.async_connect(endpoints, as_tuple(use_awaitable));
        if (cec) {
            auto err = classifyTransportError(cec, "connect " + baseUrl_);
            // Any failure to establish the connection means nothing is listening yet
            if (err.code == ErrorCode::NetworkError) {
                err.code = ErrorCode::ConnectionRefused;
            }
            co_return err;
        }

        http::request<http::string_body> req{http::verb::post, "/generate", 11};
        req.set(http::field::host, options_.host + ":" + std::to_string(options_.port));
        req.set(http::field::user_agent, std::string("dockhand/") + DOCKHAND_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.keep_alive(false);
        req.body() = toJson(request).dump();
        req.prepare_payload();

        auto [wec, written] = co_await http::async_write(stream, req, as_tuple(use_awaitable));
        if (wec) {
            co_return classifyTransportError(wec, "write /generate");
        }

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(64 * 1024 * 1024);
        auto [rdec, read] = co_await http::async_read(stream, buffer, parser, as_tuple(use_awaitable));
        if (rdec) {
            co_return classifyTransportError(rdec, "read /generate");
        }

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const auto& res = parser.get();
        const auto status = res.result_int();
        if (status < 200 || status >= 300) {
            spdlog::debug("[TgiClient] {} answered HTTP {}", baseUrl_, status);
            co_return parseErrorResponse(status, res.body());
        }
        co_return parseGenerateResponse(res.body());
    }

    const std::string& serviceName() const override { return options_.serviceName; }
    const std::string& baseUrl() const override { return baseUrl_; }

private:
    boost::asio::any_io_executor executor_;
    TgiClientOptions options_;
    std::string baseUrl_;
};

} // namespace

std::shared_ptr<IGenerationClient> makeTgiClient(boost::asio::any_io_executor executor,
                                                 TgiClientOptions options) {
    return std::make_shared<TgiClient>(std::move(executor), std::move(options));
}

} // namespace dockhand::client
