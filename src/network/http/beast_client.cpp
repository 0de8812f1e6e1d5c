#include "beast_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Wikipath {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Wikipath::Core::Constants;

namespace {

Response error_response(const std::string& message, ErrorType type) {
    Response response;
    response.success     = false;
    response.error       = message;
    response.error_type  = type;
    response.status_code = static_cast<long>(HTTPCode::NetworkError);
    return response;
}

Response to_response(http::response<http::string_body>&& res) {
    Response response;
    response.status_code = res.result_int();
    response.success     = response.status_code >= 200
                       && response.status_code < static_cast<long>(MaxCode::ClientError);
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc = res.find(http::field::location);
    if (loc != res.end())
        response.location = std::string(loc->value());
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    response.body = std::move(res.body());
    return response;
}

}  // namespace

BeastClient::BeastClient()
    : user_agent_(Constants::USER_AGENT),
      connect_timeout_(Constants::CONNECT_TIMEOUT_MS),
      request_timeout_(Constants::REQUEST_TIMEOUT_SECONDS) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::seconds timeout) {
    request_timeout_ = timeout;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    auto parsed = Wikipath::Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        co_return error_response("Invalid URL", ErrorType::Other);
    }

    std::string port =
        parsed.port.empty() ? Wikipath::Utils::Url::default_port(parsed.scheme) : parsed.port;
    std::string target = Wikipath::Utils::Url::request_target(parsed);

    try {
        if (parsed.scheme == "https") {
            co_return co_await perform_https_request(parsed.host, port, target);
        }
        co_return co_await perform_http_request(parsed.host, port, target);
    } catch (const boost::system::system_error& e) {
        ErrorType type = e.code() == beast::error::timeout ? ErrorType::Timeout : ErrorType::Network;
        co_return error_response(e.what(), type);
    } catch (const std::exception& e) {
        co_return error_response(e.what(), ErrorType::Other);
    }
}

http::request<http::empty_body> BeastClient::make_request(const std::string& host,
                                                          const std::string& target) const {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html");
    return req;
}

net::awaitable<Response> BeastClient::perform_http_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);
    auto req = make_request(host, target);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return to_response(std::move(res));
}

net::awaitable<Response> BeastClient::perform_https_request(const std::string& host,
                                                            const std::string& port,
                                                            const std::string& target) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);
    auto req = make_request(host, target);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(ssl_stream, b, res, net::use_awaitable);

    // Servers commonly drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return to_response(std::move(res));
}

}  // namespace Http
}  // namespace Network
}  // namespace Wikipath
