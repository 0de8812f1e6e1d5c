#pragma once

#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "http_client.hpp"

namespace Wikipath {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_user_agent(const std::string& user_agent) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::seconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::string               user_agent_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::seconds      request_timeout_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Response> perform_http_request(const std::string& host,
                                                          const std::string& port,
                                                          const std::string& target);
    boost::asio::awaitable<Response> perform_https_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target);

    boost::beast::http::request<boost::beast::http::empty_body>
    make_request(const std::string& host, const std::string& target) const;
};

}  // namespace Http
}  // namespace Network
}  // namespace Wikipath
