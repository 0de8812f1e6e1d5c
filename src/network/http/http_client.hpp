#pragma once

#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>

namespace Wikipath {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Other };

inline const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Other: return "other";
    }
    return "unknown";
}

enum class HTTPCode { NetworkError = 0 };

enum class MaxCode { ClientError = 400 };

}  // namespace Http
}  // namespace Network
}  // namespace Wikipath

namespace Wikipath {

struct Response {
    long                     status_code = 0;
    std::string              content_type;
    std::string              location;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_user_agent(const std::string& /*user_agent*/){};
    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/){};
    virtual void set_request_timeout(std::chrono::seconds /*timeout*/){};
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Wikipath
