#pragma once

#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>

namespace Wikipath {
namespace Network {
namespace Fetch {

struct Page {
    std::string url;
    std::string content_type;
    std::string body;
};

// Resolves a node to its HTML document. An empty optional means the node is
// not fetchable: wrong content type, transport failure or HTTP error.
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    virtual boost::asio::awaitable<std::optional<Page>> fetch(const std::string& url) = 0;
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Wikipath
