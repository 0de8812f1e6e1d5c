#pragma once

#include <memory>
#include "../http/http_client.hpp"
#include "page_fetcher.hpp"

namespace Wikipath {
namespace Network {
namespace Fetch {

class HttpPageFetcher : public PageFetcher {
public:
    explicit HttpPageFetcher(std::unique_ptr<Http::HttpClient> client,
                             int                               max_redirects);

    boost::asio::awaitable<std::optional<Page>> fetch(const std::string& url) override;

private:
    std::unique_ptr<Http::HttpClient> client_;
    int                               max_redirects_;
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Wikipath
