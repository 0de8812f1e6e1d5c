#include "http_page_fetcher.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Wikipath {
namespace Network {
namespace Fetch {

using namespace Wikipath::Core;

HttpPageFetcher::HttpPageFetcher(std::unique_ptr<Http::HttpClient> client, int max_redirects)
    : client_(std::move(client)), max_redirects_(max_redirects) {
}

boost::asio::awaitable<std::optional<Page>> HttpPageFetcher::fetch(const std::string& url) {
    std::string location = url;

    for (int hop = 0; hop <= max_redirects_; ++hop) {
        Response res = co_await client_->get(location);

        if (is_redirect_status(res.status_code) && !res.location.empty()) {
            std::string next = Wikipath::Utils::Url::resolve(location, res.location);
            if (next.empty()) {
                Logger::debug("Unfollowable redirect from \"" + location + "\" to \""
                              + res.location + "\"");
                co_return std::nullopt;
            }
            Logger::debug("Redirect \"" + location + "\" -> \"" + next + "\"");
            location = std::move(next);
            continue;
        }

        if (!res.success) {
            Logger::debug("Fetch \"" + url + "\" failed (" + Http::to_string(res.error_type)
                          + " error): " + res.error);
            co_return std::nullopt;
        }

        std::string content_type = Wikipath::Utils::Text::to_lower(res.content_type);
        if (!Wikipath::Utils::Text::starts_with(content_type, Constants::HTML_MIME)) {
            Logger::debug("Fetch \"" + url + "\" failed, not HTML (" + res.content_type + ")");
            co_return std::nullopt;
        }

        co_return Page{location, std::move(res.content_type), std::move(res.body)};
    }

    Logger::debug("Fetch \"" + url + "\" failed: too many redirects");
    co_return std::nullopt;
}

}  // namespace Fetch
}  // namespace Network
}  // namespace Wikipath
