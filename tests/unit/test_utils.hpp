#pragma once
#include <algorithm>
#include <boost/asio.hpp>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../../src/network/fetch/page_fetcher.hpp"

namespace Wikipath {
namespace Test {

using Wikipath::Network::Fetch::Page;
using Wikipath::Network::Fetch::PageFetcher;

inline const std::string WIKI = "https://en.wikipedia.org";

inline std::string wiki(const std::string& title) {
    return WIKI + "/wiki/" + title;
}

// (href, text) pairs rendered as an article body.
inline std::string make_html(const std::vector<std::pair<std::string, std::string>>& links) {
    std::string html = "<html><head><title>t</title></head><body><div id=\"content\">";
    for (const auto& [href, text] : links) {
        html += "<p><a href=\"" + href + "\">" + text + "</a></p>";
    }
    html += "<a href=\"https://other.org/wiki/Off\">off-site</a></div></body></html>";
    return html;
}

// Runs one coroutine to completion on a private io_context.
template <typename T>
T run_coroutine(boost::asio::awaitable<T> task) {
    boost::asio::io_context ioc;
    auto future = boost::asio::co_spawn(ioc, std::move(task), boost::asio::use_future);
    ioc.run();
    return future.get();
}

// In-memory site. Unknown URLs are not fetchable; URLs marked with
// throw_on() raise from fetch().
class MockPageFetcher : public PageFetcher {
public:
    void add_page(const std::string& url, const std::vector<std::string>& titles) {
        std::vector<std::pair<std::string, std::string>> links;
        for (const auto& title : titles)
            links.emplace_back("/wiki/" + title, title);
        add_html(url, make_html(links));
    }

    void add_html(const std::string& url, const std::string& html) {
        pages_[url] = html;
    }

    void throw_on(const std::string& url) {
        throwing_[url] = true;
    }

    void set_latency(std::chrono::milliseconds latency) {
        latency_ = latency;
    }

    boost::asio::awaitable<std::optional<Page>> fetch(const std::string& url) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++fetches_[url];
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
        }

        if (latency_.count() > 0) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(latency_);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }

        if (throwing_.count(url))
            throw std::runtime_error("malformed response for " + url);

        auto it = pages_.find(url);
        if (it == pages_.end())
            co_return std::nullopt;
        co_return Page{url, "text/html; charset=UTF-8", it->second};
    }

    int fetch_count(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = fetches_.find(url);
        return it == fetches_.end() ? 0 : it->second;
    }

    int total_fetches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int                         total = 0;
        for (const auto& entry : fetches_)
            total += entry.second;
        return total;
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    std::map<std::string, std::string> pages_;
    std::map<std::string, bool>        throwing_;
    std::chrono::milliseconds          latency_{0};

    mutable std::mutex         mutex_;
    std::map<std::string, int> fetches_;
    int                        in_flight_     = 0;
    int                        max_in_flight_ = 0;
};

}  // namespace Test
}  // namespace Wikipath
