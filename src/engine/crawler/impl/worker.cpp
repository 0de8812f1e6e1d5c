#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio/co_spawn.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/url/url.hpp"
#include "../../prioritizer/link_prioritizer.hpp"
#include "../crawler.hpp"

namespace Wikipath {
namespace Engine {

using namespace Wikipath::Core;
using Wikipath::Network::Fetch::Page;
using Wikipath::Utils::Text::Anchor;
using Wikipath::Utils::Text::LinkExtractor;

boost::asio::awaitable<bool> Crawler::expand_start() {
    graph_.claim(start_);
    co_return co_await expand(start_);
}

boost::asio::awaitable<void> Crawler::worker_loop() {
    while (!target_found_.is_set()) {
        auto entry = co_await frontier_.take();
        if (!entry || target_found_.is_set())
            break;

        if (!graph_.claim(entry->node)) {
            Logger::debug("Already expanded: " + entry->node);
            continue;
        }
        co_await expand(entry->node);
    }
}

boost::asio::awaitable<bool> Crawler::expand(const std::string& current) {
    std::optional<Page> page;

    co_await fetch_limiter_.acquire();
    {
        Sync::SemaphoreGuard permit(fetch_limiter_);
        Logger::debug("Fetching: " + current);
        page = co_await fetcher_->fetch(current);
    }

    if (!page) {
        Logger::debug("Fetch \"" + current + "\" failed, skipping");
        co_return false;
    }

    std::vector<Anchor> anchors = LinkExtractor::extract(page->body, link_prefix_);
    Logger::debug("Fetch \"" + current + "\"... found " + std::to_string(anchors.size())
                  + " article links");
    process_links(current, anchors);
    co_return true;
}

void Crawler::process_links(const std::string& current, const std::vector<Anchor>& anchors) {
    for (auto& link : LinkPrioritizer::prioritize(anchors, keywords_)) {
        std::string next = Wikipath::Utils::Url::resolve(current, link.href);
        if (next.empty())
            continue;

        graph_.add_edge(current, next);
        if (next == target_) {
            on_target_found(current);
            break;
        }
        frontier_.put(link.priority, std::move(next));
    }
}

void Crawler::on_target_found(const std::string& current) {
    if (target_found_.set()) {
        Logger::debug("Target \"" + target_ + "\" linked from \"" + current + "\"");
        finish(CrawlStatus::TargetFound);
    }
    frontier_.close();
}

void Crawler::spawn_seed() {
    boost::asio::co_spawn(
        boost::asio::make_strand(ioc_),
        expand_start(),
        [this](std::exception_ptr error, bool fetched) {
            if (error) {
                record_failure(error);
                trigger_done();
                return;
            }
            if (!fetched) {
                Logger::error("Initial fetch failed: \"" + start_ + "\" not fetchable");
                finish(CrawlStatus::StartNotFetchable);
                trigger_done();
                return;
            }
            if (target_found_.is_set() || frontier_.closed()) {
                trigger_done();
                return;
            }
            spawn_workers();
        });
}

void Crawler::spawn_workers() {
    frontier_.set_consumers(num_workers_);
    running_workers_ = num_workers_;
    for (int i = 0; i < num_workers_; ++i) {
        boost::asio::co_spawn(
            boost::asio::make_strand(ioc_), worker_loop(), [this](std::exception_ptr error) {
                if (error)
                    record_failure(error);
                if (--running_workers_ == 0)
                    on_workers_finished();
            });
    }
    Logger::debug("Crawler: " + std::to_string(num_workers_) + " workers spawned");
}

void Crawler::on_workers_finished() {
    if (frontier_.exhausted() && finish(CrawlStatus::FrontierExhausted)) {
        Logger::warn("Crawler: frontier exhausted, \"" + target_ + "\" not reachable from \""
                     + start_ + "\"");
    }
    trigger_done();
}

}  // namespace Engine
}  // namespace Wikipath
