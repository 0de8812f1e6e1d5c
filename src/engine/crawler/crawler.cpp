#include "crawler.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../network/fetch/http_page_fetcher.hpp"
#include "../../network/http/beast_client.hpp"
#include "../graph/path_finder.hpp"

namespace Wikipath {
namespace Engine {

using namespace Wikipath::Core;

namespace {

int fetch_permits(const CrawlerConfig& config) {
    return config.max_fetches > 0 ? config.max_fetches : config.concurrency;
}

}  // namespace

const char* to_string(CrawlStatus status) {
    switch (status) {
        case CrawlStatus::NotStarted: return "not started";
        case CrawlStatus::Running: return "running";
        case CrawlStatus::TargetFound: return "target found";
        case CrawlStatus::FrontierExhausted: return "frontier exhausted";
        case CrawlStatus::StartNotFetchable: return "start page not fetchable";
        case CrawlStatus::Cancelled: return "cancelled";
        case CrawlStatus::Failed: return "failed";
    }
    return "unknown";
}

Crawler::Crawler(const CrawlerConfig& config, std::shared_ptr<PageFetcher> fetcher)
    : num_workers_(config.concurrency),
      num_threads_(config.threads),
      keywords_(config.keywords),
      link_prefix_(config.link_prefix),
      handle_signals_(config.handle_signals),
      fetcher_(std::move(fetcher)),
      fetch_limiter_(fetch_permits(config)) {
    if (num_workers_ < 1)
        throw std::invalid_argument("Crawler needs at least one worker");
    if (num_threads_ < 1)
        throw std::invalid_argument("Crawler needs at least one IO thread");
    if (!fetcher_)
        throw std::invalid_argument("Crawler needs a page fetcher");
}

std::vector<std::string> Crawler::find_path(const std::string& start, const std::string& target) {
    if (started_.exchange(true))
        throw std::logic_error("Crawler instances are single-use");

    start_  = start;
    target_ = target;

    CrawlStatus expected = CrawlStatus::NotStarted;
    if (!status_.compare_exchange_strong(expected, CrawlStatus::Running)) {
        Logger::debug("Crawler: " + std::string(to_string(expected)) + " before the crawl began");
        return {};
    }
    log_setup();

    if (start_ == target_) {
        finish(CrawlStatus::TargetFound);
        return {start_};
    }

    init_io_services();
    if (handle_signals_)
        init_signals();
    spawn_seed();
    await_completion();
    shutdown();

    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_)
            std::rethrow_exception(error_);
    }

    Logger::debug("Crawler: " + std::string(to_string(status())) + " after expanding "
                  + std::to_string(graph_.node_count()) + " pages ("
                  + std::to_string(graph_.edge_count()) + " links, "
                  + std::to_string(frontier_.size()) + " left queued)");
    return PathFinder::shortest_path(graph_, start_, target_);
}

void Crawler::cancel() {
    CrawlStatus expected = CrawlStatus::NotStarted;
    if (status_.compare_exchange_strong(expected, CrawlStatus::Cancelled)
        || finish(CrawlStatus::Cancelled))
        Logger::warn("Crawler: cancelled, finishing in-flight pages...");
    frontier_.close();
}

CrawlStatus Crawler::status() const {
    return status_.load();
}

bool Crawler::finish(CrawlStatus status) {
    CrawlStatus expected = CrawlStatus::Running;
    return status_.compare_exchange_strong(expected, status);
}

void Crawler::record_failure(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        Logger::error("Crawler: aborting, " + std::string(e.what()));
    } catch (...) {
        Logger::error("Crawler: aborting, unknown exception");
    }

    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!error_)
            error_ = error;
    }
    finish(CrawlStatus::Failed);
    frontier_.close();
}

std::vector<std::string> find_path(const std::string&              start,
                                   const std::string&              target,
                                   int                             concurrency,
                                   const std::vector<std::string>& keywords,
                                   std::shared_ptr<PageFetcher>    fetcher) {
    CrawlerConfig config;
    config.concurrency = concurrency;
    config.keywords    = keywords;

    Crawler crawler(config, std::move(fetcher));
    return crawler.find_path(start, target);
}

std::vector<std::string> find_path(const std::string&              start,
                                   const std::string&              target,
                                   int                             concurrency,
                                   const std::vector<std::string>& keywords) {
    auto fetcher = std::make_shared<Network::Fetch::HttpPageFetcher>(
        std::make_unique<Network::Http::BeastClient>(), Constants::MAX_REDIRECTS);
    return find_path(start, target, concurrency, keywords, std::move(fetcher));
}

}  // namespace Engine
}  // namespace Wikipath
