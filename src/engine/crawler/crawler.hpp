#pragma once
#include <atomic>
#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio.hpp>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/fetch/page_fetcher.hpp"
#include "../../utils/text/link_extractor.hpp"
#include "../frontier/frontier.hpp"
#include "../graph/graph.hpp"
#include "../sync/async_semaphore.hpp"
#include "../sync/termination_signal.hpp"

namespace Wikipath {
namespace Engine {

using Wikipath::Network::Fetch::PageFetcher;

struct CrawlerConfig {
    int                      concurrency    = Wikipath::Core::Constants::DEFAULT_CONCURRENCY;
    int                      threads        = Wikipath::Core::Constants::DEFAULT_THREADS;
    int                      max_fetches    = Wikipath::Core::Constants::DEFAULT_MAX_FETCHES;
    std::vector<std::string> keywords;
    std::string              link_prefix    = Wikipath::Core::Constants::DEFAULT_LINK_PREFIX;
    bool                     handle_signals = false;
};

enum class CrawlStatus {
    NotStarted,
    Running,
    TargetFound,
    FrontierExhausted,
    StartNotFetchable,
    Cancelled,
    Failed
};

const char* to_string(CrawlStatus status);

// Single-use crawl from a start page towards a target page. find_path()
// expands the start page, runs `concurrency` workers over the frontier until
// the target shows up as a link or nothing is left to expand, and returns the
// shortest path over the links recorded by then.
class Crawler {
public:
    Crawler(const CrawlerConfig& config, std::shared_ptr<PageFetcher> fetcher);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    std::vector<std::string> find_path(const std::string& start, const std::string& target);
    void                     cancel();

    CrawlStatus  status() const;
    const Graph& graph() const {
        return graph_;
    }

private:
    int                          num_workers_;
    int                          num_threads_;
    std::vector<std::string>     keywords_;
    std::string                  link_prefix_;
    bool                         handle_signals_;
    std::shared_ptr<PageFetcher> fetcher_;

    std::string start_;
    std::string target_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};

    Graph                   graph_;
    Frontier                frontier_;
    Sync::AsyncSemaphore    fetch_limiter_;
    Sync::TerminationSignal target_found_;

    std::atomic<CrawlStatus> status_{CrawlStatus::NotStarted};
    std::atomic<int>         running_workers_{0};
    std::atomic<bool>        started_{false};
    std::atomic<bool>        is_shutdown_{false};

    std::atomic<bool>       done_{false};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;

    std::exception_ptr error_;
    std::mutex         error_mutex_;

    void log_setup() const;
    void init_io_services();
    void init_signals();
    void spawn_seed();
    void spawn_workers();
    void on_workers_finished();
    void await_completion();
    void trigger_done();
    void shutdown();

    bool finish(CrawlStatus status);
    void record_failure(std::exception_ptr error);

    boost::asio::awaitable<bool> expand_start();
    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<bool> expand(const std::string& current);
    void process_links(const std::string& current, const std::vector<Utils::Text::Anchor>& anchors);
    void on_target_found(const std::string& current);
};

std::vector<std::string> find_path(const std::string&              start,
                                   const std::string&              target,
                                   int                             concurrency,
                                   const std::vector<std::string>& keywords,
                                   std::shared_ptr<PageFetcher>    fetcher);

// Crawls over HTTP(S) with the default client settings.
std::vector<std::string> find_path(const std::string&              start,
                                   const std::string&              target,
                                   int                             concurrency,
                                   const std::vector<std::string>& keywords);

}  // namespace Engine
}  // namespace Wikipath
