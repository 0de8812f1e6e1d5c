#include <iostream>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "network/fetch/http_page_fetcher.hpp"
#include "network/http/beast_client.hpp"
#include "utils/text/string_utils.hpp"

namespace {

using namespace Wikipath::Core;
using namespace Wikipath::Engine;

std::shared_ptr<Wikipath::Network::Fetch::PageFetcher> make_fetcher(const Config& config) {
    auto client = std::make_unique<Wikipath::Network::Http::BeastClient>();
    client->set_user_agent(config.user_agent);
    client->set_connect_timeout(std::chrono::milliseconds(config.connect_timeout));
    client->set_request_timeout(std::chrono::seconds(config.request_timeout));
    return std::make_shared<Wikipath::Network::Fetch::HttpPageFetcher>(std::move(client),
                                                                       config.max_redirects);
}

int exit_code_for(CrawlStatus status) {
    switch (status) {
        case CrawlStatus::StartNotFetchable: return EXIT_START_NOT_FETCHABLE;
        case CrawlStatus::Cancelled: return EXIT_CANCELLED;
        case CrawlStatus::Failed: return EXIT_FAILURE_GENERIC;
        default: return EXIT_NO_PATH;
    }
}

int run_crawler(const Config& config) {
    CrawlerConfig crawler_config;
    crawler_config.concurrency    = config.concurrency;
    crawler_config.threads        = config.threads;
    crawler_config.max_fetches    = config.max_fetches;
    crawler_config.keywords       = config.keywords;
    crawler_config.link_prefix    = config.link_prefix;
    crawler_config.handle_signals = true;

    Crawler crawler(crawler_config, make_fetcher(config));
    auto    path = crawler.find_path(config.start, config.target);

    if (path.empty()) {
        Logger::error("No path found (" + std::string(to_string(crawler.status())) + ")");
        return exit_code_for(crawler.status());
    }

    std::cout << Wikipath::Utils::Text::join(path, " ") << std::endl;
    return EXIT_PATH_FOUND;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return EXIT_FAILURE_GENERIC;
    }
    Logger::set_level(config.log_level());

    if (config.start.empty() || config.target.empty()) {
        Logger::error("Both a start and a target URL are required. See --help.");
        return EXIT_FAILURE_GENERIC;
    }

    try {
        return run_crawler(config);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return EXIT_FAILURE_GENERIC;
    }
}
