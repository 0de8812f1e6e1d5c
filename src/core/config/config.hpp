#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Wikipath {
namespace Core {

struct Config {
    std::string              start;
    std::string              target;
    int                      concurrency     = Constants::DEFAULT_CONCURRENCY;
    int                      threads         = Constants::DEFAULT_THREADS;
    int                      max_fetches     = Constants::DEFAULT_MAX_FETCHES;
    std::vector<std::string> keywords;
    std::string              link_prefix     = Constants::DEFAULT_LINK_PREFIX;
    int                      request_timeout = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    int                      connect_timeout = Constants::CONNECT_TIMEOUT_MS;       // milliseconds
    int                      max_redirects   = Constants::MAX_REDIRECTS;
    std::string              user_agent      = Constants::USER_AGENT;
    std::string              config_path;
    bool                     verbose = false;
    bool                     quiet   = false;

    int  log_level() const;
    void validate() const;

    static Config parse(int argc, char* argv[]);
};

}  // namespace Core
}  // namespace Wikipath
