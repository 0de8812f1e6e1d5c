#pragma once
#include <chrono>
#include <string>

namespace Wikipath {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS     = 2;   // IO Threads
    static constexpr int         DEFAULT_CONCURRENCY = 25;  // Worker coroutines
    static constexpr int         DEFAULT_MAX_FETCHES = 0;   // 0 = same as concurrency
    static constexpr const char* DEFAULT_LINK_PREFIX = "/wiki/";
    static constexpr const char* VERSION             = "0.1.0";

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr int         CONNECT_TIMEOUT_MS      = 5000;
    static constexpr int         MAX_REDIRECTS           = 5;
    static constexpr const char* USER_AGENT              = "Wikipath/0.1";
    static constexpr const char* HTML_MIME               = "text/html";
};

enum ExitCode {
    EXIT_PATH_FOUND          = 0,
    EXIT_FAILURE_GENERIC     = 1,
    EXIT_NO_PATH             = 2,
    EXIT_START_NOT_FETCHABLE = 3,
    EXIT_CANCELLED           = 4
};

inline bool is_redirect_status(long status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 || status_code == 307
           || status_code == 308;
}

}  // namespace Core
}  // namespace Wikipath
