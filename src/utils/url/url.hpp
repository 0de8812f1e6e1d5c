#pragma once
#include <string>

namespace Wikipath {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static std::string request_target(const UrlParsed& parsed);
    static std::string default_port(const std::string& scheme);
};

}  // namespace Utils
}  // namespace Wikipath
