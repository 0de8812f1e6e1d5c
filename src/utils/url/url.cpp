#include "url.hpp"
#include <string_view>
#include <vector>

namespace Wikipath {
namespace Utils {

namespace {

bool has_scheme(std::string_view sv) {
    size_t colon = sv.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return false;
    size_t delimiter = sv.find_first_of("/?#");
    return delimiter == std::string_view::npos || colon < delimiter;
}

void split_host_port(const std::string& host_port, UrlParsed& parsed) {
    if (!host_port.empty() && host_port[0] == '[') {
        size_t end_bracket = host_port.find(']');
        if (end_bracket == std::string::npos) {
            parsed.host = host_port;
            return;
        }
        parsed.host    = host_port.substr(0, end_bracket + 1);
        size_t p_colon = host_port.find(':', end_bracket + 1);
        if (p_colon != std::string::npos)
            parsed.port = host_port.substr(p_colon + 1);
        return;
    }

    size_t p_colon = host_port.find_last_of(':');
    if (p_colon == std::string::npos) {
        parsed.host = host_port;
        return;
    }
    parsed.host = host_port.substr(0, p_colon);
    parsed.port = host_port.substr(p_colon + 1);
}

std::string authority_of(const UrlParsed& parsed) {
    if (parsed.port.empty())
        return parsed.host;
    return parsed.host + ":" + parsed.port;
}

// RFC 3986 5.2.4, applied to an absolute path.
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t                   begin = 1;
    while (begin <= path.size()) {
        size_t      end     = path.find('/', begin);
        std::string segment = path.substr(begin, end == std::string::npos ? std::string::npos
                                                                           : end - begin);
        bool        last    = end == std::string::npos;

        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            if (last)
                segments.emplace_back();
        }
        else if (segment == ".") {
            if (last)
                segments.emplace_back();
        }
        else {
            segments.push_back(std::move(segment));
        }

        if (last)
            break;
        begin = end + 1;
    }

    std::string out;
    for (const auto& segment : segments) {
        out += '/';
        out += segment;
    }
    return out.empty() ? "/" : out;
}

std::string merge_path(const UrlParsed& base, const std::string& relative_path) {
    if (!base.host.empty() && (base.path.empty() || base.path == "/"))
        return "/" + relative_path;
    size_t last_slash = base.path.find_last_of('/');
    if (last_slash == std::string::npos)
        return "/" + relative_path;
    return base.path.substr(0, last_slash + 1) + relative_path;
}

std::string compose(const UrlParsed& parsed) {
    std::string out = parsed.scheme + "://" + authority_of(parsed) + parsed.path;
    if (!parsed.query.empty())
        out += "?" + parsed.query;
    if (!parsed.fragment.empty())
        out += "#" + parsed.fragment;
    return out;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;
    if (has_scheme(sv)) {
        size_t colon  = sv.find(':');
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv.remove_prefix(end_auth == std::string_view::npos ? sv.size() : end_auth);

        size_t at = authority.find_last_of('@');
        split_host_port(at == std::string::npos ? authority : authority.substr(at + 1), parsed);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

// Joins `relative` against `base`. Returns an empty string for references
// that do not address a fetchable page (mailto:, javascript:, ...).
std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (has_scheme(relative)) {
        std::string scheme = relative.substr(0, relative.find(':'));
        if (scheme != "http" && scheme != "https")
            return "";
        return relative;
    }

    UrlParsed target = parse(base);
    if (target.scheme.empty() || target.host.empty())
        return "";

    if (relative.compare(0, 2, "//") == 0)
        return target.scheme + ":" + relative;

    UrlParsed reference = parse(relative);
    target.fragment     = reference.fragment;

    if (relative[0] == '#')
        return compose(target);

    if (relative[0] == '?') {
        target.query = reference.query;
        return compose(target);
    }

    target.query = reference.query;
    if (relative[0] == '/')
        target.path = remove_dot_segments(reference.path);
    else
        target.path = remove_dot_segments(merge_path(target, reference.path));
    return compose(target);
}

std::string Url::request_target(const UrlParsed& parsed) {
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;
    return target;
}

std::string Url::default_port(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

}  // namespace Utils
}  // namespace Wikipath
