#pragma once
#include <string>
#include <vector>
#include "../../utils/text/link_extractor.hpp"

namespace Wikipath {
namespace Engine {

struct PrioritizedLink {
    int         priority = 0;
    std::string href;
};

class LinkPrioritizer {
public:
    // One entry per anchor, in anchor order. The priority is the index of the
    // first keyword found (case-insensitively) in the anchor text or href, or
    // keywords.size() when none matches.
    static std::vector<PrioritizedLink>
    prioritize(const std::vector<Wikipath::Utils::Text::Anchor>& anchors,
               const std::vector<std::string>&                   keywords);
};

}  // namespace Engine
}  // namespace Wikipath
