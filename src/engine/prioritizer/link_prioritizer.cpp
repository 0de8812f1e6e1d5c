#include "link_prioritizer.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Wikipath {
namespace Engine {

using Wikipath::Utils::Text::Anchor;
using Wikipath::Utils::Text::to_lower;

std::vector<PrioritizedLink> LinkPrioritizer::prioritize(const std::vector<Anchor>&      anchors,
                                                         const std::vector<std::string>& keywords) {
    std::vector<std::string> lowered;
    lowered.reserve(keywords.size());
    for (const auto& keyword : keywords) {
        lowered.push_back(to_lower(keyword));
    }

    std::vector<PrioritizedLink> links;
    links.reserve(anchors.size());
    for (const auto& anchor : anchors) {
        std::string text = to_lower(anchor.text);
        std::string href = to_lower(anchor.href);

        int priority = static_cast<int>(lowered.size());
        for (size_t i = 0; i < lowered.size(); ++i) {
            if (text.find(lowered[i]) != std::string::npos
                || href.find(lowered[i]) != std::string::npos) {
                priority = static_cast<int>(i);
                break;
            }
        }
        links.push_back(PrioritizedLink{priority, anchor.href});
    }
    return links;
}

}  // namespace Engine
}  // namespace Wikipath
