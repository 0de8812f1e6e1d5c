#include "path_finder.hpp"
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace Wikipath {
namespace Engine {

std::vector<std::string> PathFinder::shortest_path(const Graph&       graph,
                                                   const std::string& start,
                                                   const std::string& target) {
    if (start == target)
        return {start};

    std::unordered_map<std::string, std::string> parent;
    std::deque<std::string>                      queue;
    parent.emplace(start, std::string());
    queue.push_back(start);

    bool found = false;
    while (!queue.empty() && !found) {
        std::string at = std::move(queue.front());
        queue.pop_front();

        for (const auto& next : graph.neighbors(at)) {
            if (!parent.emplace(next, at).second)
                continue;
            if (next == target) {
                found = true;
                break;
            }
            queue.push_back(next);
        }
    }

    if (!found)
        return {};

    std::vector<std::string> path;
    for (std::string node = target; node != start; node = parent.at(node)) {
        path.push_back(node);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());
    return path;
}

}  // namespace Engine
}  // namespace Wikipath
