#pragma once
#include <string>
#include <vector>
#include "graph.hpp"

namespace Wikipath {
namespace Engine {

class PathFinder {
public:
    // Breadth-first search over the edges recorded so far. The result is the
    // shortest path within the explored graph only; nodes the crawl never
    // expanded may hide a shorter one. Empty when target is unreachable.
    static std::vector<std::string> shortest_path(const Graph&       graph,
                                                  const std::string& start,
                                                  const std::string& target);
};

}  // namespace Engine
}  // namespace Wikipath
