#include "graph.hpp"

namespace Wikipath {
namespace Engine {

bool Graph::has_entry(const std::string& node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacency_.find(node) != adjacency_.end();
}

bool Graph::claim(const std::string& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacency_.try_emplace(node).second;
}

void Graph::add_edge(const std::string& source, const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (adjacency_[source].insert(target).second)
        ++edges_;
}

NodeSet Graph::neighbors(const std::string& node) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = adjacency_.find(node);
    return it != adjacency_.end() ? it->second : NodeSet{};
}

size_t Graph::node_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacency_.size();
}

size_t Graph::edge_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_;
}

}  // namespace Engine
}  // namespace Wikipath
