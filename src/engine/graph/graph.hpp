#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Wikipath {
namespace Engine {

using NodeSet = std::unordered_set<std::string>;

// Adjacency sets of the explored link graph. A node has an entry once a worker
// has claimed it for expansion; edges are only ever added.
class Graph {
public:
    Graph() = default;

    Graph(const Graph&)            = delete;
    Graph& operator=(const Graph&) = delete;

    bool    has_entry(const std::string& node) const;
    bool    claim(const std::string& node);
    void    add_edge(const std::string& source, const std::string& target);
    NodeSet neighbors(const std::string& node) const;

    size_t node_count() const;
    size_t edge_count() const;

private:
    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, NodeSet> adjacency_;
    size_t                                   edges_ = 0;
};

}  // namespace Engine
}  // namespace Wikipath
