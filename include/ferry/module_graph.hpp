#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ferry {

struct ModuleInfo {
    std::string key;          // cache key, or file:// URL for local modules
    std::string hash;         // SHA-256 hex of the content
    int64_t size = 0;
    bool remote = false;
    bool from_cache = false;
};

struct ImportEdge {
    std::string raw;          // specifier as written in the importer
    bool dynamic = false;
};

// ---------------------------------------------------------------------------
// ModuleGraph: modules keyed by specifier, edges are imports
// ---------------------------------------------------------------------------

class ModuleGraph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId to;
        ImportEdge data;
    };

    // Returns the existing node when `info.key` is already present
    NodeId add_module(ModuleInfo info) {
        auto it = ids_.find(info.key);
        if (it != ids_.end()) return it->second;
        NodeId id = nodes_.size();
        ids_[info.key] = id;
        nodes_.push_back(std::move(info));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_root(NodeId id) {
        for (NodeId r : roots_) {
            if (r == id) return;
        }
        roots_.push_back(id);
    }

    // Parallel edges between one pair of modules are collapsed
    void add_import(NodeId from, NodeId to, ImportEdge data = {}) {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return;
        }
        adj_[from].push_back({to, std::move(data)});
        radj_[to].push_back(from);
    }

    std::optional<NodeId> find(const std::string& key) const {
        auto it = ids_.find(key);
        if (it == ids_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& key) const { return ids_.count(key) > 0; }

    size_t size() const { return nodes_.size(); }

    const ModuleInfo& module(NodeId id) const { return nodes_[id]; }
    ModuleInfo& module(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& imports_of(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& importers_of(NodeId id) const { return radj_[id]; }
    const std::vector<NodeId>& roots() const { return roots_; }

    int64_t total_size() const {
        int64_t total = 0;
        for (const auto& n : nodes_) total += n.size;
        return total;
    }

    // Dependencies before dependents (post-order DFS from the roots).
    // Import cycles are legal in ES modules; the back edge is skipped.
    std::vector<NodeId> load_order() const {
        std::vector<NodeId> order;
        std::unordered_set<NodeId> visited;
        for (NodeId r : roots_) post_order(r, visited, order);
        return order;
    }

    // Kahn's algorithm over the whole graph
    bool has_cycle() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        for (size_t i = 0; i < n; ++i) {
            in_deg[i] = radj_[i].size();
        }

        std::queue<NodeId> q;
        for (size_t i = 0; i < n; ++i) {
            if (in_deg[i] == 0) q.push(i);
        }

        size_t seen = 0;
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            ++seen;
            for (const auto& e : adj_[u]) {
                if (--in_deg[e.to] == 0) {
                    q.push(e.to);
                }
            }
        }
        return seen != n;
    }

    // Dependency tree as text; repeated subtrees are marked (*)
    std::string tree_display(
        NodeId root,
        std::function<std::string(const ModuleInfo&)> to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, true, visited, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<ModuleInfo> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;
    std::unordered_map<std::string, NodeId> ids_;
    std::vector<NodeId> roots_;

    void post_order(NodeId u, std::unordered_set<NodeId>& visited,
                    std::vector<NodeId>& order) const {
        if (!visited.insert(u).second) return;
        for (const auto& e : adj_[u]) {
            post_order(e.to, visited, order);
        }
        order.push_back(u);
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        bool is_root,
        std::unordered_set<NodeId>& visited,
        std::function<std::string(const ModuleInfo&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!is_root) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << (adj_[u].empty() ? "\n" : " (*)\n");
            return;
        }
        out << "\n";

        auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            std::string child_prefix = prefix;
            if (!is_root) {
                child_prefix += (is_last ? "    " : "│   ");
            }
            tree_display_impl(edges[i].to, child_prefix,
                              i == edges.size() - 1, false,
                              visited, to_string_fn, out);
        }
    }
};

} // namespace ferry
