#include <depwatch/dep_graph.hpp>
#include <algorithm>
#include <queue>
#include <set>
#include <sstream>

namespace depwatch {

namespace {

const std::vector<std::string>& empty_list() {
    static const std::vector<std::string> none;
    return none;
}

void tree_display_impl(const std::unordered_map<std::string, std::vector<std::string>>& deps,
                       const std::string& u,
                       const std::string& prefix,
                       bool is_last,
                       bool is_root,
                       std::unordered_set<std::string>& visited,
                       std::ostringstream& out) {
    out << prefix;
    if (!is_root) {
        out << (is_last ? "└── " : "├── ");
    }
    out << u;

    if (!visited.insert(u).second) {
        out << " (*)\n";
        return;
    }
    out << "\n";

    auto it = deps.find(u);
    if (it == deps.end()) return;
    const auto& edges = it->second;
    for (size_t i = 0; i < edges.size(); ++i) {
        std::string child_prefix = prefix;
        if (!is_root) {
            child_prefix += (is_last ? "    " : "│   ");
        }
        tree_display_impl(deps, edges[i], child_prefix,
                          i == edges.size() - 1, false, visited, out);
    }
}

} // namespace

void DependencyGraph::clear() {
    deps_.clear();
    rdeps_.clear();
    closures_.clear();
}

void DependencyGraph::unlink_reverse(const std::string& from, const std::string& to) {
    auto it = rdeps_.find(to);
    if (it == rdeps_.end()) return;
    auto& importers = it->second;
    importers.erase(std::remove(importers.begin(), importers.end(), from), importers.end());
    if (importers.empty()) rdeps_.erase(it);
}

void DependencyGraph::set_edges(const std::string& unit, std::vector<std::string> deps) {
    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    deps.erase(std::remove(deps.begin(), deps.end(), unit), deps.end());

    auto it = deps_.find(unit);
    if (it != deps_.end()) {
        for (const auto& old : it->second) {
            unlink_reverse(unit, old);
        }
    }
    for (const auto& d : deps) {
        rdeps_[d].push_back(unit);
    }
    deps_[unit] = std::move(deps);
    closures_.clear();
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    if (from == to) return;
    auto& out = deps_[from];
    auto pos = std::lower_bound(out.begin(), out.end(), to);
    if (pos != out.end() && *pos == to) return;
    out.insert(pos, to);
    rdeps_[to].push_back(from);
    closures_.clear();
}

void DependencyGraph::remove_unit(const std::string& unit) {
    auto it = deps_.find(unit);
    if (it != deps_.end()) {
        for (const auto& d : it->second) {
            unlink_reverse(unit, d);
        }
        deps_.erase(it);
    }

    auto rit = rdeps_.find(unit);
    if (rit != rdeps_.end()) {
        for (const auto& importer : rit->second) {
            auto dit = deps_.find(importer);
            if (dit == deps_.end()) continue;
            auto& out = dit->second;
            out.erase(std::remove(out.begin(), out.end(), unit), out.end());
        }
        rdeps_.erase(rit);
    }
    closures_.clear();
}

bool DependencyGraph::has_unit(const std::string& unit) const {
    return deps_.count(unit) > 0;
}

bool DependencyGraph::has_edge(const std::string& from, const std::string& to) const {
    auto it = deps_.find(from);
    if (it == deps_.end()) return false;
    return std::binary_search(it->second.begin(), it->second.end(), to);
}

const std::vector<std::string>& DependencyGraph::dependencies(const std::string& unit) const {
    auto it = deps_.find(unit);
    return it == deps_.end() ? empty_list() : it->second;
}

const std::vector<std::string>& DependencyGraph::dependents(const std::string& unit) const {
    auto it = rdeps_.find(unit);
    return it == rdeps_.end() ? empty_list() : it->second;
}

const std::unordered_set<std::string>& DependencyGraph::closure(const std::string& from) const {
    auto cached = closures_.find(from);
    if (cached != closures_.end()) return cached->second;

    // Iterative DFS; the visited set keeps diamond-shaped graphs linear.
    std::unordered_set<std::string> visited;
    std::vector<const std::string*> stack;
    visited.insert(from);
    stack.push_back(&from);
    while (!stack.empty()) {
        const std::string* u = stack.back();
        stack.pop_back();
        auto it = deps_.find(*u);
        if (it == deps_.end()) continue;
        for (const auto& d : it->second) {
            if (visited.insert(d).second) {
                stack.push_back(&d);
            }
        }
    }
    return closures_.emplace(from, std::move(visited)).first->second;
}

bool DependencyGraph::reachable(const std::string& from, const std::string& to) const {
    if (from == to) return true;
    return closure(from).count(to) > 0;
}

Result<std::vector<std::string>> DependencyGraph::topological_order() const {
    std::set<std::string> nodes;
    for (const auto& [u, out] : deps_) {
        nodes.insert(u);
        nodes.insert(out.begin(), out.end());
    }

    std::unordered_map<std::string, size_t> in_deg;
    for (const auto& n : nodes) in_deg[n] = 0;
    for (const auto& [u, out] : deps_) {
        for (const auto& d : out) ++in_deg[d];
    }

    std::queue<std::string> q;
    for (const auto& n : nodes) {
        if (in_deg[n] == 0) q.push(n);
    }

    std::vector<std::string> order;
    order.reserve(nodes.size());
    while (!q.empty()) {
        std::string u = q.front();
        q.pop();
        order.push_back(u);
        for (const auto& d : dependencies(u)) {
            if (--in_deg[d] == 0) q.push(d);
        }
    }

    if (order.size() != nodes.size()) {
        std::string stuck;
        for (const auto& [n, deg] : in_deg) {
            if (deg > 0 && deps_.count(n)) {
                stuck = n;
                break;
            }
        }
        return DepwatchError{DepwatchError::Cycle,
            "dependency graph contains a cycle through " + stuck,
            "unit listings should never form an import cycle; check the lister output"};
    }
    return Result<std::vector<std::string>>::ok(std::move(order));
}

std::string DependencyGraph::tree_display(const std::string& root) const {
    std::ostringstream out;
    std::unordered_set<std::string> visited;
    tree_display_impl(deps_, root, "", true, true, visited, out);
    return out.str();
}

size_t DependencyGraph::edge_count() const {
    size_t n = 0;
    for (const auto& [u, out] : deps_) n += out.size();
    return n;
}

} // namespace depwatch
