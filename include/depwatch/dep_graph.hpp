#pragma once

#include <depwatch/result.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depwatch {

// ---------------------------------------------------------------------------
// DependencyGraph: unit -> direct dependencies, with a reverse index
// ---------------------------------------------------------------------------
//
// Nodes are unit identifiers. Targets do not have to be known units: an edge
// to a toolchain package nobody indexed is kept and simply has no successors.
//
// Reachability closures are memoized per source unit and thrown away on any
// edge mutation, so repeated queries between events are a hash lookup.
class DependencyGraph {
public:
    void clear();

    // Replace `unit`'s outgoing edges in one step.
    void set_edges(const std::string& unit, std::vector<std::string> deps);

    // Add a single edge; no-op if it already exists.
    void add_edge(const std::string& from, const std::string& to);

    // Delete `unit`'s outgoing edges and prune it from every other unit's
    // recorded edges.
    void remove_unit(const std::string& unit);

    bool has_unit(const std::string& unit) const;
    bool has_edge(const std::string& from, const std::string& to) const;

    const std::vector<std::string>& dependencies(const std::string& unit) const;
    const std::vector<std::string>& dependents(const std::string& unit) const;

    // True when from == to or `to` is transitively imported by `from`.
    bool reachable(const std::string& from, const std::string& to) const;

    // Every node reachable from `from`, `from` included.
    const std::unordered_set<std::string>& closure(const std::string& from) const;

    // Units in dependency order (importers before imports).
    // Cycle error if the acyclic-import guarantee was ever violated upstream.
    Result<std::vector<std::string>> topological_order() const;

    // Indented dependency tree below `root`; repeated subtrees are marked (*).
    std::string tree_display(const std::string& root) const;

    size_t unit_count() const { return deps_.size(); }
    size_t edge_count() const;

private:
    std::unordered_map<std::string, std::vector<std::string>> deps_;
    std::unordered_map<std::string, std::vector<std::string>> rdeps_;
    mutable std::unordered_map<std::string, std::unordered_set<std::string>> closures_;

    void unlink_reverse(const std::string& from, const std::string& to);
};

} // namespace depwatch
