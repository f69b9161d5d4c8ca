#pragma once

#include <depwatch/dep_graph.hpp>
#include <depwatch/entry_registry.hpp>
#include <depwatch/file_index.hpp>
#include <depwatch/result.hpp>
#include <depwatch/unit_index.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace depwatch {

// An entry handle resolved against the current indexes.
struct EntryResolution {
    std::filesystem::path file;       // canonical location of the handle's file
    std::optional<std::string> unit;  // entry unit, if one matched
};

// Read-only view answering "does entry E's build include file F".
// Holds references only; build one per query against consistent state.
class OwnershipResolver {
public:
    OwnershipResolver(const std::filesystem::path& root,
                      const UnitIndex& units,
                      const FileIndex& files,
                      const DependencyGraph& graph,
                      const EntryRegistry& entries,
                      bool basename_fallback)
        : root_(root), units_(units), files_(files), graph_(graph),
          entries_(entries), basename_fallback_(basename_fallback) {}

    // InvalidInput when the handle is empty or its file does not exist.
    Result<EntryResolution> resolve_entry(const std::string& handle) const;

    // `file` must already be canonical.
    bool owned_by(const std::filesystem::path& file, const EntryResolution& entry) const;

    // Owning unit of a canonical file location, basename fallback included.
    std::optional<std::string> unit_of(const std::filesystem::path& file) const;

    // Entry units whose build includes any unit owning a file named `basename`.
    std::vector<std::string> entries_owning(const std::string& basename) const;

private:
    const std::filesystem::path& root_;
    const UnitIndex& units_;
    const FileIndex& files_;
    const DependencyGraph& graph_;
    const EntryRegistry& entries_;
    bool basename_fallback_;
};

} // namespace depwatch
