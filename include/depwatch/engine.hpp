#pragma once

#include <depwatch/dep_graph.hpp>
#include <depwatch/entry_registry.hpp>
#include <depwatch/file_index.hpp>
#include <depwatch/ownership.hpp>
#include <depwatch/result.hpp>
#include <depwatch/unit_index.hpp>
#include <depwatch/unit_lister.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace depwatch {

enum class FileEvent { Create, Write, Remove, Rename };

// "create", "write", "remove", "rename" (watcher spelling), anything else is
// InvalidInput.
Result<FileEvent> parse_file_event(const std::string& name);
const char* file_event_name(FileEvent event);

struct EngineOptions {
    bool test_imports = false;       // index test files and test-only imports
    bool basename_fallback = true;   // see FileIndex::lookup
};

// Dependency-graph cache and ownership resolver for one source tree.
//
// Lifecycle: the engine starts Uninitialized and performs a full scan on the
// first query. Once Ready, file events patch the indexes in place:
//
//   create  new file joins the unit of its directory; a new directory is
//           listed on its own and joins the graph as a new unit. Paths
//           that are no longer on disk are ignored
//   remove  file leaves its unit; a unit without files leaves the graph
//   rename  remove followed by create
//   write   to any file of an entry unit, not only the entry file named by
//           the query: full rebuild (its imports may have changed, and
//           newly imported units may not be indexed yet). This rebuilds
//           more often than strictly needed for multi-file entry units.
//           Anything else only marks that unit's metadata stale
//
// Only rebuild() or a change of options goes back to a full scan.
// The engine is single-threaded; callers sharing one across threads must
// serialize every call behind one lock.
class Engine {
public:
    enum class State { Uninitialized, Ready };

    Engine(std::filesystem::path root,
           std::unique_ptr<UnitLister> lister,
           EngineOptions options = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Does the build of the entry named by `entry_handle` include
    // `changed_file`? The event is applied to the cache first.
    //   - empty arguments, a missing entry file: InvalidInput
    //   - scan failures: ScanFailure
    //   - files outside every unit: false, not an error
    // `entry_handle` is relative to the root (or absolute); `changed_file`
    // is relative to the current directory (or absolute).
    Result<bool> owned_by(const std::string& entry_handle,
                          const std::string& changed_file,
                          FileEvent event);

    // Entry units whose build includes a file named `file_basename`, sorted.
    Result<std::vector<std::string>> entries_owning(const std::string& file_basename);

    // Units matched by `source_pattern` that transitively import a unit
    // matched by any of `target_patterns`. Patterns are an identifier, an
    // identifier prefix ending in "/...", "..." for everything, or the same
    // forms starting with "./" which match directories relative to the root.
    // A unit is not reported for matching only itself.
    Result<std::vector<std::string>> find_reverse_deps(
        const std::string& source_pattern,
        const std::vector<std::string>& target_patterns);

    // Apply one file event without asking an ownership question.
    Status apply_event(FileEvent event, const std::string& file);

    // Two-path rename: remove(old_path) then create(new_path).
    Status rename(const std::string& old_path, const std::string& new_path);

    // Full scan now. On failure the engine is left Uninitialized so the next
    // query retries.
    Status rebuild();

    Status ensure_ready();

    // Changing the setting invalidates the cache.
    void set_test_imports(bool enabled);

    State state() const { return state_; }
    const std::filesystem::path& root() const { return root_; }
    const EngineOptions& options() const { return options_; }
    size_t rebuild_count() const { return rebuild_count_; }

    const UnitIndex& units() const { return units_; }
    const FileIndex& files() const { return files_; }
    const DependencyGraph& graph() const { return graph_; }
    const EntryRegistry& entry_points() const { return entries_; }

private:
    std::filesystem::path root_;
    std::unique_ptr<UnitLister> lister_;
    EngineOptions options_;
    State state_ = State::Uninitialized;
    size_t rebuild_count_ = 0;

    UnitIndex units_;
    FileIndex files_;
    DependencyGraph graph_;
    EntryRegistry entries_;

    OwnershipResolver resolver() const;

    Status apply(FileEvent event, const std::filesystem::path& file,
                 const std::filesystem::path& entry_file);
    Status handle_create(const std::filesystem::path& file);
    Status handle_remove(const std::filesystem::path& file);
    Status handle_write(const std::filesystem::path& file,
                        const std::filesystem::path& entry_file);

    void link_unit(const Unit& unit);
    bool matches_pattern(const std::string& pattern, const Unit& unit) const;
};

} // namespace depwatch
