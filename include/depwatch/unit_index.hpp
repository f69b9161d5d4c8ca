#pragma once

#include <depwatch/result.hpp>
#include <depwatch/unit.hpp>
#include <depwatch/unit_lister.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace depwatch {

// Per-unit metadata keyed by identifier. Iteration order (units()) is sorted
// by identifier and is the discovery order every derived index uses.
class UnitIndex {
public:
    // When enabled, test files and test-only dependencies are folded into
    // each unit's files and dependencies.
    void set_include_tests(bool enabled) { include_tests_ = enabled; }
    bool include_tests() const { return include_tests_; }

    // Full scan. Replaces the index contents on success. Per-unit failures
    // are logged, kept in failures() and the unit is left out.
    Status load(UnitLister& lister, const std::filesystem::path& root);

    // Re-list one directory and replace its unit wholesale.
    // NotFound if the directory holds no unit (any previous unit is dropped).
    Result<const Unit*> rescan(UnitLister& lister,
                               const std::filesystem::path& root,
                               const std::filesystem::path& directory);

    // Normalize lister output into a Unit. Relative directories are taken
    // relative to `root`, relative file names relative to the directory.
    Unit normalize(const UnitMetadata& meta, const std::filesystem::path& root) const;

    void put(Unit unit);
    bool erase(const std::string& identifier);

    const Unit* find(const std::string& identifier) const;
    const Unit* find_by_directory(const std::filesystem::path& directory) const;

    // Returns false if the unit is unknown or already lists the file.
    bool add_file(const std::string& identifier, const std::filesystem::path& file);
    // Returns the number of files the unit still has, 0 when unknown.
    size_t remove_file(const std::string& identifier, const std::filesystem::path& file);

    // Mark the unit's metadata as out of date with its files. The marker is
    // diagnostic only: queries keep using the cached metadata and edges, and
    // every full scan re-lists all units whether stale or not.
    void invalidate(const std::string& identifier);
    bool is_stale(const std::string& identifier) const;
    size_t stale_count() const { return stale_.size(); }

    std::vector<const Unit*> units() const;
    size_t size() const { return units_.size(); }
    bool empty() const { return units_.empty(); }

    const std::vector<DepwatchError>& failures() const { return failures_; }

private:
    std::map<std::string, Unit> units_;
    std::unordered_map<std::string, std::string> dir_to_unit_;
    std::set<std::string> stale_;
    std::vector<DepwatchError> failures_;
    bool include_tests_ = false;
};

} // namespace depwatch
