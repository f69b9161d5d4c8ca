#pragma once

#include <depwatch/unit_index.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace depwatch {

// file location -> owning unit (unique), file basename -> owning units.
//
// The basename map keeps units in discovery order (UnitIndex::units(), i.e.
// sorted by identifier, then insertion order for files added later). When a
// lookup has to fall back to the basename and several units share it, the
// first one wins. That tie-break is the only guarantee made.
class FileIndex {
public:
    void rebuild(const UnitIndex& units);
    void clear();

    // Returns false (and logs) when `file` is already owned by another unit;
    // the existing owner is kept.
    bool insert(const std::filesystem::path& file, const std::string& unit);
    // Returns false if the file was not indexed.
    bool remove(const std::filesystem::path& file);
    // Drop every file owned by `unit`.
    void remove_unit(const std::string& unit);

    // Exact location only.
    std::optional<std::string> owner(const std::filesystem::path& file) const;

    // Exact location, then (if allowed) the first unit owning a file with the
    // same basename. The fallback is only tried for files that exist on
    // disk, so a removed file never gets re-attributed to a namesake.
    std::optional<std::string> lookup(const std::filesystem::path& file,
                                      bool basename_fallback) const;

    const std::vector<std::string>& units_with_basename(const std::string& name) const;

    size_t size() const { return path_to_unit_.size(); }

private:
    std::unordered_map<std::string, std::string> path_to_unit_;
    std::unordered_map<std::string, std::vector<std::string>> basename_to_units_;
};

} // namespace depwatch
