#pragma once

#include <depwatch/unit_index.hpp>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace depwatch {

// Units that produce a standalone executable.
class EntryRegistry {
public:
    void rebuild(const UnitIndex& units);
    void clear() { entries_.clear(); }

    void add(const std::string& unit) { entries_.insert(unit); }
    void remove(const std::string& unit) { entries_.erase(unit); }

    bool is_entry_point(const std::string& unit) const {
        return entries_.count(unit) > 0;
    }

    // Resolve a caller's entry handle (a path naming its main file, relative
    // to `root` or absolute) to an entry unit. Tried in order, first hit wins:
    //   1. an entry unit listing exactly that file,
    //   2. for a handle without a directory, the entry unit at the root,
    //   3. an entry unit whose directory ends with the handle's directory,
    //   4. an entry unit whose identifier's last segment equals the name of
    //      the handle's directory.
    // Only step 1 is exact.
    std::optional<std::string> match_handle(const std::string& handle,
                                            const std::filesystem::path& root,
                                            const UnitIndex& units) const;

    const std::set<std::string>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    std::set<std::string> entries_;
};

} // namespace depwatch
