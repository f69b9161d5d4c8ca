#include <depwatch/entry_registry.hpp>
#include <depwatch/log.hpp>
#include <depwatch/path_utils.hpp>
#include <algorithm>

namespace depwatch {

namespace fs = std::filesystem;

void EntryRegistry::rebuild(const UnitIndex& units) {
    entries_.clear();
    for (const Unit* unit : units.units()) {
        if (unit->entry_point) entries_.insert(unit->identifier);
    }
}

std::optional<std::string> EntryRegistry::match_handle(const std::string& handle,
                                                       const fs::path& root,
                                                       const UnitIndex& units) const {
    if (handle.empty()) return std::nullopt;

    fs::path handle_file = canonical_path(handle, root);
    for (const auto& id : entries_) {
        const Unit* unit = units.find(id);
        if (!unit) continue;
        if (std::find(unit->files.begin(), unit->files.end(), handle_file) != unit->files.end()) {
            return id;
        }
    }

    // Directory of the handle, relative to root when possible.
    fs::path handle_dir = fs::path(handle).parent_path().lexically_normal();
    if (handle_dir.is_absolute()) {
        handle_dir = handle_file.parent_path().lexically_relative(root);
    }

    if (handle_dir.empty() || handle_dir == ".") {
        for (const auto& id : entries_) {
            const Unit* unit = units.find(id);
            if (unit && unit->directory == root) return id;
        }
        return std::nullopt;
    }

    for (const auto& id : entries_) {
        const Unit* unit = units.find(id);
        if (unit && path_has_suffix(unit->directory, handle_dir)) {
            log::trace("entry handle %s matched %s by directory", handle.c_str(), id.c_str());
            return id;
        }
    }

    std::string dir_name = handle_dir.filename().string();
    for (const auto& id : entries_) {
        if (last_segment(id) == dir_name) {
            log::trace("entry handle %s matched %s by name", handle.c_str(), id.c_str());
            return id;
        }
    }
    return std::nullopt;
}

} // namespace depwatch
