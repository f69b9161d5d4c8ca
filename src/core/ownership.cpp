#include <depwatch/ownership.hpp>
#include <depwatch/log.hpp>
#include <depwatch/path_utils.hpp>

namespace depwatch {

namespace fs = std::filesystem;

Result<EntryResolution> OwnershipResolver::resolve_entry(const std::string& handle) const {
    if (handle.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "entry handle cannot be empty"};
    }

    EntryResolution entry;
    entry.file = canonical_path(handle, root_);

    std::error_code ec;
    if (!fs::is_regular_file(entry.file, ec)) {
        return DepwatchError{DepwatchError::InvalidInput,
            "entry file does not exist: " + entry.file.string(),
            "entry handles are resolved relative to " + root_.string()};
    }

    entry.unit = entries_.match_handle(handle, root_, units_);
    if (!entry.unit) {
        log::debug("entry handle %s does not match any entry unit", handle.c_str());
    }
    return Result<EntryResolution>::ok(std::move(entry));
}

std::optional<std::string> OwnershipResolver::unit_of(const fs::path& file) const {
    return files_.lookup(file, basename_fallback_);
}

bool OwnershipResolver::owned_by(const fs::path& file, const EntryResolution& entry) const {
    // An entry always owns its own file, indexed or not.
    if (file == entry.file) return true;
    if (!entry.unit) return false;

    auto unit = unit_of(file);
    if (!unit) {
        log::trace("%s is not part of any unit", file.string().c_str());
        return false;
    }
    return graph_.reachable(*entry.unit, *unit);
}

std::vector<std::string> OwnershipResolver::entries_owning(const std::string& basename) const {
    std::vector<std::string> result;
    const auto& candidates = files_.units_with_basename(basename);
    if (candidates.empty()) return result;

    for (const auto& entry : entries_.entries()) {
        for (const auto& unit : candidates) {
            if (graph_.reachable(entry, unit)) {
                result.push_back(entry);
                break;
            }
        }
    }
    return result;
}

} // namespace depwatch
