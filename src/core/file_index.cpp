#include <depwatch/file_index.hpp>
#include <depwatch/log.hpp>
#include <algorithm>

namespace depwatch {

namespace fs = std::filesystem;

void FileIndex::clear() {
    path_to_unit_.clear();
    basename_to_units_.clear();
}

void FileIndex::rebuild(const UnitIndex& units) {
    clear();
    for (const Unit* unit : units.units()) {
        for (const auto& file : unit->files) {
            insert(file, unit->identifier);
        }
    }
}

bool FileIndex::insert(const fs::path& file, const std::string& unit) {
    auto [it, inserted] = path_to_unit_.emplace(file.string(), unit);
    if (!inserted) {
        if (it->second != unit) {
            log::warn("%s is claimed by both %s and %s, keeping %s",
                      file.string().c_str(), it->second.c_str(),
                      unit.c_str(), it->second.c_str());
            return false;
        }
        return true;
    }

    auto& owners = basename_to_units_[file.filename().string()];
    if (std::find(owners.begin(), owners.end(), unit) == owners.end()) {
        owners.push_back(unit);
    }
    return true;
}

bool FileIndex::remove(const fs::path& file) {
    auto it = path_to_unit_.find(file.string());
    if (it == path_to_unit_.end()) return false;
    std::string unit = it->second;
    path_to_unit_.erase(it);

    auto name = file.filename().string();
    auto bit = basename_to_units_.find(name);
    if (bit == basename_to_units_.end()) return true;

    auto& owners = bit->second;
    owners.erase(std::remove(owners.begin(), owners.end(), unit), owners.end());
    if (owners.empty()) basename_to_units_.erase(bit);
    return true;
}

void FileIndex::remove_unit(const std::string& unit) {
    for (auto it = path_to_unit_.begin(); it != path_to_unit_.end();) {
        if (it->second == unit) {
            it = path_to_unit_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = basename_to_units_.begin(); it != basename_to_units_.end();) {
        auto& owners = it->second;
        owners.erase(std::remove(owners.begin(), owners.end(), unit), owners.end());
        if (owners.empty()) {
            it = basename_to_units_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<std::string> FileIndex::owner(const fs::path& file) const {
    auto it = path_to_unit_.find(file.string());
    if (it == path_to_unit_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> FileIndex::lookup(const fs::path& file,
                                             bool basename_fallback) const {
    if (auto exact = owner(file)) return exact;
    if (!basename_fallback) return std::nullopt;

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return std::nullopt;

    const auto& owners = units_with_basename(file.filename().string());
    if (owners.empty()) return std::nullopt;
    if (owners.size() > 1) {
        log::debug("%s matches %zu units by name, using %s",
                   file.string().c_str(), owners.size(), owners.front().c_str());
    }
    return owners.front();
}

const std::vector<std::string>& FileIndex::units_with_basename(const std::string& name) const {
    static const std::vector<std::string> none;
    auto it = basename_to_units_.find(name);
    return it == basename_to_units_.end() ? none : it->second;
}

} // namespace depwatch
