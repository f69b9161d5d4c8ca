#include <depwatch/unit_index.hpp>
#include <depwatch/log.hpp>
#include <depwatch/path_utils.hpp>
#include <algorithm>

namespace depwatch {

namespace fs = std::filesystem;

Unit UnitIndex::normalize(const UnitMetadata& meta, const fs::path& root) const {
    Unit unit;
    unit.identifier = meta.identifier;
    unit.package_name = meta.package_name;
    unit.directory = canonical_path(meta.directory, root);
    unit.entry_point = meta.buildable;

    auto add_files = [&](const std::vector<std::string>& names) {
        for (const auto& name : names) {
            fs::path p(name);
            p = p.is_absolute() ? canonical_path(p) : (unit.directory / p).lexically_normal();
            if (std::find(unit.files.begin(), unit.files.end(), p) == unit.files.end()) {
                unit.files.push_back(std::move(p));
            }
        }
    };
    add_files(meta.source_files);

    unit.dependencies = meta.dependencies;
    if (include_tests_) {
        add_files(meta.test_source_files);
        unit.dependencies.insert(unit.dependencies.end(),
                                 meta.test_dependencies.begin(),
                                 meta.test_dependencies.end());
    }

    std::sort(unit.dependencies.begin(), unit.dependencies.end());
    unit.dependencies.erase(
        std::unique(unit.dependencies.begin(), unit.dependencies.end()),
        unit.dependencies.end());
    // A unit importing itself would be a toolchain error; never record it.
    unit.dependencies.erase(
        std::remove(unit.dependencies.begin(), unit.dependencies.end(), unit.identifier),
        unit.dependencies.end());
    return unit;
}

Status UnitIndex::load(UnitLister& lister, const fs::path& root) {
    auto listing = lister.list_units(root);
    if (listing.is_err()) {
        auto err = std::move(listing).error();
        err.code = DepwatchError::ScanFailure;
        return err;
    }

    units_.clear();
    dir_to_unit_.clear();
    stale_.clear();
    failures_ = std::move(listing.value().failures);

    for (const auto& failure : failures_) {
        log::warn("skipping unit: %s", failure.message.c_str());
    }

    for (const auto& meta : listing.value().units) {
        if (meta.identifier.empty()) {
            log::warn("skipping unit with empty identifier in %s",
                      meta.directory.string().c_str());
            continue;
        }
        if (units_.count(meta.identifier)) {
            log::warn("unit %s listed twice, keeping the first",
                      meta.identifier.c_str());
            continue;
        }
        put(normalize(meta, root));
    }
    return ok_status();
}

Result<const Unit*> UnitIndex::rescan(UnitLister& lister,
                                      const fs::path& root,
                                      const fs::path& directory) {
    fs::path dir = canonical_path(directory, root);
    auto meta = lister.list_directory(root, dir);

    auto existing = dir_to_unit_.find(dir.string());
    if (meta.is_err()) {
        if (meta.error().code == DepwatchError::NotFound && existing != dir_to_unit_.end()) {
            erase(std::string(existing->second));
        }
        return std::move(meta).error();
    }

    if (existing != dir_to_unit_.end() && existing->second != meta.value().identifier) {
        erase(std::string(existing->second));
    }

    Unit unit = normalize(meta.value(), root);
    std::string id = unit.identifier;
    put(std::move(unit));
    return Result<const Unit*>::ok(find(id));
}

void UnitIndex::put(Unit unit) {
    auto old = units_.find(unit.identifier);
    if (old != units_.end()) {
        dir_to_unit_.erase(old->second.directory.string());
    }
    stale_.erase(unit.identifier);
    dir_to_unit_[unit.directory.string()] = unit.identifier;
    std::string id = unit.identifier;
    units_[id] = std::move(unit);
}

bool UnitIndex::erase(const std::string& identifier) {
    auto it = units_.find(identifier);
    if (it == units_.end()) return false;
    auto dir = dir_to_unit_.find(it->second.directory.string());
    if (dir != dir_to_unit_.end() && dir->second == identifier) {
        dir_to_unit_.erase(dir);
    }
    stale_.erase(identifier);
    units_.erase(it);
    return true;
}

const Unit* UnitIndex::find(const std::string& identifier) const {
    auto it = units_.find(identifier);
    return it == units_.end() ? nullptr : &it->second;
}

const Unit* UnitIndex::find_by_directory(const fs::path& directory) const {
    auto it = dir_to_unit_.find(directory.string());
    if (it == dir_to_unit_.end()) return nullptr;
    return find(it->second);
}

bool UnitIndex::add_file(const std::string& identifier, const fs::path& file) {
    auto it = units_.find(identifier);
    if (it == units_.end()) return false;
    auto& files = it->second.files;
    if (std::find(files.begin(), files.end(), file) != files.end()) return false;
    files.push_back(file);
    return true;
}

size_t UnitIndex::remove_file(const std::string& identifier, const fs::path& file) {
    auto it = units_.find(identifier);
    if (it == units_.end()) return 0;
    auto& files = it->second.files;
    files.erase(std::remove(files.begin(), files.end(), file), files.end());
    return files.size();
}

void UnitIndex::invalidate(const std::string& identifier) {
    if (units_.count(identifier)) {
        stale_.insert(identifier);
    }
}

bool UnitIndex::is_stale(const std::string& identifier) const {
    return stale_.count(identifier) > 0;
}

std::vector<const Unit*> UnitIndex::units() const {
    std::vector<const Unit*> out;
    out.reserve(units_.size());
    for (const auto& [id, unit] : units_) {
        out.push_back(&unit);
    }
    return out;
}

} // namespace depwatch
