#pragma once

#include <depwatch/unit_lister.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// In-memory UnitLister. Units are keyed by directory; tests mutate `units`
// between scans to simulate edits on disk.
class FakeUnitLister : public depwatch::UnitLister {
public:
    std::map<std::filesystem::path, depwatch::UnitMetadata> units;
    std::vector<depwatch::DepwatchError> failures;
    bool fail_listing = false;
    int list_calls = 0;
    int directory_calls = 0;

    depwatch::UnitMetadata& add(const std::filesystem::path& dir,
                                const std::string& id,
                                const std::string& package,
                                std::vector<std::string> files,
                                std::vector<std::string> deps = {}) {
        depwatch::UnitMetadata meta;
        meta.identifier = id;
        meta.package_name = package;
        meta.directory = dir;
        meta.source_files = std::move(files);
        meta.dependencies = std::move(deps);
        meta.buildable = package == "main";
        return units[dir] = std::move(meta);
    }

    depwatch::Result<depwatch::UnitListing> list_units(const std::filesystem::path&) override {
        ++list_calls;
        if (fail_listing) {
            return depwatch::DepwatchError{depwatch::DepwatchError::IO, "lister unavailable"};
        }
        depwatch::UnitListing listing;
        for (const auto& [dir, meta] : units) listing.units.push_back(meta);
        listing.failures = failures;
        return depwatch::Result<depwatch::UnitListing>::ok(std::move(listing));
    }

    depwatch::Result<depwatch::UnitMetadata> list_directory(
            const std::filesystem::path&, const std::filesystem::path& dir) override {
        ++directory_calls;
        auto it = units.find(dir);
        if (it == units.end()) {
            return depwatch::DepwatchError{depwatch::DepwatchError::NotFound,
                                           "no unit in " + dir.string()};
        }
        return depwatch::Result<depwatch::UnitMetadata>::ok(it->second);
    }

    bool is_source_file(const std::filesystem::path& path, bool include_tests) const override {
        if (path.extension() != ".go") return false;
        std::string name = path.filename().string();
        bool test = name.size() > 8 && name.compare(name.size() - 8, 8, "_test.go") == 0;
        return include_tests || !test;
    }
};
