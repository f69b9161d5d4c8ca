#pragma once

#include <depwatch/error.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace depwatch {

// Raw build-unit metadata as reported by a UnitLister. File names may be
// relative to `directory`; the UnitIndex normalizes them.
struct UnitMetadata {
    std::string identifier;               // e.g. "example.com/app/db"
    std::string package_name;             // declared name, "main" for executables
    std::filesystem::path directory;
    std::vector<std::string> source_files;
    std::vector<std::string> dependencies;       // direct dependency identifiers
    std::vector<std::string> test_source_files;
    std::vector<std::string> test_dependencies;  // imports only test files add
    bool buildable = false;               // produces a standalone executable
};

// Whole-tree listing. A unit the lister could not describe shows up in
// `failures` instead of `units`; it never aborts the others.
struct UnitListing {
    std::vector<UnitMetadata> units;
    std::vector<DepwatchError> failures;
};

// Normalized unit as held by the UnitIndex.
struct Unit {
    std::string identifier;
    std::string package_name;
    std::filesystem::path directory;          // canonical
    std::vector<std::filesystem::path> files; // canonical, listing order
    std::vector<std::string> dependencies;    // sorted, unique
    bool entry_point = false;
};

} // namespace depwatch
