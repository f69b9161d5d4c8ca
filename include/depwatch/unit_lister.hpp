#pragma once

#include <depwatch/result.hpp>
#include <depwatch/unit.hpp>
#include <filesystem>

namespace depwatch {

// Source of build-unit metadata. Implementations may shell out to a
// toolchain or read sources directly; the engine only sees this interface.
class UnitLister {
public:
    virtual ~UnitLister() = default;

    // Describe every unit under `root`. A failure of the whole listing is a
    // ScanFailure; per-unit failures go into UnitListing::failures.
    virtual Result<UnitListing> list_units(const std::filesystem::path& root) = 0;

    // Describe the unit living in `directory` only. NotFound when the
    // directory holds no unit; ScanFailure when it holds a broken one.
    virtual Result<UnitMetadata> list_directory(const std::filesystem::path& root,
                                                const std::filesystem::path& directory) = 0;

    // Whether `path` names a file this lister attributes to units at all.
    virtual bool is_source_file(const std::filesystem::path& path,
                                bool include_tests) const = 0;
};

} // namespace depwatch
