#pragma once

#include <depwatch/config.hpp>
#include <depwatch/unit_lister.hpp>
#include <memory>
#include <string>
#include <vector>

namespace depwatch::go {

// Lists packages by running `go list -e -f <record> ./...` in the root.
// Every package is one tab-separated record; packages the toolchain reports
// with an error become per-unit failures.
class GoListUnitLister : public UnitLister {
public:
    explicit GoListUnitLister(std::string go_binary = "go", int timeout_seconds = 0)
        : go_binary_(std::move(go_binary)), timeout_seconds_(timeout_seconds) {}

    Result<UnitListing> list_units(const std::filesystem::path& root) override;
    Result<UnitMetadata> list_directory(const std::filesystem::path& root,
                                        const std::filesystem::path& directory) override;
    bool is_source_file(const std::filesystem::path& path, bool include_tests) const override;

    // The -f template handed to go list.
    static const std::string& record_format();

    // Parse go list output produced with record_format().
    static UnitListing parse_records(const std::string& output);

private:
    std::string go_binary_;
    int timeout_seconds_;

    Result<UnitListing> run(const std::filesystem::path& root, const std::string& pattern);
};

// Lists packages without a toolchain: reads the module path from go.mod,
// walks the tree and scans the package clause and imports of every .go file.
// Skips hidden and '_' directories, testdata, vendor, nested modules and any
// directory named in `skip_dirs`.
class SourceScanUnitLister : public UnitLister {
public:
    explicit SourceScanUnitLister(std::vector<std::string> skip_dirs = {})
        : skip_dirs_(std::move(skip_dirs)) {}

    Result<UnitListing> list_units(const std::filesystem::path& root) override;
    Result<UnitMetadata> list_directory(const std::filesystem::path& root,
                                        const std::filesystem::path& directory) override;
    bool is_source_file(const std::filesystem::path& path, bool include_tests) const override;

private:
    std::vector<std::string> skip_dirs_;

    bool skip_directory(const std::filesystem::path& dir,
                        const std::filesystem::path& root) const;
    Result<UnitMetadata> describe(const std::filesystem::path& root,
                                  const std::string& module,
                                  const std::filesystem::path& directory) const;
};

// Lister selected by the [scan] configuration.
Result<std::unique_ptr<UnitLister>> make_unit_lister(const ScanConfig& scan);

} // namespace depwatch::go
