#include <depwatch/go/listers.hpp>
#include <depwatch/go/go_source.hpp>
#include <depwatch/log.hpp>
#include <depwatch/path_utils.hpp>
#include <algorithm>
#include <set>

namespace depwatch::go {

namespace fs = std::filesystem;

namespace {

// Files the go tool ignores regardless of build tags.
bool ignored_file(const fs::path& p) {
    std::string name = p.filename().string();
    return name.empty() || name[0] == '.' || name[0] == '_';
}

std::vector<fs::path> go_files_in(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto& p = entry.path();
        if (is_go_file(p) && !ignored_file(p)) files.push_back(p);
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string unit_identifier(const std::string& module, const fs::path& root, const fs::path& dir) {
    fs::path rel = dir.lexically_relative(root);
    if (rel.empty() || rel == ".") return module;
    return module + "/" + rel.generic_string();
}

} // namespace

bool SourceScanUnitLister::skip_directory(const fs::path& dir, const fs::path& root) const {
    if (dir == root) return false;
    std::string name = dir.filename().string();
    if (name.empty() || name[0] == '.' || name[0] == '_') return true;
    if (name == "testdata" || name == "vendor") return true;
    if (std::find(skip_dirs_.begin(), skip_dirs_.end(), name) != skip_dirs_.end()) return true;

    // A nested go.mod starts a different module.
    std::error_code ec;
    return fs::exists(dir / "go.mod", ec);
}

Result<UnitMetadata> SourceScanUnitLister::describe(const fs::path& root,
                                                    const std::string& module,
                                                    const fs::path& directory) const {
    std::string id = unit_identifier(module, root, directory);

    UnitMetadata meta;
    meta.identifier = id;
    meta.directory = directory;

    std::set<std::string> deps, test_deps;
    std::string first_file;
    for (const auto& file : go_files_in(directory)) {
        auto header = scan_go_file(file);
        if (header.is_err()) {
            auto err = std::move(header).error();
            err.message = id + ": " + err.message;
            err.code = DepwatchError::ScanFailure;
            return err;
        }

        const auto& h = header.value();
        std::string name = file.filename().string();
        bool test = is_go_test_file(file);
        // Test files may declare the external "<name>_test" package.
        if (!test) {
            if (meta.package_name.empty()) {
                meta.package_name = h.package_name;
                first_file = name;
            } else if (h.package_name != meta.package_name) {
                return DepwatchError{DepwatchError::ScanFailure,
                    id + ": found packages " + meta.package_name + " (" + first_file +
                        ") and " + h.package_name + " (" + name + ")",
                    "", file.string(), h.package_line};
            }
        }

        auto& into = test ? test_deps : deps;
        for (const auto& imp : h.imports) {
            if (imp.path != "C") into.insert(imp.path);
        }
        (test ? meta.test_source_files : meta.source_files).push_back(name);
    }

    if (meta.source_files.empty()) {
        return DepwatchError{DepwatchError::NotFound,
            "no non-test Go files in " + directory.string()};
    }

    meta.dependencies.assign(deps.begin(), deps.end());
    meta.test_dependencies.assign(test_deps.begin(), test_deps.end());
    meta.buildable = meta.package_name == "main";
    return Result<UnitMetadata>::ok(std::move(meta));
}

Result<UnitListing> SourceScanUnitLister::list_units(const fs::path& root) {
    auto module = read_module_path(root / "go.mod");
    if (module.is_err()) {
        auto err = std::move(module).error();
        err.code = DepwatchError::ScanFailure;
        if (err.hint.empty()) err.hint = "the source lister needs a go.mod at the root";
        return err;
    }

    std::vector<fs::path> dirs{root};
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return DepwatchError{DepwatchError::ScanFailure,
            "cannot walk " + root.string() + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            log::warn("walk of %s stopped early: %s", root.string().c_str(),
                      ec.message().c_str());
            break;
        }
        if (!it->is_directory(ec)) continue;
        if (skip_directory(it->path(), root)) {
            it.disable_recursion_pending();
            continue;
        }
        dirs.push_back(it->path());
    }
    std::sort(dirs.begin(), dirs.end());

    UnitListing listing;
    for (const auto& dir : dirs) {
        auto meta = describe(root, module.value(), dir);
        if (meta.is_ok()) {
            listing.units.push_back(std::move(meta).value());
        } else if (meta.error().code != DepwatchError::NotFound) {
            listing.failures.push_back(std::move(meta).error());
        }
    }
    log::debug("scanned %zu directories, %zu packages", dirs.size(), listing.units.size());
    return Result<UnitListing>::ok(std::move(listing));
}

Result<UnitMetadata> SourceScanUnitLister::list_directory(const fs::path& root,
                                                          const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec) || !path_within(directory, root)) {
        return DepwatchError{DepwatchError::NotFound,
            "no package in " + directory.string()};
    }
    for (fs::path d = directory; d != root && d.has_parent_path(); d = d.parent_path()) {
        if (skip_directory(d, root)) {
            return DepwatchError{DepwatchError::NotFound,
                directory.string() + " is excluded from scanning"};
        }
    }

    auto module = read_module_path(root / "go.mod");
    if (module.is_err()) {
        return std::move(module).with_code(DepwatchError::ScanFailure).error();
    }
    return describe(root, module.value(), directory);
}

bool SourceScanUnitLister::is_source_file(const fs::path& path, bool include_tests) const {
    if (!is_go_file(path) || ignored_file(path)) return false;
    return include_tests || !is_go_test_file(path);
}

} // namespace depwatch::go
