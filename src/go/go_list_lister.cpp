#include <depwatch/go/listers.hpp>
#include <depwatch/go/go_source.hpp>
#include <depwatch/log.hpp>
#include <depwatch/process.hpp>
#include <sstream>

namespace depwatch::go {

namespace fs = std::filesystem;

namespace {

// Field order of one go list record
enum Field {
    ImportPath, Dir, Name, GoFiles, Imports,
    TestGoFiles, XTestGoFiles, TestImports, XTestImports, Error,
    FieldCount
};

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, sep)) {
        out.push_back(cur);
    }
    // getline drops a trailing empty field
    if (!s.empty() && s.back() == sep) out.emplace_back();
    return out;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    for (auto& item : split(s, ',')) {
        if (!item.empty()) out.push_back(std::move(item));
    }
    return out;
}

bool is_missing_package(const std::string& err) {
    return err.find("no Go files") != std::string::npos ||
           err.find("build constraints exclude all Go files") != std::string::npos;
}

} // namespace

const std::string& GoListUnitLister::record_format() {
    static const std::string format =
        "{{.ImportPath}}\t{{.Dir}}\t{{.Name}}\t"
        "{{join .GoFiles \",\"}}\t{{join .Imports \",\"}}\t"
        "{{join .TestGoFiles \",\"}}\t{{join .XTestGoFiles \",\"}}\t"
        "{{join .TestImports \",\"}}\t{{join .XTestImports \",\"}}\t"
        "{{if .Error}}{{printf \"%q\" .Error.Err}}{{end}}";
    return format;
}

UnitListing GoListUnitLister::parse_records(const std::string& output) {
    UnitListing listing;
    std::istringstream in(output);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto fields = split(line, '\t');
        if (fields.size() != FieldCount) {
            listing.failures.push_back(DepwatchError{DepwatchError::ScanFailure,
                "malformed go list record on line " + std::to_string(line_no),
                "expected " + std::to_string(FieldCount) + " tab-separated fields, got " +
                    std::to_string(fields.size())});
            continue;
        }

        if (!fields[Error].empty()) {
            listing.failures.push_back(DepwatchError{DepwatchError::ScanFailure,
                "package " + fields[ImportPath] + ": " + fields[Error]});
            continue;
        }

        UnitMetadata meta;
        meta.identifier = fields[ImportPath];
        meta.directory = fields[Dir];
        meta.package_name = fields[Name];
        meta.source_files = split_list(fields[GoFiles]);
        meta.dependencies = split_list(fields[Imports]);
        meta.test_source_files = split_list(fields[TestGoFiles]);
        for (auto& f : split_list(fields[XTestGoFiles])) {
            meta.test_source_files.push_back(std::move(f));
        }
        meta.test_dependencies = split_list(fields[TestImports]);
        for (auto& d : split_list(fields[XTestImports])) {
            meta.test_dependencies.push_back(std::move(d));
        }
        meta.buildable = meta.package_name == "main";
        listing.units.push_back(std::move(meta));
    }
    return listing;
}

Result<UnitListing> GoListUnitLister::run(const fs::path& root, const std::string& pattern) {
    auto cmd = run_command({go_binary_, "list", "-e", "-f", record_format(), pattern},
                           root.string(), timeout_seconds_);
    if (cmd.is_err()) {
        return std::move(cmd).with_code(DepwatchError::ScanFailure).error();
    }
    if (cmd.value().exit_code != 0) {
        std::string detail = cmd.value().stderr_str;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        return DepwatchError{DepwatchError::ScanFailure,
            go_binary_ + " list " + pattern + " failed with exit code " +
                std::to_string(cmd.value().exit_code),
            detail};
    }
    return Result<UnitListing>::ok(parse_records(cmd.value().stdout_str));
}

Result<UnitListing> GoListUnitLister::list_units(const fs::path& root) {
    auto listing = run(root, "./...");
    if (listing.is_ok()) {
        log::debug("go list reported %zu packages, %zu with errors",
                   listing.value().units.size(), listing.value().failures.size());
    }
    return listing;
}

Result<UnitMetadata> GoListUnitLister::list_directory(const fs::path& root,
                                                      const fs::path& directory) {
    fs::path rel = directory.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return DepwatchError{DepwatchError::NotFound,
            directory.string() + " is outside " + root.string()};
    }
    std::string pattern = rel == "." ? "." : "./" + rel.generic_string();

    auto listing = run(root, pattern);
    if (listing.is_err()) return std::move(listing).error();

    auto& result = listing.value();
    if (!result.failures.empty()) {
        auto err = result.failures.front();
        if (is_missing_package(err.message)) {
            err.code = DepwatchError::NotFound;
        }
        return err;
    }
    if (result.units.empty()) {
        return DepwatchError{DepwatchError::NotFound,
            "no package in " + directory.string()};
    }
    return Result<UnitMetadata>::ok(std::move(result.units.front()));
}

bool GoListUnitLister::is_source_file(const fs::path& path, bool include_tests) const {
    return is_go_file(path) && (include_tests || !is_go_test_file(path));
}

Result<std::unique_ptr<UnitLister>> make_unit_lister(const ScanConfig& scan) {
    using Ptr = std::unique_ptr<UnitLister>;
    if (scan.lister == "go-list") {
        return Result<Ptr>::ok(std::make_unique<GoListUnitLister>(scan.go_binary,
                                                                  scan.timeout_seconds));
    }
    if (scan.lister == "source") {
        return Result<Ptr>::ok(std::make_unique<SourceScanUnitLister>(scan.skip_dirs));
    }
    return DepwatchError{DepwatchError::Config,
        "unknown lister '" + scan.lister + "'",
        "expected \"go-list\" or \"source\""};
}

} // namespace depwatch::go
