#pragma once

#include <depwatch/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace depwatch::go {

struct GoImport {
    std::string path;
    std::string alias;  // "", "_", "." or an identifier
    int line = 0;
};

// Package clause and import declarations of one Go source file.
struct GoFileHeader {
    std::string package_name;
    std::vector<GoImport> imports;
    int package_line = 0;
};

// Read the package clause and every import declaration, skipping comments.
// Scanning stops at the first top-level declaration that is not an import,
// so the rest of the file may be incomplete. Parse errors carry the line.
Result<GoFileHeader> scan_go_header(const std::string& source,
                                    const std::string& filename = "<input>");

// Read `path` and scan it. IO error if it cannot be read.
Result<GoFileHeader> scan_go_file(const std::filesystem::path& path);

bool is_go_file(const std::filesystem::path& path);
bool is_go_test_file(const std::filesystem::path& path);

// Import path declared by the `module` directive of a go.mod file.
Result<std::string> read_module_path(const std::filesystem::path& go_mod);

} // namespace depwatch::go
