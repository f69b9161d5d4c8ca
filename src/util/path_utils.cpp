#include <depwatch/path_utils.hpp>
#include <algorithm>
#include <vector>

namespace depwatch {

namespace fs = std::filesystem;

fs::path canonical_path(const fs::path& p, const fs::path& base) {
    std::error_code ec;
    fs::path abs = p;
    if (abs.is_relative()) {
        if (base.empty()) {
            abs = fs::absolute(p, ec);
            if (ec) abs = p;
        } else {
            abs = base / p;
        }
    }

    fs::path resolved = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal();

    // weakly_canonical keeps a trailing separator for directories given as "dir/"
    if (!resolved.has_filename() && resolved.has_parent_path() &&
        resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool path_within(const fs::path& p, const fs::path& dir) {
    fs::path rel = p.lexically_relative(dir);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

bool path_has_suffix(const fs::path& dir, const fs::path& suffix) {
    std::vector<fs::path> d, s;
    for (const auto& c : dir) {
        if (!c.empty() && c != ".") d.push_back(c);
    }
    for (const auto& c : suffix) {
        if (!c.empty() && c != ".") s.push_back(c);
    }
    if (s.empty() || s.size() > d.size()) return false;
    return std::equal(s.rbegin(), s.rend(), d.rbegin());
}

std::string last_segment(const std::string& identifier) {
    auto pos = identifier.rfind('/');
    if (pos == std::string::npos) return identifier;
    return identifier.substr(pos + 1);
}

} // namespace depwatch
