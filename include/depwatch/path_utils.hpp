#pragma once

#include <filesystem>
#include <string>

namespace depwatch {

// Absolute, symlink-resolved form of `p`. Relative paths are taken relative
// to `base` (the current directory when `base` is empty). Components that do
// not exist yet are kept lexically, so removed or not-yet-created files still
// normalize to the same key they were indexed under.
std::filesystem::path canonical_path(const std::filesystem::path& p,
                                     const std::filesystem::path& base = {});

// True when `p` (already normalized) lies inside `dir` or equals it.
bool path_within(const std::filesystem::path& p, const std::filesystem::path& dir);

// True when the trailing components of `dir` equal the components of `suffix`.
// An empty suffix never matches.
bool path_has_suffix(const std::filesystem::path& dir, const std::filesystem::path& suffix);

// Last '/'-separated segment of a unit identifier ("mod/a/b" -> "b").
std::string last_segment(const std::string& identifier);

} // namespace depwatch
