#pragma once

#include <depwatch/result.hpp>
#include <filesystem>

namespace depwatch {

// Consulted by the caller before Engine::owned_by to skip files that are
// empty, mid-write or otherwise not worth a dependency lookup yet.
class ContentValidator {
public:
    virtual ~ContentValidator() = default;

    // false: skip the file for now. An error means the file could not be
    // inspected at all (e.g. unreadable).
    virtual Result<bool> is_processable(const std::filesystem::path& file) = 0;
};

} // namespace depwatch
