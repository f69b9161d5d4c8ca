#pragma once

#include <depwatch/content_validator.hpp>

namespace depwatch::go {

// Rejects Go files that cannot be meaningfully scanned yet: empty files,
// comment-only files, a missing or incomplete package clause, broken import
// declarations, and unbalanced (), [] or {} as left by an editor mid-save.
// Files that are not Go sources always pass.
class GoContentValidator : public ContentValidator {
public:
    Result<bool> is_processable(const std::filesystem::path& file) override;

    // Same checks over in-memory content.
    static bool is_complete_source(const std::string& source);
};

} // namespace depwatch::go
