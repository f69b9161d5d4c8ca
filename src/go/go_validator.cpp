#include <depwatch/go/go_validator.hpp>
#include <depwatch/go/go_source.hpp>
#include <depwatch/log.hpp>
#include <fstream>
#include <sstream>
#include <vector>

namespace depwatch::go {

namespace fs = std::filesystem;

namespace {

// Walks the whole file once, ignoring brackets inside comments, string,
// raw string and rune literals.
bool brackets_balanced(const std::string& src) {
    std::vector<char> stack;
    size_t i = 0;
    const size_t n = src.size();
    while (i < n) {
        char c = src[i];
        if (c == '/' && i + 1 < n && src[i + 1] == '/') {
            while (i < n && src[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && src[i + 1] == '*') {
            size_t end = src.find("*/", i + 2);
            if (end == std::string::npos) return false;
            i = end + 2;
            continue;
        }
        if (c == '"' || c == '\'') {
            ++i;
            while (i < n && src[i] != c) {
                if (src[i] == '\n') return false;
                if (src[i] == '\\') ++i;
                ++i;
            }
            if (i >= n) return false;
            ++i;
            continue;
        }
        if (c == '`') {
            size_t end = src.find('`', i + 1);
            if (end == std::string::npos) return false;
            i = end + 1;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            stack.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            char open = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back() != open) return false;
            stack.pop_back();
        }
        ++i;
    }
    return stack.empty();
}

} // namespace

bool GoContentValidator::is_complete_source(const std::string& source) {
    // Also covers empty and comment-only files: both lack a package clause.
    auto header = scan_go_header(source);
    if (header.is_err()) return false;
    return brackets_balanced(source);
}

Result<bool> GoContentValidator::is_processable(const fs::path& file) {
    if (!is_go_file(file)) {
        return Result<bool>::ok(true);
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return DepwatchError{DepwatchError::IO, "cannot read " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    bool ok = is_complete_source(ss.str());
    if (!ok) {
        log::debug("skipping %s, content incomplete", file.string().c_str());
    }
    return Result<bool>::ok(ok);
}

} // namespace depwatch::go
