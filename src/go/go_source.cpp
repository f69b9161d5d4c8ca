#include <depwatch/go/go_source.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace depwatch::go {

namespace fs = std::filesystem;

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

// Position-tracking reader over the top of a Go file.
class HeaderScanner {
public:
    HeaderScanner(const std::string& src, const std::string& file)
        : src_(src), file_(file) {}

    Result<GoFileHeader> scan();

private:
    const std::string& src_;
    const std::string& file_;
    size_t pos_ = 0;
    int line_ = 1;

    bool at_end() const { return pos_ >= src_.size(); }
    char peek(size_t off = 0) const {
        return pos_ + off < src_.size() ? src_[pos_ + off] : '\0';
    }
    void advance() {
        if (src_[pos_] == '\n') ++line_;
        ++pos_;
    }

    DepwatchError error(const std::string& msg) const {
        return DepwatchError{DepwatchError::Parse, msg, "", file_, line_};
    }

    Status skip_trivia();
    std::string read_ident();
    Result<std::string> read_string();
    Status read_import_spec(GoFileHeader& header);
};

// Whitespace, comments and the (explicit or implied) semicolons between
// declarations.
Status HeaderScanner::skip_trivia() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';') {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n') advance();
        } else if (c == '/' && peek(1) == '*') {
            int start = line_;
            advance();
            advance();
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) advance();
            if (at_end()) {
                return DepwatchError{DepwatchError::Parse,
                    "unterminated block comment", "", file_, start};
            }
            advance();
            advance();
        } else {
            break;
        }
    }
    return ok_status();
}

std::string HeaderScanner::read_ident() {
    size_t start = pos_;
    if (at_end() || !is_ident_start(peek())) return "";
    while (!at_end() && is_ident_char(peek())) advance();
    return src_.substr(start, pos_ - start);
}

Result<std::string> HeaderScanner::read_string() {
    char quote = peek();
    if (quote != '"' && quote != '`') {
        return error("expected import path string");
    }
    int start = line_;
    advance();

    std::string out;
    while (!at_end() && peek() != quote) {
        char c = peek();
        if (quote == '"') {
            if (c == '\n') break;
            if (c == '\\' && pos_ + 1 < src_.size()) {
                advance();
                c = peek();
            }
        }
        out += c;
        advance();
    }
    if (at_end() || peek() != quote) {
        return DepwatchError{DepwatchError::Parse,
            "unterminated import path", "", file_, start};
    }
    advance();
    return Result<std::string>::ok(std::move(out));
}

Status HeaderScanner::read_import_spec(GoFileHeader& header) {
    GoImport imp;
    imp.line = line_;
    if (peek() == '.') {
        imp.alias = ".";
        advance();
    } else if (is_ident_start(peek())) {
        imp.alias = read_ident();
    }
    DEPWATCH_TRY(skip_trivia());

    auto path = read_string();
    if (path.is_err()) return std::move(path).error();
    if (path.value().empty()) {
        return error("empty import path");
    }
    imp.path = std::move(path).value();
    header.imports.push_back(std::move(imp));
    return ok_status();
}

Result<GoFileHeader> HeaderScanner::scan() {
    GoFileHeader header;

    DEPWATCH_TRY(skip_trivia());
    if (at_end()) return error("missing package clause");
    if (read_ident() != "package") return error("expected 'package'");

    DEPWATCH_TRY(skip_trivia());
    header.package_line = line_;
    header.package_name = read_ident();
    if (header.package_name.empty()) return error("expected package name");

    while (true) {
        DEPWATCH_TRY(skip_trivia());
        if (at_end()) break;
        if (read_ident() != "import") break;

        DEPWATCH_TRY(skip_trivia());
        if (peek() == '(') {
            int open_line = line_;
            advance();
            while (true) {
                DEPWATCH_TRY(skip_trivia());
                if (at_end()) {
                    return DepwatchError{DepwatchError::Parse,
                        "unterminated import block", "", file_, open_line};
                }
                if (peek() == ')') {
                    advance();
                    break;
                }
                DEPWATCH_TRY(read_import_spec(header));
            }
        } else {
            DEPWATCH_TRY(read_import_spec(header));
        }
    }
    return Result<GoFileHeader>::ok(std::move(header));
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

Result<GoFileHeader> scan_go_header(const std::string& source, const std::string& filename) {
    HeaderScanner scanner(source, filename);
    return scanner.scan();
}

Result<GoFileHeader> scan_go_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepwatchError{DepwatchError::IO, "cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return scan_go_header(ss.str(), path.string());
}

bool is_go_file(const fs::path& path) {
    return path.extension() == ".go";
}

bool is_go_test_file(const fs::path& path) {
    static const std::string suffix = "_test.go";
    std::string name = path.filename().string();
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<std::string> read_module_path(const fs::path& go_mod) {
    std::ifstream file(go_mod);
    if (!file.is_open()) {
        return DepwatchError{DepwatchError::IO, "cannot open " + go_mod.string()};
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        auto comment = line.find("//");
        if (comment != std::string::npos) line.erase(comment);
        line = trim(line);
        if (line.rfind("module", 0) != 0) continue;
        if (line.size() == 6 || !std::isspace(static_cast<unsigned char>(line[6]))) continue;

        std::string path = trim(line.substr(6));
        if (path.size() >= 2 && (path.front() == '"' || path.front() == '`')) {
            path = path.substr(1, path.size() - 2);
        }
        if (path.empty()) {
            return DepwatchError{DepwatchError::Parse, "empty module path", "",
                                 go_mod.string(), line_no};
        }
        return Result<std::string>::ok(path);
    }
    return DepwatchError{DepwatchError::Parse,
        "no module directive in " + go_mod.string(),
        "add a line like: module example.com/project"};
}

} // namespace depwatch::go
