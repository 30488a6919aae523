#include <ferry/imports.hpp>

#include <cctype>
#include <optional>
#include <set>

namespace ferry {

std::string strip_comments(const std::string& source) {
    std::string out = source;
    size_t i = 0;
    const size_t n = out.size();
    while (i < n) {
        char c = out[i];
        if (c == '"' || c == '\'' || c == '`') {
            char quote = c;
            ++i;
            while (i < n && out[i] != quote) {
                if (out[i] == '\\') ++i;
                else if (out[i] == '\n' && quote != '`') break;
                ++i;
            }
            ++i;
        } else if (c == '/' && i + 1 < n && out[i + 1] == '/') {
            while (i < n && out[i] != '\n') out[i++] = ' ';
        } else if (c == '/' && i + 1 < n && out[i + 1] == '*') {
            out[i++] = ' ';
            out[i++] = ' ';
            while (i < n && !(out[i] == '*' && i + 1 < n && out[i + 1] == '/')) {
                if (out[i] != '\n') out[i] = ' ';
                ++i;
            }
            if (i < n) {
                out[i++] = ' ';
                out[i++] = ' ';
            }
        } else {
            ++i;
        }
    }
    return out;
}

namespace {

bool is_ident_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

bool is_quote(char c) { return c == '"' || c == '\''; }

// Single forward pass over comment-free source. Never recurses, so module
// size only costs time.
class ImportScanner {
public:
    explicit ImportScanner(const std::string& src) : source(src), pos(0), line(1) {}

    std::vector<ImportRef> run() {
        while (!at_end()) {
            char c = peek();
            if (is_quote(c) || c == '`') {
                skip_string();
            } else if (is_ident_char(c)) {
                bool member = pos > 0 && source[pos - 1] == '.';
                std::string word = read_ident();
                if (member) continue;
                if (word == "import") scan_import();
                else if (word == "export") scan_export();
            } else {
                advance();
            }
        }
        return std::move(refs);
    }

private:
    struct Mark {
        size_t pos;
        int line;
    };

    const std::string& source;
    size_t pos;
    int line;
    std::vector<ImportRef> refs;
    std::set<std::string> seen;

    bool at_end() const { return pos >= source.size(); }
    char peek() const { return source[pos]; }

    char advance() {
        char c = source[pos++];
        if (c == '\n') ++line;
        return c;
    }

    Mark mark() const { return {pos, line}; }
    void reset(Mark m) {
        pos = m.pos;
        line = m.line;
    }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) advance();
    }

    std::string read_ident() {
        size_t start = pos;
        while (!at_end() && is_ident_char(peek())) advance();
        return source.substr(start, pos - start);
    }

    // Quoted literal on one line; nullopt leaves pos where the literal broke off
    std::optional<std::string> read_string() {
        char quote = advance();
        std::string text;
        while (!at_end()) {
            char c = peek();
            if (c == quote) {
                advance();
                return text;
            }
            if (c == '\n') return std::nullopt;
            if (c == '\\') {
                advance();
                if (at_end()) break;
            }
            text += advance();
        }
        return std::nullopt;
    }

    void skip_string() {
        char quote = advance();
        while (!at_end()) {
            char c = advance();
            if (c == quote) return;
            if (c == '\\' && !at_end()) advance();
            else if (c == '\n' && quote != '`') return;
        }
    }

    // Positioned on the keyword `from` followed by a quoted literal
    bool at_from_specifier() const {
        if (source.compare(pos, 4, "from") != 0) return false;
        size_t i = pos + 4;
        if (i < source.size() && is_ident_char(source[i])) return false;
        while (i < source.size() && std::isspace(static_cast<unsigned char>(source[i]))) ++i;
        return i < source.size() && is_quote(source[i]);
    }

    void add(std::string specifier, int at, bool dynamic, bool type_only) {
        if (specifier.empty() || !seen.insert(specifier).second) return;
        ImportRef ref;
        ref.specifier = std::move(specifier);
        ref.line = at;
        ref.dynamic = dynamic;
        ref.type_only = type_only;
        refs.push_back(std::move(ref));
    }

    void scan_import() {
        skip_whitespace();
        if (at_end()) return;
        char c = peek();

        // import "m"
        if (is_quote(c)) {
            int at = line;
            if (auto s = read_string()) add(std::move(*s), at, false, false);
            return;
        }

        // import("m") and import("m", { with: ... })
        if (c == '(') {
            advance();
            skip_whitespace();
            if (at_end() || !is_quote(peek())) return;
            int at = line;
            auto s = read_string();
            if (!s) return;
            skip_whitespace();
            if (!at_end() && (peek() == ',' || peek() == ')')) add(std::move(*s), at, true, false);
            return;
        }

        // `import type X from` is type-only; `import type from "m"` binds a name
        bool type_only = false;
        if (is_ident_char(c)) {
            Mark m = mark();
            if (read_ident() == "type") {
                skip_whitespace();
                type_only = !at_end() &&
                    (peek() == '{' || peek() == '*' ||
                     (is_ident_char(peek()) && !at_from_specifier()));
            }
            if (!type_only) reset(m);
        }
        scan_from_clause(type_only);
    }

    // Only `export {...} from` and `export * from` name another module
    void scan_export() {
        skip_whitespace();
        bool type_only = false;
        if (!at_end() && is_ident_char(peek())) {
            Mark m = mark();
            if (read_ident() != "type") {
                reset(m);
                return;
            }
            skip_whitespace();
            type_only = true;
        }
        if (at_end() || (peek() != '{' && peek() != '*')) return;
        scan_from_clause(type_only);
    }

    // Walks bindings up to `from "m"`; anything else ends the clause
    void scan_from_clause(bool type_only) {
        while (!at_end()) {
            char c = peek();
            if (std::isspace(static_cast<unsigned char>(c)) ||
                c == '{' || c == '}' || c == ',' || c == '*') {
                advance();
                continue;
            }
            if (!is_ident_char(c)) return;

            if (at_from_specifier()) {
                read_ident();
                skip_whitespace();
                int at = line;
                if (auto s = read_string()) add(std::move(*s), at, false, type_only);
                return;
            }
            Mark m = mark();
            std::string word = read_ident();
            if (word == "import" || word == "export") {
                reset(m);
                return;
            }
        }
    }
};

} // namespace

std::vector<ImportRef> scan_imports(const std::string& source) {
    std::string src = strip_comments(source);
    return ImportScanner(src).run();
}

} // namespace ferry
