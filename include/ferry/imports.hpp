#pragma once

#include <string>
#include <vector>

namespace ferry {

struct ImportRef {
    std::string specifier;
    int line = 0;           // 1-based
    bool dynamic = false;   // import("...") with a literal argument
    bool type_only = false; // import type / export type
};

// Static imports, re-exports and literal dynamic imports in JS/TS source,
// in source order, each specifier once. Comments are ignored; imports
// built from expressions are not seen.
std::vector<ImportRef> scan_imports(const std::string& source);

// Replaces comment text with spaces, keeping newlines and string literals
std::string strip_comments(const std::string& source);

} // namespace ferry
