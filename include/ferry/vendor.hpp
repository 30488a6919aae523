#pragma once

#include <ferry/result.hpp>

#include <filesystem>
#include <string>

namespace ferry {

// Project-local copy of remote modules, consulted before the global cache.
//
//   jsr:@x/y@1.3.0/util.ts          -> jsr.io/@x/y/1.3.0/util.ts
//   jsr:@x/y@1.3.0                  -> jsr.io/@x/y/1.3.0/_default
//   npm:left-pad@1.3.0              -> npm/left-pad/1.3.0/package.tgz
//   https://deno.land:8080/x/a.ts   -> deno.land_8080/x/a.ts
class VendorDir {
public:
    explicit VendorDir(std::filesystem::path root);

    // Location for a cache key; InvalidArg for keys that cannot be placed
    // safely (escaping "..", unknown scheme)
    Result<std::filesystem::path> path_for(const std::string& key) const;

    bool contains(const std::string& key) const;
    Result<std::string> read(const std::string& key) const;
    Status write(const std::string& key, const std::string& content) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace ferry
