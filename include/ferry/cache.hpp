#pragma once

#include <ferry/result.hpp>
#include <ferry/version.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ferry {

struct CacheEntry {
    std::string key;          // resolved specifier, concrete version
    std::string hash;         // SHA-256 hex of the content
    int64_t size = 0;
    int64_t fetched_at = 0;   // unix seconds
};

struct CacheStats {
    int64_t entry_count = 0;
    int64_t blob_count = 0;
    int64_t content_bytes = 0;
    int64_t index_bytes = 0;
};

// Global content-addressable module cache.
//
//   <root>/blobs/<h[0:2]>/<h>   content, named by its SHA-256
//   <root>/index.db             key -> hash, size, fetch time (SQLite)
//
// Entries are replaced whole, never edited. Safe to share between fetch
// threads.
class ModuleCache {
public:
    ModuleCache();
    ~ModuleCache();
    ModuleCache(ModuleCache&&) noexcept;
    ModuleCache& operator=(ModuleCache&&) noexcept;

    Status open(const std::filesystem::path& root);
    void close();
    bool is_open() const;
    const std::filesystem::path& root() const;

    // $FERRY_DIR, else ~/.ferry/cache
    static std::filesystem::path default_cache_root();

    // Index row for `key`; NotFound when absent
    Result<CacheEntry> lookup(const std::string& key);

    // Index row present and blob on disk
    bool contains(const std::string& key);

    // Content for `key`. A blob that no longer hashes to its indexed
    // value is reported as NotFound.
    Result<std::string> read(const std::string& key);

    // Writes the blob (temp + rename), then the index row
    Result<CacheEntry> store(const std::string& key, const std::string& content);

    Status remove(const std::string& key);
    Status clear();

    Result<std::vector<CacheEntry>> entries();
    Result<CacheStats> stats();

    // Concrete versions present for "jsr:@x/y" or "npm:name"
    Result<std::vector<Version>> versions_cached(const std::string& package_key);

    std::filesystem::path blob_path(const std::string& hash) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ferry
