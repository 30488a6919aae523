#pragma once

#include <ferry/result.hpp>
#include <ferry/specifier.hpp>
#include <ferry/version.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ferry {

// On-disk lock file:
//
//   version = "1"
//
//   [specifiers]
//   "jsr:@x/y@^1.2.0" = "1.3.0"
//
//   [remote]
//   "jsr:@x/y@1.3.0" = "<sha256 hex>"
struct LockFile {
    std::string version = "1";
    std::map<std::string, std::string> specifiers;  // range key -> version
    std::map<std::string, std::string> remote;      // resolved key -> hash

    static Result<LockFile> parse(const std::string& toml_str);

    // NotFound when the file does not exist
    static Result<LockFile> load(const std::filesystem::path& path);

    // Sorted, deterministic, with a header comment
    std::string serialize() const;
    Status save(const std::filesystem::path& path) const;

    bool empty() const { return specifiers.empty() && remote.empty(); }
};

enum class LockMode {
    Additive,  // unknown entries are inserted
    Frozen,    // unknown entries are errors, nothing is saved
};

enum class LockState { Unlocked, Locked, Fatal };

// Owns the lock file for a run. All methods may be called concurrently;
// mutation is serialised by one mutex.
class LockManager {
public:
    LockManager(LockFile lock, std::filesystem::path path, LockMode mode);

    // Loads `path`, or starts empty when it does not exist
    static Result<std::unique_ptr<LockManager>> open(const std::filesystem::path& path,
                                                     LockMode mode);

    // Hash `content` and check it against the entry for `key`.
    //   match          -> ok, Locked
    //   mismatch       -> IntegrityMismatch (expected vs actual), Fatal
    //   absent         -> Additive: inserted, Locked; Frozen: UntrackedDependency
    Status verify(const std::string& key, const std::string& content);
    Status verify(const Specifier& spec, const std::string& content);

    // Insert or overwrite the entry for `key`
    void write(const std::string& key, const std::string& content);

    // Record the version chosen for a range key. An existing pin that
    // disagrees is replaced only when `update` is set.
    Status pin(const std::string& range_key, const Version& version, bool update = false);
    std::optional<Version> pinned(const std::string& range_key) const;

    LockState state(const std::string& key) const;

    static std::string compute_integrity(const std::string& content);

    bool dirty() const;

    // Atomic save when dirty. Frozen locks are never written.
    Status flush();

    LockFile snapshot() const;
    LockMode mode() const { return mode_; }
    const std::filesystem::path& path() const { return path_; }

private:
    mutable std::mutex mutex_;
    LockFile lock_;
    std::filesystem::path path_;
    LockMode mode_;
    bool dirty_ = false;
    std::map<std::string, LockState> states_;
};

} // namespace ferry
