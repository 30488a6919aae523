#include <ferry/lockfile.hpp>
#include <ferry/file_io.hpp>
#include <ferry/log.hpp>
#include <ferry/sha256.hpp>

#include <toml++/toml.hpp>

#include <sstream>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

static const char LOCK_HEADER[] =
    "# This file is auto-generated by ferry. Do not edit manually.\n\n";

// ---------------------------------------------------------------------------
// LockFile
// ---------------------------------------------------------------------------

static Status read_string_table(const toml::table& doc, const char* name,
                                std::map<std::string, std::string>& out) {
    const toml::node* node = doc.get(name);
    if (!node) return ok_status();
    const toml::table* tbl = node->as_table();
    if (!tbl) {
        return FerryError{FerryError::Parse,
            std::string("lock file [") + name + "] must be a table"};
    }
    for (const auto& [key, val] : *tbl) {
        auto s = val.value<std::string>();
        if (!s) {
            return FerryError{FerryError::Parse,
                std::string("lock file [") + name + "] entry '" +
                    std::string(key.str()) + "' must be a string"};
        }
        out[std::string(key.str())] = *s;
    }
    return ok_status();
}

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FerryError{FerryError::Parse,
            std::string("lock file TOML parse error: ") + std::string(e.description())};
    }

    LockFile lf;
    if (auto v = doc["version"].value<std::string>()) {
        lf.version = *v;
    }
    if (lf.version != "1") {
        return FerryError{FerryError::Parse,
            "unsupported lock file version '" + lf.version + "'",
            "delete the lock file and run again to regenerate it"};
    }

    FERRY_TRY(read_string_table(doc, "specifiers", lf.specifiers));
    FERRY_TRY(read_string_table(doc, "remote", lf.remote));
    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return FerryError{FerryError::NotFound, "lock file not found: " + path.string()};
    }
    auto text = read_file(path);
    if (text.is_err()) return std::move(text).error();

    auto lf = parse(text.value());
    if (lf.is_err()) {
        auto err = std::move(lf).error();
        err.file = path.string();
        return err;
    }
    return lf;
}

std::string LockFile::serialize() const {
    toml::table specs;
    for (const auto& [k, v] : specifiers) specs.insert(k, v);
    toml::table rem;
    for (const auto& [k, v] : remote) rem.insert(k, v);

    toml::table doc;
    doc.insert("version", version);
    doc.insert("specifiers", std::move(specs));
    doc.insert("remote", std::move(rem));

    std::ostringstream ss;
    ss << LOCK_HEADER << doc << "\n";
    return ss.str();
}

Status LockFile::save(const fs::path& path) const {
    return write_file_atomic(path, serialize());
}

// ---------------------------------------------------------------------------
// LockManager
// ---------------------------------------------------------------------------

LockManager::LockManager(LockFile lock, fs::path path, LockMode mode)
    : lock_(std::move(lock)), path_(std::move(path)), mode_(mode) {}

Result<std::unique_ptr<LockManager>> LockManager::open(const fs::path& path, LockMode mode) {
    LockFile lf;
    auto loaded = LockFile::load(path);
    if (loaded.is_ok()) {
        lf = std::move(loaded).value();
        log::debug("lock file %s: %zu pins, %zu hashes", path.c_str(),
                   lf.specifiers.size(), lf.remote.size());
    } else if (loaded.error().code != FerryError::NotFound) {
        return std::move(loaded).error();
    }
    return Result<std::unique_ptr<LockManager>>::ok(
        std::make_unique<LockManager>(std::move(lf), path, mode));
}

std::string LockManager::compute_integrity(const std::string& content) {
    return sha256_hex(content);
}

Status LockManager::verify(const std::string& key, const std::string& content) {
    std::string actual = compute_integrity(content);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lock_.remote.find(key);
    if (it == lock_.remote.end()) {
        if (mode_ == LockMode::Frozen) {
            return FerryError{FerryError::UntrackedDependency,
                "'" + key + "' is not in the lock file " + path_.string(),
                "run without --frozen to add it"};
        }
        lock_.remote[key] = actual;
        states_[key] = LockState::Locked;
        dirty_ = true;
        log::debug("lock: added %s", key.c_str());
        return ok_status();
    }

    const std::string& expected = it->second;
    auto state = states_.find(key);
    if (expected != actual || (state != states_.end() && state->second == LockState::Fatal)) {
        states_[key] = LockState::Fatal;
        return FerryError{FerryError::IntegrityMismatch,
            "integrity check failed for '" + key + "'\n"
            "  expected: " + expected + "\n"
            "  actual:   " + actual,
            "the content changed since it was locked; if this is expected, "
            "run with --reload --lock-write"};
    }
    states_[key] = LockState::Locked;
    return ok_status();
}

Status LockManager::verify(const Specifier& spec, const std::string& content) {
    return verify(spec.cache_key(), content);
}

void LockManager::write(const std::string& key, const std::string& content) {
    std::string hash = compute_integrity(content);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lock_.remote.find(key);
    if (it == lock_.remote.end() || it->second != hash) {
        lock_.remote[key] = hash;
        dirty_ = true;
    }
    states_[key] = LockState::Locked;
}

Status LockManager::pin(const std::string& range_key, const Version& version, bool update) {
    std::string v = version.to_string();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lock_.specifiers.find(range_key);
    if (it != lock_.specifiers.end()) {
        if (it->second == v) return ok_status();
        if (!update) {
            return FerryError{FerryError::Config,
                "lock file pins '" + range_key + "' to " + it->second +
                    " but " + v + " was resolved",
                "run with --lock-write to update the lock file"};
        }
    } else if (mode_ == LockMode::Frozen && !update) {
        return FerryError{FerryError::UntrackedDependency,
            "'" + range_key + "' is not pinned in the lock file " + path_.string(),
            "run without --frozen to add it"};
    }
    lock_.specifiers[range_key] = v;
    dirty_ = true;
    return ok_status();
}

std::optional<Version> LockManager::pinned(const std::string& range_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lock_.specifiers.find(range_key);
    if (it == lock_.specifiers.end()) return std::nullopt;
    auto v = Version::parse(it->second);
    if (v.is_err()) {
        log::warn("lock file pin for %s is not a version: '%s'",
                  range_key.c_str(), it->second.c_str());
        return std::nullopt;
    }
    return std::move(v).value();
}

LockState LockManager::state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(key);
    return it == states_.end() ? LockState::Unlocked : it->second;
}

bool LockManager::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

Status LockManager::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == LockMode::Frozen || !dirty_) return ok_status();
    FERRY_TRY(lock_.save(path_));
    dirty_ = false;
    log::debug("wrote %s", path_.c_str());
    return ok_status();
}

LockFile LockManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lock_;
}

} // namespace ferry
