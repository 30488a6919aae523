#pragma once

#include <ferry/http.hpp>
#include <ferry/result.hpp>
#include <ferry/specifier.hpp>
#include <ferry/version.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

// A package source. Implementations must be safe to call from several
// fetch threads at once.
class Registry {
public:
    virtual ~Registry() = default;

    virtual RegistryKind kind() const = 0;

    // All installable versions of `package`, in no particular order
    virtual Result<std::vector<Version>> list_versions(const std::string& package) = 0;

    // Module bytes. An empty subpath means the package's default entry.
    virtual Result<std::string> fetch_content(const std::string& package,
                                              const Version& version,
                                              const std::string& subpath) = 0;
};

// ---- JSR over HTTP ----
//   <base>/<pkg>/meta.json          version list, yanked flags
//   <base>/<pkg>/<ver>_meta.json    exports (default entry)
//   <base>/<pkg>/<ver>/<path>       file content
class JsrRegistry : public Registry {
public:
    explicit JsrRegistry(HttpClient& http, std::string base_url = "https://jsr.io");

    RegistryKind kind() const override { return RegistryKind::Jsr; }
    Result<std::vector<Version>> list_versions(const std::string& package) override;
    Result<std::string> fetch_content(const std::string& package, const Version& version,
                                      const std::string& subpath) override;

    // exports["."] of the version metadata, without "./"
    Result<std::string> default_export(const std::string& package, const Version& version);

private:
    Result<std::string> get_text(const std::string& url);

    HttpClient& http_;
    std::string base_;
};

// ---- npm over HTTP ----
// Content for a version is its tarball.
class NpmRegistry : public Registry {
public:
    explicit NpmRegistry(HttpClient& http,
                         std::string base_url = "https://registry.npmjs.org");

    RegistryKind kind() const override { return RegistryKind::Npm; }
    Result<std::vector<Version>> list_versions(const std::string& package) override;
    Result<std::string> fetch_content(const std::string& package, const Version& version,
                                      const std::string& subpath) override;

    Result<std::string> tarball_url(const std::string& package, const Version& version);

private:
    struct Packument {
        std::vector<Version> versions;
        std::map<std::string, std::string> tarballs;  // version -> URL
    };
    Result<Packument> packument(const std::string& package);

    HttpClient& http_;
    std::string base_;
    std::mutex mutex_;
    std::map<std::string, Packument> packuments_;
};

// ---- Directory mirror ----
//   <dir>/<pkg>/<ver>/<file>
// The default entry is mod.ts for jsr and package.tgz for npm.
class LocalRegistry : public Registry {
public:
    LocalRegistry(std::filesystem::path dir, RegistryKind kind);

    RegistryKind kind() const override { return kind_; }
    Result<std::vector<Version>> list_versions(const std::string& package) override;
    Result<std::string> fetch_content(const std::string& package, const Version& version,
                                      const std::string& subpath) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    RegistryKind kind_;
};

// One registry per kind, owned for the run
class RegistrySet {
public:
    void set(std::unique_ptr<Registry> registry);
    Registry* get(RegistryKind kind) const;

    // NotFound naming the kind when none is configured
    Result<Registry*> require(RegistryKind kind) const;

private:
    std::unique_ptr<Registry> jsr_;
    std::unique_ptr<Registry> npm_;
};

} // namespace ferry
