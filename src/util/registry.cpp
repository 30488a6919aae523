#include <ferry/registry.hpp>
#include <ferry/file_io.hpp>
#include <ferry/log.hpp>

#include <nlohmann/json.hpp>

#include <system_error>

namespace ferry {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

Result<json> parse_metadata(const std::string& text, const std::string& url) {
    try {
        return Result<json>::ok(json::parse(text));
    } catch (const json::parse_error& e) {
        return FerryError{FerryError::Parse,
            "invalid JSON from " + url + ": " + e.what()};
    }
}

} // namespace

// ---- JsrRegistry ----

JsrRegistry::JsrRegistry(HttpClient& http, std::string base_url)
    : http_(http), base_(trim_slash(std::move(base_url))) {}

Result<std::string> JsrRegistry::get_text(const std::string& url) {
    auto resp = http_.get(url);
    if (resp.is_err()) return std::move(resp).error();
    FERRY_TRY(check_http_status(resp.value(), url));
    return Result<std::string>::ok(std::move(resp.value().body));
}

Result<std::vector<Version>> JsrRegistry::list_versions(const std::string& package) {
    std::string url = base_ + "/" + package + "/meta.json";
    auto text = get_text(url);
    if (text.is_err()) {
        auto err = std::move(text).error();
        if (err.code == FerryError::NotFound) {
            err.message = "package jsr:" + package + " not found (" + err.message + ")";
        }
        return err;
    }
    auto doc = parse_metadata(text.value(), url);
    if (doc.is_err()) return std::move(doc).error();

    const json& meta = doc.value();
    if (!meta.contains("versions") || !meta["versions"].is_object()) {
        return FerryError{FerryError::Parse, url + " has no \"versions\" object"};
    }

    std::vector<Version> out;
    for (auto it = meta["versions"].begin(); it != meta["versions"].end(); ++it) {
        const json& info = it.value();
        if (info.is_object()) {
            auto yanked = info.find("yanked");
            if (yanked != info.end() && yanked->is_boolean() && yanked->get<bool>()) continue;
        }
        auto v = Version::parse(it.key());
        if (v.is_err()) {
            log::debug("jsr:%s: skipping unparseable version '%s'",
                       package.c_str(), it.key().c_str());
            continue;
        }
        out.push_back(std::move(v).value());
    }
    return Result<std::vector<Version>>::ok(std::move(out));
}

Result<std::string> JsrRegistry::default_export(const std::string& package,
                                                const Version& version) {
    std::string url = base_ + "/" + package + "/" + version.to_string() + "_meta.json";
    auto text = get_text(url);
    if (text.is_err()) return std::move(text).error();
    auto doc = parse_metadata(text.value(), url);
    if (doc.is_err()) return std::move(doc).error();

    const json& meta = doc.value();
    if (meta.contains("exports") && meta["exports"].is_object()) {
        const json& exports = meta["exports"];
        auto dot = exports.find(".");
        if (dot != exports.end() && dot->is_string()) {
            std::string path = dot->get<std::string>();
            if (path.rfind("./", 0) == 0) path = path.substr(2);
            else if (!path.empty() && path[0] == '/') path = path.substr(1);
            return Result<std::string>::ok(path);
        }
    }
    return FerryError{FerryError::UnresolvedSpecifier,
        "jsr:" + package + "@" + version.to_string() + " has no default export",
        "import a specific file, e.g. jsr:" + package + "@" + version.to_string() + "/mod.ts"};
}

Result<std::string> JsrRegistry::fetch_content(const std::string& package,
                                               const Version& version,
                                               const std::string& subpath) {
    std::string path = subpath;
    if (path.empty()) {
        auto entry = default_export(package, version);
        if (entry.is_err()) return std::move(entry).error();
        path = std::move(entry).value();
    }
    return get_text(base_ + "/" + package + "/" + version.to_string() + "/" + path);
}

// ---- NpmRegistry ----

NpmRegistry::NpmRegistry(HttpClient& http, std::string base_url)
    : http_(http), base_(trim_slash(std::move(base_url))) {}

Result<NpmRegistry::Packument> NpmRegistry::packument(const std::string& package) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = packuments_.find(package);
        if (it != packuments_.end()) return Result<Packument>::ok(it->second);
    }

    // Scoped names are requested as @scope%2fname
    std::string encoded = package;
    size_t slash = encoded.find('/');
    if (!encoded.empty() && encoded[0] == '@' && slash != std::string::npos) {
        encoded.replace(slash, 1, "%2f");
    }
    std::string url = base_ + "/" + encoded;

    auto resp = http_.get(url);
    if (resp.is_err()) return std::move(resp).error();
    auto status = check_http_status(resp.value(), url);
    if (status.is_err()) {
        auto err = std::move(status).error();
        if (err.code == FerryError::NotFound) {
            err.message = "package npm:" + package + " not found (" + err.message + ")";
        }
        return err;
    }
    auto doc = parse_metadata(resp.value().body, url);
    if (doc.is_err()) return std::move(doc).error();

    const json& meta = doc.value();
    if (!meta.contains("versions") || !meta["versions"].is_object()) {
        return FerryError{FerryError::Parse, url + " has no \"versions\" object"};
    }

    Packument p;
    for (auto it = meta["versions"].begin(); it != meta["versions"].end(); ++it) {
        auto v = Version::parse(it.key());
        if (v.is_err()) continue;
        const json& info = it.value();
        if (info.is_object() && info.contains("dist") && info["dist"].is_object()) {
            const json& dist = info["dist"];
            if (dist.contains("tarball") && dist["tarball"].is_string()) {
                p.tarballs[v.value().to_string()] = dist["tarball"].get<std::string>();
            }
        }
        p.versions.push_back(std::move(v).value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    packuments_[package] = p;
    return Result<Packument>::ok(std::move(p));
}

Result<std::vector<Version>> NpmRegistry::list_versions(const std::string& package) {
    auto p = packument(package);
    if (p.is_err()) return std::move(p).error();
    return Result<std::vector<Version>>::ok(std::move(p.value().versions));
}

Result<std::string> NpmRegistry::tarball_url(const std::string& package,
                                             const Version& version) {
    auto p = packument(package);
    if (p.is_err()) return std::move(p).error();
    auto it = p.value().tarballs.find(version.to_string());
    if (it == p.value().tarballs.end()) {
        return FerryError{FerryError::VersionNotFound,
            "npm:" + package + "@" + version.to_string() + " has no tarball"};
    }
    return Result<std::string>::ok(it->second);
}

Result<std::string> NpmRegistry::fetch_content(const std::string& package,
                                               const Version& version,
                                               const std::string& /*subpath*/) {
    auto url = tarball_url(package, version);
    if (url.is_err()) return std::move(url).error();

    auto resp = http_.get(url.value());
    if (resp.is_err()) return std::move(resp).error();
    FERRY_TRY(check_http_status(resp.value(), url.value()));
    return Result<std::string>::ok(std::move(resp.value().body));
}

// ---- LocalRegistry ----

LocalRegistry::LocalRegistry(fs::path dir, RegistryKind kind)
    : dir_(std::move(dir)), kind_(kind) {}

Result<std::vector<Version>> LocalRegistry::list_versions(const std::string& package) {
    fs::path pkg_dir = dir_ / package;
    std::error_code ec;
    if (!fs::is_directory(pkg_dir, ec)) {
        return FerryError{FerryError::NotFound,
            std::string("package ") + registry_name(kind_) + ":" + package +
                " not found in mirror " + dir_.string()};
    }

    std::vector<Version> out;
    for (const auto& entry : fs::directory_iterator(pkg_dir, ec)) {
        if (!entry.is_directory()) continue;
        auto v = Version::parse(entry.path().filename().string());
        if (v.is_ok()) out.push_back(std::move(v).value());
    }
    if (ec) {
        return FerryError{FerryError::IO, "cannot list " + pkg_dir.string() + ": " + ec.message()};
    }
    return Result<std::vector<Version>>::ok(std::move(out));
}

Result<std::string> LocalRegistry::fetch_content(const std::string& package,
                                                 const Version& version,
                                                 const std::string& subpath) {
    std::string file = subpath;
    if (kind_ == RegistryKind::Npm || file.empty()) {
        file = kind_ == RegistryKind::Npm ? "package.tgz" : "mod.ts";
    }
    fs::path path = dir_ / package / version.to_string() / file;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return FerryError{FerryError::NotFound,
            std::string(registry_name(kind_)) + ":" + package + "@" + version.to_string() +
                (subpath.empty() ? "" : "/" + subpath) + " not found in mirror",
            "expected " + path.string()};
    }
    return read_file(path);
}

// ---- RegistrySet ----

void RegistrySet::set(std::unique_ptr<Registry> registry) {
    if (!registry) return;
    if (registry->kind() == RegistryKind::Jsr) {
        jsr_ = std::move(registry);
    } else {
        npm_ = std::move(registry);
    }
}

Registry* RegistrySet::get(RegistryKind kind) const {
    return kind == RegistryKind::Jsr ? jsr_.get() : npm_.get();
}

Result<Registry*> RegistrySet::require(RegistryKind kind) const {
    Registry* r = get(kind);
    if (!r) {
        return FerryError{FerryError::Config,
            std::string("no ") + registry_name(kind) + " registry configured"};
    }
    return Result<Registry*>::ok(r);
}

} // namespace ferry
