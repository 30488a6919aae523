#include <ferry/vendor.hpp>
#include <ferry/file_io.hpp>
#include <ferry/sha256.hpp>
#include <ferry/specifier.hpp>
#include <ferry/url.hpp>

#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

namespace {

Status check_segments(const std::string& rel, const std::string& key) {
    size_t start = 0;
    while (start <= rel.size()) {
        size_t slash = rel.find('/', start);
        std::string seg = rel.substr(start, slash == std::string::npos ? std::string::npos
                                                                       : slash - start);
        if (seg == "..") {
            return FerryError{FerryError::InvalidArg,
                "cannot vendor '" + key + "': path escapes the vendor directory"};
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return ok_status();
}

} // namespace

VendorDir::VendorDir(fs::path root) : root_(std::move(root)) {}

Result<fs::path> VendorDir::path_for(const std::string& key) const {
    std::string rel;

    if (key.rfind("jsr:", 0) == 0 || key.rfind("npm:", 0) == 0) {
        auto spec = Specifier::parse_registry(key);
        if (spec.is_err()) return std::move(spec).error();
        const RegistrySpecifier& r = spec.value();
        if (!r.range.is_exact()) {
            return FerryError{FerryError::InvalidArg,
                "cannot vendor '" + key + "': version is not resolved"};
        }
        std::string ver = r.range.version.to_string();
        if (r.kind == RegistryKind::Jsr) {
            rel = "jsr.io/" + r.package + "/" + ver + "/" +
                  (r.subpath.empty() ? std::string("_default") : r.subpath);
        } else {
            rel = "npm/" + r.package + "/" + ver + "/package.tgz";
        }
    } else if (has_http_scheme(key)) {
        auto url = Url::parse(key);
        if (url.is_err()) return std::move(url).error();
        const Url& u = url.value();
        rel = u.host;
        if (u.port >= 0) rel += "_" + std::to_string(u.port);
        std::string path = u.path;
        if (path.empty() || path.back() == '/') path += "_index";
        rel += path;
        if (!u.query.empty()) rel += "_" + sha256_hex(u.query).substr(0, 12);
    } else {
        return FerryError{FerryError::InvalidArg,
            "cannot vendor '" + key + "': only registry and URL modules are vendored"};
    }

    FERRY_TRY(check_segments(rel, key));
    return Result<fs::path>::ok(root_ / fs::path(rel));
}

bool VendorDir::contains(const std::string& key) const {
    auto path = path_for(key);
    if (path.is_err()) return false;
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

Result<std::string> VendorDir::read(const std::string& key) const {
    auto path = path_for(key);
    if (path.is_err()) return std::move(path).error();
    std::error_code ec;
    if (!fs::is_regular_file(path.value(), ec)) {
        return FerryError{FerryError::NotFound, key + " is not vendored"};
    }
    return read_file(path.value());
}

Status VendorDir::write(const std::string& key, const std::string& content) const {
    auto path = path_for(key);
    if (path.is_err()) return std::move(path).error();
    return write_file_atomic(path.value(), content);
}

} // namespace ferry
