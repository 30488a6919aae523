#include <ferry/url.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace ferry {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool has_http_scheme(const std::string& s) {
    std::string head = to_lower(s.substr(0, 8));
    return starts_with(head, "http://") || starts_with(head, "https://");
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    size_t start = 0;
    bool absolute = !path.empty() && path[0] == '/';
    bool trailing = false;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        std::string seg = path.substr(start, pos == std::string::npos
                                             ? std::string::npos : pos - start);
        trailing = false;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailing = true;
        } else if (seg == ".") {
            trailing = true;
        } else if (!seg.empty()) {
            out.push_back(seg);
        } else if (pos == std::string::npos) {
            trailing = true;
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < out.size(); ++i) {
        if (i > 0) result += "/";
        result += out[i];
    }
    if (trailing && !out.empty()) result += "/";
    return result;
}

Result<Url> Url::parse(const std::string& s) {
    size_t colon = s.find("://");
    if (colon == std::string::npos || colon == 0) {
        return FerryError{FerryError::UnresolvedSpecifier, "not an absolute URL: '" + s + "'"};
    }

    Url url;
    url.scheme = to_lower(s.substr(0, colon));
    if (url.scheme != "http" && url.scheme != "https") {
        return FerryError{FerryError::UnresolvedSpecifier,
            "unsupported URL scheme '" + url.scheme + "' in '" + s + "'"};
    }

    size_t auth_start = colon + 3;
    size_t auth_end = s.find_first_of("/?#", auth_start);
    std::string authority = s.substr(auth_start, auth_end == std::string::npos
                                                  ? std::string::npos : auth_end - auth_start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    size_t port_colon = authority.rfind(':');
    if (port_colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string port = authority.substr(port_colon + 1);
        authority = authority.substr(0, port_colon);
        if (!port.empty()) {
            if (!std::all_of(port.begin(), port.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; }) ||
                port.size() > 5) {
                return FerryError{FerryError::UnresolvedSpecifier,
                    "invalid port in URL '" + s + "'"};
            }
            url.port = std::stoi(port);
        }
    }
    url.host = to_lower(authority);
    if (url.host.empty()) {
        return FerryError{FerryError::UnresolvedSpecifier, "URL has no host: '" + s + "'"};
    }

    // Drop default ports so equal locations produce equal keys
    if ((url.scheme == "http" && url.port == 80) ||
        (url.scheme == "https" && url.port == 443)) {
        url.port = -1;
    }

    std::string rest = auth_end == std::string::npos ? "" : s.substr(auth_end);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) rest = rest.substr(0, hash);
    size_t q = rest.find('?');
    if (q != std::string::npos) {
        url.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    url.path = rest.empty() ? "/" : remove_dot_segments(rest);
    if (url.path.empty() || url.path[0] != '/') url.path = "/" + url.path;

    return Result<Url>::ok(std::move(url));
}

Result<Url> Url::join(const std::string& ref) const {
    if (has_http_scheme(ref)) return Url::parse(ref);
    if (starts_with(ref, "//")) return Url::parse(scheme + ":" + ref);

    Url out = *this;
    out.query.clear();

    std::string path = ref;
    size_t hash = path.find('#');
    if (hash != std::string::npos) path = path.substr(0, hash);
    size_t q = path.find('?');
    if (q != std::string::npos) {
        out.query = path.substr(q + 1);
        path = path.substr(0, q);
    }

    if (!path.empty() && path[0] == '/') {
        out.path = remove_dot_segments(path);
    } else {
        std::string dir = this->path.substr(0, this->path.rfind('/') + 1);
        out.path = remove_dot_segments(dir + path);
    }
    if (out.path.empty() || out.path[0] != '/') out.path = "/" + out.path;
    return Result<Url>::ok(std::move(out));
}

std::string Url::authority() const {
    if (port < 0) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    std::string s = scheme + "://" + authority() + path;
    if (!query.empty()) s += "?" + query;
    return s;
}

std::string file_url(const fs::path& path, bool as_dir) {
    std::string p = path.lexically_normal().generic_string();
    if (p.empty() || p[0] != '/') p = "/" + p;
    if (as_dir && p.back() != '/') p += "/";
    return "file://" + p;
}

fs::path path_from_file_url(const std::string& url) {
    if (!starts_with(url, "file://")) return {};
    return fs::path(url.substr(7));
}

} // namespace ferry
