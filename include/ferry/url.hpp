#pragma once

#include <ferry/result.hpp>
#include <filesystem>
#include <string>

namespace ferry {

// Minimal absolute URL for http(s) module locations
struct Url {
    std::string scheme;    // lowercase, e.g. "https"
    std::string host;      // lowercase
    int port = -1;         // -1 when not given
    std::string path;      // always starts with '/'
    std::string query;     // without '?'

    static Result<Url> parse(const std::string& s);

    // RFC 3986 reference resolution for "./x", "../x", "/x" and absolute refs
    Result<Url> join(const std::string& ref) const;

    // "host" or "host:port"
    std::string authority() const;
    std::string to_string() const;
};

// True for strings starting with http:// or https://
bool has_http_scheme(const std::string& s);

// Removes "." and ".." segments from a '/'-separated path. Leading ".."
// segments that would climb above the root are dropped.
std::string remove_dot_segments(const std::string& path);

// file:// URL for an absolute local path. Directories keep a trailing '/'
// when `as_dir` is set.
std::string file_url(const std::filesystem::path& path, bool as_dir = false);

// Inverse of file_url; returns empty when `url` is not a file URL
std::filesystem::path path_from_file_url(const std::string& url);

} // namespace ferry
