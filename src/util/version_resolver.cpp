#include <ferry/version_resolver.hpp>
#include <ferry/log.hpp>

#include <algorithm>
#include <exception>

namespace ferry {

namespace {

std::string join_versions(std::vector<Version> vs) {
    if (vs.empty()) return "none";
    std::sort(vs.begin(), vs.end());
    std::string out;
    for (size_t i = 0; i < vs.size(); ++i) {
        if (i) out += ", ";
        out += vs[i].to_string();
    }
    return out;
}

} // namespace

VersionResolver::VersionResolver(RegistrySet& registries) : registries_(registries) {}

Result<std::vector<Version>> VersionResolver::versions(RegistryKind kind,
                                                       const std::string& package) {
    std::string key = std::string(registry_name(kind)) + ":" + package;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memo_.find(key);
        if (it != memo_.end()) return Result<std::vector<Version>>::ok(it->second);
    }

    auto registry = registries_.require(kind);
    if (registry.is_err()) return std::move(registry).error();

    auto listed = [&]() -> Result<std::vector<Version>> {
        try {
            return registry.value()->list_versions(package);
        } catch (const std::exception& e) {
            return FerryError{FerryError::IO,
                "listing versions of " + key + " failed: " + e.what()};
        }
    }();
    if (listed.is_err()) return std::move(listed).error();
    log::debug("%s: %zu published versions", key.c_str(), listed.value().size());

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = memo_.emplace(key, std::move(listed).value());
    return Result<std::vector<Version>>::ok(it->second);
}

Result<Version> VersionResolver::resolve(RegistryKind kind, const std::string& package,
                                         const VersionRange& range) {
    auto published = versions(kind, package);
    if (published.is_err()) return std::move(published).error();
    return select(std::string(registry_name(kind)) + ":" + package, published.value(), range);
}

Result<Version> VersionResolver::select(const std::string& label,
                                        const std::vector<Version>& published,
                                        const VersionRange& range) {
    const Version* best = nullptr;
    const Version* best_pre = nullptr;

    for (const auto& v : published) {
        if (range.kind == RangeKind::Latest) {
            const Version*& slot = v.is_prerelease() ? best_pre : best;
            if (!slot || v > *slot) slot = &v;
            continue;
        }
        if (!range.matches(v)) continue;
        if (!best || v > *best) best = &v;
    }
    if (!best) best = best_pre;

    if (!best) {
        std::string wanted = range.kind == RangeKind::Latest ? "latest" : range.to_string();
        return FerryError{FerryError::VersionNotFound,
            "no version of " + label + " matches " + wanted,
            "available versions: " + join_versions(published)};
    }
    return Result<Version>::ok(*best);
}

} // namespace ferry
