#pragma once

#include <ferry/registry.hpp>
#include <ferry/result.hpp>
#include <ferry/version.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

// Chooses concrete versions for registry ranges. Version lists are
// fetched once per package and reused for the rest of the run.
class VersionResolver {
public:
    explicit VersionResolver(RegistrySet& registries);

    Result<Version> resolve(RegistryKind kind, const std::string& package,
                            const VersionRange& range);

    // Highest version in `published` accepted by `range`. Latest prefers
    // releases and falls back to the highest pre-release. `label` names
    // the package in errors ("jsr:@x/y").
    static Result<Version> select(const std::string& label,
                                  const std::vector<Version>& published,
                                  const VersionRange& range);

    // Published versions, memoised
    Result<std::vector<Version>> versions(RegistryKind kind, const std::string& package);

private:
    RegistrySet& registries_;
    std::mutex mutex_;
    std::map<std::string, std::vector<Version>> memo_;
};

} // namespace ferry
