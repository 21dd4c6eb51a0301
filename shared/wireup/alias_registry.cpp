#include "alias_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "logging/logging.hpp"

namespace wireup {

Result<void> AliasRegistry::registerAlias(const std::string& name, const std::string& alias)
{
    if (name.empty() || alias.empty()) {
        return Error(ResultCode::InvalidArgument, "name and alias must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (alias == name) {
        // 자기 자신을 가리키는 alias 는 제거만 한다.
        aliases_.erase(alias);
        return OK();
    }

    auto it = aliases_.find(alias);
    if (it != aliases_.end()) {
        if (it->second == name) {
            return DuplicateIgnored();
        }
        if (!allow_overriding_) {
            return Error(ResultCode::AlreadyExists,
                         fmt::format("Cannot define alias '{}' for name '{}': it is already registered for name '{}'",
                                     alias, name, it->second));
        }
        LOGD("overriding alias '{}' definition for registered name '{}' with new target name '{}'",
             alias, it->second, name);
    }

    if (hasAliasLocked(alias, name)) {
        return Error(ResultCode::InvalidArgument,
                     fmt::format("Cannot register alias '{}' for name '{}': circular reference - '{}' is a direct or "
                                 "indirect alias for '{}' already", alias, name, name, alias));
    }

    aliases_[alias] = name;
    LOGT("alias '{}' registered for '{}'", alias, name);
    return OK();
}

Result<void> AliasRegistry::removeAlias(const std::string& alias)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (aliases_.erase(alias) == 0) {
        return Error(ResultCode::NotFound, fmt::format("No alias '{}' registered", alias));
    }
    return OK();
}

bool AliasRegistry::isAlias(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.count(name) > 0;
}

std::vector<std::string> AliasRegistry::aliasesOf(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    collectAliasesLocked(name, result);
    std::sort(result.begin(), result.end());
    return result;
}

std::string AliasRegistry::canonicalName(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string canonical = name;
    for (;;) {
        auto it = aliases_.find(canonical);
        if (it == aliases_.end()) return canonical;
        canonical = it->second;
    }
}

// name 에 대해 alias 가 (간접적으로라도) 등록되어 있는지
bool AliasRegistry::hasAliasLocked(const std::string& name, const std::string& alias) const
{
    for (const auto& [registered_alias, target] : aliases_) {
        if (target == name) {
            if (registered_alias == alias || hasAliasLocked(registered_alias, alias)) return true;
        }
    }
    return false;
}

void AliasRegistry::collectAliasesLocked(const std::string& name, std::vector<std::string>& out) const
{
    for (const auto& [alias, target] : aliases_) {
        if (target == name) {
            out.push_back(alias);
            collectAliasesLocked(alias, out);
        }
    }
}

} // namespace wireup
