#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/result.h"

namespace wireup {

    // alias -> name. alias 가 다른 alias 를 가리킬 수 있다.
    class AliasRegistry
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        Result<void> registerAlias(const std::string& name, const std::string& alias);
        Result<void> removeAlias(const std::string& alias);
        bool isAlias(const std::string& name) const;

        // name 을 직접 / 간접적으로 가리키는 모든 alias
        std::vector<std::string> aliasesOf(const std::string& name) const;

        // alias chain 을 따라간 최종 이름. alias 가 아니면 그대로 반환.
        std::string canonicalName(const std::string& name) const;

        void setAllowAliasOverriding(bool allow) { allow_overriding_ = allow; }
        bool allowAliasOverriding() const { return allow_overriding_; }

    private:
        bool hasAliasLocked(const std::string& name, const std::string& alias) const;
        void collectAliasesLocked(const std::string& name, std::vector<std::string>& out) const;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::string> aliases_;
        bool allow_overriding_ = true;
    }; // class AliasRegistry

} // namespace wireup
