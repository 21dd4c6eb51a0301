#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "alias_registry.hpp"
#include "common/result.h"
#include "object_definition.hpp"

namespace wireup {

    // 이름 -> ObjectDefinition.
    // 설정 단계에서 채워지고, freeze() 이후에는 읽기 전용이다.
    class DefinitionRegistry : public AliasRegistry
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        Result<void> registerDefinition(const std::string& name, ObjectDefinition definition);
        Result<void> removeDefinition(const std::string& name);

        // 등록된 definition 객체를 그대로 둔 채 내용만 수정한다.
        Result<void> updateDefinition(const std::string& name, const std::function<void(ObjectDefinition&)>& update);

        bool containsDefinition(const std::string& name) const;
        std::shared_ptr<const ObjectDefinition> definition(const std::string& name) const;

        // 등록 순서
        std::vector<std::string> names() const;
        size_t count() const;

        // parent 가 병합된 definition. 없는 이름이면 NoSuchDefinitionError,
        // parent 가 없거나 순환이면 DefinitionError.
        std::shared_ptr<MergedDefinition> merged(const std::string& name) const;

        void freeze();
        bool isFrozen() const;

        void setAllowDefinitionOverriding(bool allow) { allow_overriding_ = allow; }
        bool allowDefinitionOverriding() const { return allow_overriding_; }

    private:
        std::shared_ptr<MergedDefinition> mergedLocked(const std::string& name,
                                                       std::unordered_set<std::string>& visiting) const;
        Result<void> validate(const std::string& name, const ObjectDefinition& definition) const;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<ObjectDefinition>> definitions_;
        std::vector<std::string> order_;
        mutable std::unordered_map<std::string, std::shared_ptr<MergedDefinition>> merged_;
        bool frozen_ = false;
        bool allow_overriding_ = true;
    }; // class DefinitionRegistry

} // namespace wireup
