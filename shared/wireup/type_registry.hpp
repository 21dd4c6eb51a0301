#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "class_builder.hpp"
#include "class_metadata.hpp"
#include "type_info.hpp"

namespace wireup {

    // TypeId / class 이름 -> ClassMetadata
    class TypeRegistry
    {
    public:
        TypeRegistry() = default;

        // 같은 타입을 다시 정의하면 이전 정의를 대체한다.
        template<typename T>
        ClassBuilder<T> define(const std::string& name)
        {
            auto metadata = std::make_shared<ClassMetadata>(name, getTypeId<T>());
            ClassBuilder<T> builder(metadata);
            add(metadata);
            return builder;
        }

        template<typename T>
        ClassBuilder<T> define()
        {
            return define<T>(getTypeId<T>().name());
        }

        // 정의되지 않은 타입이면 기본 정보(기본 생성자, framework interface)로 정의한다.
        template<typename T>
        std::shared_ptr<const ClassMetadata> ensure()
        {
            auto found = find(getTypeId<T>());
            if (found) return found;
            return define<T>().metadata();
        }

        template<typename T>
        std::shared_ptr<const ClassMetadata> find() const { return find(getTypeId<T>()); }

        std::shared_ptr<const ClassMetadata> find(TypeId id) const;
        std::shared_ptr<const ClassMetadata> find(const std::string& name) const;

        // 등록된 정의 중 type 으로 변환 가능한 것
        std::vector<std::shared_ptr<const ClassMetadata>> assignableTo(TypeId type) const;

        // T 의 shared_ptr 를 Object 로 감싼다. (T 가 정의되지 않았으면 ensure)
        template<typename T>
        Object wrap(std::shared_ptr<T> instance)
        {
            if (!instance) return Object();
            return Object(std::shared_ptr<void>(std::move(instance)), ensure<T>());
        }

        size_t size() const;

    private:
        void add(const std::shared_ptr<ClassMetadata>& metadata);

        mutable std::mutex mutex_;
        std::unordered_map<TypeId, std::shared_ptr<const ClassMetadata>> by_id_;
        std::unordered_map<std::string, std::shared_ptr<const ClassMetadata>> by_name_;
    }; // class TypeRegistry

} // namespace wireup
