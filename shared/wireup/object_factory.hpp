#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "aop/proxy_config.hpp"
#include "common/result.h"
#include "creation_context.hpp"
#include "definition_registry.hpp"
#include "errors.hpp"
#include "instance_cache.hpp"
#include "object.hpp"
#include "object_definition.hpp"
#include "post_processor_pipeline.hpp"
#include "type_registry.hpp"

namespace wireup {

    // 이름 -> 완성된 객체.
    //
    // singleton 생성은 InstanceCache 의 monitor 를 잡은 상태로 진행된다.
    // 같은 thread 안의 재진입(setter cycle)은 early reference 로 해소되고,
    // 생성자만으로 이루어진 cycle 은 CircularConstructionError 로 실패한다.
    class ObjectFactory
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        ObjectFactory();
        explicit ObjectFactory(std::shared_ptr<TypeRegistry> types);
        virtual ~ObjectFactory();

        ObjectFactory(const ObjectFactory&) = delete;
        ObjectFactory& operator=(const ObjectFactory&) = delete;

        TypeRegistry& types() { return *types_; }
        const std::shared_ptr<TypeRegistry>& typesPtr() const { return types_; }
        DefinitionRegistry& definitions() { return definitions_; }
        const DefinitionRegistry& definitions() const { return definitions_; }
        InstanceCache& cache() { return cache_; }
        PostProcessorPipeline& pipeline() { return pipeline_; }

        // --- settings ---
        void setAllowCircularReferences(bool allow) { allow_circular_ = allow; }
        bool allowCircularReferences() const { return allow_circular_; }
        void setAllowRawInjectionDespiteWrapping(bool allow) { allow_raw_injection_ = allow; }
        bool allowRawInjectionDespiteWrapping() const { return allow_raw_injection_; }

        // --- registration ---
        Result<void> registerDefinition(const std::string& name, ObjectDefinition definition);
        // 등록된 definition 을 수정한다. 이미 만든 singleton 은 버려서 다음 resolve 에 반영한다.
        Result<void> updateDefinition(const std::string& name, const std::function<void(ObjectDefinition&)>& update);
        Result<void> registerAlias(const std::string& name, const std::string& alias);
        Result<void> registerSingleton(const std::string& name, Object instance);

        template<typename T>
        Result<void> registerSingleton(const std::string& name, std::shared_ptr<T> instance)
        {
            return registerSingleton(name, types_->wrap(std::move(instance)));
        }

        void addPostProcessor(const Object& processor, const std::string& name = "");

        template<typename P>
        void addPostProcessor(std::shared_ptr<P> processor, const std::string& name = "")
        {
            addPostProcessor(types_->wrap(std::move(processor)), name);
        }

        size_t postProcessorCount() const { return pipeline_.size(); }

        // --- resolution ---
        Object resolve(const std::string& name);
        // 명시적인 생성자 / factory method 인자 (prototype 또는 첫 singleton 생성에만 사용된다)
        Object resolve(const std::string& name, const std::vector<Value>& args);
        // 유일하게 일치하는 객체. 없거나 여럿이면 NoSuchDefinitionError
        Object resolve(TypeId type);

        template<typename T>
        std::shared_ptr<T> get(const std::string& name)
        {
            return cast<T>(resolve(name), name);
        }

        template<typename T>
        std::shared_ptr<T> get()
        {
            return cast<T>(resolve(getTypeId<T>()), getTypeId<T>().name());
        }

        template<typename T>
        Result<std::shared_ptr<T>> tryGet(const std::string& name)
        {
            try {
                return Result<std::shared_ptr<T>>::OK(get<T>(name));
            } catch (const ContainerError& e) {
                return Result<std::shared_ptr<T>>::Error(e.code(), std::string(e.what()));
            }
        }

        bool containsObject(const std::string& name) const;
        bool isSingleton(const std::string& name);
        bool isPrototype(const std::string& name);
        bool isTypeMatch(const std::string& name, TypeId type);
        // 노출될 객체의 타입. factory object 는 product 타입. 알 수 없으면 빈 TypeId
        TypeId typeOf(const std::string& name);
        std::vector<std::string> aliasesOf(const std::string& name) const;

        // type 으로 변환 가능한 객체 이름 (definition 등록 순서, 수동 singleton 은 뒤에)
        std::vector<std::string> namesForType(TypeId type, bool include_non_singletons = true);

        template<typename T>
        std::vector<std::string> namesForType(bool include_non_singletons = true)
        {
            return namesForType(getTypeId<T>(), include_non_singletons);
        }

        template<typename T>
        std::map<std::string, std::shared_ptr<T>> objectsOfType()
        {
            std::map<std::string, std::shared_ptr<T>> result;
            for (const auto& name : namesForType(getTypeId<T>())) {
                result.emplace(name, get<T>(name));
            }
            return result;
        }

        // --- proxy ---
        Object createProxy(const aop::ProxyConfig& config);

        // --- lifecycle ---
        void freezeConfiguration() { definitions_.freeze(); }
        void preInstantiateSingletons();
        void destroySingletons();

        // --- resolver 지원 (InstantiationStrategy / PropertyResolver / ValueResolver) ---

        // name 을 requesting 의 dependency 로 기록하고 resolve 한다.
        Object resolveReference(const std::string& name, const std::string& requesting, CreationContext& context);

        // param 타입의 후보를 찾는다. 후보가 없으면 std::nullopt,
        // 단일 값 후보가 여럿이면 primary / fallback_name 으로 고르고 실패하면 UnsatisfiedDependencyError.
        std::optional<Value> resolveDependency(const ParamInfo& param, const std::string& requesting,
                                               const std::string& fallback_name, CreationContext& context);

        // 이름 없는 inner definition 으로 객체를 만든다. 캐시하지 않는다.
        // prototype inner 객체의 dependency 는 outer 이름으로 기록한다.
        Object createInner(const std::string& inner_name, const ObjectDefinition& definition,
                           const std::string& outer_name, CreationContext& context);

        std::string nextInnerName(const std::string& outer_name);

        std::shared_ptr<const ClassMetadata> resolveType(MergedDefinition& merged);
        // 생성 없이 예측한 노출 타입 (factory method 의 반환 타입 포함)
        std::shared_ptr<const ClassMetadata> predictType(MergedDefinition& merged);

    protected:
        Object doResolve(const std::string& requested, const std::vector<Value>* args, CreationContext& context);
        Object createObject(const std::string& name, MergedDefinition& merged, const std::vector<Value>* args,
                            CreationContext& context);

    private:
        template<typename T>
        std::shared_ptr<T> cast(const Object& object, const std::string& name)
        {
            auto typed = object.as<T>();
            if (!typed) {
                throw ContainerError(ResultCode::InvalidArgument, name,
                                     "Object named '" + name + "' is expected to be of type '" +
                                     getTypeId<T>().name() + "' but was actually of type '" + object.typeName() + "'");
            }
            return typed;
        }

        Object doCreate(const std::string& name, MergedDefinition& merged,
                        const std::shared_ptr<const ClassMetadata>& type,
                        const std::vector<Value>* args, CreationContext& context);
        Object createSingleton(const std::string& name, MergedDefinition& merged, const std::vector<Value>* args,
                               CreationContext& context);
        Object initialize(const std::string& name, const Object& raw, MergedDefinition& merged);
        void invokeAwareMethods(const std::string& name, const Object& object);
        void invokeInitMethods(const std::string& name, const Object& object, MergedDefinition& merged);
        void registerDisposableIfNecessary(const std::string& name, const Object& raw, MergedDefinition& merged);
        void resolveDependsOn(const std::string& name, MergedDefinition& merged, CreationContext& context);
        void discardSingleton(const std::string& name);
        // dependency edge 를 기록할 이름 (생성 중인 prototype inner 객체는 outer 이름)
        std::string dependencyOwner(const std::string& name);

        // factory object 이면 product 를, "&name" 이면 factory 자체를 반환한다.
        Object objectForInstance(const Object& instance, const std::string& requested, const std::string& name,
                                 bool singleton);
        Object productOf(const Object& factory, const std::string& name, bool cacheable);

        // '&' 를 제거하고 alias 를 따라간 이름
        std::string canonicalName(const std::string& name) const;
        TypeId productTypeOf(const std::string& name, const std::shared_ptr<const ClassMetadata>& factory_type);
        bool typeAssignable(TypeId actual, TypeId target) const;
        bool isPrimary(const std::string& name) const;
        std::vector<std::string> autowireCandidates(TypeId type, const std::string& requesting);

        std::shared_ptr<TypeRegistry> types_;
        DefinitionRegistry definitions_;
        InstanceCache cache_;
        PostProcessorPipeline pipeline_;

        // singleton factory object 의 product (monitor 보호)
        std::unordered_map<std::string, Object> factory_products_;
        // 생성 중인 prototype inner 이름 -> outer 이름 (monitor 보호)
        std::unordered_map<std::string, std::string> inner_owners_;

        std::atomic<bool> allow_circular_{true};
        std::atomic<bool> allow_raw_injection_{false};
        std::atomic<uint64_t> inner_sequence_{0};
    }; // class ObjectFactory

} // namespace wireup
