#pragma once

#include <optional>
#include <string>
#include <vector>

#include "class_metadata.hpp"
#include "object.hpp"
#include "object_definition.hpp"

namespace wireup {

    class ObjectFactory;
    class DefinitionRegistry;

    // 모든 instance-level hook 의 공통 base.
    // 한 객체가 여러 hook 을 구현할 수 있도록 virtual 로 상속한다.
    class PostProcessor
    {
    public:
        virtual ~PostProcessor() = default;
    };

    // 초기화 전후 변환. 빈 Object 반환은 "변경 없음" 이다.
    class LifecycleHook : public virtual PostProcessor
    {
    public:
        virtual Object beforeInitialization(const Object& object, const std::string& name)
        {
            (void)name;
            return object;
        }

        virtual Object afterInitialization(const Object& object, const std::string& name)
        {
            (void)name;
            return object;
        }
    };

    class InstantiationHook : public virtual PostProcessor
    {
    public:
        // 빈 Object 가 아니면 일반 생성 과정을 대체한다.
        virtual Object beforeInstantiation(const ClassMetadata& type, const std::string& name)
        {
            (void)type; (void)name;
            return Object();
        }

        // false 를 반환하면 property 주입을 중단한다.
        virtual bool afterInstantiation(const Object& object, const std::string& name)
        {
            (void)object; (void)name;
            return true;
        }
    };

    class PropertyHook : public virtual PostProcessor
    {
    public:
        // std::nullopt 를 반환하면 property 주입을 건너뛴다.
        virtual std::optional<PropertyValues> processProperties(const PropertyValues& values,
                                                                const Object& object, const std::string& name)
        {
            (void)object; (void)name;
            return values;
        }
    };

    // 생성자 후보 결정과 cycle 해소용 early reference
    class EarlyReferenceHook : public virtual PostProcessor
    {
    public:
        virtual std::vector<const ConstructorInfo*> determineCandidateConstructors(const ClassMetadata& type,
                                                                                   const std::string& name)
        {
            (void)type; (void)name;
            return {};
        }

        virtual Object earlyReference(const Object& object, const std::string& name)
        {
            (void)name;
            return object;
        }

        // name 의 생성이 실패했다. earlyReference 에서 기록한 상태를 지운다.
        virtual void discardEarlyReference(const std::string& name) { (void)name; }
    };


    // definition 단계 hook. freeze 이전에 실행된다.
    class ContainerPostProcessor
    {
    public:
        virtual ~ContainerPostProcessor() = default;
        virtual void postProcessContainer(ObjectFactory& factory) = 0;
    };

    class DefinitionRegistryPostProcessor : public ContainerPostProcessor
    {
    public:
        virtual void postProcessRegistry(DefinitionRegistry& registry) = 0;

        void postProcessContainer(ObjectFactory& factory) override { (void)factory; }
    };

} // namespace wireup
