#pragma once

#include <climits>
#include <string>

#include "object.hpp"
#include "type_info.hpp"

namespace wireup {

    class ObjectFactory;

    inline constexpr int HIGHEST_PRECEDENCE = INT_MIN;
    inline constexpr int LOWEST_PRECEDENCE = INT_MAX;

    // 순서가 있는 객체. 값이 작을수록 먼저 실행된다.
    class Ordered
    {
    public:
        virtual ~Ordered() = default;
        virtual int order() const = 0;
    };

    // Ordered 보다 항상 먼저 처리되는 우선순위 그룹
    class PriorityOrdered : public virtual Ordered
    {
    };

    // 모든 property 가 주입된 후 호출된다.
    class InitializingObject
    {
    public:
        virtual ~InitializingObject() = default;
        virtual void afterPropertiesSet() = 0;
    };

    // 컨테이너 종료 시 호출된다.
    class DisposableObject
    {
    public:
        virtual ~DisposableObject() = default;
        virtual void destroy() = 0;
    };

    class NameAware
    {
    public:
        virtual ~NameAware() = default;
        virtual void setObjectName(const std::string& name) = 0;
    };

    class ContainerAware
    {
    public:
        virtual ~ContainerAware() = default;
        virtual void setContainer(ObjectFactory& factory) = 0;
    };

    // 자기 자신 대신 product 를 노출하는 factory 객체.
    // "&name" 으로 조회하면 factory 자체를 얻는다.
    class FactoryObject
    {
    public:
        virtual ~FactoryObject() = default;
        virtual Object getObject() = 0;
        virtual TypeId objectType() const = 0;
        virtual bool isSingleton() const { return true; }
    };

    // 이벤트 구독자. 컨테이너가 생성 직후 색인한다.
    class EventSubscriber
    {
    public:
        virtual ~EventSubscriber() = default;
        virtual void onEvent(const std::string& topic, const Value& payload) = 0;
    };

    inline constexpr const char* FACTORY_DEREFERENCE_PREFIX = "&";
    // inner 객체 이름: "<outer>#inner<N>"
    inline constexpr const char* INNER_OBJECT_SEPARATOR = "#inner";

} // namespace wireup
