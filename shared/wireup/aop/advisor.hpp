#pragma once

#include <any>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "wireup/class_metadata.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/object.hpp"

namespace wireup::aop {

    // 하나의 proxied 호출. proceed() 는 다음 interceptor 또는 target 을 호출한다.
    class MethodInvocation
    {
    public:
        virtual ~MethodInvocation() = default;

        virtual const std::string& methodName() const = 0;
        virtual const Object& target() const = 0;
        virtual const Object& proxy() const = 0;

        // void 메서드는 빈 std::any 를 반환한다.
        virtual std::any proceed() = 0;
    };

    class MethodInterceptor
    {
    public:
        virtual ~MethodInterceptor() = default;
        virtual std::any invoke(MethodInvocation& invocation) = 0;
    };

    // interceptor 와 적용 조건(class / method)의 묶음
    class Advisor
    {
    public:
        virtual ~Advisor() = default;

        virtual bool matches(const ClassMetadata& type) const = 0;
        virtual bool matchesMethod(const std::string& method) const { (void)method; return true; }
        virtual std::shared_ptr<MethodInterceptor> interceptor() const = 0;
    };

    // 여러 advisor 를 선언하는 aspect 객체.
    // AnnotationAwareAspectAutoProxyCreator 만 수집한다.
    class Aspect
    {
    public:
        virtual ~Aspect() = default;
        virtual std::vector<std::shared_ptr<Advisor>> advisors() = 0;
    };


    // 함수 기반 interceptor
    class FunctionInterceptor : public MethodInterceptor
    {
    public:
        using Function = std::function<std::any(MethodInvocation&)>;

        explicit FunctionInterceptor(Function fn) : fn_(std::move(fn)) {}

        std::any invoke(MethodInvocation& invocation) override { return fn_(invocation); }

    private:
        Function fn_;
    };


    // class predicate + method 이름 목록으로 매칭하는 기본 advisor.
    // method 목록이 비어 있으면 모든 method 에 적용된다.
    class NameMatchAdvisor : public Advisor, public Ordered
    {
    public:
        using ClassFilter = std::function<bool(const ClassMetadata&)>;

        NameMatchAdvisor() = default;

        NameMatchAdvisor(std::shared_ptr<MethodInterceptor> interceptor, ClassFilter filter = nullptr,
                         std::set<std::string> methods = {}, int order = LOWEST_PRECEDENCE)
            : interceptor_(std::move(interceptor)), filter_(std::move(filter)),
              methods_(std::move(methods)), order_(order) {}

        bool matches(const ClassMetadata& type) const override
        {
            return !filter_ || filter_(type);
        }

        bool matchesMethod(const std::string& method) const override
        {
            return methods_.empty() || methods_.count(method) > 0;
        }

        std::shared_ptr<MethodInterceptor> interceptor() const override { return interceptor_; }

        int order() const override { return order_; }

        void setInterceptor(std::shared_ptr<MethodInterceptor> interceptor) { interceptor_ = std::move(interceptor); }
        void setClassFilter(ClassFilter filter) { filter_ = std::move(filter); }
        void setMappedNames(std::set<std::string> methods) { methods_ = std::move(methods); }
        void setOrder(int order) { order_ = order; }

    private:
        std::shared_ptr<MethodInterceptor> interceptor_;
        ClassFilter filter_;
        std::set<std::string> methods_;
        int order_ = LOWEST_PRECEDENCE;
    }; // class NameMatchAdvisor

    // type 이 T 로 변환 가능한 경우에만 매칭하는 class filter
    template<typename T>
    NameMatchAdvisor::ClassFilter assignableTo()
    {
        return [](const ClassMetadata& type) { return type.isAssignableTo(getTypeId<T>()); };
    }

} // namespace wireup::aop
