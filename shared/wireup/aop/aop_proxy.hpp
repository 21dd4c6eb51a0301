#pragma once

#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "advisor.hpp"
#include "proxy_config.hpp"
#include "wireup/errors.hpp"
#include "wireup/object.hpp"

namespace wireup::aop {

    // proxy 내부 상태 조회
    class Advised
    {
    public:
        virtual ~Advised() = default;

        virtual Object targetObject() const = 0;
        virtual std::vector<std::shared_ptr<Advisor>> proxyAdvisors() const = 0;
        virtual ProxyStrategy proxyStrategy() const = 0;
        virtual bool isExposeProxy() const = 0;
    };


    // 호출 중인 proxy. expose_proxy 가 설정된 경우에만 채워진다.
    class ProxyContext
    {
    public:
        // 호출 중이 아니면 빈 Object
        static Object currentProxy();

        // 이전 값을 반환한다.
        static Object setCurrentProxy(Object proxy);
    };


    // proxy stub 이 모든 호출을 위임하는 대상.
    // target 과 advisor chain 을 보관하고 MethodInvocation 을 구성한다.
    class InvocationDispatcher
    {
    public:
        using TargetCall = std::function<std::any(const Object& target)>;

        InvocationDispatcher(Object target, std::vector<std::shared_ptr<Advisor>> advisors,
                             ProxyStrategy strategy, bool expose_proxy);

        std::any invoke(const std::string& method, const TargetCall& call);

        // proxy 생성 직후 한 번 호출된다. (weak reference)
        void bindProxy(const Object& proxy);
        Object proxy() const;

        const Object& target() const { return target_; }
        const std::vector<std::shared_ptr<Advisor>>& advisors() const { return advisors_; }
        ProxyStrategy strategy() const { return strategy_; }
        bool exposeProxy() const { return expose_proxy_; }

    private:
        std::vector<std::shared_ptr<MethodInterceptor>> interceptorsFor(const std::string& method);

        Object target_;
        std::vector<std::shared_ptr<Advisor>> advisors_;
        ProxyStrategy strategy_;
        bool expose_proxy_;

        std::weak_ptr<void> proxy_ptr_;
        std::shared_ptr<const ClassMetadata> proxy_metadata_;

        std::mutex cache_mutex_;
        std::unordered_map<std::string, std::vector<std::shared_ptr<MethodInterceptor>>> chain_cache_;
    }; // class InvocationDispatcher


    // 모든 proxy stub 이 구현하는 marker. auto-proxy creator 는 이 타입을 다시 proxy 하지 않는다.
    class ProxyInstance : public Advised
    {
    public:
        virtual std::shared_ptr<InvocationDispatcher> dispatcher() const = 0;
    };


    // 사용자 stub 의 base.
    //
    //   class GreeterProxy : public Greeter, public aop::ProxyHandle<Greeter> {
    //   public:
    //       using ProxyHandle::ProxyHandle;
    //       std::string greet(const std::string& who) override {
    //           return call<std::string>("greet", [&](Greeter& t) { return t.greet(who); });
    //       }
    //   };
    template<typename T>
    class ProxyHandle : public ProxyInstance
    {
    public:
        explicit ProxyHandle(std::shared_ptr<InvocationDispatcher> dispatcher)
            : dispatcher_(std::move(dispatcher)) {}

        std::shared_ptr<InvocationDispatcher> dispatcher() const override { return dispatcher_; }

        Object targetObject() const override { return dispatcher_->target(); }
        std::vector<std::shared_ptr<Advisor>> proxyAdvisors() const override { return dispatcher_->advisors(); }
        ProxyStrategy proxyStrategy() const override { return dispatcher_->strategy(); }
        bool isExposeProxy() const override { return dispatcher_->exposeProxy(); }

    protected:
        template<typename R = void, typename F>
        R call(const std::string& method, F&& fn)
        {
            static_assert(!std::is_reference_v<R>, "proxied methods must return by value");

            std::any result = dispatcher_->invoke(method, [&](const Object& target) -> std::any {
                auto self = target.as<T>();
                if (!self) {
                    throw ProxyConfigError("proxy target of type '" + target.typeName() +
                                           "' is not a " + getTypeId<T>().name());
                }
                if constexpr (std::is_void_v<R>) {
                    fn(*self);
                    return std::any();
                } else {
                    return std::any(fn(*self));
                }
            });

            if constexpr (!std::is_void_v<R>) {
                if (!result.has_value()) {
                    throw ContainerError(ResultCode::InvalidState, "",
                                         "interceptor chain for '" + method + "' returned no value");
                }
                return std::any_cast<R>(result);
            }
        }

    private:
        std::shared_ptr<InvocationDispatcher> dispatcher_;
    }; // class ProxyHandle

} // namespace wireup::aop
