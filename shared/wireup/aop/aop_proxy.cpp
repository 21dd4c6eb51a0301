#include "aop_proxy.hpp"

#include "logging/logging.hpp"

namespace wireup::aop {

namespace {

thread_local Object current_proxy;

// interceptor 목록을 차례로 호출하고 마지막에 target 을 호출한다.
class ChainedInvocation : public MethodInvocation
{
public:
    ChainedInvocation(const std::string& method, const Object& target, const Object& proxy,
                      const std::vector<std::shared_ptr<MethodInterceptor>>& chain,
                      const InvocationDispatcher::TargetCall& call)
        : method_(method), target_(target), proxy_(proxy), chain_(chain), call_(call) {}

    const std::string& methodName() const override { return method_; }
    const Object& target() const override { return target_; }
    const Object& proxy() const override { return proxy_; }

    std::any proceed() override
    {
        if (index_ >= chain_.size()) {
            return call_(target_);
        }
        auto& interceptor = chain_[index_++];
        return interceptor->invoke(*this);
    }

private:
    const std::string& method_;
    const Object& target_;
    const Object& proxy_;
    const std::vector<std::shared_ptr<MethodInterceptor>>& chain_;
    const InvocationDispatcher::TargetCall& call_;
    size_t index_ = 0;
};

// expose_proxy 호출 범위 동안 current proxy 를 설정/복원
class ProxyScope
{
public:
    ProxyScope(bool active, const Object& proxy) : active_(active)
    {
        if (active_) old_ = ProxyContext::setCurrentProxy(proxy);
    }
    ~ProxyScope()
    {
        if (active_) ProxyContext::setCurrentProxy(std::move(old_));
    }

private:
    bool active_;
    Object old_;
};

} // namespace


Object ProxyContext::currentProxy()
{
    return current_proxy;
}

Object ProxyContext::setCurrentProxy(Object proxy)
{
    Object old = std::move(current_proxy);
    current_proxy = std::move(proxy);
    return old;
}


InvocationDispatcher::InvocationDispatcher(Object target, std::vector<std::shared_ptr<Advisor>> advisors,
                                           ProxyStrategy strategy, bool expose_proxy)
    : target_(std::move(target)),
      advisors_(std::move(advisors)),
      strategy_(strategy),
      expose_proxy_(expose_proxy)
{
}

void InvocationDispatcher::bindProxy(const Object& proxy)
{
    proxy_ptr_ = proxy.pointer();
    proxy_metadata_ = proxy.metadataPtr();
}

Object InvocationDispatcher::proxy() const
{
    auto ptr = proxy_ptr_.lock();
    if (!ptr) return Object();
    return Object(std::move(ptr), proxy_metadata_);
}

std::any InvocationDispatcher::invoke(const std::string& method, const TargetCall& call)
{
    auto chain = interceptorsFor(method);
    Object proxy_object = proxy();
    ProxyScope scope(expose_proxy_, proxy_object);

    if (chain.empty()) {
        return call(target_);
    }
    ChainedInvocation invocation(method, target_, proxy_object, chain, call);
    return invocation.proceed();
}

std::vector<std::shared_ptr<MethodInterceptor>> InvocationDispatcher::interceptorsFor(const std::string& method)
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = chain_cache_.find(method);
    if (it != chain_cache_.end()) return it->second;

    std::vector<std::shared_ptr<MethodInterceptor>> chain;
    const ClassMetadata* type = target_.metadata();
    for (const auto& advisor : advisors_) {
        if (type && !advisor->matches(*type)) continue;
        if (!advisor->matchesMethod(method)) continue;
        auto interceptor = advisor->interceptor();
        if (interceptor) chain.push_back(std::move(interceptor));
    }
    LOG_TRACE("aop", "interceptor chain for {}::{} = {}", target_.typeName(), method, chain.size());
    chain_cache_.emplace(method, chain);
    return chain;
}

} // namespace wireup::aop
