#include "proxy_factory.hpp"

#include <fmt/format.h>

#include "aop_proxy.hpp"
#include "common/helper.hpp"
#include "logging/logging.hpp"
#include "proxy_strategy_selector.hpp"
#include "wireup/errors.hpp"
#include "wireup/type_registry.hpp"

namespace wireup::aop {

Object ProxyFactory::getProxy(const ProxyConfig& config) const
{
    if (!config.target) {
        throw ProxyConfigError("proxy target must not be null");
    }

    ProxyStrategySelector selector(types_);
    ProxyStrategy strategy = selector.select(config);

    auto [stub, proxied] = findStub(strategy, config);
    auto metadata = proxyMetadata(*stub, proxied);

    auto dispatcher = std::make_shared<InvocationDispatcher>(config.target, config.advisors, strategy,
                                                             config.expose_proxy);
    std::shared_ptr<void> instance = stub->make(dispatcher);
    if (!instance) {
        throw ProxyConfigError(fmt::format("proxy stub '{}' returned null", metadata->name()));
    }

    Object proxy(std::move(instance), metadata);
    dispatcher->bindProxy(proxy);

    LOGD("created {} proxy '{}' for target [{}] with {} advisor(s)",
         to_string(strategy), metadata->name(), config.target.typeName(), config.advisors.size());
    return proxy;
}

std::pair<const ProxyStub*, std::shared_ptr<const ClassMetadata>>
ProxyFactory::findStub(ProxyStrategy strategy, const ProxyConfig& config) const
{
    auto target_class = config.targetClass();

    if (strategy == ProxyStrategy::ClassBased) {
        const ProxyStub& stub = target_class->subclassProxy();
        if (!stub) {
            throw ProxyConfigError(fmt::format("Could not generate class-based proxy of class [{}]: "
                                               "no subclass proxy stub is defined for it", target_class->name()));
        }
        return {&stub, target_class};
    }

    ProxyStrategySelector selector(types_);
    std::vector<TypeId> candidates;
    if (target_class && target_class->isInterface()) {
        candidates.push_back(target_class->id());
    }
    for (TypeId type : selector.usableInterfaces(config.interfaces)) {
        candidates.push_back(type);
    }
    // proxy 의 proxy: 안쪽 proxy 가 노출하는 interface
    if (target_class && target_class->isProxyClass()) {
        for (TypeId type : selector.usableInterfaces(target_class->interfaces())) {
            candidates.push_back(type);
        }
    }

    std::vector<std::string> names;
    for (TypeId type : candidates) {
        auto metadata = types_.find(type);
        if (metadata && metadata->interfaceProxy()) {
            return {&metadata->interfaceProxy(), metadata};
        }
        names.push_back(type.name());
    }
    throw ProxyConfigError(fmt::format("Could not generate interface-based proxy for target [{}]: "
                                       "no interface proxy stub is defined for any of [{}]",
                                       config.target.typeName(), joinPath(names, ", ")));
}

std::shared_ptr<ClassMetadata> ProxyFactory::proxyMetadata(const ProxyStub& stub,
                                                           const std::shared_ptr<const ClassMetadata>& proxied) const
{
    auto metadata = std::make_shared<ClassMetadata>(*stub.metadata);

    std::shared_ptr<const ClassMetadata> stub_metadata = stub.metadata;
    const TypeId proxied_id = proxied->id();
    for (TypeId type : proxied->interfaces()) {
        if (metadata->isAssignableTo(type)) continue;
        // stub -> proxied -> interface
        metadata->addInterface(type, [stub_metadata, proxied, proxied_id, type](const std::shared_ptr<void>& ptr) {
            return proxied->cast(stub_metadata->cast(ptr, proxied_id), type);
        });
    }
    return metadata;
}

} // namespace wireup::aop
