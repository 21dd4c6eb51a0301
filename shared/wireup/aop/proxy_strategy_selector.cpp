#include "proxy_strategy_selector.hpp"

#include "wireup/errors.hpp"
#include "wireup/type_registry.hpp"

namespace wireup::aop {

ProxyStrategy ProxyStrategySelector::select(const ProxyConfig& config) const
{
    if (config.optimize || config.proxy_target_class || !hasUsableInterfaces(config.interfaces)) {
        auto target_class = config.targetClass();
        if (!target_class) {
            throw ProxyConfigError("TargetSource cannot determine target class: "
                                   "either an interface or a target is required for proxy creation");
        }
        if (target_class->isInterface()) {
            return ProxyStrategy::InterfaceBased;
        }
        if (target_class->isProxyClass() && hasUsableInterfaces(target_class->interfaces())) {
            return ProxyStrategy::InterfaceBased;
        }
        return ProxyStrategy::ClassBased;
    }
    return ProxyStrategy::InterfaceBased;
}

std::vector<TypeId> ProxyStrategySelector::usableInterfaces(const std::vector<TypeId>& interfaces) const
{
    std::vector<TypeId> usable;
    for (TypeId type : interfaces) {
        if (isFrameworkInterface(type)) continue;
        auto metadata = types_.find(type);
        if (metadata && metadata->isMarker()) continue;
        usable.push_back(type);
    }
    return usable;
}

bool ProxyStrategySelector::hasUsableInterfaces(const std::vector<TypeId>& interfaces) const
{
    return !usableInterfaces(interfaces).empty();
}

} // namespace wireup::aop
