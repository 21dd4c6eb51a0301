#include "type_registry.hpp"

#include <unordered_set>

namespace wireup {

bool isFrameworkInterface(TypeId type)
{
    static const std::unordered_set<TypeId> framework = {
        getTypeId<InitializingObject>(),
        getTypeId<DisposableObject>(),
        getTypeId<NameAware>(),
        getTypeId<ContainerAware>(),
        getTypeId<Ordered>(),
        getTypeId<PriorityOrdered>(),
        getTypeId<FactoryObject>(),
        getTypeId<EventSubscriber>(),
        getTypeId<PostProcessor>(),
        getTypeId<LifecycleHook>(),
        getTypeId<InstantiationHook>(),
        getTypeId<PropertyHook>(),
        getTypeId<EarlyReferenceHook>(),
        getTypeId<ContainerPostProcessor>(),
        getTypeId<DefinitionRegistryPostProcessor>(),
        getTypeId<aop::Advised>(),
        getTypeId<aop::ProxyInstance>(),
    };
    return framework.count(type) > 0;
}

std::shared_ptr<const ClassMetadata> TypeRegistry::find(TypeId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

std::shared_ptr<const ClassMetadata> TypeRegistry::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const ClassMetadata>> TypeRegistry::assignableTo(TypeId type) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const ClassMetadata>> result;
    for (const auto& [id, metadata] : by_id_) {
        if (metadata->isAssignableTo(type)) result.push_back(metadata);
    }
    return result;
}

size_t TypeRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return by_id_.size();
}

void TypeRegistry::add(const std::shared_ptr<ClassMetadata>& metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = by_id_.find(metadata->id());
    if (previous != by_id_.end() && previous->second->name() != metadata->name()) {
        by_name_.erase(previous->second->name());
    }
    by_id_[metadata->id()] = metadata;
    by_name_[metadata->name()] = metadata;
}

} // namespace wireup
