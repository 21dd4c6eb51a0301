#include "class_metadata.hpp"

#include <algorithm>

namespace wireup {

const char* to_string(ParamKind kind)
{
    switch (kind) {
        case ParamKind::Simple:     return "simple";
        case ParamKind::Object:     return "object";
        case ParamKind::Collection: return "collection";
        case ParamKind::Generic:    return "generic";
    }
    return "unknown";
}

ClassMetadata::ClassMetadata(std::string name, TypeId id)
    : name_(std::move(name)), id_(id)
{
}

bool ClassMetadata::isAssignableTo(TypeId type) const
{
    return type == id_ || casters_.count(type) > 0;
}

std::shared_ptr<void> ClassMetadata::cast(const std::shared_ptr<void>& ptr, TypeId target) const
{
    if (!ptr) return nullptr;
    if (target == id_) return ptr;
    auto it = casters_.find(target);
    if (it == casters_.end()) return nullptr;
    return it->second(ptr);
}

const ConstructorInfo* ClassMetadata::defaultConstructor() const
{
    for (const auto& ctor : constructors_) {
        if (ctor.params.empty()) return &ctor;
    }
    return nullptr;
}

const PropertyInfo* ClassMetadata::findProperty(const std::string& name) const
{
    auto it = properties_.find(name);
    return it == properties_.end() ? nullptr : &it->second;
}

const std::function<void(void*)>* ClassMetadata::findMethod(const std::string& name) const
{
    auto it = methods_.find(name);
    return it == methods_.end() ? nullptr : &it->second;
}

std::vector<const FactoryMethodInfo*> ClassMetadata::findFactoryMethods(const std::string& name) const
{
    std::vector<const FactoryMethodInfo*> result;
    auto range = factory_methods_.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        result.push_back(&it->second);
    }
    // 인자가 많은 overload 부터 시도한다.
    std::stable_sort(result.begin(), result.end(), [](const FactoryMethodInfo* a, const FactoryMethodInfo* b) {
        return a->params.size() > b->params.size();
    });
    return result;
}

void ClassMetadata::addInterface(TypeId type, Caster caster)
{
    if (type == id_ || casters_.count(type) > 0) return;
    interfaces_.push_back(type);
    casters_.emplace(type, std::move(caster));
}

void ClassMetadata::addConstructor(ConstructorInfo ctor)
{
    // 같은 arity 의 중복 등록은 마지막 것을 사용
    auto same = std::find_if(constructors_.begin(), constructors_.end(), [&](const ConstructorInfo& c) {
        return c.signature == ctor.signature;
    });
    if (same != constructors_.end()) {
        *same = std::move(ctor);
        return;
    }
    constructors_.push_back(std::move(ctor));
    // 인자가 많은 생성자부터 (greedy)
    std::stable_sort(constructors_.begin(), constructors_.end(), [](const ConstructorInfo& a, const ConstructorInfo& b) {
        return a.params.size() > b.params.size();
    });
}

void ClassMetadata::addProperty(PropertyInfo property)
{
    auto name = property.name;
    properties_[name] = std::move(property);
}

void ClassMetadata::addMethod(const std::string& name, std::function<void(void*)> method)
{
    methods_[name] = std::move(method);
}

void ClassMetadata::addFactoryMethod(FactoryMethodInfo method)
{
    auto name = method.name;
    factory_methods_.emplace(name, std::move(method));
}

} // namespace wireup
