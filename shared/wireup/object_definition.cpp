#include "object_definition.hpp"

#include <algorithm>

namespace wireup {

const char* to_string(Scope scope)
{
    return scope == Scope::Singleton ? "singleton" : "prototype";
}

const char* to_string(AutowireMode mode)
{
    switch (mode) {
        case AutowireMode::None:        return "no";
        case AutowireMode::ByName:      return "byName";
        case AutowireMode::ByType:      return "byType";
        case AutowireMode::Constructor: return "constructor";
    }
    return "unknown";
}

const char* to_string(Role role)
{
    return role == Role::Application ? "application" : "infrastructure";
}

// ---------------------------------------------------------------------------
// ValueSpec
// ---------------------------------------------------------------------------

ValueSpec ValueSpec::literal(std::any value)
{
    ValueSpec spec;
    spec.kind_ = Kind::Literal;
    spec.literal_ = std::move(value);
    return spec;
}

ValueSpec ValueSpec::ref(std::string name)
{
    ValueSpec spec;
    spec.kind_ = Kind::Reference;
    spec.ref_ = std::move(name);
    return spec;
}

ValueSpec ValueSpec::list(std::vector<ValueSpec> items)
{
    ValueSpec spec;
    spec.kind_ = Kind::List;
    spec.items_ = std::move(items);
    return spec;
}

ValueSpec ValueSpec::inner(std::shared_ptr<ObjectDefinition> definition)
{
    ValueSpec spec;
    spec.kind_ = Kind::Inner;
    spec.inner_ = std::move(definition);
    return spec;
}

ValueSpec ValueSpec::computed(Expression expression)
{
    ValueSpec spec;
    spec.kind_ = Kind::Computed;
    spec.expression_ = std::move(expression);
    return spec;
}

ValueSpec ValueSpec::resolved(Value value)
{
    return computed([value = std::move(value)](DependencyResolver&) { return value; });
}

// ---------------------------------------------------------------------------
// PropertyValues
// ---------------------------------------------------------------------------

PropertyValues& PropertyValues::add(const std::string& name, ValueSpec value)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == name; });
    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace_back(name, std::move(value));
    }
    return *this;
}

bool PropertyValues::contains(const std::string& name) const
{
    return get(name) != nullptr;
}

const ValueSpec* PropertyValues::get(const std::string& name) const
{
    for (const auto& e : entries_) {
        if (e.first == name) return &e.second;
    }
    return nullptr;
}

bool PropertyValues::remove(const std::string& name)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == name; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

void PropertyValues::overlay(const PropertyValues& other)
{
    for (const auto& e : other.entries_) {
        add(e.first, e.second);
    }
}

// ---------------------------------------------------------------------------
// ConstructorArgs
// ---------------------------------------------------------------------------

ConstructorArgs& ConstructorArgs::add(ValueSpec value)
{
    args_[count()] = std::move(value);
    return *this;
}

ConstructorArgs& ConstructorArgs::set(size_t index, ValueSpec value)
{
    args_[index] = std::move(value);
    return *this;
}

const ValueSpec* ConstructorArgs::get(size_t index) const
{
    auto it = args_.find(index);
    return it == args_.end() ? nullptr : &it->second;
}

void ConstructorArgs::overlay(const ConstructorArgs& other)
{
    for (const auto& [index, value] : other.args_) {
        args_[index] = value;
    }
}

// ---------------------------------------------------------------------------
// ObjectDefinition
// ---------------------------------------------------------------------------

ObjectDefinition ObjectDefinition::merge(const ObjectDefinition& parent, const ObjectDefinition& child)
{
    ObjectDefinition merged = parent;

    if (child.type_.valid() || !child.type_name_.empty()) {
        merged.type_ = child.type_;
        merged.type_name_ = child.type_name_;
    }
    if (child.scope_) merged.scope_ = child.scope_;
    if (child.lazy_init_) merged.lazy_init_ = child.lazy_init_;
    if (child.autowire_) merged.autowire_ = child.autowire_;
    if (child.dependency_check_) merged.dependency_check_ = child.dependency_check_;

    merged.ctor_args_.overlay(child.ctor_args_);
    merged.properties_.overlay(child.properties_);

    if (!child.factory_method_.empty()) merged.factory_method_ = child.factory_method_;
    if (!child.factory_object_.empty()) merged.factory_object_ = child.factory_object_;
    if (child.supplier_) merged.supplier_ = child.supplier_;
    if (!child.init_method_.empty()) merged.init_method_ = child.init_method_;
    if (!child.destroy_method_.empty()) merged.destroy_method_ = child.destroy_method_;
    if (!child.depends_on_.empty()) merged.depends_on_ = child.depends_on_;

    // 상속되지 않는 값들
    merged.parent_name_.clear();
    merged.abstract_ = child.abstract_;
    merged.autowire_candidate_ = child.autowire_candidate_;
    merged.primary_ = child.primary_;
    merged.role_ = child.role_;
    merged.cacheable_ = child.cacheable_;
    return merged;
}

} // namespace wireup
