#include "value_resolver.hpp"

#include <fmt/format.h>

#include "errors.hpp"
#include "object_factory.hpp"

namespace wireup {

ValueResolver::ValueResolver(ObjectFactory& factory, const std::string& owner, bool owner_is_prototype,
                             CreationContext& context)
    : factory_(factory), owner_(owner), owner_is_prototype_(owner_is_prototype), context_(context)
{
}

Value ValueResolver::resolve(const ValueSpec& spec, const std::string& what)
{
    switch (spec.kind()) {
        case ValueSpec::Kind::Literal:
            if (!spec.literalValue().has_value()) return Value::null();
            return Value::fromLiteral(spec.literalValue());

        case ValueSpec::Kind::Reference:
        case ValueSpec::Kind::Inner:
            return Value::fromObject(resolveObject(spec, what));

        case ValueSpec::Kind::List: {
            std::vector<Object> items;
            size_t index = 0;
            for (const auto& item : spec.items()) {
                Value v = resolve(item, fmt::format("{}[{}]", what, index++));
                if (v.kind() == Value::Kind::Object) {
                    items.push_back(v.asObject());
                } else if (v.kind() == Value::Kind::List) {
                    items.insert(items.end(), v.asList().begin(), v.asList().end());
                } else if (!v.isNull()) {
                    throw DefinitionError(owner_, fmt::format("{} must resolve to objects but was {}", what, v.describe()));
                }
            }
            return Value::fromList(std::move(items));
        }

        case ValueSpec::Kind::Computed: {
            if (!spec.expression()) return Value::null();
            ContextDependencyResolver resolver(factory_, owner_, context_);
            return spec.expression()(resolver);
        }
    }
    return Value::null();
}

Object ValueResolver::resolveObject(const ValueSpec& spec, const std::string& what)
{
    if (spec.kind() == ValueSpec::Kind::Reference) {
        if (spec.refName().empty()) {
            throw DefinitionError(owner_, fmt::format("{} references an empty object name", what));
        }
        return factory_.resolveReference(spec.refName(), owner_, context_);
    }

    const auto& inner = spec.innerDefinition();
    if (!inner) {
        throw DefinitionError(owner_, fmt::format("{} has no inner definition", what));
    }
    ObjectDefinition definition = *inner;
    // prototype 안의 inner 객체는 prototype 이다.
    if (owner_is_prototype_) definition.setScope(Scope::Prototype);
    return factory_.createInner(factory_.nextInnerName(owner_), definition, owner_, context_);
}


Object ContextDependencyResolver::resolve(const std::string& name)
{
    return factory_.resolveReference(name, requesting_, context_);
}

Object ContextDependencyResolver::resolve(TypeId type)
{
    ParamInfo param;
    param.kind = ParamKind::Object;
    param.type = type;
    auto value = factory_.resolveDependency(param, requesting_, "", context_);
    if (!value || value->isNull()) {
        throw UnsatisfiedDependencyError(requesting_,
                                         fmt::format("No qualifying object of type '{}' available", type.name()));
    }
    return value->asObject();
}

} // namespace wireup
