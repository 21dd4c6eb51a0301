#include "property_resolver.hpp"

#include <fmt/format.h>

#include "errors.hpp"
#include "logging/logging.hpp"
#include "object_factory.hpp"
#include "value_resolver.hpp"

namespace wireup {

namespace {

    bool isObjectKind(ParamKind kind)
    {
        return kind == ParamKind::Object || kind == ParamKind::Collection;
    }

} // namespace

void PropertyResolver::populate(const std::string& name, MergedDefinition& merged, const Object& instance,
                                CreationContext& context)
{
    if (!instance) return;

    // hook 이 property 주입을 직접 처리하는 경우
    if (!factory_.pipeline().applyAfterInstantiation(instance, name)) {
        return;
    }

    const ClassMetadata& type = *instance.metadata();
    const ObjectDefinition& def = merged.definition;
    PropertyValues values = def.properties();

    switch (def.autowireMode()) {
        case AutowireMode::ByName:
            autowireByName(name, type, values, context);
            break;
        case AutowireMode::ByType:
            autowireByType(name, type, values, context);
            break;
        default:
            break;
    }

    if (factory_.pipeline().hasPropertyHooks()) {
        auto processed = factory_.pipeline().applyPropertyHooks(std::move(values), instance, name);
        if (!processed) return;
        values = std::move(*processed);
    }

    if (def.dependencyCheck() != DependencyCheck::None) {
        checkDependencies(name, type, def.dependencyCheck(), values);
    }

    if (!values.empty()) {
        applyValues(name, merged, instance, values, context);
    }
}

void PropertyResolver::autowireByName(const std::string& name, const ClassMetadata& type, PropertyValues& values,
                                      CreationContext& context)
{
    for (const auto& [property, info] : type.properties()) {
        if (!isObjectKind(info.param.kind) || values.contains(property)) continue;

        if (factory_.containsObject(property)) {
            Object dependency = factory_.resolveReference(property, name, context);
            values.add(property, ValueSpec::resolved(Value::fromObject(dependency)));
            LOGD("added autowiring by name from object '{}' via property '{}' to object named '{}'",
                 name, property, property);
        } else {
            LOGT("not autowiring property '{}' of object '{}' by name: no matching object found", property, name);
        }
    }
}

void PropertyResolver::autowireByType(const std::string& name, const ClassMetadata& type, PropertyValues& values,
                                      CreationContext& context)
{
    for (const auto& [property, info] : type.properties()) {
        if (!isObjectKind(info.param.kind) || values.contains(property)) continue;

        auto dependency = factory_.resolveDependency(info.param, name, property, context);
        if (!dependency) {
            LOGT("not autowiring property '{}' of object '{}' by type: no matching object found", property, name);
            continue;
        }
        LOGD("autowiring by type from object '{}' via property '{}'", name, property);
        values.add(property, ValueSpec::resolved(std::move(*dependency)));
    }
}

void PropertyResolver::checkDependencies(const std::string& name, const ClassMetadata& type, DependencyCheck check,
                                         const PropertyValues& values)
{
    for (const auto& [property, info] : type.properties()) {
        if (values.contains(property)) continue;

        bool simple = info.param.kind == ParamKind::Simple;
        bool unsatisfied = check == DependencyCheck::All ||
                           (check == DependencyCheck::Simple && simple) ||
                           (check == DependencyCheck::Objects && !simple);
        if (unsatisfied) {
            throw UnsatisfiedDependencyError(name, fmt::format(
                "Unsatisfied dependency expressed through property '{}': "
                "set this property value or disable dependency checking for this object", property));
        }
    }
}

void PropertyResolver::applyValues(const std::string& name, MergedDefinition& merged, const Object& instance,
                                   const PropertyValues& values, CreationContext& context)
{
    const ClassMetadata& type = *instance.metadata();
    ValueResolver resolver(factory_, name, merged.definition.isPrototype(), context);

    for (const auto& [property, spec] : values) {
        const PropertyInfo* info = type.findProperty(property);
        if (!info) {
            throw DefinitionError(name, fmt::format("Invalid property '{}' of class [{}]: property is not writable",
                                                    property, type.name()));
        }

        Value value = resolver.resolve(spec, fmt::format("property '{}'", property));
        if (!info->param.accepts(value)) {
            throw UnsatisfiedDependencyError(name, fmt::format(
                "Failed to convert value {} of property '{}' to required type '{}'",
                value.describe(), property, info->param.type.name()));
        }

        try {
            info->setter(instance.pointer().get(), value);
        } catch (const ContainerError&) {
            throw;
        } catch (const std::exception&) {
            throw InitializationFailure(name, fmt::format("Error setting property '{}'", property),
                                        std::current_exception());
        }
    }
}

} // namespace wireup
