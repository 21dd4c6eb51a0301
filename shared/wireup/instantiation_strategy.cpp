#include "instantiation_strategy.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "errors.hpp"
#include "logging/logging.hpp"
#include "object_factory.hpp"
#include "value_resolver.hpp"

namespace wireup {

Object InstantiationStrategy::instantiate(const std::string& name, MergedDefinition& merged,
                                          const std::shared_ptr<const ClassMetadata>& type,
                                          const std::vector<Value>* args, CreationContext& context)
{
    const ObjectDefinition& def = merged.definition;

    if (def.instanceSupplier()) {
        return fromSupplier(name, merged);
    }
    if (!def.factoryMethod().empty()) {
        return fromFactoryMethod(name, merged, type, args, context);
    }

    if (!type) {
        throw DefinitionError(name, "no type could be resolved for the definition");
    }
    if (type->isInterface()) {
        throw DefinitionError(name, fmt::format("type '{}' is an interface or abstract class", type->name()));
    }

    // 이전에 선택된 생성자
    if (!args && merged.resolved_constructor) {
        LOGT("reusing resolved constructor {} for '{}'", merged.resolved_constructor->signature, name);
        auto values = resolveArguments(name, merged, merged.resolved_constructor->params, nullptr, true, context);
        return invoke(name, *merged.resolved_constructor, type, values);
    }

    auto candidates = factory_.pipeline().determineCandidateConstructors(*type, name);
    bool autowire_mode = def.autowireMode() == AutowireMode::Constructor;
    if (!candidates.empty() || autowire_mode || !def.constructorArgs().empty() || args) {
        bool autowiring = !candidates.empty() || autowire_mode;
        if (candidates.empty()) {
            for (const auto& ctor : type->constructors()) candidates.push_back(&ctor);
        }
        // 인자가 많은 생성자부터 시도한다.
        std::stable_sort(candidates.begin(), candidates.end(), [](const ConstructorInfo* a, const ConstructorInfo* b) {
            return a->params.size() > b->params.size();
        });
        return autowireConstructor(name, merged, type, std::move(candidates), args, autowiring, context);
    }

    return instantiateDefault(name, type);
}

Object InstantiationStrategy::fromSupplier(const std::string& name, MergedDefinition& merged)
{
    Object instance;
    try {
        instance = merged.definition.instanceSupplier()();
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception&) {
        throw InstantiationFailure(name, "instance supplier threw exception", std::current_exception());
    }
    if (!instance) {
        throw InstantiationFailure(name, "instance supplier returned null");
    }
    return instance;
}

Object InstantiationStrategy::fromFactoryMethod(const std::string& name, MergedDefinition& merged,
                                                const std::shared_ptr<const ClassMetadata>& type,
                                                const std::vector<Value>* args, CreationContext& context)
{
    const ObjectDefinition& def = merged.definition;

    std::shared_ptr<const ClassMetadata> host;
    Object factory_object;
    bool is_static = def.factoryObject().empty();

    if (!is_static) {
        if (factory_.definitions().canonicalName(def.factoryObject()) == name) {
            throw DefinitionError(name, "factory-object reference points back to the same definition");
        }
        factory_object = factory_.resolveReference(def.factoryObject(), name, context);
        host = factory_object.metadataPtr();
    } else {
        host = type;
        if (!host) {
            throw DefinitionError(name, fmt::format("static factory method '{}' requires a type", def.factoryMethod()));
        }
    }

    std::vector<const FactoryMethodInfo*> methods;
    if (!args && merged.resolved_factory_method) {
        methods.push_back(merged.resolved_factory_method);
    } else {
        for (const auto* m : host->findFactoryMethods(def.factoryMethod())) {
            if (m->is_static == is_static) methods.push_back(m);
        }
    }
    if (methods.empty()) {
        throw DefinitionError(name, fmt::format("No matching factory method found: {} '{}'; factory method '{}'",
                                                is_static ? "factory class" : "factory object",
                                                is_static ? host->name() : def.factoryObject(),
                                                def.factoryMethod()));
    }

    bool autowiring = def.autowireMode() == AutowireMode::Constructor;
    size_t min_args = args ? args->size() : def.constructorArgs().count();
    std::exception_ptr last_error;

    for (const auto* method : methods) {
        if (method->params.size() < min_args) continue;
        if (args && method->params.size() != args->size()) continue;

        std::vector<Value> values;
        try {
            values = resolveArguments(name, merged, method->params, args, autowiring, context);
        } catch (const UnsatisfiedDependencyError&) {
            last_error = std::current_exception();
            continue;
        }

        if (!args && def.isCacheable()) merged.resolved_factory_method = method;

        std::shared_ptr<void> product;
        try {
            product = method->invoke(is_static ? nullptr : factory_object.pointer().get(), values);
        } catch (const ContainerError&) {
            throw;
        } catch (const std::exception&) {
            throw InstantiationFailure(name, fmt::format("factory method '{}' threw exception", method->name),
                                       std::current_exception());
        }
        if (!product) {
            throw InstantiationFailure(name, fmt::format("factory method '{}' returned null", method->name));
        }

        auto product_type = factory_.types().find(method->returns);
        if (!product_type) {
            throw DefinitionError(name, fmt::format("return type '{}' of factory method '{}' is not defined",
                                                    method->returns.name(), method->name));
        }
        return Object(std::move(product), std::move(product_type));
    }

    if (last_error) std::rethrow_exception(last_error);
    throw UnsatisfiedDependencyError(name, fmt::format("no overload of factory method '{}' accepts {} argument(s)",
                                                       def.factoryMethod(), min_args));
}

Object InstantiationStrategy::autowireConstructor(const std::string& name, MergedDefinition& merged,
                                                  const std::shared_ptr<const ClassMetadata>& type,
                                                  std::vector<const ConstructorInfo*> candidates,
                                                  const std::vector<Value>* args, bool autowiring,
                                                  CreationContext& context)
{
    size_t min_args = args ? args->size() : merged.definition.constructorArgs().count();
    std::exception_ptr last_error;

    for (const auto* ctor : candidates) {
        if (ctor->params.size() < min_args) continue;
        if (args && ctor->params.size() != args->size()) continue;

        std::vector<Value> values;
        try {
            values = resolveArguments(name, merged, ctor->params, args, autowiring, context);
        } catch (const UnsatisfiedDependencyError& e) {
            LOGT("constructor {} of '{}' not satisfiable: {}", ctor->signature, name, e.message());
            last_error = std::current_exception();
            continue;
        }

        if (!args && merged.definition.isCacheable()) merged.resolved_constructor = ctor;
        return invoke(name, *ctor, type, values);
    }

    if (last_error) std::rethrow_exception(last_error);
    throw UnsatisfiedDependencyError(name, fmt::format("Could not resolve matching constructor on '{}' for {} argument(s)",
                                                       type->name(), min_args));
}

Object InstantiationStrategy::instantiateDefault(const std::string& name,
                                                 const std::shared_ptr<const ClassMetadata>& type)
{
    const ConstructorInfo* ctor = type->defaultConstructor();
    if (!ctor) {
        throw InstantiationFailure(name, fmt::format("No default constructor found for '{}'", type->name()));
    }
    return invoke(name, *ctor, type, {});
}

std::vector<Value> InstantiationStrategy::resolveArguments(const std::string& name, MergedDefinition& merged,
                                                           const std::vector<ParamInfo>& params,
                                                           const std::vector<Value>* args, bool autowiring,
                                                           CreationContext& context)
{
    const auto& ctor_args = merged.definition.constructorArgs();
    ValueResolver resolver(factory_, name, merged.definition.isPrototype(), context);

    std::vector<Value> values;
    values.reserve(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        const ParamInfo& param = params[i];
        Value value;

        if (args) {
            value = (*args)[i];
        } else if (const ValueSpec* spec = ctor_args.get(i)) {
            value = resolver.resolve(*spec, fmt::format("constructor argument {}", i));
        } else if (autowiring && (param.kind == ParamKind::Object || param.kind == ParamKind::Collection)) {
            auto dependency = factory_.resolveDependency(param, name, "", context);
            if (!dependency) {
                throw UnsatisfiedDependencyError(name, fmt::format(
                    "Unsatisfied dependency expressed through constructor parameter {}: "
                    "no qualifying object of type '{}' available", i, param.type.name()));
            }
            value = std::move(*dependency);
        } else {
            throw UnsatisfiedDependencyError(name, fmt::format(
                "Unsatisfied dependency expressed through constructor parameter {} of type '{}'",
                i, param.type.name()));
        }

        if (!param.accepts(value)) {
            throw UnsatisfiedDependencyError(name, fmt::format(
                "Could not convert constructor argument {} value {} to required type '{}'",
                i, value.describe(), param.type.name()));
        }
        values.push_back(std::move(value));
    }
    return values;
}

Object InstantiationStrategy::invoke(const std::string& name, const ConstructorInfo& ctor,
                                     const std::shared_ptr<const ClassMetadata>& type, const std::vector<Value>& args)
{
    std::shared_ptr<void> instance;
    try {
        instance = ctor.invoke(args);
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception&) {
        throw InstantiationFailure(name, fmt::format("Failed to instantiate [{}]: constructor {} threw exception",
                                                     type->name(), ctor.signature),
                                   std::current_exception());
    }
    return Object(std::move(instance), type);
}

} // namespace wireup
