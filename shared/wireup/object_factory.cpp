#include "object_factory.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "aop/proxy_factory.hpp"
#include "common/helper.hpp"
#include "instantiation_strategy.hpp"
#include "lifecycle.hpp"
#include "logging/logging.hpp"
#include "property_resolver.hpp"

namespace wireup {

namespace {

    bool isDereference(const std::string& name)
    {
        return name.rfind(FACTORY_DEREFERENCE_PREFIX, 0) == 0;
    }

    int orderOf(const Object& object)
    {
        auto ordered = object.as<Ordered>();
        return ordered ? ordered->order() : LOWEST_PRECEDENCE;
    }

} // namespace

ObjectFactory::ObjectFactory()
    : ObjectFactory(std::make_shared<TypeRegistry>())
{
}

ObjectFactory::ObjectFactory(std::shared_ptr<TypeRegistry> types)
    : types_(std::move(types))
{
}

ObjectFactory::~ObjectFactory() = default;

// ---------------------------------------------------------------------------
// registration
// ---------------------------------------------------------------------------

Result<void> ObjectFactory::registerDefinition(const std::string& name, ObjectDefinition definition)
{
    auto result = definitions_.registerDefinition(name, std::move(definition));
    if (result) {
        discardSingleton(name);
    }
    return result;
}

Result<void> ObjectFactory::updateDefinition(const std::string& name,
                                             const std::function<void(ObjectDefinition&)>& update)
{
    auto result = definitions_.updateDefinition(name, update);
    if (result) {
        discardSingleton(name);
    }
    return result;
}

// 이전 definition 으로 만든 singleton 은 버린다.
void ObjectFactory::discardSingleton(const std::string& name)
{
    std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
    if (!cache_.isFinished(name)) return;

    LOGD("definition '{}' changed, destroying its cached singleton", name);
    Object instance = cache_.get(name, false);
    if (instance && pipeline_.remove(instance)) {
        LOGD("removed post-processor '{}' from the pipeline", name);
    }
    cache_.destroySingleton(name);
    factory_products_.erase(name);
}

Result<void> ObjectFactory::registerAlias(const std::string& name, const std::string& alias)
{
    return definitions_.registerAlias(name, alias);
}

Result<void> ObjectFactory::registerSingleton(const std::string& name, Object instance)
{
    auto result = cache_.registerSingleton(name, std::move(instance));
    if (result) {
        LOGD("registered singleton '{}'", name);
    }
    return result;
}

void ObjectFactory::addPostProcessor(const Object& processor, const std::string& name)
{
    if (!processor) {
        LOGW("ignoring null post-processor '{}'", name);
        return;
    }
    pipeline_.add(name.empty() ? processor.typeName() : name, processor);
}

// ---------------------------------------------------------------------------
// resolution
// ---------------------------------------------------------------------------

Object ObjectFactory::resolve(const std::string& name)
{
    CreationContext context;
    return doResolve(name, nullptr, context);
}

Object ObjectFactory::resolve(const std::string& name, const std::vector<Value>& args)
{
    CreationContext context;
    return doResolve(name, &args, context);
}

Object ObjectFactory::resolve(TypeId type)
{
    auto candidates = autowireCandidates(type, "");
    if (candidates.size() == 1) {
        return resolve(candidates.front());
    }
    if (candidates.empty()) {
        throw NoSuchDefinitionError(type.name(),
                                    fmt::format("No qualifying object of type '{}' available", type.name()));
    }

    std::vector<std::string> primaries;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(primaries),
                 [this](const std::string& c) { return isPrimary(c); });
    if (primaries.size() == 1) {
        return resolve(primaries.front());
    }
    if (primaries.size() > 1) {
        throw NoSuchDefinitionError(type.name(), fmt::format(
            "No qualifying object of type '{}' available: more than one 'primary' object found among candidates: {}",
            type.name(), joinPath(primaries, ", ")));
    }
    throw NoSuchDefinitionError(type.name(), fmt::format(
        "No qualifying object of type '{}' available: expected single matching object but found {}: {}",
        type.name(), candidates.size(), joinPath(candidates, ", ")));
}

Object ObjectFactory::doResolve(const std::string& requested, const std::vector<Value>* args,
                                CreationContext& context)
{
    const std::string name = canonicalName(requested);
    try {
        // 완성된 singleton 또는 생성 중인 singleton 의 early reference
        Object shared = cache_.get(name, args == nullptr);
        if (shared) {
            if (cache_.isCreating(name)) {
                LOGT("returning eagerly cached instance of singleton '{}' that is not fully initialized yet "
                     "(circular reference)", name);
            }
            return objectForInstance(shared, requested, name, true);
        }

        if (!definitions_.containsDefinition(name)) {
            throw NoSuchDefinitionError(name);
        }
        auto merged = definitions_.merged(name);
        const ObjectDefinition& def = merged->definition;
        if (def.isAbstract()) {
            throw DefinitionError(name, "definition is abstract and cannot be instantiated");
        }
        if (def.isPrototype() && context.contains(name)) {
            throw CircularConstructionError(name, context.cycleTo(name));
        }

        std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
        resolveDependsOn(name, *merged, context);

        Object instance;
        if (def.isSingleton()) {
            instance = createSingleton(name, *merged, args, context);
        } else {
            instance = createObject(name, *merged, args, context);
        }
        return objectForInstance(instance, requested, name, def.isSingleton());
    } catch (ContainerError& e) {
        e.prependPath(name);
        throw;
    }
}

Object ObjectFactory::createSingleton(const std::string& name, MergedDefinition& merged,
                                      const std::vector<Value>* args, CreationContext& context)
{
    // 다른 thread 가 monitor 를 잡고 있는 동안 완성했을 수 있다.
    if (Object existing = cache_.get(name, false)) {
        return existing;
    }
    if (cache_.isDestroying()) {
        throw ContainerError(ResultCode::InvalidState, name,
                             "Singleton creation not allowed while singletons of this factory are in destruction");
    }
    if (!cache_.beginCreation(name)) {
        throw CircularConstructionError(name, context.cycleTo(name));
    }

    LOGD("Creating shared instance of singleton object '{}'", name);
    try {
        Object instance = createObject(name, merged, args, context);
        cache_.finish(name, instance);
        return instance;
    } catch (...) {
        // 실패한 singleton 과 그 early reference 를 가져간 객체를 제거한다.
        pipeline_.discardEarlyReference(name);
        cache_.abort(name);
        cache_.destroySingleton(name);
        factory_products_.erase(name);
        throw;
    }
}

void ObjectFactory::resolveDependsOn(const std::string& name, MergedDefinition& merged, CreationContext& context)
{
    for (const auto& dependency : merged.definition.dependsOn()) {
        std::string dependency_name = canonicalName(dependency);
        if (cache_.isDependent(name, dependency_name)) {
            throw CircularConstructionError(name, {name, dependency_name, name});
        }
        if (!containsObject(dependency_name)) {
            throw NoSuchDefinitionError(name, fmt::format("'{}' depends on missing object '{}'", name, dependency));
        }
        cache_.registerDependent(dependency_name, dependencyOwner(name));
        doResolve(dependency, nullptr, context);
    }
}

Object ObjectFactory::createObject(const std::string& name, MergedDefinition& merged,
                                   const std::vector<Value>* args, CreationContext& context)
{
    CreationContext::Frame frame(context, name);
    auto type = resolveType(merged);

    try {
        // hook 이 대신 만든 객체는 populate / init 을 거치지 않는다.
        if (pipeline_.hasInstantiationHooks()) {
            auto target = predictType(merged);
            if (target) {
                Object surrogate = pipeline_.applyBeforeInstantiation(*target, name);
                if (surrogate) {
                    return pipeline_.applyAfterInitialization(surrogate, name);
                }
            }
        }
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception&) {
        throw InstantiationFailure(name, "post-processor before instantiation of object failed",
                                   std::current_exception());
    }

    return doCreate(name, merged, type, args, context);
}

Object ObjectFactory::doCreate(const std::string& name, MergedDefinition& merged,
                               const std::shared_ptr<const ClassMetadata>& type,
                               const std::vector<Value>* args, CreationContext& context)
{
    InstantiationStrategy strategy(*this);
    Object raw = strategy.instantiate(name, merged, type, args, context);

    const bool singleton = merged.definition.isSingleton();
    const bool early_exposure = singleton && allow_circular_ && cache_.isCreating(name);
    if (early_exposure) {
        LOGD("Eagerly caching object '{}' to allow for resolving potential circular references", name);
        cache_.setEarlyFactory(name, [this, raw, name]() { return pipeline_.applyEarlyReference(raw, name); });
    }

    PropertyResolver(*this).populate(name, merged, raw, context);
    Object exposed = initialize(name, raw, merged);

    if (early_exposure) {
        Object early = cache_.earlyObject(name);
        if (early) {
            if (exposed == raw) {
                exposed = early;
            } else if (!allow_raw_injection_) {
                auto dependents = cache_.dependentsOf(name);
                if (!dependents.empty()) {
                    throw RawReferenceLeakedError(name, dependents);
                }
            }
        }
    }

    if (singleton) {
        registerDisposableIfNecessary(name, raw, merged);
    }
    return exposed;
}

Object ObjectFactory::initialize(const std::string& name, const Object& raw, MergedDefinition& merged)
{
    try {
        invokeAwareMethods(name, raw);
        Object wrapped = pipeline_.applyBeforeInitialization(raw, name);
        invokeInitMethods(name, wrapped, merged);
        return pipeline_.applyAfterInitialization(wrapped, name);
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception&) {
        throw InitializationFailure(name, "Invocation of init method failed", std::current_exception());
    }
}

void ObjectFactory::invokeAwareMethods(const std::string& name, const Object& object)
{
    if (auto aware = object.as<NameAware>()) {
        aware->setObjectName(name);
    }
    if (auto aware = object.as<ContainerAware>()) {
        aware->setContainer(*this);
    }
}

void ObjectFactory::invokeInitMethods(const std::string& name, const Object& object, MergedDefinition& merged)
{
    auto initializing = object.as<InitializingObject>();
    if (initializing) {
        LOGT("Invoking afterPropertiesSet() on object with name '{}'", name);
        initializing->afterPropertiesSet();
    }

    const std::string& init = merged.definition.initMethod();
    if (init.empty() || (initializing && init == "afterPropertiesSet")) return;

    const auto* method = object.metadata()->findMethod(init);
    if (!method) {
        throw DefinitionError(name, fmt::format("Could not find an init method named '{}' on object with name '{}'",
                                                init, name));
    }
    LOGT("Invoking init method '{}' on object with name '{}'", init, name);
    (*method)(object.pointer().get());
}

void ObjectFactory::registerDisposableIfNecessary(const std::string& name, const Object& raw,
                                                  MergedDefinition& merged)
{
    auto disposable = raw.as<DisposableObject>();
    const std::string& destroy = merged.definition.destroyMethod();

    const std::function<void(void*)>* method = nullptr;
    if (!destroy.empty() && !(disposable && destroy == "destroy")) {
        method = raw.metadata()->findMethod(destroy);
        if (!method) {
            throw DefinitionError(name, fmt::format("Could not find a destroy method named '{}' on object with name '{}'",
                                                    destroy, name));
        }
    }
    if (!disposable && !method) return;

    cache_.registerDisposable(name, [name, raw, disposable, method, destroy]() {
        if (disposable) {
            LOG_TRACE(LOG_TAG, "Invoking destroy() on object with name '{}'", name);
            disposable->destroy();
        }
        if (method) {
            LOG_TRACE(LOG_TAG, "Invoking destroy method '{}' on object with name '{}'", destroy, name);
            (*method)(raw.pointer().get());
        }
    });
}

// ---------------------------------------------------------------------------
// factory objects
// ---------------------------------------------------------------------------

Object ObjectFactory::objectForInstance(const Object& instance, const std::string& requested,
                                        const std::string& name, bool singleton)
{
    auto factory = instance.as<FactoryObject>();
    if (isDereference(requested)) {
        if (!factory) {
            throw DefinitionError(name, fmt::format("Object named '{}' is expected to be a FactoryObject but was '{}'",
                                                    name, instance.typeName()));
        }
        return instance;
    }
    if (!factory) return instance;
    return productOf(instance, name, singleton);
}

Object ObjectFactory::productOf(const Object& factory_object, const std::string& name, bool cacheable)
{
    auto factory = factory_object.as<FactoryObject>();

    auto produce = [&]() {
        Object product;
        try {
            product = factory->getObject();
        } catch (const ContainerError&) {
            throw;
        } catch (const std::exception&) {
            throw InstantiationFailure(name, "FactoryObject threw exception on object creation",
                                       std::current_exception());
        }
        if (!product) {
            throw InstantiationFailure(name, "FactoryObject returned null from getObject()");
        }
        try {
            return pipeline_.applyAfterInitialization(product, name);
        } catch (const ContainerError&) {
            throw;
        } catch (const std::exception&) {
            throw InitializationFailure(name, "Post-processing of FactoryObject's object failed",
                                        std::current_exception());
        }
    };

    // factory 자체가 아직 생성 중이면 product 를 cache 하지 않는다.
    if (cacheable && factory->isSingleton() && cache_.isFinished(name)) {
        std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
        auto it = factory_products_.find(name);
        if (it != factory_products_.end()) return it->second;

        Object product = produce();
        factory_products_.emplace(name, product);
        return product;
    }
    return produce();
}

// ---------------------------------------------------------------------------
// resolver 지원
// ---------------------------------------------------------------------------

Object ObjectFactory::resolveReference(const std::string& name, const std::string& requesting,
                                       CreationContext& context)
{
    Object object = doResolve(name, nullptr, context);
    cache_.registerDependent(canonicalName(name), dependencyOwner(requesting));
    return object;
}

std::string ObjectFactory::dependencyOwner(const std::string& name)
{
    std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
    auto it = inner_owners_.find(name);
    return it == inner_owners_.end() ? name : it->second;
}

std::optional<Value> ObjectFactory::resolveDependency(const ParamInfo& param, const std::string& requesting,
                                                      const std::string& fallback_name, CreationContext& context)
{
    if (param.kind != ParamKind::Object && param.kind != ParamKind::Collection) {
        return std::nullopt;
    }

    auto candidates = autowireCandidates(param.type, requesting);
    if (candidates.empty()) return std::nullopt;

    if (param.kind == ParamKind::Collection) {
        std::vector<Object> items;
        for (const auto& candidate : candidates) {
            items.push_back(resolveReference(candidate, requesting, context));
        }
        std::stable_sort(items.begin(), items.end(),
                         [](const Object& a, const Object& b) { return orderOf(a) < orderOf(b); });
        return Value::fromList(std::move(items));
    }

    std::string chosen;
    if (candidates.size() == 1) {
        chosen = candidates.front();
    } else {
        std::vector<std::string> primaries;
        std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(primaries),
                     [this](const std::string& c) { return isPrimary(c); });

        if (primaries.size() == 1) {
            chosen = primaries.front();
        } else if (primaries.size() > 1) {
            throw UnsatisfiedDependencyError(requesting, fmt::format(
                "more than one 'primary' object of type '{}' found among candidates: {}",
                param.type.name(), joinPath(primaries, ", ")));
        } else if (!fallback_name.empty()) {
            for (const auto& candidate : candidates) {
                auto aliases = definitions_.aliasesOf(candidate);
                if (candidate == fallback_name ||
                    std::find(aliases.begin(), aliases.end(), fallback_name) != aliases.end()) {
                    chosen = candidate;
                    break;
                }
            }
        }
        if (chosen.empty()) {
            throw UnsatisfiedDependencyError(requesting, fmt::format(
                "No qualifying object of type '{}' available: expected single matching object but found {}: {}",
                param.type.name(), candidates.size(), joinPath(candidates, ", ")));
        }
    }
    return Value::fromObject(resolveReference(chosen, requesting, context));
}

Object ObjectFactory::createInner(const std::string& inner_name, const ObjectDefinition& definition,
                                  const std::string& outer_name, CreationContext& context)
{
    std::shared_ptr<MergedDefinition> merged;
    try {
        if (!definition.parentName().empty()) {
            auto parent = definitions_.merged(canonicalName(definition.parentName()));
            merged = std::make_shared<MergedDefinition>(inner_name,
                                                        ObjectDefinition::merge(parent->definition, definition));
        } else {
            merged = std::make_shared<MergedDefinition>(inner_name, definition);
        }

        // prototype inner 이름은 resolve 마다 새로 만들어지므로 edge 에 남기지 않는다.
        const bool transient = merged->definition.isPrototype();
        std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
        if (transient) {
            inner_owners_[inner_name] = dependencyOwner(outer_name);
        }

        Object instance;
        try {
            instance = createObject(inner_name, *merged, nullptr, context);
        } catch (...) {
            inner_owners_.erase(inner_name);
            throw;
        }

        if (transient) {
            inner_owners_.erase(inner_name);
        } else {
            cache_.registerDependent(inner_name, outer_name);
        }
        return objectForInstance(instance, inner_name, inner_name, false);
    } catch (ContainerError& e) {
        e.prependPath(inner_name);
        throw;
    }
}

std::string ObjectFactory::nextInnerName(const std::string& outer_name)
{
    return fmt::format("{}{}{}", outer_name, INNER_OBJECT_SEPARATOR, ++inner_sequence_);
}

std::shared_ptr<const ClassMetadata> ObjectFactory::resolveType(MergedDefinition& merged)
{
    std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
    if (merged.resolved_type) return merged.resolved_type;

    const ObjectDefinition& def = merged.definition;
    std::shared_ptr<const ClassMetadata> type;
    if (def.type().valid()) {
        type = types_->find(def.type());
        if (!type) {
            throw DefinitionError(merged.name, fmt::format("class '{}' is not defined in the type registry",
                                                           def.type().name()));
        }
    } else if (!def.typeName().empty()) {
        type = types_->find(def.typeName());
        if (!type) {
            throw DefinitionError(merged.name, fmt::format("Cannot find class [{}]", def.typeName()));
        }
    }
    merged.resolved_type = type;
    return type;
}

std::shared_ptr<const ClassMetadata> ObjectFactory::predictType(MergedDefinition& merged)
{
    try {
        const ObjectDefinition& def = merged.definition;
        if (def.factoryMethod().empty()) {
            return def.hasType() ? resolveType(merged) : nullptr;
        }
        if (merged.resolved_factory_method) {
            return types_->find(merged.resolved_factory_method->returns);
        }

        const bool is_static = def.factoryObject().empty();
        std::shared_ptr<const ClassMetadata> host;
        if (is_static) {
            host = def.hasType() ? resolveType(merged) : nullptr;
        } else {
            std::string factory_name = canonicalName(def.factoryObject());
            if (Object instance = cache_.get(factory_name, false)) {
                host = instance.metadataPtr();
            } else if (factory_name != merged.name && definitions_.containsDefinition(factory_name)) {
                host = predictType(*definitions_.merged(factory_name));
            }
        }
        if (!host) return nullptr;

        // 오버로드의 반환 타입이 모두 같을 때만 예측한다.
        TypeId returns;
        for (const auto* method : host->findFactoryMethods(def.factoryMethod())) {
            if (method->is_static != is_static) continue;
            if (returns.valid() && returns != method->returns) return nullptr;
            returns = method->returns;
        }
        return returns.valid() ? types_->find(returns) : nullptr;
    } catch (const ContainerError& e) {
        LOGT("could not predict type of object '{}': {}", merged.name, e.what());
        return nullptr;
    }
}

// ---------------------------------------------------------------------------
// queries
// ---------------------------------------------------------------------------

bool ObjectFactory::containsObject(const std::string& name) const
{
    std::string canonical = canonicalName(name);
    return cache_.state(canonical) != InstanceCache::State::Absent || definitions_.containsDefinition(canonical);
}

bool ObjectFactory::isSingleton(const std::string& name)
{
    std::string canonical = canonicalName(name);
    if (Object instance = cache_.get(canonical, false)) {
        auto factory = instance.as<FactoryObject>();
        return !factory || isDereference(name) || factory->isSingleton();
    }
    if (!definitions_.containsDefinition(canonical)) {
        throw NoSuchDefinitionError(canonical);
    }
    return definitions_.merged(canonical)->definition.isSingleton();
}

bool ObjectFactory::isPrototype(const std::string& name)
{
    std::string canonical = canonicalName(name);
    if (definitions_.containsDefinition(canonical)) {
        if (definitions_.merged(canonical)->definition.isPrototype()) return true;
        if (isDereference(name)) return false;
        if (Object instance = cache_.get(canonical, false)) {
            auto factory = instance.as<FactoryObject>();
            return factory && !factory->isSingleton();
        }
        return false;
    }
    if (cache_.isFinished(canonical)) return false;
    throw NoSuchDefinitionError(canonical);
}

bool ObjectFactory::isTypeMatch(const std::string& name, TypeId type)
{
    std::string canonical = canonicalName(name);
    bool dereference = isDereference(name);

    if (Object instance = cache_.get(canonical, false)) {
        if (!dereference) {
            if (auto factory = instance.as<FactoryObject>()) {
                return typeAssignable(factory->objectType(), type);
            }
        }
        return instance.isA(type);
    }
    if (!definitions_.containsDefinition(canonical)) return false;

    auto predicted = predictType(*definitions_.merged(canonical));
    if (!predicted) return false;
    if (!dereference && predicted->isAssignableTo(getTypeId<FactoryObject>())) {
        return typeAssignable(productTypeOf(canonical, predicted), type);
    }
    return predicted->isAssignableTo(type);
}

TypeId ObjectFactory::typeOf(const std::string& name)
{
    std::string canonical = canonicalName(name);
    bool dereference = isDereference(name);

    if (Object instance = cache_.get(canonical, false)) {
        if (!dereference) {
            if (auto factory = instance.as<FactoryObject>()) return factory->objectType();
        }
        return instance.type();
    }
    if (!definitions_.containsDefinition(canonical)) return TypeId();

    auto predicted = predictType(*definitions_.merged(canonical));
    if (!predicted) return TypeId();
    if (!dereference && predicted->isAssignableTo(getTypeId<FactoryObject>())) {
        return productTypeOf(canonical, predicted);
    }
    return predicted->id();
}

std::vector<std::string> ObjectFactory::aliasesOf(const std::string& name) const
{
    return definitions_.aliasesOf(canonicalName(name));
}

std::vector<std::string> ObjectFactory::namesForType(TypeId type, bool include_non_singletons)
{
    const TypeId factory_type = getTypeId<FactoryObject>();
    std::vector<std::string> result;

    for (const auto& name : definitions_.names()) {
        std::shared_ptr<MergedDefinition> merged;
        try {
            merged = definitions_.merged(name);
        } catch (const ContainerError& e) {
            LOGT("ignoring definition '{}' while matching type '{}': {}", name, type.name(), e.what());
            continue;
        }
        const ObjectDefinition& def = merged->definition;
        if (def.isAbstract()) continue;

        // 완성된 instance 가 있으면 그 타입(proxy 포함)을 사용한다.
        Object instance = cache_.get(name, false);
        auto actual = instance ? instance.metadataPtr() : predictType(*merged);
        if (!actual) continue;

        bool singleton = def.isSingleton();
        if (actual->isAssignableTo(factory_type)) {
            auto factory = instance.as<FactoryObject>();
            bool product_singleton = singleton && (!factory || factory->isSingleton());
            if ((include_non_singletons || product_singleton) && typeAssignable(productTypeOf(name, actual), type)) {
                result.push_back(name);
            }
            if ((include_non_singletons || singleton) && actual->isAssignableTo(type)) {
                result.push_back(FACTORY_DEREFERENCE_PREFIX + name);
            }
        } else if ((include_non_singletons || singleton) && actual->isAssignableTo(type)) {
            result.push_back(name);
        }
    }

    // definition 없이 등록된 singleton
    for (const auto& name : cache_.names()) {
        if (definitions_.containsDefinition(name)) continue;
        Object instance = cache_.get(name, false);
        if (!instance) continue;

        if (auto factory = instance.as<FactoryObject>()) {
            if (typeAssignable(factory->objectType(), type)) result.push_back(name);
            if (instance.isA(type)) result.push_back(FACTORY_DEREFERENCE_PREFIX + name);
        } else if (instance.isA(type)) {
            result.push_back(name);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// proxy / lifecycle
// ---------------------------------------------------------------------------

Object ObjectFactory::createProxy(const aop::ProxyConfig& config)
{
    return aop::ProxyFactory(*types_).getProxy(config);
}

void ObjectFactory::preInstantiateSingletons()
{
    LOGD("Pre-instantiating singletons in {}", fmt::ptr(this));

    for (const auto& name : definitions_.names()) {
        auto merged = definitions_.merged(name);
        const ObjectDefinition& def = merged->definition;
        if (def.isAbstract() || !def.isSingleton() || def.isLazyInit()) continue;

        auto type = predictType(*merged);
        if (type && type->isAssignableTo(getTypeId<FactoryObject>())) {
            resolve(FACTORY_DEREFERENCE_PREFIX + name);
        } else {
            resolve(name);
        }
    }
}

void ObjectFactory::destroySingletons()
{
    std::lock_guard<std::recursive_mutex> lock(cache_.monitor());
    factory_products_.clear();
    cache_.destroySingletons();
}

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------

std::string ObjectFactory::canonicalName(const std::string& name) const
{
    std::string stripped = name;
    while (isDereference(stripped)) {
        stripped.erase(0, std::char_traits<char>::length(FACTORY_DEREFERENCE_PREFIX));
    }
    return definitions_.canonicalName(stripped);
}

TypeId ObjectFactory::productTypeOf(const std::string& name, const std::shared_ptr<const ClassMetadata>& factory_type)
{
    if (factory_type && factory_type->producedType().valid()) {
        return factory_type->producedType();
    }
    if (Object instance = cache_.get(name, false)) {
        if (auto factory = instance.as<FactoryObject>()) return factory->objectType();
    }
    return TypeId();
}

bool ObjectFactory::typeAssignable(TypeId actual, TypeId target) const
{
    if (!actual.valid()) return false;
    if (actual == target) return true;
    auto metadata = types_->find(actual);
    return metadata && metadata->isAssignableTo(target);
}

bool ObjectFactory::isPrimary(const std::string& name) const
{
    std::string canonical = canonicalName(name);
    if (!definitions_.containsDefinition(canonical)) return false;
    return definitions_.merged(canonical)->definition.isPrimary();
}

std::vector<std::string> ObjectFactory::autowireCandidates(TypeId type, const std::string& requesting)
{
    std::vector<std::string> candidates;
    for (const auto& name : namesForType(type)) {
        std::string canonical = canonicalName(name);
        if (!requesting.empty() && canonical == requesting) continue;
        if (definitions_.containsDefinition(canonical) &&
            !definitions_.merged(canonical)->definition.isAutowireCandidate()) {
            continue;
        }
        candidates.push_back(name);
    }
    return candidates;
}

} // namespace wireup
