#include "auto_proxy_creator.hpp"

#include <algorithm>

#include "aop_proxy.hpp"
#include "logging/logging.hpp"
#include "proxy_strategy_selector.hpp"
#include "wireup/errors.hpp"
#include "wireup/object_factory.hpp"
#include "wireup/type_registry.hpp"

namespace wireup::aop {

namespace {

    constexpr const char* ORIGINAL_INSTANCE_SUFFIX = ".ORIGINAL";

    int advisorOrder(const std::shared_ptr<Advisor>& advisor)
    {
        auto ordered = std::dynamic_pointer_cast<Ordered>(advisor);
        return ordered ? ordered->order() : LOWEST_PRECEDENCE;
    }

    bool endsWith(const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    template<typename C>
    void defineCreator(TypeRegistry& types, const char* name)
    {
        if (types.find(getTypeId<C>())) return;
        types.define<C>(name)
            .property("order", static_cast<void (C::*)(int)>(&C::setOrder))
            .property("proxyTargetClass", static_cast<void (C::*)(bool)>(&C::setProxyTargetClass))
            .property("optimize", static_cast<void (C::*)(bool)>(&C::setOptimize))
            .property("exposeProxy", static_cast<void (C::*)(bool)>(&C::setExposeProxy));
    }

} // namespace

// ---------------------------------------------------------------------------
// AutoProxyCreator
// ---------------------------------------------------------------------------

Object AutoProxyCreator::earlyReference(const Object& object, const std::string& name)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        early_proxy_references_[name] = object.address();
    }
    return wrapIfNecessary(object, name);
}

void AutoProxyCreator::discardEarlyReference(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    early_proxy_references_.erase(name);
}

Object AutoProxyCreator::afterInitialization(const Object& object, const std::string& name)
{
    if (!object) return object;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = early_proxy_references_.find(name);
        if (it != early_proxy_references_.end()) {
            const void* early = it->second;
            early_proxy_references_.erase(it);
            // early reference 로 이미 감싼 객체
            if (early == object.address()) return object;
        }
    }
    return wrapIfNecessary(object, name);
}

bool AutoProxyCreator::isInfrastructureClass(const ClassMetadata& type) const
{
    return type.isAssignableTo(getTypeId<Advisor>()) ||
           type.isAssignableTo(getTypeId<Aspect>()) ||
           type.isAssignableTo(getTypeId<MethodInterceptor>()) ||
           type.isAssignableTo(getTypeId<ProxyInstance>()) ||
           type.isAssignableTo(getTypeId<PostProcessor>()) ||
           type.isAssignableTo(getTypeId<ContainerPostProcessor>());
}

bool AutoProxyCreator::shouldSkip(const ClassMetadata& type, const std::string& name)
{
    (void)type;
    return endsWith(name, ORIGINAL_INSTANCE_SUFFIX);
}

std::vector<std::shared_ptr<Advisor>> AutoProxyCreator::eligibleAdvisors(const ClassMetadata& type)
{
    std::vector<std::shared_ptr<Advisor>> eligible;
    for (auto& advisor : candidateAdvisors()) {
        if (advisor && advisor->matches(type)) {
            eligible.push_back(std::move(advisor));
        }
    }
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const auto& a, const auto& b) { return advisorOrder(a) < advisorOrder(b); });
    return eligible;
}

std::vector<std::shared_ptr<Advisor>> AutoProxyCreator::advisorObjects(bool infrastructure_only)
{
    std::vector<std::shared_ptr<Advisor>> advisors;
    if (!factory_) return advisors;

    for (const auto& name : factory_->namesForType<Advisor>()) {
        if (name.rfind(FACTORY_DEREFERENCE_PREFIX, 0) == 0) continue;
        if (infrastructure_only) {
            auto definition = factory_->definitions().definition(name);
            if (!definition || definition->role() != Role::Infrastructure) continue;
        }
        if (factory_->cache().isCreating(name)) {
            LOGT("Skipping currently created advisor '{}'", name);
            continue;
        }
        try {
            advisors.push_back(factory_->get<Advisor>(name));
        } catch (const ContainerError& e) {
            if (e.code() != ResultCode::CircularReference) throw;
            LOGT("Skipping advisor '{}' with dependency on currently created object: {}", name, e.what());
        }
    }
    return advisors;
}

Object AutoProxyCreator::wrapIfNecessary(const Object& object, const std::string& name)
{
    if (!object) return object;
    // inner 객체 이름은 한 번만 쓰이므로 판정을 기록하지 않는다.
    const bool remember = name.find(INNER_OBJECT_SEPARATOR) == std::string::npos;
    if (remember) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = advised_.find(name);
        if (it != advised_.end() && !it->second) return object;
    }

    const ClassMetadata* type = object.metadata();
    if (!type || isInfrastructureClass(*type) || shouldSkip(*type, name)) {
        if (remember) {
            std::lock_guard<std::mutex> lock(mutex_);
            advised_[name] = false;
        }
        return object;
    }

    auto advisors = eligibleAdvisors(*type);
    if (remember) {
        std::lock_guard<std::mutex> lock(mutex_);
        advised_[name] = !advisors.empty();
    }
    if (advisors.empty()) return object;

    LOGD("Creating implicit proxy for object '{}' with {} advisor(s)", name, advisors.size());
    return createProxy(object, std::move(advisors));
}

Object AutoProxyCreator::createProxy(const Object& target, std::vector<std::shared_ptr<Advisor>> advisors)
{
    if (!factory_) {
        throw ProxyConfigError("auto-proxy creator is not attached to a container");
    }

    ProxyConfig config(target);
    config.copyFrom(options_);
    config.advisors = std::move(advisors);

    if (!config.proxy_target_class) {
        ProxyStrategySelector selector(factory_->types());
        auto interfaces = selector.usableInterfaces(target.metadata()->interfaces());
        if (interfaces.empty()) {
            config.proxy_target_class = true;
        }
        for (TypeId type : interfaces) {
            config.addInterface(type);
        }
    }
    return factory_->createProxy(config);
}


// ---------------------------------------------------------------------------
// variants
// ---------------------------------------------------------------------------

std::vector<std::shared_ptr<Advisor>> InfrastructureAdvisorAutoProxyCreator::candidateAdvisors()
{
    return advisorObjects(true);
}

std::vector<std::shared_ptr<Advisor>> AspectAwareAdvisorAutoProxyCreator::candidateAdvisors()
{
    return advisorObjects(false);
}

std::vector<std::shared_ptr<Advisor>> AnnotationAwareAspectAutoProxyCreator::candidateAdvisors()
{
    auto advisors = AspectAwareAdvisorAutoProxyCreator::candidateAdvisors();
    auto declared = aspectAdvisors();
    advisors.insert(advisors.end(), declared.begin(), declared.end());
    return advisors;
}

std::vector<std::shared_ptr<Advisor>> AnnotationAwareAspectAutoProxyCreator::aspectAdvisors()
{
    std::vector<std::shared_ptr<Advisor>> advisors;
    if (!factory_) return advisors;

    for (const auto& name : factory_->namesForType<Aspect>(false)) {
        if (name.rfind(FACTORY_DEREFERENCE_PREFIX, 0) == 0) continue;
        {
            std::lock_guard<std::mutex> lock(aspect_mutex_);
            auto it = aspect_cache_.find(name);
            if (it != aspect_cache_.end()) {
                advisors.insert(advisors.end(), it->second.begin(), it->second.end());
                continue;
            }
        }
        if (factory_->cache().isCreating(name)) {
            LOGT("Skipping currently created aspect '{}'", name);
            continue;
        }

        auto declared = factory_->get<Aspect>(name)->advisors();
        LOGD("Found {} advisor(s) on aspect '{}'", declared.size(), name);
        {
            std::lock_guard<std::mutex> lock(aspect_mutex_);
            aspect_cache_[name] = declared;
        }
        advisors.insert(advisors.end(), declared.begin(), declared.end());
    }
    return advisors;
}


void defineAutoProxyCreatorTypes(TypeRegistry& types)
{
    defineCreator<InfrastructureAdvisorAutoProxyCreator>(types, INFRASTRUCTURE_ADVISOR_AUTO_PROXY_CREATOR);
    defineCreator<AspectAwareAdvisorAutoProxyCreator>(types, ASPECT_AWARE_ADVISOR_AUTO_PROXY_CREATOR);
    defineCreator<AnnotationAwareAspectAutoProxyCreator>(types, ANNOTATION_AWARE_ASPECT_AUTO_PROXY_CREATOR);
}

} // namespace wireup::aop
