#include "auto_proxy_registry.hpp"

#include <iterator>

#include <fmt/format.h>

#include "auto_proxy_creator.hpp"
#include "logging/logging.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/object_factory.hpp"

namespace wireup::aop {

namespace {

    // 우선순위 순서
    const char* const CREATOR_TYPES[] = {
        INFRASTRUCTURE_ADVISOR_AUTO_PROXY_CREATOR,
        ASPECT_AWARE_ADVISOR_AUTO_PROXY_CREATOR,
        ANNOTATION_AWARE_ASPECT_AUTO_PROXY_CREATOR,
    };

} // namespace

const char* to_string(AutoProxyMode mode)
{
    switch (mode) {
        case AutoProxyMode::None:           return "none";
        case AutoProxyMode::Infrastructure: return "infrastructure";
        case AutoProxyMode::Aspect:         return "aspect";
        case AutoProxyMode::Annotation:     return "annotation";
    }
    return "unknown";
}

AutoProxyRegistry::AutoProxyRegistry(ObjectFactory& factory)
    : factory_(factory)
{
    defineAutoProxyCreatorTypes(factory_.types());
}

const char* AutoProxyRegistry::typeNameOf(AutoProxyMode mode)
{
    switch (mode) {
        case AutoProxyMode::Infrastructure: return INFRASTRUCTURE_ADVISOR_AUTO_PROXY_CREATOR;
        case AutoProxyMode::Aspect:         return ASPECT_AWARE_ADVISOR_AUTO_PROXY_CREATOR;
        case AutoProxyMode::Annotation:     return ANNOTATION_AWARE_ASPECT_AUTO_PROXY_CREATOR;
        default:                            return nullptr;
    }
}

int AutoProxyRegistry::priorityOf(const std::string& type_name)
{
    for (int i = 0; i < static_cast<int>(std::size(CREATOR_TYPES)); ++i) {
        if (type_name == CREATOR_TYPES[i]) return i;
    }
    return -1;
}

Result<void> AutoProxyRegistry::registerCreator(AutoProxyMode mode)
{
    const char* type_name = typeNameOf(mode);
    if (!type_name) {
        return Error(ResultCode::InvalidArgument,
                     fmt::format("auto-proxy mode '{}' has no creator", to_string(mode)));
    }
    return registerOrEscalate(type_name);
}

Result<void> AutoProxyRegistry::registerOrEscalate(const std::string& type_name)
{
    auto& definitions = factory_.definitions();

    if (auto existing = definitions.definition(AUTO_PROXY_CREATOR_NAME)) {
        const std::string current = existing->typeName();
        if (current == type_name) {
            return DuplicateIgnored(fmt::format("'{}' already registered", type_name));
        }

        int current_priority = priorityOf(current);
        int requested_priority = priorityOf(type_name);
        if (current_priority >= requested_priority) {
            LOGT("keeping auto-proxy creator [{}], requested [{}] has lower or equal priority", current, type_name);
            return DuplicateIgnored(fmt::format("'{}' has priority over '{}'", current, type_name));
        }

        auto result = factory_.updateDefinition(AUTO_PROXY_CREATOR_NAME, [&type_name](ObjectDefinition& def) {
            def.setTypeName(type_name);
        });
        if (result) {
            LOGD("escalated auto-proxy creator [{}] -> [{}]", current, type_name);
        }
        return result;
    }

    ObjectDefinition definition(type_name);
    definition.setRole(Role::Infrastructure)
              .property("order", ValueSpec::of(HIGHEST_PRECEDENCE));

    auto result = factory_.registerDefinition(AUTO_PROXY_CREATOR_NAME, std::move(definition));
    if (result) {
        LOGD("registered auto-proxy creator [{}] as '{}'", type_name, AUTO_PROXY_CREATOR_NAME);
    }
    return result;
}

Result<void> AutoProxyRegistry::forceClassProxying()
{
    return setCreatorProperty("proxyTargetClass");
}

Result<void> AutoProxyRegistry::forceExposeProxy()
{
    return setCreatorProperty("exposeProxy");
}

Result<void> AutoProxyRegistry::setCreatorProperty(const char* property)
{
    auto& definitions = factory_.definitions();
    if (!definitions.containsDefinition(AUTO_PROXY_CREATOR_NAME)) {
        return Error(ResultCode::NotFound,
                     fmt::format("no auto-proxy creator registered under '{}'", AUTO_PROXY_CREATOR_NAME));
    }
    return factory_.updateDefinition(AUTO_PROXY_CREATOR_NAME, [property](ObjectDefinition& def) {
        def.property(property, ValueSpec::of(true));
    });
}

AutoProxyMode AutoProxyRegistry::registeredVariant() const
{
    auto existing = factory_.definitions().definition(AUTO_PROXY_CREATOR_NAME);
    if (!existing) return AutoProxyMode::None;

    switch (priorityOf(existing->typeName())) {
        case 0:  return AutoProxyMode::Infrastructure;
        case 1:  return AutoProxyMode::Aspect;
        case 2:  return AutoProxyMode::Annotation;
        default: return AutoProxyMode::None;
    }
}

} // namespace wireup::aop
