#include "container.hpp"

#include <exception>

#include "logging/logging.hpp"
#include "post_processor_registration.hpp"

namespace wireup {

// ---------------------------------------------------------------------------
// EventSubscriberDetector
// ---------------------------------------------------------------------------

Object EventSubscriberDetector::afterInitialization(const Object& object, const std::string& name)
{
    auto subscriber = object.as<EventSubscriber>();
    if (!subscriber) return object;

    if (!container_.containsObject(name)) {
        LOGW("Inner object '{}' implements EventSubscriber but is not reliably processable for event subscription: "
             "probably because it is an inner object", name);
        return object;
    }
    if (!container_.isSingleton(name)) {
        LOGW("Object '{}' implements EventSubscriber but is not a singleton: "
             "it will not receive events through the container", name);
        return object;
    }
    container_.addSubscriber(name, std::move(subscriber));
    return object;
}


// ---------------------------------------------------------------------------
// Container
// ---------------------------------------------------------------------------

Container::Container()
    : Container(ContainerSettings())
{
}

Container::Container(ContainerSettings settings, std::shared_ptr<TypeRegistry> types)
    : ObjectFactory(std::move(types)), settings_(std::move(settings)), auto_proxy_(*this)
{
    applySettings();
}

Container::~Container()
{
    close();
}

void Container::applySettings()
{
    setAllowCircularReferences(settings_.allow_circular_references);
    setAllowRawInjectionDespiteWrapping(settings_.allow_raw_injection);
    definitions().setAllowDefinitionOverriding(settings_.allow_definition_overriding);
    definitions().setAllowAliasOverriding(settings_.allow_alias_overriding);
}

void Container::addContainerPostProcessor(std::shared_ptr<ContainerPostProcessor> processor)
{
    if (!processor) {
        LOGW("ignoring null container post-processor");
        return;
    }
    container_processors_.push_back(std::move(processor));
}

void Container::prepareAutoProxy()
{
    if (settings_.auto_proxy == aop::AutoProxyMode::None) return;

    auto result = auto_proxy_.registerCreator(settings_.auto_proxy);
    if (result.code() == ResultCode::DuplicateIgnored) {
        LOGD("{}", to_string(result));
    }
    if (result && settings_.proxy_target_class) {
        result = auto_proxy_.forceClassProxying();
    }
    if (result && settings_.expose_proxy) {
        result = auto_proxy_.forceExposeProxy();
    }
    if (!result) {
        throw ContainerError(result.code(), aop::AUTO_PROXY_CREATOR_NAME, to_string(result));
    }
}

void Container::refresh()
{
    std::lock_guard<std::mutex> lock(startup_mutex_);
    if (refreshed_) {
        throw ContainerError(ResultCode::InvalidState, "",
                             "Container does not support multiple refresh attempts: just call 'refresh' once");
    }
    refreshed_ = true;

    LOGI("Refreshing container with {} definition(s)", definitions().count());
    try {
        prepareAutoProxy();
        invokeContainerPostProcessors(*this, container_processors_);
        freezeConfiguration();

        registerPostProcessors(*this, types().wrap(std::make_shared<EventSubscriberDetector>(*this)));
        preInstantiateSingletons();
    } catch (const std::exception& e) {
        // container post-processor 가 던진 예외도 같은 정리를 거친다.
        LOGW("Exception encountered during container initialization - cancelling refresh attempt: {}", e.what());
        destroySingletons();
        throw;
    }

    active_ = true;
    LOGI("Container refreshed: {} singleton(s), {} post-processor(s)", cache().count(), postProcessorCount());
}

void Container::close()
{
    if (closed_.exchange(true)) return;

    LOGD("Closing container");
    active_ = false;
    destroySingletons();

    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    subscribers_.clear();
}

std::map<std::string, std::shared_ptr<EventSubscriber>> Container::subscribers() const
{
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    return subscribers_;
}

void Container::addSubscriber(const std::string& name, std::shared_ptr<EventSubscriber> subscriber)
{
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    subscribers_[name] = std::move(subscriber);
    LOGT("indexed event subscriber '{}'", name);
}

} // namespace wireup
