#include <atomic>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "common/result_helper.hpp"
#include "logging/logging.hpp"
#include "sample_objects.hpp"
#include "wireup/aop/advisor.hpp"
#include "wireup/container.hpp"

using wireup::ObjectDefinition;
using wireup::ValueSpec;

static constexpr const char* TAG = "host";

namespace {

    void configure(wireup::Container& container, const std::shared_ptr<std::atomic<int>>& calls)
    {
        sample::defineTypes(container.types());

        // ---------------------------
        // advisor: store 의 append 호출을 센다
        // ---------------------------
        auto interceptor = std::make_shared<wireup::aop::FunctionInterceptor>(
            [calls](wireup::aop::MethodInvocation& invocation) {
                ++*calls;
                LOG_DEBUG(TAG, "-> {}", invocation.methodName());
                return invocation.proceed();
            });

        ObjectDefinition advisor("wireup.aop.NameMatchAdvisor");
        advisor.setRole(wireup::Role::Infrastructure)
               .setInstanceSupplier([&types = container.types(), interceptor]() {
                   return types.wrap(std::make_shared<wireup::aop::NameMatchAdvisor>(
                       interceptor, wireup::aop::assignableTo<sample::MessageStore>(),
                       std::set<std::string>{"append"}));
               });
        auto r = container.registerDefinition("storeAdvisor", std::move(advisor));
        THROW_IF_ERR(r, std::runtime_error);

        // ---------------------------
        // application objects
        // ---------------------------
        r = container.registerDefinition("store", ObjectDefinition("sample.MemoryStore"));
        THROW_IF_ERR(r, std::runtime_error);

        r = container.registerDefinition("publisher", ObjectDefinition("sample.Publisher")
                                                          .property("store", ValueSpec::ref("store"))
                                                          .property("auditor", ValueSpec::ref("auditor"))
                                                          .property("topic", ValueSpec::of(std::string("news"))));
        THROW_IF_ERR(r, std::runtime_error);

        r = container.registerDefinition("auditor", ObjectDefinition("sample.Auditor")
                                                        .property("publisher", ValueSpec::ref("publisher")));
        THROW_IF_ERR(r, std::runtime_error);

        r = container.registerAlias("publisher", "newsPublisher");
        THROW_IF_ERR(r, std::runtime_error);
    }

} // namespace

int main(int argc, char* argv[])
{
    const std::string config = argc > 1 ? argv[1] : "config/container.yaml";

    // YAML 기반 설정 적용
    try {
        logging::init(logging::Type::SpdLog, config);
    } catch (const std::exception& e) {
        std::cerr << "logging init failed: " << e.what() << std::endl;
        return 1;
    }

    auto settings = wireup::ContainerConfigLoader::loadFile(config);
    if (!settings) {
        LOG_FATAL(TAG, "cannot load container settings: {}", settings.error().value_or(to_string(settings.code())));
        logging::shutdown();
        return 1;
    }

    LOG_INFO(TAG, "서비스 시작");

    int rc = 0;
    try {
        auto calls = std::make_shared<std::atomic<int>>(0);
        wireup::Container container(settings.value());
        configure(container, calls);
        container.refresh();

        auto publisher = container.get<sample::Publisher>("newsPublisher");
        publisher->publish("hello");
        publisher->publish("world");

        auto store = container.get<sample::MessageStore>("store");
        LOG_INFO(TAG, "store holds {} message(s), {} intercepted append call(s), proxied: {}",
                 store->size(), calls->load(), container.resolve("store").is<wireup::aop::ProxyInstance>());
        LOG_INFO(TAG, "auditor sees the same publisher: {}", publisher->auditor()->publisher() == publisher);

        for (const auto& [name, subscriber] : container.subscribers()) {
            subscriber->onEvent("host.started", wireup::Value::of(name));
        }

        container.close();
    } catch (const wireup::ContainerError& e) {
        LOG_FATAL(TAG, "container failed [{}]: {}", to_string(e.code()), e.what());
        rc = 1;
    } catch (const std::exception& e) {
        LOG_FATAL(TAG, "host failed: {}", e.what());
        rc = 1;
    }

    LOG_INFO(TAG, "서비스 종료");
    logging::shutdown();
    return rc;
}
