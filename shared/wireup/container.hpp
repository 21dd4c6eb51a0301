#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "aop/auto_proxy_registry.hpp"
#include "container_config.hpp"
#include "lifecycle.hpp"
#include "object_factory.hpp"
#include "post_processor.hpp"

namespace wireup {

    class Container;

    // 마지막 after-initialization hook. EventSubscriber singleton 을 컨테이너에 색인한다.
    class EventSubscriberDetector : public LifecycleHook
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        explicit EventSubscriberDetector(Container& container) : container_(container) {}

        Object afterInitialization(const Object& object, const std::string& name) override;

    private:
        Container& container_;
    }; // class EventSubscriberDetector


    // 설정 적용 -> definition 단계 hook -> freeze -> hook 등록 -> singleton 사전 생성.
    //
    //   Container container(settings);
    //   container.registerDefinition("service", ObjectDefinition("Service"));
    //   container.refresh();
    //   auto service = container.get<Service>("service");
    class Container : public ObjectFactory
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        Container();
        explicit Container(ContainerSettings settings,
                           std::shared_ptr<TypeRegistry> types = std::make_shared<TypeRegistry>());
        ~Container() override;

        const ContainerSettings& settings() const { return settings_; }
        aop::AutoProxyRegistry& autoProxy() { return auto_proxy_; }

        // refresh 시 definition 단계에서 실행된다.
        void addContainerPostProcessor(std::shared_ptr<ContainerPostProcessor> processor);

        // 한 번만 호출할 수 있다. 실패하면 만들어진 singleton 을 모두 파괴하고 예외를 다시 던진다.
        void refresh();
        // 여러 번 호출해도 된다.
        void close();

        bool isActive() const { return active_; }

        std::map<std::string, std::shared_ptr<EventSubscriber>> subscribers() const;

    private:
        friend class EventSubscriberDetector;

        void applySettings();
        void prepareAutoProxy();
        void addSubscriber(const std::string& name, std::shared_ptr<EventSubscriber> subscriber);

        ContainerSettings settings_;
        aop::AutoProxyRegistry auto_proxy_;
        std::vector<std::shared_ptr<ContainerPostProcessor>> container_processors_;

        std::mutex startup_mutex_;
        bool refreshed_ = false;
        std::atomic<bool> active_{false};
        std::atomic<bool> closed_{false};

        mutable std::mutex subscriber_mutex_;
        std::map<std::string, std::shared_ptr<EventSubscriber>> subscribers_;
    }; // class Container

} // namespace wireup
