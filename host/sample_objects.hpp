#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "logging/logging.hpp"
#include "wireup/aop/aop_proxy.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/type_registry.hpp"

namespace sample {

    // ---------------------------
    // message store (interface 기반 proxy 대상)
    // ---------------------------
    class MessageStore
    {
    public:
        virtual ~MessageStore() = default;
        virtual void append(const std::string& message) = 0;
        virtual size_t size() = 0;
    };

    class MessageStoreProxy : public MessageStore, public wireup::aop::ProxyHandle<MessageStore>
    {
    public:
        using ProxyHandle::ProxyHandle;

        void append(const std::string& message) override
        {
            call("append", [&](MessageStore& t) { t.append(message); });
        }

        size_t size() override
        {
            return call<size_t>("size", [](MessageStore& t) { return t.size(); });
        }
    };

    class MemoryStore : public MessageStore, public wireup::DisposableObject
    {
    public:
        static constexpr const char* LOG_TAG = "sample";

        void append(const std::string& message) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        }

        size_t size() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return messages_.size();
        }

        void destroy() override
        {
            LOGI("memory store released {} message(s)", size());
        }

    private:
        std::mutex mutex_;
        std::vector<std::string> messages_;
    };


    // ---------------------------
    // publisher <-> auditor (setter cycle)
    // ---------------------------
    class Auditor;

    class Publisher : public wireup::InitializingObject
    {
    public:
        static constexpr const char* LOG_TAG = "sample";

        void setStore(std::shared_ptr<MessageStore> store) { store_ = std::move(store); }
        void setAuditor(std::shared_ptr<Auditor> auditor) { auditor_ = std::move(auditor); }
        void setTopic(std::string topic) { topic_ = std::move(topic); }

        void afterPropertiesSet() override
        {
            LOGI("publisher ready on topic '{}'", topic_);
        }

        void publish(const std::string& message);

        const std::shared_ptr<Auditor>& auditor() const { return auditor_; }

    private:
        std::shared_ptr<MessageStore> store_;
        std::shared_ptr<Auditor> auditor_;
        std::string topic_;
    };

    class Auditor : public wireup::EventSubscriber
    {
    public:
        static constexpr const char* LOG_TAG = "sample";

        void setPublisher(std::shared_ptr<Publisher> publisher) { publisher_ = publisher; }
        std::shared_ptr<Publisher> publisher() const { return publisher_.lock(); }

        void record(const std::string& message)
        {
            ++count_;
            LOGD("audit #{}: {}", count_.load(), message);
        }

        void onEvent(const std::string& topic, const wireup::Value& payload) override
        {
            LOGI("event on '{}': {}", topic, payload.describe());
        }

        int count() const { return count_; }

    private:
        // cycle 이 소유권 cycle 이 되지 않도록 weak
        std::weak_ptr<Publisher> publisher_;
        std::atomic<int> count_{0};
    };

    inline void Publisher::publish(const std::string& message)
    {
        store_->append(topic_ + ": " + message);
        if (auditor_) auditor_->record(message);
    }


    inline void defineTypes(wireup::TypeRegistry& types)
    {
        types.define<MessageStore>("sample.MessageStore")
            .interfaceProxy<MessageStoreProxy>();

        types.define<MemoryStore>("sample.MemoryStore")
            .implements<MessageStore>();

        types.define<Publisher>("sample.Publisher")
            .property("store", &Publisher::setStore)
            .property("auditor", &Publisher::setAuditor)
            .property("topic", &Publisher::setTopic);

        types.define<Auditor>("sample.Auditor")
            .property("publisher", &Auditor::setPublisher);

        types.define<wireup::aop::NameMatchAdvisor>("wireup.aop.NameMatchAdvisor");
    }

} // namespace sample
