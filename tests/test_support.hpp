#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "wireup/aop/aop_proxy.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/object_factory.hpp"
#include "wireup/post_processor.hpp"

// 여러 test 에서 공유하는 객체들
namespace testing_support {

    // 호출 순서 기록
    class Journal
    {
    public:
        void add(const std::string& entry)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(entry);
        }

        std::vector<std::string> entries() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> entries_;
    };

    class Greeter
    {
    public:
        virtual ~Greeter() = default;
        virtual std::string greet(const std::string& who) = 0;
    };

    class PoliteGreeter : public Greeter
    {
    public:
        std::string greet(const std::string& who) override { return prefix_ + ", " + who; }
        void setPrefix(std::string prefix) { prefix_ = std::move(prefix); }

    private:
        std::string prefix_ = "Hello";
    };

    class GreeterProxy : public Greeter, public wireup::aop::ProxyHandle<Greeter>
    {
    public:
        using ProxyHandle::ProxyHandle;

        std::string greet(const std::string& who) override
        {
            return call<std::string>("greet", [&](Greeter& target) { return target.greet(who); });
        }
    };

    class PoliteGreeterProxy : public PoliteGreeter, public wireup::aop::ProxyHandle<PoliteGreeter>
    {
    public:
        using ProxyHandle::ProxyHandle;

        std::string greet(const std::string& who) override
        {
            return call<std::string>("greet", [&](PoliteGreeter& target) { return target.greet(who); });
        }
    };

    // setter cycle 용
    class Node
    {
    public:
        void setNext(std::shared_ptr<Node> next) { next_ = next; }
        std::shared_ptr<Node> next() const { return next_.lock(); }

        void setLabel(std::string label) { label_ = std::move(label); }
        const std::string& label() const { return label_; }

    private:
        std::weak_ptr<Node> next_;
        std::string label_;
    };

    // 생성자 cycle 용
    class Link
    {
    public:
        Link() = default;
        explicit Link(std::shared_ptr<Link> next) : next_(std::move(next)) {}

        const std::shared_ptr<Link>& next() const { return next_; }

    private:
        std::shared_ptr<Link> next_;
    };

    // destroy 호출을 Journal 에 남긴다.
    class Resource : public wireup::DisposableObject, public wireup::NameAware
    {
    public:
        void setJournal(std::shared_ptr<Journal> journal) { journal_ = std::move(journal); }
        void setDependency(std::shared_ptr<Resource> dependency) { dependency_ = std::move(dependency); }

        void setObjectName(const std::string& name) override { name_ = name; }
        const std::string& name() const { return name_; }

        void destroy() override
        {
            if (journal_) journal_->add("destroy:" + name_);
        }

    private:
        std::shared_ptr<Journal> journal_;
        std::shared_ptr<Resource> dependency_;
        std::string name_;
    };

    inline void defineCommonTypes(wireup::TypeRegistry& types)
    {
        types.define<Journal>("test.Journal");

        types.define<Greeter>("test.Greeter")
            .interfaceProxy<GreeterProxy>();
        types.define<PoliteGreeter>("test.PoliteGreeter")
            .implements<Greeter>()
            .subclassProxy<PoliteGreeterProxy>()
            .property("prefix", &PoliteGreeter::setPrefix);

        types.define<Node>("test.Node")
            .property("next", &Node::setNext)
            .property("label", &Node::setLabel);

        types.define<Link>("test.Link")
            .constructor<std::shared_ptr<Link>>();

        types.define<Resource>("test.Resource")
            .property("journal", &Resource::setJournal)
            .property("dependency", &Resource::setDependency);
    }

} // namespace testing_support
