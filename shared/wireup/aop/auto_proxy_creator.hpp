#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "advisor.hpp"
#include "proxy_config.hpp"
#include "wireup/lifecycle.hpp"
#include "wireup/object.hpp"
#include "wireup/post_processor.hpp"

namespace wireup {
    class ObjectFactory;
    class TypeRegistry;
}

namespace wireup::aop {

    // 일치하는 advisor 가 있는 객체를 proxy 로 감싸는 hook 의 공통 base.
    //
    // cycle 로 early reference 가 먼저 요청되면 그 시점에 proxy 를 만들고 이름을 기록해 두어,
    // 초기화 이후에 같은 객체를 다시 감싸지 않는다.
    class AutoProxyCreator : public EarlyReferenceHook, public LifecycleHook, public Ordered, public ContainerAware
    {
    public:
        static constexpr const char* LOG_TAG = "aop";

        ~AutoProxyCreator() override = default;

        void setContainer(ObjectFactory& factory) override { factory_ = &factory; }

        Object earlyReference(const Object& object, const std::string& name) override;
        void discardEarlyReference(const std::string& name) override;
        Object afterInitialization(const Object& object, const std::string& name) override;

        int order() const override { return order_; }
        void setOrder(int order) { order_ = order; }

        void setProxyTargetClass(bool value) { options_.proxy_target_class = value; }
        bool isProxyTargetClass() const { return options_.proxy_target_class; }
        void setOptimize(bool value) { options_.optimize = value; }
        bool isOptimize() const { return options_.optimize; }
        void setExposeProxy(bool value) { options_.expose_proxy = value; }
        bool isExposeProxy() const { return options_.expose_proxy; }

    protected:
        // 후보 advisor 전체 (class 일치 여부와 무관)
        virtual std::vector<std::shared_ptr<Advisor>> candidateAdvisors() = 0;

        // advisor / aspect / interceptor / hook 자체는 proxy 하지 않는다.
        virtual bool isInfrastructureClass(const ClassMetadata& type) const;
        // "<name>.ORIGINAL" 로 등록된 원본 인스턴스는 감싸지 않는다.
        virtual bool shouldSkip(const ClassMetadata& type, const std::string& name);

        // type 에 적용되는 advisor (order 순)
        std::vector<std::shared_ptr<Advisor>> eligibleAdvisors(const ClassMetadata& type);

        // 컨테이너에 정의된 Advisor 객체. 생성 중인 advisor 는 건너뛴다.
        std::vector<std::shared_ptr<Advisor>> advisorObjects(bool infrastructure_only);

        Object wrapIfNecessary(const Object& object, const std::string& name);
        Object createProxy(const Object& target, std::vector<std::shared_ptr<Advisor>> advisors);

        ObjectFactory* factory_ = nullptr;

    private:
        std::mutex mutex_;
        std::unordered_map<std::string, const void*> early_proxy_references_;
        std::unordered_map<std::string, bool> advised_;
        ProxyOptions options_;
        int order_ = LOWEST_PRECEDENCE;
    }; // class AutoProxyCreator


    // role 이 infrastructure 인 advisor definition 만 사용한다.
    class InfrastructureAdvisorAutoProxyCreator : public AutoProxyCreator
    {
    protected:
        std::vector<std::shared_ptr<Advisor>> candidateAdvisors() override;
    };

    // 컨테이너의 모든 advisor 를 사용한다.
    class AspectAwareAdvisorAutoProxyCreator : public AutoProxyCreator
    {
    protected:
        std::vector<std::shared_ptr<Advisor>> candidateAdvisors() override;
    };

    // 모든 advisor 와 Aspect 객체가 선언한 advisor 를 사용한다.
    class AnnotationAwareAspectAutoProxyCreator : public AspectAwareAdvisorAutoProxyCreator
    {
    protected:
        std::vector<std::shared_ptr<Advisor>> candidateAdvisors() override;

    private:
        std::vector<std::shared_ptr<Advisor>> aspectAdvisors();

        std::mutex aspect_mutex_;
        std::unordered_map<std::string, std::vector<std::shared_ptr<Advisor>>> aspect_cache_;
    };


    inline constexpr const char* INFRASTRUCTURE_ADVISOR_AUTO_PROXY_CREATOR = "wireup.aop.InfrastructureAdvisorAutoProxyCreator";
    inline constexpr const char* ASPECT_AWARE_ADVISOR_AUTO_PROXY_CREATOR = "wireup.aop.AspectAwareAdvisorAutoProxyCreator";
    inline constexpr const char* ANNOTATION_AWARE_ASPECT_AUTO_PROXY_CREATOR = "wireup.aop.AnnotationAwareAspectAutoProxyCreator";

    // 세 creator 를 위 이름으로 TypeRegistry 에 정의한다. (order / proxyTargetClass / optimize / exposeProxy property)
    void defineAutoProxyCreatorTypes(TypeRegistry& types);

} // namespace wireup::aop
