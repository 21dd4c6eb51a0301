#pragma once

#include <string>

#include "common/result.h"

namespace wireup {
    class ObjectFactory;
    class TypeRegistry;
}

namespace wireup::aop {

    // 컨테이너 전체에서 하나만 존재하는 auto-proxy creator 의 definition 이름
    inline constexpr const char* AUTO_PROXY_CREATOR_NAME = "wireup.internalAutoProxyCreator";

    // 뒤로 갈수록 우선순위가 높다.
    enum class AutoProxyMode { None, Infrastructure, Aspect, Annotation };

    const char* to_string(AutoProxyMode mode);

    // AUTO_PROXY_CREATOR_NAME 슬롯의 상태 기계.
    //
    //   unregistered --register(v)--> registered(v)
    //   registered(v) --register(w), priority(w) > priority(v)--> registered(w)   (같은 definition 객체, type 만 교체)
    //   registered(v) --register(w), priority(w) <= priority(v)--> registered(v)  (DuplicateIgnored)
    class AutoProxyRegistry
    {
    public:
        static constexpr const char* LOG_TAG = "aop";

        explicit AutoProxyRegistry(ObjectFactory& factory);

        Result<void> registerInfrastructureCreator() { return registerCreator(AutoProxyMode::Infrastructure); }
        Result<void> registerAspectCreator() { return registerCreator(AutoProxyMode::Aspect); }
        Result<void> registerAnnotationCreator() { return registerCreator(AutoProxyMode::Annotation); }
        Result<void> registerCreator(AutoProxyMode mode);

        // 등록된 creator definition 의 property 를 설정한다. 등록 전이면 NotFound.
        Result<void> forceClassProxying();
        Result<void> forceExposeProxy();

        // 현재 등록된 variant. 없으면 None.
        AutoProxyMode registeredVariant() const;

        static const char* typeNameOf(AutoProxyMode mode);
        // 알 수 없는 type 이름은 -1
        static int priorityOf(const std::string& type_name);

    private:
        Result<void> registerOrEscalate(const std::string& type_name);
        Result<void> setCreatorProperty(const char* property);

        ObjectFactory& factory_;
    }; // class AutoProxyRegistry

} // namespace wireup::aop
