#pragma once

#include <memory>
#include <utility>

#include "proxy_config.hpp"
#include "wireup/class_metadata.hpp"
#include "wireup/object.hpp"

namespace wireup {
    class TypeRegistry;
}

namespace wireup::aop {

    // ProxyConfig -> proxy Object.
    // 선택된 방식의 stub 을 InvocationDispatcher 와 함께 생성한다.
    class ProxyFactory
    {
    public:
        static constexpr const char* LOG_TAG = "aop";

        explicit ProxyFactory(const TypeRegistry& types) : types_(types) {}

        Object getProxy(const ProxyConfig& config) const;

    private:
        // stub 과 그 stub 이 구현하는 타입(target class 또는 interface)
        std::pair<const ProxyStub*, std::shared_ptr<const ClassMetadata>>
        findStub(ProxyStrategy strategy, const ProxyConfig& config) const;

        // stub metadata 를 복사하고 proxied 타입의 interface 로의 변환을 추가한다.
        std::shared_ptr<ClassMetadata> proxyMetadata(const ProxyStub& stub,
                                                     const std::shared_ptr<const ClassMetadata>& proxied) const;

        const TypeRegistry& types_;
    }; // class ProxyFactory

} // namespace wireup::aop
