#pragma once

#include <algorithm>
#include <memory>
#include <vector>

#include "advisor.hpp"
#include "wireup/class_metadata.hpp"
#include "wireup/object.hpp"
#include "wireup/type_info.hpp"

namespace wireup::aop {

    enum class ProxyStrategy {
        ClassBased,      // target class 를 상속한 stub (subclassProxy)
        InterfaceBased   // interface 를 구현한 stub (interfaceProxy)
    };

    inline const char* to_string(ProxyStrategy strategy)
    {
        return strategy == ProxyStrategy::ClassBased ? "class-based" : "interface-based";
    }

    // proxy 생성 옵션. auto-proxy creator 와 ProxyFactory 가 공유한다.
    struct ProxyOptions {
        bool proxy_target_class = false;
        bool optimize = false;
        bool expose_proxy = false;
    };

    // 하나의 proxy 를 만들기 위한 설정
    struct ProxyConfig : ProxyOptions {
        Object target;
        // target 의 class. 비어 있으면 target.metadataPtr() 를 사용한다.
        std::shared_ptr<const ClassMetadata> target_class;
        // proxy 할 사용자 interface (선언 순서)
        std::vector<TypeId> interfaces;
        std::vector<std::shared_ptr<Advisor>> advisors;

        ProxyConfig() = default;
        explicit ProxyConfig(Object t) : target(std::move(t)) {}

        std::shared_ptr<const ClassMetadata> targetClass() const
        {
            return target_class ? target_class : target.metadataPtr();
        }

        void addInterface(TypeId type)
        {
            if (std::find(interfaces.begin(), interfaces.end(), type) == interfaces.end())
                interfaces.push_back(type);
        }

        void addAdvisor(std::shared_ptr<Advisor> advisor) { advisors.push_back(std::move(advisor)); }

        void copyFrom(const ProxyOptions& options) { static_cast<ProxyOptions&>(*this) = options; }
    };

} // namespace wireup::aop
