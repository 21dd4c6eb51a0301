#pragma once

#include <vector>

#include "proxy_config.hpp"
#include "wireup/type_info.hpp"

namespace wireup {
    class TypeRegistry;
}

namespace wireup::aop {

    // class-based / interface-based proxy 선택.
    //
    //   optimize | proxy_target_class | 사용 가능한 interface | 결과
    //   ---------+--------------------+-----------------------+----------------
    //   true     | -                  | -                     | class-based
    //   -        | true               | -                     | class-based
    //   false    | false              | 없음 (marker 만)       | class-based
    //   false    | false              | 1개 이상               | interface-based
    //
    // class-based 가 선택되었지만 target class 가 interface 이거나,
    // 이미 proxy class 이고 그 interface 로 충분하면 interface-based 로 만든다.
    class ProxyStrategySelector
    {
    public:
        explicit ProxyStrategySelector(const TypeRegistry& types) : types_(types) {}

        ProxyStrategy select(const ProxyConfig& config) const;

        // framework / marker interface 를 제외한 interface
        std::vector<TypeId> usableInterfaces(const std::vector<TypeId>& interfaces) const;
        bool hasUsableInterfaces(const std::vector<TypeId>& interfaces) const;

    private:
        const TypeRegistry& types_;
    }; // class ProxyStrategySelector

} // namespace wireup::aop
