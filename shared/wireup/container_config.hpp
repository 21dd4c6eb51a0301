#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include "aop/auto_proxy_registry.hpp"
#include "common/result.h"

namespace wireup {

    // 컨테이너 동작 설정. definition 자체는 포함하지 않는다.
    struct ContainerSettings {
        bool allow_circular_references = true;
        bool allow_raw_injection = false;
        bool allow_definition_overriding = true;
        bool allow_alias_overriding = true;

        aop::AutoProxyMode auto_proxy = aop::AutoProxyMode::None;
        bool proxy_target_class = false;
        bool expose_proxy = false;
    };

    // YAML 의 container: section 을 읽는다.
    //
    //   container:
    //     allow_circular_references: true
    //     allow_raw_injection: false
    //     allow_definition_overriding: true
    //     allow_alias_overriding: true
    //     auto_proxy:
    //       mode: annotation          # none | infrastructure | aspect | annotation
    //       proxy_target_class: false
    //       expose_proxy: false
    //
    // section 이 없으면 기본값이다.
    class ContainerConfigLoader
    {
    public:
        static constexpr const char* LOG_TAG = "config";

        static Result<ContainerSettings> loadFile(const std::string& path);
        static Result<ContainerSettings> loadString(const std::string& yaml);
        static Result<ContainerSettings> load(const YAML::Node& root);

        static Result<aop::AutoProxyMode> parseAutoProxyMode(const std::string& value);
    }; // class ContainerConfigLoader

} // namespace wireup
