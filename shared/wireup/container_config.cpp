#include "container_config.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "logging/logging.hpp"

namespace wireup {

namespace {

    Result<ContainerSettings> failed(ResultCode code, const std::string& message)
    {
        LOG_ERROR(ContainerConfigLoader::LOG_TAG, "{}", message);
        return Result<ContainerSettings>::Error(code, message);
    }

} // namespace

Result<ContainerSettings> ContainerConfigLoader::loadFile(const std::string& path)
{
    try {
        return load(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        return failed(ResultCode::NotFound, fmt::format("cannot open container config '{}'", path));
    } catch (const YAML::Exception& e) {
        return failed(ResultCode::InvalidArgument, fmt::format("invalid container config '{}': {}", path, e.what()));
    }
}

Result<ContainerSettings> ContainerConfigLoader::loadString(const std::string& yaml)
{
    try {
        return load(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        return failed(ResultCode::InvalidArgument, fmt::format("invalid container config: {}", e.what()));
    }
}

Result<ContainerSettings> ContainerConfigLoader::load(const YAML::Node& root)
{
    ContainerSettings s;
    if (!root || !root["container"]) {
        LOG_DEBUG(LOG_TAG, "no container section, using defaults");
        return Result<ContainerSettings>::OK(s);
    }

    try {
        auto c = root["container"];

        // ---------------------------
        // 생성 정책
        // ---------------------------
        s.allow_circular_references = c["allow_circular_references"].as<bool>(s.allow_circular_references);
        s.allow_raw_injection = c["allow_raw_injection"].as<bool>(s.allow_raw_injection);
        s.allow_definition_overriding = c["allow_definition_overriding"].as<bool>(s.allow_definition_overriding);
        s.allow_alias_overriding = c["allow_alias_overriding"].as<bool>(s.allow_alias_overriding);

        // ---------------------------
        // auto proxy
        // ---------------------------
        if (c["auto_proxy"]) {
            auto ap = c["auto_proxy"];
            auto mode = parseAutoProxyMode(ap["mode"].as<std::string>("none"));
            if (!mode) {
                return failed(mode.code(), mode.error().value_or("invalid auto_proxy mode"));
            }
            s.auto_proxy = mode.value();
            s.proxy_target_class = ap["proxy_target_class"].as<bool>(false);
            s.expose_proxy = ap["expose_proxy"].as<bool>(false);
        }
    } catch (const YAML::Exception& e) {
        return failed(ResultCode::InvalidArgument, fmt::format("invalid container section: {}", e.what()));
    }

    LOG_DEBUG(LOG_TAG, "container settings: circular={} raw_injection={} overriding={} auto_proxy={}",
              s.allow_circular_references, s.allow_raw_injection, s.allow_definition_overriding,
              aop::to_string(s.auto_proxy));
    return Result<ContainerSettings>::OK(s);
}

Result<aop::AutoProxyMode> ContainerConfigLoader::parseAutoProxyMode(const std::string& value)
{
    std::string mode = value;
    std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char ch) { return std::tolower(ch); });

    if (mode == "none" || mode.empty()) return Result<aop::AutoProxyMode>::OK(aop::AutoProxyMode::None);
    if (mode == "infrastructure")       return Result<aop::AutoProxyMode>::OK(aop::AutoProxyMode::Infrastructure);
    if (mode == "aspect")               return Result<aop::AutoProxyMode>::OK(aop::AutoProxyMode::Aspect);
    if (mode == "annotation")           return Result<aop::AutoProxyMode>::OK(aop::AutoProxyMode::Annotation);

    return Result<aop::AutoProxyMode>::Error(ResultCode::InvalidArgument,
                                             fmt::format("unknown auto_proxy mode '{}'", value));
}

} // namespace wireup
