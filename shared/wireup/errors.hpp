#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/result.h"

namespace wireup {

    // 객체 생성 실패의 공통 base.
    // resolve 프레임을 빠져나가면서 이름이 경로 앞쪽에 추가된다. (nested exception 을 만들지 않는다)
    class ContainerError : public std::runtime_error
    {
    public:
        ContainerError(ResultCode code, std::string object_name, std::string message,
                       std::exception_ptr cause = nullptr);

        ResultCode code() const noexcept { return code_; }
        const std::string& objectName() const noexcept { return object_name_; }
        const std::string& message() const noexcept { return message_; }
        const std::vector<std::string>& resolutionPath() const noexcept { return path_; }
        std::exception_ptr cause() const noexcept { return cause_; }

        // 가장 안쪽 원인의 메시지
        std::string rootCauseMessage() const;

        const char* what() const noexcept override { return what_.c_str(); }

        void prependPath(const std::string& name);

    private:
        void rebuild();

        ResultCode code_;
        std::string object_name_;
        std::string message_;
        std::vector<std::string> path_;
        std::exception_ptr cause_;
        std::string what_;
    }; // class ContainerError


    class DefinitionError : public ContainerError
    {
    public:
        DefinitionError(std::string object_name, std::string message)
            : ContainerError(ResultCode::DefinitionError, std::move(object_name), std::move(message)) {}
    };

    class NoSuchDefinitionError : public ContainerError
    {
    public:
        explicit NoSuchDefinitionError(std::string object_name)
            : ContainerError(ResultCode::NotFound, object_name, "No object named '" + object_name + "' is defined") {}

        NoSuchDefinitionError(std::string object_name, std::string message)
            : ContainerError(ResultCode::NotFound, std::move(object_name), std::move(message)) {}
    };

    class CircularConstructionError : public ContainerError
    {
    public:
        CircularConstructionError(std::string object_name, std::vector<std::string> cycle);

        // 첫 이름과 마지막 이름이 같다. ex) a -> b -> c -> a
        const std::vector<std::string>& cycle() const noexcept { return cycle_; }

    private:
        std::vector<std::string> cycle_;
    };

    class RawReferenceLeakedError : public ContainerError
    {
    public:
        RawReferenceLeakedError(std::string object_name, std::vector<std::string> dependents);

        const std::vector<std::string>& dependents() const noexcept { return dependents_; }

    private:
        std::vector<std::string> dependents_;
    };

    class UnsatisfiedDependencyError : public ContainerError
    {
    public:
        UnsatisfiedDependencyError(std::string object_name, std::string message)
            : ContainerError(ResultCode::UnsatisfiedDependency, std::move(object_name), std::move(message)) {}
    };

    class InstantiationFailure : public ContainerError
    {
    public:
        InstantiationFailure(std::string object_name, std::string message, std::exception_ptr cause = nullptr)
            : ContainerError(ResultCode::InstantiationFailed, std::move(object_name), std::move(message), cause) {}
    };

    class InitializationFailure : public ContainerError
    {
    public:
        InitializationFailure(std::string object_name, std::string message, std::exception_ptr cause = nullptr)
            : ContainerError(ResultCode::InitializationFailed, std::move(object_name), std::move(message), cause) {}
    };

    class ProxyConfigError : public ContainerError
    {
    public:
        explicit ProxyConfigError(std::string message)
            : ContainerError(ResultCode::ProxyConfigError, "", std::move(message)) {}
    };

} // namespace wireup
