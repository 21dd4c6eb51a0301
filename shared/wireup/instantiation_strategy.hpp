#pragma once

#include <memory>
#include <string>
#include <vector>

#include "class_metadata.hpp"
#include "creation_context.hpp"
#include "object.hpp"
#include "object_definition.hpp"

namespace wireup {

    class ObjectFactory;

    // definition 으로부터 raw instance 를 만든다.
    //
    // 선택 순서:
    //   1. instance supplier
    //   2. factory method (static / factory object)
    //   3. 이전에 선택되어 definition 에 cache 된 생성자
    //   4. hook 이 제시한 후보, autowire=constructor, 명시적 인자 -> 만족 가능한 가장 인자가 많은 생성자
    //   5. 기본 생성자
    class InstantiationStrategy
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        explicit InstantiationStrategy(ObjectFactory& factory) : factory_(factory) {}

        Object instantiate(const std::string& name, MergedDefinition& merged,
                           const std::shared_ptr<const ClassMetadata>& type,
                           const std::vector<Value>* args, CreationContext& context);

    private:
        Object fromSupplier(const std::string& name, MergedDefinition& merged);
        Object fromFactoryMethod(const std::string& name, MergedDefinition& merged,
                                 const std::shared_ptr<const ClassMetadata>& type,
                                 const std::vector<Value>* args, CreationContext& context);
        Object autowireConstructor(const std::string& name, MergedDefinition& merged,
                                   const std::shared_ptr<const ClassMetadata>& type,
                                   std::vector<const ConstructorInfo*> candidates,
                                   const std::vector<Value>* args, bool autowiring, CreationContext& context);
        Object instantiateDefault(const std::string& name, const std::shared_ptr<const ClassMetadata>& type);

        // params 에 맞는 인자 목록. 만족할 수 없으면 UnsatisfiedDependencyError
        std::vector<Value> resolveArguments(const std::string& name, MergedDefinition& merged,
                                            const std::vector<ParamInfo>& params,
                                            const std::vector<Value>* args, bool autowiring,
                                            CreationContext& context);

        Object invoke(const std::string& name, const ConstructorInfo& ctor,
                      const std::shared_ptr<const ClassMetadata>& type, const std::vector<Value>& args);

        ObjectFactory& factory_;
    }; // class InstantiationStrategy

} // namespace wireup
