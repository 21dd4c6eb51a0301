#pragma once

#include <string>

#include "creation_context.hpp"
#include "object.hpp"
#include "object_definition.hpp"

namespace wireup {

    class ObjectFactory;

    // raw instance 에 property 값을 주입한다.
    //   afterInstantiation veto -> autowire(by name / by type) -> property hook -> dependency check -> setter
    class PropertyResolver
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        explicit PropertyResolver(ObjectFactory& factory) : factory_(factory) {}

        void populate(const std::string& name, MergedDefinition& merged, const Object& instance,
                      CreationContext& context);

    private:
        void autowireByName(const std::string& name, const ClassMetadata& type, PropertyValues& values,
                            CreationContext& context);
        void autowireByType(const std::string& name, const ClassMetadata& type, PropertyValues& values,
                            CreationContext& context);
        void checkDependencies(const std::string& name, const ClassMetadata& type, DependencyCheck check,
                               const PropertyValues& values);
        void applyValues(const std::string& name, MergedDefinition& merged, const Object& instance,
                         const PropertyValues& values, CreationContext& context);

        ObjectFactory& factory_;
    }; // class PropertyResolver

} // namespace wireup
