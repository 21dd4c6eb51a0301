#pragma once

#include <string>

#include "creation_context.hpp"
#include "object.hpp"
#include "object_definition.hpp"

namespace wireup {

    class ObjectFactory;

    // ValueSpec -> Value.
    // 참조된 객체는 owner 의 dependency 로 기록된다.
    class ValueResolver
    {
    public:
        ValueResolver(ObjectFactory& factory, const std::string& owner, bool owner_is_prototype,
                      CreationContext& context);

        Value resolve(const ValueSpec& spec, const std::string& what);

    private:
        Object resolveObject(const ValueSpec& spec, const std::string& what);

        ObjectFactory& factory_;
        const std::string& owner_;
        bool owner_is_prototype_;
        CreationContext& context_;
    }; // class ValueResolver


    // computed ValueSpec 에 전달되는 resolver
    class ContextDependencyResolver : public DependencyResolver
    {
    public:
        ContextDependencyResolver(ObjectFactory& factory, const std::string& requesting, CreationContext& context)
            : factory_(factory), requesting_(requesting), context_(context) {}

        Object resolve(const std::string& name) override;
        Object resolve(TypeId type) override;
        const std::string& requestingName() const override { return requesting_; }

    private:
        ObjectFactory& factory_;
        const std::string& requesting_;
        CreationContext& context_;
    }; // class ContextDependencyResolver

} // namespace wireup
