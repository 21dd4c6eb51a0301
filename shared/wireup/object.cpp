#include "object.hpp"
#include "class_metadata.hpp"

#include <fmt/format.h>

namespace wireup {

Object::Object(std::shared_ptr<void> ptr, std::shared_ptr<const ClassMetadata> metadata)
    : ptr_(std::move(ptr)), metadata_(std::move(metadata))
{
}

TypeId Object::type() const
{
    return metadata_ ? metadata_->id() : TypeId{};
}

std::string Object::typeName() const
{
    return metadata_ ? metadata_->name() : std::string("<null>");
}

std::shared_ptr<void> Object::castTo(TypeId type) const
{
    if (!ptr_ || !metadata_) return nullptr;
    return metadata_->cast(ptr_, type);
}

bool Object::isA(TypeId type) const
{
    return metadata_ && metadata_->isAssignableTo(type);
}

std::string Value::describe() const
{
    switch (kind_) {
        case Kind::Null:    return "null";
        case Kind::Literal: return fmt::format("literal<{}>", demangle(literal_.type().name()));
        case Kind::Object:  return fmt::format("object<{}>", object_.typeName());
        case Kind::List:    return fmt::format("list[{}]", list_.size());
    }
    return "unknown";
}

} // namespace wireup
