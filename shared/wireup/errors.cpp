#include "errors.hpp"

#include <fmt/format.h>

#include "common/helper.hpp"

namespace wireup {

ContainerError::ContainerError(ResultCode code, std::string object_name, std::string message,
                               std::exception_ptr cause)
    : std::runtime_error(message),
      code_(code),
      object_name_(std::move(object_name)),
      message_(std::move(message)),
      cause_(cause)
{
    rebuild();
}

std::string ContainerError::rootCauseMessage() const
{
    if (!cause_) return message_;
    try {
        std::rethrow_exception(cause_);
    } catch (const ContainerError& e) {
        return e.rootCauseMessage();
    } catch (const std::exception& e) {
        return e.what();
    }
}

void ContainerError::prependPath(const std::string& name)
{
    if (!path_.empty() && path_.front() == name) return;
    path_.insert(path_.begin(), name);
    rebuild();
}

void ContainerError::rebuild()
{
    std::string text;
    if (!object_name_.empty()) {
        text = fmt::format("Error creating object '{}'", object_name_);
        if (path_.size() > 1)
            text += fmt::format(" [{}]", joinPath(path_));
        text += ": ";
    }
    text += message_;
    if (cause_) {
        text += "; cause: " + rootCauseMessage();
    }
    what_ = std::move(text);
}


CircularConstructionError::CircularConstructionError(std::string object_name, std::vector<std::string> cycle)
    : ContainerError(ResultCode::CircularReference, object_name,
                     fmt::format("Requested object '{}' is currently in creation: unresolvable circular reference {}",
                                 object_name, joinPath(cycle))),
      cycle_(std::move(cycle))
{
}

RawReferenceLeakedError::RawReferenceLeakedError(std::string object_name, std::vector<std::string> dependents)
    : ContainerError(ResultCode::RawReferenceLeaked, object_name,
                     fmt::format("Object '{}' has been injected into other objects [{}] in its raw version as part "
                                 "of a circular reference, but has eventually been wrapped. The other objects do not "
                                 "use the final version of the object.",
                                 object_name, joinPath(dependents, ", "))),
      dependents_(std::move(dependents))
{
}

} // namespace wireup
