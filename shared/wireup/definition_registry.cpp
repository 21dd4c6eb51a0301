#include "definition_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "common/result_helper.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"

namespace wireup {

Result<void> DefinitionRegistry::validate(const std::string& name, const ObjectDefinition& definition) const
{
    if (name.empty()) {
        return Error(ResultCode::InvalidArgument, "object name must not be empty");
    }
    bool has_source = definition.hasType()
                   || !definition.parentName().empty()
                   || !definition.factoryObject().empty()
                   || static_cast<bool>(definition.instanceSupplier());
    if (!has_source && !definition.isAbstract()) {
        return Error(ResultCode::DefinitionError,
                     fmt::format("definition '{}' has neither a type, a parent nor a factory", name));
    }
    if (!definition.factoryObject().empty() && definition.factoryMethod().empty()) {
        return Error(ResultCode::DefinitionError,
                     fmt::format("definition '{}' names factory object '{}' without a factory method",
                                 name, definition.factoryObject()));
    }
    if (definition.parentName() == name) {
        return Error(ResultCode::DefinitionError, fmt::format("definition '{}' cannot be its own parent", name));
    }
    return OK();
}

Result<void> DefinitionRegistry::registerDefinition(const std::string& name, ObjectDefinition definition)
{
    auto valid = validate(name, definition);
    RETURN_IF_ERR(valid);

    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        return Error(ResultCode::InvalidState,
                     fmt::format("Cannot register definition '{}': configuration is frozen", name));
    }

    auto existing = definitions_.find(name);
    if (existing != definitions_.end()) {
        if (!allow_overriding_) {
            return Error(ResultCode::AlreadyExists,
                         fmt::format("Cannot register definition '{}': there is already a definition bound", name));
        }
        LOGD("overriding definition for object '{}'", name);
    } else {
        order_.push_back(name);
    }

    definitions_[name] = std::make_shared<ObjectDefinition>(std::move(definition));
    // child definition 들도 다시 병합되어야 한다.
    merged_.clear();
    return OK();
}

Result<void> DefinitionRegistry::removeDefinition(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        return Error(ResultCode::InvalidState,
                     fmt::format("Cannot remove definition '{}': configuration is frozen", name));
    }
    if (definitions_.erase(name) == 0) {
        return Error(ResultCode::NotFound, fmt::format("No definition named '{}'", name));
    }
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    merged_.clear();
    return OK();
}

Result<void> DefinitionRegistry::updateDefinition(const std::string& name,
                                                  const std::function<void(ObjectDefinition&)>& update)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        return Error(ResultCode::InvalidState,
                     fmt::format("Cannot update definition '{}': configuration is frozen", name));
    }
    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        return Error(ResultCode::NotFound, fmt::format("No definition named '{}'", name));
    }
    update(*it->second);
    merged_.clear();
    return OK();
}

bool DefinitionRegistry::containsDefinition(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_.count(name) > 0;
}

std::shared_ptr<const ObjectDefinition> DefinitionRegistry::definition(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : it->second;
}

std::vector<std::string> DefinitionRegistry::names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t DefinitionRegistry::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_.size();
}

std::shared_ptr<MergedDefinition> DefinitionRegistry::merged(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<std::string> visiting;
    return mergedLocked(name, visiting);
}

std::shared_ptr<MergedDefinition> DefinitionRegistry::mergedLocked(const std::string& name,
                                                                   std::unordered_set<std::string>& visiting) const
{
    auto cached = merged_.find(name);
    if (cached != merged_.end()) return cached->second;

    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        throw NoSuchDefinitionError(name);
    }
    if (!visiting.insert(name).second) {
        throw DefinitionError(name, "circular parent definition chain");
    }

    const ObjectDefinition& child = *it->second;
    std::shared_ptr<MergedDefinition> result;
    if (child.parentName().empty()) {
        result = std::make_shared<MergedDefinition>(name, child);
    } else {
        // parent 이름은 alias 일 수 있다.
        std::string parent_name = canonicalName(child.parentName());
        if (definitions_.count(parent_name) == 0) {
            throw DefinitionError(name, fmt::format("parent definition '{}' not found", child.parentName()));
        }
        auto parent = mergedLocked(parent_name, visiting);
        result = std::make_shared<MergedDefinition>(name, ObjectDefinition::merge(parent->definition, child));
    }

    merged_[name] = result;
    return result;
}

void DefinitionRegistry::freeze()
{
    std::lock_guard<std::mutex> lock(mutex_);
    frozen_ = true;
    LOGD("configuration frozen with {} definitions", definitions_.size());
}

bool DefinitionRegistry::isFrozen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

} // namespace wireup
