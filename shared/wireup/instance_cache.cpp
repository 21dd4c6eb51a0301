#include "instance_cache.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "logging/logging.hpp"

namespace wireup {

InstanceCache::State InstanceCache::state(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    return it == entries_.end() ? State::Absent : it->second.state;
}

Object InstanceCache::get(const std::string& name, bool allow_early)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return Object();

    Entry& entry = it->second;
    if (entry.state == State::Finished) return entry.instance;
    if (!allow_early) return Object();

    if (entry.early_object) {
        return entry.early_object;
    }
    if (entry.early_factory) {
        // factory 는 한 번만 사용한다.
        auto factory = std::move(entry.early_factory);
        entry.early_factory = nullptr;
        Object early = factory();
        // factory 호출 중 entries_ 가 변경되었을 수 있다.
        auto again = entries_.find(name);
        if (again != entries_.end() && again->second.state == State::Creating) {
            again->second.early_object = early;
        }
        LOGT("returning eagerly cached instance of object '{}' that is not fully initialized yet", name);
        return early;
    }
    return Object();
}

bool InstanceCache::beginCreation(const std::string& name)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto& entry = entries_[name];
    if (entry.state != State::Absent) return false;
    entry.state = State::Creating;
    return true;
}

void InstanceCache::setEarlyFactory(const std::string& name, EarlyFactory factory)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.state != State::Creating) return;
    if (!it->second.early_object) {
        it->second.early_factory = std::move(factory);
    }
}

bool InstanceCache::hasEarlyFactory(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.state != State::Creating) return false;
    return static_cast<bool>(it->second.early_factory) || static_cast<bool>(it->second.early_object);
}

Object InstanceCache::earlyObject(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.state != State::Creating) return Object();
    return it->second.early_object;
}

void InstanceCache::finish(const std::string& name, Object instance)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto& entry = entries_[name];
    entry.state = State::Finished;
    entry.instance = std::move(instance);
    entry.early_factory = nullptr;
    entry.early_object = Object();
    if (std::find(order_.begin(), order_.end(), name) == order_.end()) {
        order_.push_back(name);
    }
}

void InstanceCache::abort(const std::string& name)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it != entries_.end() && it->second.state == State::Creating) {
        entries_.erase(it);
    }
}

Result<void> InstanceCache::registerSingleton(const std::string& name, Object instance)
{
    if (!instance) {
        return Error(ResultCode::InvalidArgument, fmt::format("singleton '{}' must not be null", name));
    }
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = entries_.find(name);
    if (it != entries_.end() && it->second.state != State::Absent) {
        return Error(ResultCode::AlreadyExists,
                     fmt::format("Could not register object under name '{}': there is already an object bound", name));
    }
    finish(name, std::move(instance));
    return OK();
}

std::vector<std::string> InstanceCache::names() const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    return order_;
}

size_t InstanceCache::count() const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    return order_.size();
}

void InstanceCache::registerDependent(const std::string& dependency, const std::string& dependent)
{
    if (dependency.empty() || dependent.empty() || dependency == dependent) return;
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    dependents_[dependency].insert(dependent);
    dependencies_[dependent].insert(dependency);
}

std::vector<std::string> InstanceCache::dependentsOf(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = dependents_.find(name);
    if (it == dependents_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> InstanceCache::dependenciesOf(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    auto it = dependencies_.find(name);
    if (it == dependencies_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

bool InstanceCache::isDependent(const std::string& name, const std::string& dependent) const
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    std::set<std::string> seen;
    return isDependentLocked(name, dependent, seen);
}

bool InstanceCache::isDependentLocked(const std::string& name, const std::string& dependent,
                                      std::set<std::string>& seen) const
{
    if (!seen.insert(name).second) return false;
    auto it = dependents_.find(name);
    if (it == dependents_.end()) return false;
    if (it->second.count(dependent)) return true;
    for (const auto& transitive : it->second) {
        if (isDependentLocked(transitive, dependent, seen)) return true;
    }
    return false;
}

void InstanceCache::registerDisposable(const std::string& name, Destroyer destroyer)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    disposables_.emplace_back(name, std::move(destroyer));
}

void InstanceCache::destroySingleton(const std::string& name)
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    destroyLocked(name);
}

void InstanceCache::destroyLocked(const std::string& name)
{
    // 이 객체를 사용하는 객체부터 파괴
    auto dependents = dependents_.find(name);
    if (dependents != dependents_.end()) {
        auto names = std::move(dependents->second);
        dependents_.erase(dependents);
        for (const auto& dependent : names) {
            LOGD("destroying dependent '{}' of '{}'", dependent, name);
            destroyLocked(dependent);
        }
    }

    auto disposable = std::find_if(disposables_.begin(), disposables_.end(),
                                   [&](const auto& d) { return d.first == name; });
    if (disposable != disposables_.end()) {
        auto destroyer = std::move(disposable->second);
        disposables_.erase(disposable);
        try {
            destroyer();
        } catch (const std::exception& e) {
            LOGW("destroy method on object '{}' threw an exception: {}", name, e.what());
        }
    }

    auto dependencies = dependencies_.find(name);
    if (dependencies != dependencies_.end()) {
        for (const auto& dependency : dependencies->second) {
            auto it = dependents_.find(dependency);
            if (it != dependents_.end()) it->second.erase(name);
        }
        dependencies_.erase(dependencies);
    }

    entries_.erase(name);
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
}

void InstanceCache::destroySingletons()
{
    std::lock_guard<std::recursive_mutex> lock(monitor_);
    destroying_ = true;
    LOGD("destroying singletons in {}", fmt::ptr(this));

    std::vector<std::string> names;
    for (auto it = disposables_.rbegin(); it != disposables_.rend(); ++it) {
        names.push_back(it->first);
    }
    for (const auto& name : names) {
        destroyLocked(name);
    }

    entries_.clear();
    order_.clear();
    dependents_.clear();
    dependencies_.clear();
    disposables_.clear();
    destroying_ = false;
}

} // namespace wireup
