#include "post_processor_pipeline.hpp"

#include <algorithm>

#include "lifecycle.hpp"
#include "logging/logging.hpp"

namespace wireup {

const char* to_string(OrderTier tier)
{
    switch (tier) {
        case OrderTier::PriorityOrdered: return "priority-ordered";
        case OrderTier::Ordered:         return "ordered";
        case OrderTier::Unordered:       return "unordered";
        case OrderTier::Last:            return "last";
    }
    return "unknown";
}

SortKey sortKeyOf(const Object& object, uint64_t sequence)
{
    SortKey key;
    key.sequence = sequence;
    if (auto priority = object.as<PriorityOrdered>()) {
        key.tier = OrderTier::PriorityOrdered;
        key.order = priority->order();
    } else if (auto ordered = object.as<Ordered>()) {
        key.tier = OrderTier::Ordered;
        key.order = ordered->order();
    } else {
        key.tier = OrderTier::Unordered;
        key.order = 0;
    }
    return key;
}


PostProcessorPipeline::PostProcessorPipeline()
    : entries_(std::make_shared<const std::vector<HookEntry>>())
{
}

void PostProcessorPipeline::add(const std::string& name, const Object& processor)
{
    std::lock_guard<std::mutex> lock(mutex_);
    HookEntry entry;
    entry.name = name;
    entry.object = processor;
    entry.key = sortKeyOf(processor, sequence_++);
    insert(std::move(entry));
}

void PostProcessorPipeline::add(const std::string& name, const Object& processor, OrderTier tier)
{
    std::lock_guard<std::mutex> lock(mutex_);
    HookEntry entry;
    entry.name = name;
    entry.object = processor;
    entry.key = sortKeyOf(processor, sequence_++);
    entry.key.tier = tier;
    insert(std::move(entry));
}

void PostProcessorPipeline::insert(HookEntry entry)
{
    entry.lifecycle = entry.object.as<LifecycleHook>();
    entry.instantiation = entry.object.as<InstantiationHook>();
    entry.property = entry.object.as<PropertyHook>();
    entry.early = entry.object.as<EarlyReferenceHook>();

    // copy-on-write
    auto next = std::make_shared<std::vector<HookEntry>>(*entries_);
    next->erase(std::remove_if(next->begin(), next->end(),
                               [&](const HookEntry& e) { return e.object == entry.object; }),
                next->end());

    LOGD("post-processor '{}' ({}) registered as {} [order={}]",
         entry.name, entry.object.typeName(), to_string(entry.key.tier), entry.key.order);

    auto pos = std::upper_bound(next->begin(), next->end(), entry,
                                [](const HookEntry& a, const HookEntry& b) { return a.key < b.key; });
    next->insert(pos, std::move(entry));
    entries_ = std::move(next);
}

bool PostProcessorPipeline::remove(const Object& processor)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<std::vector<HookEntry>>(*entries_);
    auto before = next->size();
    next->erase(std::remove_if(next->begin(), next->end(),
                               [&](const HookEntry& e) { return e.object == processor; }),
                next->end());
    if (next->size() == before) return false;
    entries_ = std::move(next);
    return true;
}

PostProcessorPipeline::Snapshot PostProcessorPipeline::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t PostProcessorPipeline::size() const
{
    return snapshot()->size();
}

size_t PostProcessorPipeline::count(OrderTier tier) const
{
    auto entries = snapshot();
    return std::count_if(entries->begin(), entries->end(), [&](const HookEntry& e) { return e.key.tier == tier; });
}

bool PostProcessorPipeline::hasInstantiationHooks() const
{
    auto entries = snapshot();
    return std::any_of(entries->begin(), entries->end(), [](const HookEntry& e) { return e.instantiation != nullptr; });
}

bool PostProcessorPipeline::hasEarlyReferenceHooks() const
{
    auto entries = snapshot();
    return std::any_of(entries->begin(), entries->end(), [](const HookEntry& e) { return e.early != nullptr; });
}

bool PostProcessorPipeline::hasPropertyHooks() const
{
    auto entries = snapshot();
    return std::any_of(entries->begin(), entries->end(), [](const HookEntry& e) { return e.property != nullptr; });
}

// 첫 번째로 객체를 반환한 hook 에서 멈춘다.
Object PostProcessorPipeline::applyBeforeInstantiation(const ClassMetadata& type, const std::string& name) const
{
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.instantiation) continue;
        Object result = e.instantiation->beforeInstantiation(type, name);
        if (result) {
            LOGD("object '{}' instantiation short-circuited by '{}'", name, e.name);
            return result;
        }
    }
    return Object();
}

bool PostProcessorPipeline::applyAfterInstantiation(const Object& object, const std::string& name) const
{
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.instantiation) continue;
        if (!e.instantiation->afterInstantiation(object, name)) {
            LOGT("property population of '{}' vetoed by '{}'", name, e.name);
            return false;
        }
    }
    return true;
}

std::optional<PropertyValues> PostProcessorPipeline::applyPropertyHooks(PropertyValues values, const Object& object,
                                                                        const std::string& name) const
{
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.property) continue;
        auto processed = e.property->processProperties(values, object, name);
        if (!processed) {
            LOGT("property population of '{}' skipped by '{}'", name, e.name);
            return std::nullopt;
        }
        values = std::move(*processed);
    }
    return values;
}

std::vector<const ConstructorInfo*> PostProcessorPipeline::determineCandidateConstructors(const ClassMetadata& type,
                                                                                          const std::string& name) const
{
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.early) continue;
        auto candidates = e.early->determineCandidateConstructors(type, name);
        if (!candidates.empty()) return candidates;
    }
    return {};
}

// transform 단계: 빈 Object 는 "변경 없음" 으로 보고 다음 hook 으로 계속 진행한다.
Object PostProcessorPipeline::applyEarlyReference(const Object& object, const std::string& name) const
{
    Object current = object;
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.early) continue;
        Object next = e.early->earlyReference(current, name);
        if (next) current = std::move(next);
    }
    return current;
}

void PostProcessorPipeline::discardEarlyReference(const std::string& name) const
{
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (e.early) e.early->discardEarlyReference(name);
    }
}

Object PostProcessorPipeline::applyBeforeInitialization(const Object& object, const std::string& name) const
{
    Object current = object;
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.lifecycle) continue;
        Object next = e.lifecycle->beforeInitialization(current, name);
        if (next) current = std::move(next);
    }
    return current;
}

Object PostProcessorPipeline::applyAfterInitialization(const Object& object, const std::string& name) const
{
    Object current = object;
    auto entries = snapshot();
    for (const auto& e : *entries) {
        if (!e.lifecycle) continue;
        Object next = e.lifecycle->afterInitialization(current, name);
        if (next) current = std::move(next);
    }
    return current;
}

} // namespace wireup
