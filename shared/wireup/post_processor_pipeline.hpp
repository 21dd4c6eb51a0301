#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "class_metadata.hpp"
#include "object.hpp"
#include "object_definition.hpp"
#include "post_processor.hpp"

namespace wireup {

    // 등록 시점에 한 번 계산되는 정렬 key
    enum class OrderTier { PriorityOrdered = 0, Ordered = 1, Unordered = 2, Last = 3 };

    const char* to_string(OrderTier tier);

    struct SortKey {
        OrderTier tier = OrderTier::Unordered;
        int order = 0;
        uint64_t sequence = 0;

        bool operator<(const SortKey& other) const
        {
            return std::tie(tier, order, sequence) < std::tie(other.tier, other.order, other.sequence);
        }
    };

    // 객체 하나에 대해 구현된 hook 들의 등록 정보
    struct HookEntry {
        std::string name;
        Object object;
        SortKey key;
        std::shared_ptr<LifecycleHook> lifecycle;
        std::shared_ptr<InstantiationHook> instantiation;
        std::shared_ptr<PropertyHook> property;
        std::shared_ptr<EarlyReferenceHook> early;
    };

    // Ordered / PriorityOrdered 구현 여부로 tier 를 결정한다.
    SortKey sortKeyOf(const Object& object, uint64_t sequence);


    // instance-level hook 목록.
    // 읽기는 snapshot 으로 진행되어 hook 실행 중 등록이 있어도 현재 호출에는 영향이 없다.
    class PostProcessorPipeline
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        using Snapshot = std::shared_ptr<const std::vector<HookEntry>>;

        PostProcessorPipeline();

        // 같은 객체가 이미 있으면 제거 후 다시 추가한다. (정렬 key 는 새로 계산)
        void add(const std::string& name, const Object& processor);
        void add(const std::string& name, const Object& processor, OrderTier tier);
        bool remove(const Object& processor);

        Snapshot snapshot() const;
        size_t size() const;
        size_t count(OrderTier tier) const;
        bool hasInstantiationHooks() const;
        bool hasEarlyReferenceHooks() const;
        bool hasPropertyHooks() const;

        // --- 단계별 호출 ---
        Object applyBeforeInstantiation(const ClassMetadata& type, const std::string& name) const;
        bool applyAfterInstantiation(const Object& object, const std::string& name) const;
        std::optional<PropertyValues> applyPropertyHooks(PropertyValues values, const Object& object,
                                                         const std::string& name) const;
        std::vector<const ConstructorInfo*> determineCandidateConstructors(const ClassMetadata& type,
                                                                           const std::string& name) const;
        Object applyEarlyReference(const Object& object, const std::string& name) const;
        void discardEarlyReference(const std::string& name) const;
        Object applyBeforeInitialization(const Object& object, const std::string& name) const;
        Object applyAfterInitialization(const Object& object, const std::string& name) const;

    private:
        void insert(HookEntry entry);

        mutable std::mutex mutex_;
        Snapshot entries_;
        uint64_t sequence_ = 0;
    }; // class PostProcessorPipeline

} // namespace wireup
