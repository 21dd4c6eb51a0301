#include "post_processor_registration.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>

#include "lifecycle.hpp"
#include "logging/logging.hpp"
#include "object_factory.hpp"

namespace wireup {

namespace {

    constexpr const char* LOG_TAG = "wireup";
    constexpr const char* CHECKER_NAME = "wireup.postProcessorChecker";

    bool isDereference(const std::string& name)
    {
        return name.rfind(FACTORY_DEREFERENCE_PREFIX, 0) == 0;
    }

    OrderTier tierOf(ObjectFactory& factory, const std::string& name)
    {
        if (factory.isTypeMatch(name, getTypeId<PriorityOrdered>())) return OrderTier::PriorityOrdered;
        if (factory.isTypeMatch(name, getTypeId<Ordered>())) return OrderTier::Ordered;
        return OrderTier::Unordered;
    }

    template<typename P>
    int orderOf(const std::shared_ptr<P>& processor)
    {
        auto ordered = std::dynamic_pointer_cast<Ordered>(processor);
        return ordered ? ordered->order() : LOWEST_PRECEDENCE;
    }

    // 아직 처리되지 않은 P definition 을 만든다. tier 가 없으면 남은 것 전부.
    template<typename P>
    std::vector<std::shared_ptr<P>> collect(ObjectFactory& factory, std::optional<OrderTier> tier,
                                            std::set<std::string>& processed)
    {
        std::vector<std::shared_ptr<P>> found;
        for (const auto& name : factory.namesForType<P>()) {
            if (isDereference(name) || processed.count(name) > 0) continue;
            if (tier && tierOf(factory, name) != *tier) continue;

            processed.insert(name);
            found.push_back(factory.get<P>(name));
        }
        std::stable_sort(found.begin(), found.end(),
                         [](const auto& a, const auto& b) { return orderOf(a) < orderOf(b); });
        return found;
    }


    // hook 등록이 끝나기 전에 만들어진 일반 객체를 알린다.
    class PostProcessorChecker : public LifecycleHook
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        PostProcessorChecker(ObjectFactory& factory, size_t expected)
            : factory_(factory), expected_(expected) {}

        Object afterInitialization(const Object& object, const std::string& name) override
        {
            if (object.is<PostProcessor>() || isInfrastructure(name)) return object;
            if (factory_.postProcessorCount() < expected_) {
                LOGI("Object '{}' of type [{}] is not eligible for getting processed by all post-processors "
                     "(for example: not eligible for auto-proxying)", name, object.typeName());
            }
            return object;
        }

    private:
        bool isInfrastructure(const std::string& name) const
        {
            auto definition = factory_.definitions().definition(name);
            return definition && definition->role() == Role::Infrastructure;
        }

        ObjectFactory& factory_;
        size_t expected_;
    }; // class PostProcessorChecker

} // namespace

void invokeContainerPostProcessors(ObjectFactory& factory,
                                   const std::vector<std::shared_ptr<ContainerPostProcessor>>& manual)
{
    std::set<std::string> processed;
    std::vector<std::shared_ptr<DefinitionRegistryPostProcessor>> registry_processors;
    std::vector<std::shared_ptr<ContainerPostProcessor>> regular_processors;

    for (const auto& processor : manual) {
        if (!processor) continue;
        if (auto registry_processor = std::dynamic_pointer_cast<DefinitionRegistryPostProcessor>(processor)) {
            registry_processor->postProcessRegistry(factory.definitions());
            registry_processors.push_back(registry_processor);
        } else {
            regular_processors.push_back(processor);
        }
    }

    auto runRegistry = [&](const std::vector<std::shared_ptr<DefinitionRegistryPostProcessor>>& current) {
        for (const auto& processor : current) {
            processor->postProcessRegistry(factory.definitions());
            registry_processors.push_back(processor);
        }
    };

    runRegistry(collect<DefinitionRegistryPostProcessor>(factory, OrderTier::PriorityOrdered, processed));
    runRegistry(collect<DefinitionRegistryPostProcessor>(factory, OrderTier::Ordered, processed));

    // registry processor 가 다른 registry processor 를 등록할 수 있다.
    size_t round = 0;
    bool reiterate = true;
    while (reiterate) {
        auto current = collect<DefinitionRegistryPostProcessor>(factory, std::nullopt, processed);
        reiterate = !current.empty();
        if (reiterate) {
            LOG_DEBUG(LOG_TAG, "invoking {} registry post-processor(s) in round {}", current.size(), ++round);
        }
        runRegistry(current);
    }

    for (const auto& processor : registry_processors) {
        processor->postProcessContainer(factory);
    }
    for (const auto& processor : regular_processors) {
        processor->postProcessContainer(factory);
    }

    for (auto tier : {OrderTier::PriorityOrdered, OrderTier::Ordered, OrderTier::Unordered}) {
        for (const auto& processor : collect<ContainerPostProcessor>(factory, tier, processed)) {
            processor->postProcessContainer(factory);
        }
    }
}

void registerPostProcessors(ObjectFactory& factory, const Object& last)
{
    std::vector<std::string> names;
    for (const auto& name : factory.namesForType<PostProcessor>()) {
        if (!isDereference(name)) names.push_back(name);
    }

    const size_t expected = factory.postProcessorCount() + 1 + names.size() + (last ? 1 : 0);
    factory.addPostProcessor(std::make_shared<PostProcessorChecker>(factory, expected), CHECKER_NAME);

    // 앞 tier 의 hook 은 다음 tier 의 hook 생성에 적용된다.
    for (auto tier : {OrderTier::PriorityOrdered, OrderTier::Ordered, OrderTier::Unordered}) {
        for (const auto& name : names) {
            if (tierOf(factory, name) != tier) continue;
            factory.addPostProcessor(factory.resolve(name), name);
        }
    }

    if (last) {
        factory.pipeline().add(last.typeName(), last, OrderTier::Last);
    }
    LOG_DEBUG(LOG_TAG, "registered {} post-processor(s)", factory.postProcessorCount());
}

} // namespace wireup
