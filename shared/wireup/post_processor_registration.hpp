#pragma once

#include <memory>
#include <vector>

#include "object.hpp"
#include "post_processor.hpp"

namespace wireup {

    class ObjectFactory;

    // definition 단계 hook 실행 (freeze 이전).
    //
    // 1. manual 로 추가된 DefinitionRegistryPostProcessor
    // 2. registry 에 정의된 DefinitionRegistryPostProcessor: PriorityOrdered -> Ordered -> 나머지.
    //    나머지 단계는 새 processor definition 이 나타나지 않을 때까지 반복한다.
    // 3. 위 processor 들의 postProcessContainer, 이어서 manual 로 추가된 일반 processor
    // 4. registry 에 정의된 ContainerPostProcessor: PriorityOrdered -> Ordered -> 나머지
    void invokeContainerPostProcessors(ObjectFactory& factory,
                                       const std::vector<std::shared_ptr<ContainerPostProcessor>>& manual);

    // registry 에 정의된 instance-level hook 을 tier 순서로 만들어 pipeline 에 등록한다.
    // 모든 hook 이 등록되기 전에 만들어진 객체는 checker 가 로그로 남긴다.
    // last 는 마지막 tier 에 추가된다.
    void registerPostProcessors(ObjectFactory& factory, const Object& last);

} // namespace wireup
