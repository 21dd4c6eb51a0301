#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/result.h"
#include "object.hpp"

namespace wireup {

    // singleton instance cache.
    //
    // 이름별 상태는 absent | creating(early factory, early object) | finished(instance) 중 하나이다.
    // 모든 생성은 monitor() 를 잡은 상태에서 진행되므로 같은 thread 의 재진입만 creating 상태를 본다.
    class InstanceCache
    {
    public:
        static constexpr const char* LOG_TAG = "wireup";

        using EarlyFactory = std::function<Object()>;
        using Destroyer = std::function<void()>;

        enum class State { Absent, Creating, Finished };

        InstanceCache() = default;

        std::recursive_mutex& monitor() { return monitor_; }

        State state(const std::string& name) const;
        bool isCreating(const std::string& name) const { return state(name) == State::Creating; }
        bool isFinished(const std::string& name) const { return state(name) == State::Finished; }

        // finished instance. allow_early 이면 creating 중인 객체의 early reference 를 반환한다.
        // early factory 는 최대 한 번 호출되고 그 결과가 보관된다.
        Object get(const std::string& name, bool allow_early = true);

        // creating 으로 전이. 이미 creating / finished 이면 false.
        bool beginCreation(const std::string& name);
        void setEarlyFactory(const std::string& name, EarlyFactory factory);
        bool hasEarlyFactory(const std::string& name) const;
        // early factory 가 호출되어 다른 객체가 reference 를 가져갔는지
        Object earlyObject(const std::string& name) const;

        // creating -> finished
        void finish(const std::string& name, Object instance);
        // creating -> absent (실패 rollback)
        void abort(const std::string& name);

        // 외부에서 만든 객체 등록
        Result<void> registerSingleton(const std::string& name, Object instance);

        // 등록(완료) 순서의 singleton 이름
        std::vector<std::string> names() const;
        size_t count() const;

        // --- dependency edges ---
        void registerDependent(const std::string& dependency, const std::string& dependent);
        std::vector<std::string> dependentsOf(const std::string& name) const;
        std::vector<std::string> dependenciesOf(const std::string& name) const;
        // dependent 가 name 에 (간접적으로) 의존하는지
        bool isDependent(const std::string& name, const std::string& dependent) const;

        // --- destruction ---
        void registerDisposable(const std::string& name, Destroyer destroyer);
        // dependents 를 먼저 파괴하고 name 을 제거한다.
        void destroySingleton(const std::string& name);
        // 등록 역순으로 모두 파괴한다.
        void destroySingletons();
        bool isDestroying() const { return destroying_; }

    private:
        struct Entry {
            State state = State::Absent;
            Object instance;
            EarlyFactory early_factory;
            Object early_object;
        };

        bool isDependentLocked(const std::string& name, const std::string& dependent,
                               std::set<std::string>& seen) const;
        void destroyLocked(const std::string& name);

        mutable std::recursive_mutex monitor_;
        std::unordered_map<std::string, Entry> entries_;
        std::vector<std::string> order_;

        std::map<std::string, std::set<std::string>> dependents_;     // name -> 이 객체를 사용하는 객체
        std::map<std::string, std::set<std::string>> dependencies_;   // name -> 이 객체가 사용하는 객체

        std::vector<std::pair<std::string, Destroyer>> disposables_;
        std::atomic<bool> destroying_{false};
    }; // class InstanceCache

} // namespace wireup
