#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "object.hpp"
#include "type_info.hpp"

namespace wireup {

    // 하나의 최상위 resolve 호출 동안 유지되는 생성 경로.
    // resolver 호출마다 인자로 전달되며 thread 사이에 공유되지 않는다.
    class CreationContext
    {
    public:
        // 생성 중인 이름을 경로에 추가/제거하는 RAII guard
        class Frame
        {
        public:
            Frame(CreationContext& context, const std::string& name) : context_(context)
            {
                context_.path_.push_back(name);
            }
            ~Frame() { context_.path_.pop_back(); }

            Frame(const Frame&) = delete;
            Frame& operator=(const Frame&) = delete;

        private:
            CreationContext& context_;
        };

        bool contains(const std::string& name) const
        {
            return std::find(path_.begin(), path_.end(), name) != path_.end();
        }

        // 현재 생성 중인 (가장 안쪽) 객체 이름. 없으면 빈 문자열.
        const std::string& current() const
        {
            static const std::string none;
            return path_.empty() ? none : path_.back();
        }

        // name 에서 시작해 다시 name 으로 돌아오는 경로
        std::vector<std::string> cycleTo(const std::string& name) const
        {
            std::vector<std::string> cycle;
            auto it = std::find(path_.begin(), path_.end(), name);
            if (it == path_.end()) {
                cycle.push_back(name);
            } else {
                cycle.assign(it, path_.end());
            }
            cycle.push_back(name);
            return cycle;
        }

        const std::vector<std::string>& path() const { return path_; }
        size_t depth() const { return path_.size(); }

    private:
        std::vector<std::string> path_;
    }; // class CreationContext


    // computed ValueSpec 이 의존 객체를 조회할 때 사용한다.
    // 조회된 이름은 현재 생성 중인 객체의 dependency 로 기록된다.
    class DependencyResolver
    {
    public:
        virtual ~DependencyResolver() = default;

        virtual Object resolve(const std::string& name) = 0;
        virtual Object resolve(TypeId type) = 0;
        virtual const std::string& requestingName() const = 0;
    };

} // namespace wireup
