#pragma once

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "type_info.hpp"

namespace wireup {

    class ClassMetadata;

    // 컨테이너가 다루는 type-erased 인스턴스 핸들.
    // ptr 은 항상 metadata 가 기술하는 타입의 subobject 를 가리킨다.
    // 빈 Object 가 null reference 이다.
    class Object
    {
    public:
        Object() = default;
        Object(std::shared_ptr<void> ptr, std::shared_ptr<const ClassMetadata> metadata);

        bool empty() const noexcept { return ptr_ == nullptr; }
        explicit operator bool() const noexcept { return ptr_ != nullptr; }

        // identity: 두 핸들이 같은 객체를 가리키는지
        const void* address() const noexcept { return ptr_.get(); }
        const std::shared_ptr<void>& pointer() const noexcept { return ptr_; }

        const ClassMetadata* metadata() const noexcept { return metadata_.get(); }
        const std::shared_ptr<const ClassMetadata>& metadataPtr() const noexcept { return metadata_; }
        TypeId type() const;
        std::string typeName() const;

        // metadata 에 등록된 up-cast 경로로 변환한다. 불가능하면 nullptr.
        std::shared_ptr<void> castTo(TypeId type) const;
        bool isA(TypeId type) const;

        template<typename T>
        std::shared_ptr<T> as() const
        {
            return std::static_pointer_cast<T>(castTo(getTypeId<T>()));
        }

        template<typename T>
        bool is() const
        {
            return isA(getTypeId<T>());
        }

        bool operator==(const Object& other) const noexcept { return address() == other.address(); }
        bool operator!=(const Object& other) const noexcept { return address() != other.address(); }

    private:
        std::shared_ptr<void> ptr_;
        std::shared_ptr<const ClassMetadata> metadata_;
    }; // class Object


    // literal 값의 폭넓은 변환 (정수 <-> 정수, 실수, bool, const char* -> std::string)
    template<typename A>
    std::optional<A> convertLiteral(const std::any& value)
    {
        if (!value.has_value()) return std::nullopt;
        if (value.type() == typeid(A)) return std::any_cast<A>(value);

        if constexpr (std::is_same_v<A, std::string>) {
            if (value.type() == typeid(const char*)) return std::string(std::any_cast<const char*>(value));
            return std::nullopt;
        } else if constexpr (std::is_arithmetic_v<A>) {
#define WIREUP_TRY_NUMERIC(Src) \
            if (value.type() == typeid(Src)) return static_cast<A>(std::any_cast<Src>(value));
            WIREUP_TRY_NUMERIC(bool)
            WIREUP_TRY_NUMERIC(int)
            WIREUP_TRY_NUMERIC(unsigned)
            WIREUP_TRY_NUMERIC(long)
            WIREUP_TRY_NUMERIC(unsigned long)
            WIREUP_TRY_NUMERIC(long long)
            WIREUP_TRY_NUMERIC(unsigned long long)
            WIREUP_TRY_NUMERIC(float)
            WIREUP_TRY_NUMERIC(double)
#undef WIREUP_TRY_NUMERIC
            return std::nullopt;
        } else {
            return std::nullopt;
        }
    }


    // 생성자 인자 / property 에 주입되는 해석된 값
    class Value
    {
    public:
        enum class Kind { Null, Literal, Object, List };

        Value() = default;

        static Value null() { return Value(); }

        static Value fromLiteral(std::any literal)
        {
            Value v;
            v.kind_ = Kind::Literal;
            if (literal.type() == typeid(const char*))
                v.literal_ = std::string(std::any_cast<const char*>(literal));
            else
                v.literal_ = std::move(literal);
            return v;
        }

        static Value fromObject(Object object)
        {
            Value v;
            v.kind_ = object ? Kind::Object : Kind::Null;
            v.object_ = std::move(object);
            return v;
        }

        static Value fromList(std::vector<Object> list)
        {
            Value v;
            v.kind_ = Kind::List;
            v.list_ = std::move(list);
            return v;
        }

        template<typename T>
        static Value of(T literal)
        {
            if constexpr (std::is_same_v<std::decay_t<T>, Object>) {
                return fromObject(std::move(literal));
            } else {
                return fromLiteral(std::any(std::move(literal)));
            }
        }

        Kind kind() const noexcept { return kind_; }
        bool isNull() const noexcept { return kind_ == Kind::Null; }
        const std::any& asLiteral() const noexcept { return literal_; }
        const Object& asObject() const noexcept { return object_; }
        const std::vector<Object>& asList() const noexcept { return list_; }

        std::string describe() const;

    private:
        Kind kind_ = Kind::Null;
        std::any literal_;
        Object object_;
        std::vector<Object> list_;
    }; // class Value

} // namespace wireup
