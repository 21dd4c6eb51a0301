#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>

#include "common/helper.hpp"

namespace wireup
{

	// Similar to std::type_index, but also storing the type size and alignment.
	// Also guaranteed to be aligned, to allow storing a TypeInfo and 1 bit together in the size of a void*.
	struct alignas(1) alignas(void*) TypeInfo {

		struct ConcreteTypeInfo {
			// These fields are allowed to have dummy values for abstract types.
			std::size_t type_size;
			std::size_t type_alignment;
			bool is_abstract;
		};

		TypeInfo(const std::type_info& info, ConcreteTypeInfo concrete_type_info)
			: info(&info), concrete_type_info(concrete_type_info), demangled(demangle(info.name())) {}

		const std::string& name() const { return demangled; }

		size_t size() const { return concrete_type_info.type_size; }

		size_t alignment() const { return concrete_type_info.type_alignment; }

		bool isAbstract() const { return concrete_type_info.is_abstract; }

		const std::type_info& typeInfo() const { return *info; }

	private:
		const std::type_info* info;
		ConcreteTypeInfo concrete_type_info;
		std::string demangled;
	};

	// 값 비교가 포인터 비교로 끝나는 타입 식별자. 기본 생성 값은 "타입 없음".
	struct TypeId {
		const TypeInfo* type_info = nullptr;

		bool valid() const { return type_info != nullptr; }

		std::string name() const { return type_info ? type_info->name() : std::string("<none>"); }

		explicit operator std::string() const { return name(); }

		bool operator==(TypeId x) const { return type_info == x.type_info; }
		bool operator!=(TypeId x) const { return type_info != x.type_info; }
		bool operator<(TypeId x) const { return type_info < x.type_info; }
	};

	template <typename T, bool is_abstract = std::is_abstract<T>::value>
	struct GetConcreteTypeInfo {
		TypeInfo::ConcreteTypeInfo operator()() const {
			return TypeInfo::ConcreteTypeInfo{ sizeof(T), alignof(T), false };
		}
	};

	// For abstract types we don't need the real information.
	template <typename T>
	struct GetConcreteTypeInfo<T, true> {
		TypeInfo::ConcreteTypeInfo operator()() const {
			return TypeInfo::ConcreteTypeInfo{ 0 /* type_size */, 0 /* type_alignment */, true };
		}
	};

	template <typename T>
	inline TypeId getTypeId() {
		static TypeInfo info(typeid(T), GetConcreteTypeInfo<T>()());
		return TypeId{ &info };
	}

} // namespace wireup

namespace std {
	template <>
	struct hash<wireup::TypeId> {
		size_t operator()(wireup::TypeId id) const noexcept {
			return std::hash<const void*>()(id.type_info);
		}
	};
} // namespace std
