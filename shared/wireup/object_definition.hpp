#pragma once

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "class_metadata.hpp"
#include "object.hpp"
#include "type_info.hpp"

namespace wireup {

    class DependencyResolver;
    class ObjectDefinition;

    enum class Scope { Singleton, Prototype };
    enum class AutowireMode { None, ByName, ByType, Constructor };
    enum class Role { Application, Infrastructure };
    enum class DependencyCheck { None, Objects, Simple, All };

    const char* to_string(Scope scope);
    const char* to_string(AutowireMode mode);
    const char* to_string(Role role);


    // definition 안의 선언적 값. 생성 시점에 Value 로 해석된다.
    class ValueSpec
    {
    public:
        enum class Kind { Literal, Reference, List, Inner, Computed };

        using Expression = std::function<Value(DependencyResolver&)>;

        ValueSpec() = default;

        static ValueSpec literal(std::any value);
        static ValueSpec ref(std::string name);
        static ValueSpec list(std::vector<ValueSpec> items);
        static ValueSpec inner(std::shared_ptr<ObjectDefinition> definition);
        static ValueSpec computed(Expression expression);
        // 이미 해석된 값 (autowiring 결과)
        static ValueSpec resolved(Value value);

        template<typename T>
        static ValueSpec of(T value) { return literal(std::any(std::move(value))); }

        Kind kind() const { return kind_; }
        const std::any& literalValue() const { return literal_; }
        const std::string& refName() const { return ref_; }
        const std::vector<ValueSpec>& items() const { return items_; }
        const std::shared_ptr<ObjectDefinition>& innerDefinition() const { return inner_; }
        const Expression& expression() const { return expression_; }

    private:
        Kind kind_ = Kind::Literal;
        std::any literal_;
        std::string ref_;
        std::vector<ValueSpec> items_;
        std::shared_ptr<ObjectDefinition> inner_;
        Expression expression_;
    }; // class ValueSpec


    // 이름 -> 값 목록 (등록 순서 유지)
    class PropertyValues
    {
    public:
        using Entry = std::pair<std::string, ValueSpec>;

        PropertyValues& add(const std::string& name, ValueSpec value);
        bool contains(const std::string& name) const;
        const ValueSpec* get(const std::string& name) const;
        bool remove(const std::string& name);

        // other 의 값으로 덮어쓴다.
        void overlay(const PropertyValues& other);

        bool empty() const { return entries_.empty(); }
        size_t size() const { return entries_.size(); }
        std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
        std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    private:
        std::vector<Entry> entries_;
    }; // class PropertyValues


    // index -> 생성자 인자
    class ConstructorArgs
    {
    public:
        ConstructorArgs& add(ValueSpec value);
        ConstructorArgs& set(size_t index, ValueSpec value);

        const ValueSpec* get(size_t index) const;
        void overlay(const ConstructorArgs& other);

        bool empty() const { return args_.empty(); }
        // 가장 큰 index + 1
        size_t count() const { return args_.empty() ? 0 : args_.rbegin()->first + 1; }
        const std::map<size_t, ValueSpec>& entries() const { return args_; }

    private:
        std::map<size_t, ValueSpec> args_;
    }; // class ConstructorArgs


    // 객체 하나를 만드는 방법의 선언.
    // registry 가 freeze 된 이후에는 수정하지 않는다.
    class ObjectDefinition
    {
    public:
        ObjectDefinition() = default;
        explicit ObjectDefinition(std::string type_name) : type_name_(std::move(type_name)) {}

        template<typename T>
        static ObjectDefinition forType()
        {
            ObjectDefinition def;
            def.setType(getTypeId<T>());
            return def;
        }

        static ObjectDefinition child(std::string parent_name)
        {
            ObjectDefinition def;
            def.setParentName(std::move(parent_name));
            return def;
        }

        // --- type ---
        ObjectDefinition& setTypeName(std::string name) { type_name_ = std::move(name); return *this; }
        ObjectDefinition& setType(TypeId type) { type_ = type; return *this; }
        const std::string& typeName() const { return type_name_; }
        TypeId type() const { return type_; }
        bool hasType() const { return type_.valid() || !type_name_.empty(); }

        // --- parent / abstract ---
        ObjectDefinition& setParentName(std::string name) { parent_name_ = std::move(name); return *this; }
        const std::string& parentName() const { return parent_name_; }
        ObjectDefinition& setAbstract(bool value) { abstract_ = value; return *this; }
        bool isAbstract() const { return abstract_; }

        // --- scope ---
        ObjectDefinition& setScope(Scope scope) { scope_ = scope; return *this; }
        Scope scope() const { return scope_.value_or(Scope::Singleton); }
        bool hasScope() const { return scope_.has_value(); }
        bool isSingleton() const { return scope() == Scope::Singleton; }
        bool isPrototype() const { return scope() == Scope::Prototype; }

        ObjectDefinition& setLazyInit(bool value) { lazy_init_ = value; return *this; }
        bool isLazyInit() const { return lazy_init_.value_or(false); }

        // --- autowiring ---
        ObjectDefinition& setAutowireMode(AutowireMode mode) { autowire_ = mode; return *this; }
        AutowireMode autowireMode() const { return autowire_.value_or(AutowireMode::None); }
        ObjectDefinition& setDependencyCheck(DependencyCheck check) { dependency_check_ = check; return *this; }
        DependencyCheck dependencyCheck() const { return dependency_check_.value_or(DependencyCheck::None); }
        ObjectDefinition& setAutowireCandidate(bool value) { autowire_candidate_ = value; return *this; }
        bool isAutowireCandidate() const { return autowire_candidate_; }
        ObjectDefinition& setPrimary(bool value) { primary_ = value; return *this; }
        bool isPrimary() const { return primary_; }

        ObjectDefinition& setDependsOn(std::vector<std::string> names) { depends_on_ = std::move(names); return *this; }
        const std::vector<std::string>& dependsOn() const { return depends_on_; }

        // --- values ---
        ObjectDefinition& arg(ValueSpec value) { ctor_args_.add(std::move(value)); return *this; }
        ObjectDefinition& property(const std::string& name, ValueSpec value) { properties_.add(name, std::move(value)); return *this; }
        ConstructorArgs& constructorArgs() { return ctor_args_; }
        const ConstructorArgs& constructorArgs() const { return ctor_args_; }
        PropertyValues& properties() { return properties_; }
        const PropertyValues& properties() const { return properties_; }

        // --- factory ---
        ObjectDefinition& setFactoryMethod(std::string method) { factory_method_ = std::move(method); return *this; }
        ObjectDefinition& setFactoryObject(std::string name) { factory_object_ = std::move(name); return *this; }
        const std::string& factoryMethod() const { return factory_method_; }
        const std::string& factoryObject() const { return factory_object_; }

        ObjectDefinition& setInstanceSupplier(std::function<Object()> supplier) { supplier_ = std::move(supplier); return *this; }
        const std::function<Object()>& instanceSupplier() const { return supplier_; }

        // --- lifecycle ---
        ObjectDefinition& setInitMethod(std::string name) { init_method_ = std::move(name); return *this; }
        ObjectDefinition& setDestroyMethod(std::string name) { destroy_method_ = std::move(name); return *this; }
        const std::string& initMethod() const { return init_method_; }
        const std::string& destroyMethod() const { return destroy_method_; }

        ObjectDefinition& setRole(Role role) { role_ = role; return *this; }
        Role role() const { return role_; }

        // cycle 해소 / 생성 결과 재사용 허용 여부
        ObjectDefinition& setCacheable(bool value) { cacheable_ = value; return *this; }
        bool isCacheable() const { return cacheable_; }

        // child 의 명시된 값을 parent 위에 덮어쓴 새 definition
        static ObjectDefinition merge(const ObjectDefinition& parent, const ObjectDefinition& child);

    private:
        std::string type_name_;
        TypeId type_;
        std::string parent_name_;
        bool abstract_ = false;
        std::optional<Scope> scope_;
        std::optional<bool> lazy_init_;
        std::optional<AutowireMode> autowire_;
        std::optional<DependencyCheck> dependency_check_;
        bool autowire_candidate_ = true;
        bool primary_ = false;
        std::vector<std::string> depends_on_;
        ConstructorArgs ctor_args_;
        PropertyValues properties_;
        std::string factory_method_;
        std::string factory_object_;
        std::function<Object()> supplier_;
        std::string init_method_;
        std::string destroy_method_;
        Role role_ = Role::Application;
        bool cacheable_ = true;
    }; // class ObjectDefinition


    // parent 가 병합된 definition 과 생성 중에 채워지는 해석 결과 cache.
    // cache 필드는 creation monitor 안에서만 수정된다.
    struct MergedDefinition {
        std::string name;
        ObjectDefinition definition;

        std::shared_ptr<const ClassMetadata> resolved_type;
        const ConstructorInfo* resolved_constructor = nullptr;
        const FactoryMethodInfo* resolved_factory_method = nullptr;
        bool post_processed = false;

        MergedDefinition(std::string n, ObjectDefinition def)
            : name(std::move(n)), definition(std::move(def)) {}
    };

} // namespace wireup
