#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "object.hpp"
#include "type_info.hpp"

namespace wireup {

    namespace aop { class InvocationDispatcher; }

    // 생성자 인자 / property 의 종류
    enum class ParamKind {
        Simple,       // literal (int, std::string, ...)
        Object,       // std::shared_ptr<U>
        Collection,   // std::vector<std::shared_ptr<U>>
        Generic       // wireup::Object, autowiring 대상이 아니다
    };

    const char* to_string(ParamKind kind);

    struct ParamInfo {
        ParamKind kind = ParamKind::Simple;
        // Simple: literal 타입, Object / Collection: 원소 타입
        TypeId type;
        std::function<bool(const Value&)> accepts;
    };

    struct ConstructorInfo {
        std::vector<ParamInfo> params;
        std::function<std::shared_ptr<void>(const std::vector<Value>&)> invoke;
        std::string signature;
    };

    struct PropertyInfo {
        std::string name;
        ParamInfo param;
        std::function<void(void*, const Value&)> setter;
    };

    struct FactoryMethodInfo {
        std::string name;
        bool is_static = false;
        std::vector<ParamInfo> params;
        TypeId returns;
        // factory: 인스턴스 factory method 의 대상 (static 이면 nullptr)
        std::function<std::shared_ptr<void>(void* factory, const std::vector<Value>&)> invoke;
    };

    using Caster = std::function<std::shared_ptr<void>(const std::shared_ptr<void>&)>;
    using ProxyStubMaker = std::function<std::shared_ptr<void>(const std::shared_ptr<aop::InvocationDispatcher>&)>;

    class ClassMetadata;

    // 사용자가 작성한 proxy stub 클래스와 그 생성 함수
    struct ProxyStub {
        std::shared_ptr<const ClassMetadata> metadata;
        ProxyStubMaker make;

        explicit operator bool() const { return metadata && make; }
    };

    // 컨테이너가 참조하는 클래스 정보.
    // ClassBuilder 로 정의되고, 첫 인스턴스 생성 이후에는 읽기 전용으로 취급한다.
    class ClassMetadata
    {
    public:
        ClassMetadata(std::string name, TypeId id);

        const std::string& name() const { return name_; }
        TypeId id() const { return id_; }

        bool isInterface() const { return is_interface_; }
        bool isMarker() const { return is_marker_; }
        bool isProxyClass() const { return is_proxy_class_; }

        // implements<I>() 로 선언된 인터페이스 (선언 순서)
        const std::vector<TypeId>& interfaces() const { return interfaces_; }
        bool isAssignableTo(TypeId type) const;
        std::shared_ptr<void> cast(const std::shared_ptr<void>& ptr, TypeId target) const;

        const std::vector<ConstructorInfo>& constructors() const { return constructors_; }
        const ConstructorInfo* defaultConstructor() const;

        // 이름 순으로 정렬된 writable property 목록
        const std::map<std::string, PropertyInfo>& properties() const { return properties_; }
        const PropertyInfo* findProperty(const std::string& name) const;

        const std::function<void(void*)>* findMethod(const std::string& name) const;

        std::vector<const FactoryMethodInfo*> findFactoryMethods(const std::string& name) const;

        // FactoryObject 의 product 타입 (선언된 경우)
        TypeId producedType() const { return produced_type_; }

        const ProxyStub& subclassProxy() const { return subclass_proxy_; }
        const ProxyStub& interfaceProxy() const { return interface_proxy_; }

        // --- definition (ClassBuilder / proxy 생성 시 사용) ---
        void addInterface(TypeId type, Caster caster);
        void addConstructor(ConstructorInfo ctor);
        void addProperty(PropertyInfo property);
        void addMethod(const std::string& name, std::function<void(void*)> method);
        void addFactoryMethod(FactoryMethodInfo method);
        void setInterface(bool value) { is_interface_ = value; }
        void setMarker(bool value) { is_marker_ = value; }
        void setProxyClass(bool value) { is_proxy_class_ = value; }
        void setProducedType(TypeId type) { produced_type_ = type; }
        void setSubclassProxy(ProxyStub stub) { subclass_proxy_ = std::move(stub); }
        void setInterfaceProxy(ProxyStub stub) { interface_proxy_ = std::move(stub); }
        void rename(const std::string& name) { name_ = name; }

    private:
        std::string name_;
        TypeId id_;
        bool is_interface_ = false;
        bool is_marker_ = false;
        bool is_proxy_class_ = false;
        std::vector<TypeId> interfaces_;
        std::unordered_map<TypeId, Caster> casters_;
        std::vector<ConstructorInfo> constructors_;
        std::map<std::string, PropertyInfo> properties_;
        std::unordered_map<std::string, std::function<void(void*)>> methods_;
        std::multimap<std::string, FactoryMethodInfo> factory_methods_;
        TypeId produced_type_;
        ProxyStub subclass_proxy_;
        ProxyStub interface_proxy_;
    }; // class ClassMetadata

} // namespace wireup
