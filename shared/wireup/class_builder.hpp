#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "aop/advisor.hpp"
#include "aop/aop_proxy.hpp"
#include "class_metadata.hpp"
#include "lifecycle.hpp"
#include "object.hpp"
#include "post_processor.hpp"
#include "type_info.hpp"

namespace wireup {

    namespace detail {

        template<typename T>
        struct is_shared_ptr : std::false_type {};
        template<typename U>
        struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

        template<typename T>
        struct is_object_vector : std::false_type {};
        template<typename U>
        struct is_object_vector<std::vector<std::shared_ptr<U>>> : std::true_type {};

        // literal
        template<typename A, typename = void>
        struct ParamTraits {
            static constexpr ParamKind kind = ParamKind::Simple;
            static TypeId type() { return getTypeId<A>(); }

            static bool accepts(const Value& v)
            {
                return v.kind() == Value::Kind::Literal && convertLiteral<A>(v.asLiteral()).has_value();
            }

            static A convert(const Value& v)
            {
                auto converted = convertLiteral<A>(v.asLiteral());
                if (!converted) {
                    throw std::invalid_argument(fmt::format("cannot convert {} to {}", v.describe(), type().name()));
                }
                return *converted;
            }
        };

        // std::shared_ptr<U>
        template<typename U>
        struct ParamTraits<std::shared_ptr<U>, void> {
            static constexpr ParamKind kind = ParamKind::Object;
            static TypeId type() { return getTypeId<U>(); }

            static bool accepts(const Value& v)
            {
                return v.isNull() || (v.kind() == Value::Kind::Object && v.asObject().isA(type()));
            }

            static std::shared_ptr<U> convert(const Value& v)
            {
                if (v.isNull()) return nullptr;
                if (v.kind() != Value::Kind::Object || !v.asObject().isA(type())) {
                    throw std::invalid_argument(fmt::format("cannot convert {} to {}", v.describe(), type().name()));
                }
                return v.asObject().template as<U>();
            }
        };

        // std::vector<std::shared_ptr<U>>
        template<typename U>
        struct ParamTraits<std::vector<std::shared_ptr<U>>, void> {
            static constexpr ParamKind kind = ParamKind::Collection;
            static TypeId type() { return getTypeId<U>(); }

            static bool accepts(const Value& v)
            {
                switch (v.kind()) {
                    case Value::Kind::Null:   return true;
                    case Value::Kind::Object: return v.asObject().isA(type());
                    case Value::Kind::List:
                        for (const auto& o : v.asList()) {
                            if (!o.isA(type())) return false;
                        }
                        return true;
                    default:
                        return false;
                }
            }

            static std::vector<std::shared_ptr<U>> convert(const Value& v)
            {
                if (!accepts(v)) {
                    throw std::invalid_argument(fmt::format("cannot convert {} to vector of {}", v.describe(), type().name()));
                }
                std::vector<std::shared_ptr<U>> out;
                if (v.kind() == Value::Kind::Object) {
                    out.push_back(v.asObject().template as<U>());
                } else if (v.kind() == Value::Kind::List) {
                    for (const auto& o : v.asList()) out.push_back(o.template as<U>());
                }
                return out;
            }
        };

        // wireup::Object
        template<>
        struct ParamTraits<Object, void> {
            static constexpr ParamKind kind = ParamKind::Generic;
            static TypeId type() { return getTypeId<Object>(); }

            static bool accepts(const Value& v)
            {
                return v.isNull() || v.kind() == Value::Kind::Object;
            }

            static Object convert(const Value& v)
            {
                return v.asObject();
            }
        };

        template<typename A>
        ParamInfo makeParam()
        {
            using Traits = ParamTraits<std::decay_t<A>>;
            ParamInfo info;
            info.kind = Traits::kind;
            info.type = Traits::type();
            info.accepts = &Traits::accepts;
            return info;
        }

        template<typename... Args>
        std::vector<ParamInfo> makeParams()
        {
            return { makeParam<Args>()... };
        }

        template<typename... Args>
        std::string signatureOf()
        {
            std::vector<std::string> names{ getTypeId<std::decay_t<Args>>().name()... };
            return "(" + joinPath(names, ", ") + ")";
        }

        template<typename A>
        decltype(auto) convertArg(const Value& v)
        {
            return ParamTraits<std::decay_t<A>>::convert(v);
        }

        template<typename T, typename... Args, size_t... I>
        std::shared_ptr<void> construct(const std::vector<Value>& args, std::index_sequence<I...>)
        {
            return std::make_shared<T>(convertArg<Args>(args.at(I))...);
        }

        template<typename R, typename... Args, size_t... I>
        std::shared_ptr<void> callStatic(std::shared_ptr<R> (*fn)(Args...), const std::vector<Value>& args,
                                         std::index_sequence<I...>)
        {
            return fn(convertArg<Args>(args.at(I))...);
        }

        template<typename T, typename R, typename... Args, size_t... I>
        std::shared_ptr<void> callMember(T* self, std::shared_ptr<R> (T::*fn)(Args...), const std::vector<Value>& args,
                                         std::index_sequence<I...>)
        {
            return (self->*fn)(convertArg<Args>(args.at(I))...);
        }

        template<typename From, typename To>
        Caster upcast()
        {
            return [](const std::shared_ptr<void>& p) -> std::shared_ptr<void> {
                std::shared_ptr<To> to = std::static_pointer_cast<From>(p);
                return to;
            };
        }

    } // namespace detail


    // ClassMetadata 를 채우는 fluent builder.
    //   types.define<Service>("Service")
    //        .implements<IService>()
    //        .constructor<std::shared_ptr<Repo>>()
    //        .property("timeout", &Service::setTimeout)
    //        .method("init", &Service::init);
    template<typename T>
    class ClassBuilder
    {
    public:
        explicit ClassBuilder(std::shared_ptr<ClassMetadata> metadata)
            : metadata_(std::move(metadata))
        {
            if constexpr (std::is_abstract_v<T>) {
                metadata_->setInterface(true);
            }
            if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>) {
                constructor<>();
            }
            detectFrameworkInterfaces();
        }

        template<typename I>
        ClassBuilder& implements()
        {
            static_assert(std::is_base_of_v<I, T>, "T must derive from I");
            metadata_->addInterface(getTypeId<I>(), detail::upcast<T, I>());
            return *this;
        }

        template<typename... Args>
        ClassBuilder& constructor()
        {
            static_assert(std::is_constructible_v<T, Args...>, "no matching constructor");
            ConstructorInfo ctor;
            ctor.params = detail::makeParams<Args...>();
            ctor.signature = detail::signatureOf<Args...>();
            ctor.invoke = [](const std::vector<Value>& args) {
                return detail::construct<T, Args...>(args, std::index_sequence_for<Args...>{});
            };
            metadata_->addConstructor(std::move(ctor));
            return *this;
        }

        template<typename A>
        ClassBuilder& property(const std::string& name, void (T::*setter)(A))
        {
            PropertyInfo prop;
            prop.name = name;
            prop.param = detail::makeParam<A>();
            prop.setter = [setter](void* self, const Value& v) {
                (static_cast<T*>(self)->*setter)(detail::convertArg<A>(v));
            };
            metadata_->addProperty(std::move(prop));
            return *this;
        }

        template<typename M>
        ClassBuilder& field(const std::string& name, M T::*member)
        {
            PropertyInfo prop;
            prop.name = name;
            prop.param = detail::makeParam<M>();
            prop.setter = [member](void* self, const Value& v) {
                static_cast<T*>(self)->*member = detail::convertArg<M>(v);
            };
            metadata_->addProperty(std::move(prop));
            return *this;
        }

        template<typename R>
        ClassBuilder& method(const std::string& name, R (T::*fn)())
        {
            metadata_->addMethod(name, [fn](void* self) { (static_cast<T*>(self)->*fn)(); });
            return *this;
        }

        template<typename R, typename... Args>
        ClassBuilder& staticFactory(const std::string& name, std::shared_ptr<R> (*fn)(Args...))
        {
            FactoryMethodInfo info;
            info.name = name;
            info.is_static = true;
            info.params = detail::makeParams<Args...>();
            info.returns = getTypeId<R>();
            info.invoke = [fn](void*, const std::vector<Value>& args) {
                return detail::callStatic(fn, args, std::index_sequence_for<Args...>{});
            };
            metadata_->addFactoryMethod(std::move(info));
            return *this;
        }

        template<typename R, typename... Args>
        ClassBuilder& factoryMethod(const std::string& name, std::shared_ptr<R> (T::*fn)(Args...))
        {
            FactoryMethodInfo info;
            info.name = name;
            info.is_static = false;
            info.params = detail::makeParams<Args...>();
            info.returns = getTypeId<R>();
            info.invoke = [fn](void* self, const std::vector<Value>& args) {
                return detail::callMember(static_cast<T*>(self), fn, args, std::index_sequence_for<Args...>{});
            };
            metadata_->addFactoryMethod(std::move(info));
            return *this;
        }

        // class 기반 proxy stub. P 는 T 와 aop::ProxyHandle<T> 를 상속한다.
        template<typename P>
        ClassBuilder& subclassProxy()
        {
            static_assert(std::is_base_of_v<T, P>, "subclass proxy must derive from the target class");
            metadata_->setSubclassProxy(makeStub<P>("$$SubclassProxy"));
            return *this;
        }

        // interface 기반 proxy stub. T 는 interface 이고 P 는 T 를 구현한다.
        template<typename P>
        ClassBuilder& interfaceProxy()
        {
            static_assert(std::is_base_of_v<T, P>, "interface proxy must implement the interface");
            metadata_->setInterfaceProxy(makeStub<P>("$$InterfaceProxy"));
            return *this;
        }

        ClassBuilder& marker()
        {
            metadata_->setMarker(true);
            metadata_->setInterface(true);
            return *this;
        }

        template<typename R>
        ClassBuilder& produces()
        {
            metadata_->setProducedType(getTypeId<R>());
            return *this;
        }

        std::shared_ptr<ClassMetadata> metadata() const { return metadata_; }

    private:
        template<typename P>
        ProxyStub makeStub(const char* suffix)
        {
            static_assert(std::is_base_of_v<aop::ProxyInstance, P>, "proxy stub must derive from aop::ProxyHandle");
            auto stub_metadata = std::make_shared<ClassMetadata>(metadata_->name() + suffix, getTypeId<P>());
            ClassBuilder<P> stub(stub_metadata);
            stub.template implements<T>();
            stub_metadata->setProxyClass(true);

            ProxyStub result;
            result.metadata = stub_metadata;
            result.make = [](const std::shared_ptr<aop::InvocationDispatcher>& dispatcher) -> std::shared_ptr<void> {
                return std::make_shared<P>(dispatcher);
            };
            return result;
        }

        template<typename I>
        void detectInterface()
        {
            if constexpr (std::is_base_of_v<I, T> && !std::is_same_v<I, T>) {
                metadata_->addInterface(getTypeId<I>(), detail::upcast<T, I>());
            }
        }

        void detectFrameworkInterfaces()
        {
            detectInterface<InitializingObject>();
            detectInterface<DisposableObject>();
            detectInterface<NameAware>();
            detectInterface<ContainerAware>();
            detectInterface<Ordered>();
            detectInterface<PriorityOrdered>();
            detectInterface<FactoryObject>();
            detectInterface<EventSubscriber>();
            detectInterface<PostProcessor>();
            detectInterface<LifecycleHook>();
            detectInterface<InstantiationHook>();
            detectInterface<PropertyHook>();
            detectInterface<EarlyReferenceHook>();
            detectInterface<ContainerPostProcessor>();
            detectInterface<DefinitionRegistryPostProcessor>();
            detectInterface<aop::Advisor>();
            detectInterface<aop::Aspect>();
            detectInterface<aop::MethodInterceptor>();
            detectInterface<aop::Advised>();
            detectInterface<aop::ProxyInstance>();
        }

        std::shared_ptr<ClassMetadata> metadata_;
    }; // class ClassBuilder

    // 컨테이너가 callback 으로만 사용하는 interface. proxy 대상 interface 에서 제외된다.
    bool isFrameworkInterface(TypeId type);

} // namespace wireup
