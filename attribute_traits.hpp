//
//  attribute_traits.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "attribute.hpp"

namespace fieldmap {

// Keeps a temporary alive for as long as any reference into it is held
using Anchor = std::shared_ptr<const void>;

// Converts a C++ value into an AttributeValue
template<typename T>
struct AttributeTraits;

// Type trait to check if a class has _attribute_map
template<typename T>
struct HasAttributeMap {
private:
    template<typename C>
    static auto test(int) -> decltype(C::_attribute_map(), std::true_type{});

    template<typename>
    static auto test(...) -> std::false_type;

public:
    static constexpr bool value = decltype(test<T>(0))::value;
};

// Type trait to check if a class has _attribute_base_types
template<typename T>
struct HasAttributeBases {
private:
    template<typename C>
    static auto test(int) -> decltype(std::void_t<typename C::_attribute_base_types>(), std::true_type{});

    template<typename>
    static auto test(...) -> std::false_type;

public:
    static constexpr bool value = decltype(test<T>(0))::value;
};

template<typename T>
inline constexpr bool has_attribute_map_v = HasAttributeMap<T>::value;

// |value| must outlive the result when it holds declared structs; |anchor| can own it
template<typename T>
AttributeValue make_value(const T& value, const Anchor& anchor = nullptr) {
    return AttributeTraits<std::decay_t<T>>::to_value(value, anchor);
}

// Temporaries are moved into a holder that every reference into them keeps alive
template<typename T>
    requires(!std::is_lvalue_reference_v<T>)
AttributeValue make_value(T&& value) {
    auto holder = std::make_shared<std::decay_t<T>>(std::move(value));
    return AttributeTraits<std::decay_t<T>>::to_value(*holder, holder);
}

// SourceObject view over a struct that declares its attributes.
// Holds a pointer to the struct; |anchor| owns it when it is a temporary.
template<typename T>
class BoundObject : public SourceObject {
public:
    BoundObject(const T* object, Anchor anchor)
        : object_(object), anchor_(std::move(anchor)) {}

    std::optional<AttributeValue> get_attribute(std::string_view name) const override {
        return lookup<T>(*object_, name);
    }

    const T& object() const { return *object_; }

    std::string type_name() const override {
        if constexpr (requires { T::_attribute_type_name(); }) {
            return T::_attribute_type_name();
        } else {
            return "object";
        }
    }

private:
    // Own attributes shadow those inherited from declared bases
    template<typename C>
    std::optional<AttributeValue> lookup(const C& obj, std::string_view name) const {
        if constexpr (HasAttributeMap<C>::value) {
            auto found = lookup_in_map(obj, name, C::_attribute_map());
            if (found) {
                return found;
            }
        }
        if constexpr (HasAttributeBases<C>::value) {
            using BaseTypes = typename C::_attribute_base_types;
            return [&]<size_t... Is>(std::index_sequence<Is...>) {
                std::optional<AttributeValue> result;
                ((result ? void()
                         : void(result = lookup<std::tuple_element_t<Is, BaseTypes>>(
                                    static_cast<const std::tuple_element_t<Is, BaseTypes>&>(obj), name))),
                 ...);
                return result;
            }(std::make_index_sequence<std::tuple_size_v<BaseTypes>>{});
        }
        return std::nullopt;
    }

    template<typename C, typename... Args>
    std::optional<AttributeValue> lookup_in_map(const C& obj, std::string_view name,
                                                const std::tuple<Args...>& attributes) const {
        return [&]<size_t... I>(std::index_sequence<I...>) {
            std::optional<AttributeValue> result;
            ((!result && name == std::get<I * 2>(attributes)
                  ? void(result = read_member(obj, std::get<I * 2 + 1>(attributes)))
                  : void()),
             ...);
            return result;
        }(std::make_index_sequence<sizeof...(Args) / 2>{});
    }

    template<typename C, typename Member>
    AttributeValue read_member(const C& obj, Member member) const {
        if constexpr (std::is_member_function_pointer_v<Member>) {
            // Accessor results are temporaries: anchor them so nested references stay valid
            using Result = std::decay_t<std::invoke_result_t<Member, const C&>>;
            auto holder = std::make_shared<Result>(std::invoke(member, obj));
            return make_value(*holder, holder);
        } else {
            return make_value(obj.*member, anchor_);
        }
    }

    const T* object_;
    Anchor anchor_;
};

// Wraps a declared struct as an ObjectRef without copying it
template<typename T>
    requires HasAttributeMap<T>::value || HasAttributeBases<T>::value
ObjectRef make_object(const T& object, Anchor anchor = nullptr) {
    return std::make_shared<BoundObject<T>>(&object, std::move(anchor));
}

// A temporary would dangle; use make_owned_object
template<typename T>
    requires(!std::is_lvalue_reference_v<T>) &&
            (HasAttributeMap<std::decay_t<T>>::value || HasAttributeBases<std::decay_t<T>>::value)
ObjectRef make_object(T&& object, Anchor anchor = nullptr) = delete;

// Moves a temporary struct into an ObjectRef that owns it
template<typename T>
    requires HasAttributeMap<T>::value || HasAttributeBases<T>::value
ObjectRef make_owned_object(T object) {
    auto holder = std::make_shared<T>(std::move(object));
    return std::make_shared<BoundObject<T>>(holder.get(), holder);
}

// Typed view of a bound struct, nullptr when |value| is not a BoundObject<T>
template<typename T>
const T* object_cast(const AttributeValue& value) {
    const auto* ref = value.get_if<ObjectRef>();
    if (ref == nullptr) {
        return nullptr;
    }
    const auto* bound = dynamic_cast<const BoundObject<T>*>(ref->get());
    return bound ? &bound->object() : nullptr;
}

// Generic container conversion template to reduce code duplication
template<typename Container>
struct GenericListTraits {
    static AttributeValue to_value(const Container& value, const Anchor& anchor) {
        AttributeValue::List items;
        items.reserve(value.size());
        for (const auto& item : value) {
            items.push_back(make_value(item, anchor));
        }
        return AttributeValue(std::move(items));
    }
};

// Generic map conversion template; keys must be strings or integers
template<typename Map>
struct GenericMapTraits {
    static AttributeValue to_value(const Map& value, const Anchor& anchor) {
        AttributeValue::Map entries;
        entries.reserve(value.size());
        for (const auto& [key, item] : value) {
            if constexpr (std::is_integral_v<std::decay_t<decltype(key)>>) {
                entries.push_back({std::to_string(key), make_value(item, anchor)});
            } else {
                entries.push_back({std::string(key), make_value(item, anchor)});
            }
        }
        return AttributeValue(std::move(entries));
    }
};

// Generic smart pointer conversion template
template<typename SmartPtr>
struct GenericSmartPtrTraits {
    static AttributeValue to_value(const SmartPtr& value, const Anchor& anchor) {
        if (!value) {
            return AttributeValue();
        }
        return make_value(*value, anchor);
    }
};

// Basic type conversion
template<typename T>
struct BasicTypeTraits {
    static AttributeValue to_value(const T& value, const Anchor&) {
        if constexpr (std::is_same_v<T, bool>) {
            return AttributeValue(value);
        } else if constexpr (std::is_integral_v<T>) {
            return AttributeValue(static_cast<std::int64_t>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            return AttributeValue(static_cast<double>(value));
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
            return AttributeValue(std::string(value));
        } else {
            static_assert(std::is_same_v<T, void>, "Unsupported basic type");
            return AttributeValue();
        }
    }
};

template<typename T>
    requires std::is_arithmetic_v<T> || std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>
struct AttributeTraits<T> : BasicTypeTraits<T> {};

template<>
struct AttributeTraits<const char*> {
    static AttributeValue to_value(const char* value, const Anchor&) {
        return value ? AttributeValue(value) : AttributeValue();
    }
};

// Enums are exposed by their underlying integer
template<typename T>
    requires std::is_enum_v<T>
struct AttributeTraits<T> {
    static AttributeValue to_value(const T& value, const Anchor&) {
        return AttributeValue(static_cast<std::int64_t>(static_cast<std::underlying_type_t<T>>(value)));
    }
};

template<>
struct AttributeTraits<Date> {
    static AttributeValue to_value(const Date& value, const Anchor&) {
        return AttributeValue(value);
    }
};

template<>
struct AttributeTraits<std::chrono::sys_days> {
    static AttributeValue to_value(const std::chrono::sys_days& value, const Anchor&) {
        return AttributeValue(Date(value));
    }
};

template<typename Duration>
    requires(!std::is_same_v<Duration, std::chrono::days>)
struct AttributeTraits<std::chrono::sys_time<Duration>> {
    static AttributeValue to_value(const std::chrono::sys_time<Duration>& value, const Anchor&) {
        return AttributeValue(std::chrono::time_point_cast<std::chrono::microseconds>(value));
    }
};

template<>
struct AttributeTraits<AttributeValue> {
    static AttributeValue to_value(const AttributeValue& value, const Anchor&) {
        return value;
    }
};

template<>
struct AttributeTraits<ObjectRef> {
    static AttributeValue to_value(const ObjectRef& value, const Anchor&) {
        return AttributeValue(value);
    }
};

template<typename T>
struct AttributeTraits<std::optional<T>> {
    static AttributeValue to_value(const std::optional<T>& value, const Anchor& anchor) {
        if (!value.has_value()) {
            return AttributeValue();
        }
        return make_value(value.value(), anchor);
    }
};

template<typename T>
struct AttributeTraits<std::vector<T>> : GenericListTraits<std::vector<T>> {};

template<typename T>
struct AttributeTraits<std::list<T>> : GenericListTraits<std::list<T>> {};

template<typename T>
struct AttributeTraits<std::deque<T>> : GenericListTraits<std::deque<T>> {};

template<typename T>
struct AttributeTraits<std::set<T>> : GenericListTraits<std::set<T>> {};

template<typename T, std::size_t N>
struct AttributeTraits<std::array<T, N>> : GenericListTraits<std::array<T, N>> {};

template<typename K, typename V>
struct AttributeTraits<std::map<K, V>> : GenericMapTraits<std::map<K, V>> {};

template<typename K, typename V>
struct AttributeTraits<std::unordered_map<K, V>> : GenericMapTraits<std::unordered_map<K, V>> {};

template<typename T>
struct AttributeTraits<std::unique_ptr<T>> : GenericSmartPtrTraits<std::unique_ptr<T>> {};

template<typename T>
    requires(!std::is_base_of_v<SourceObject, T>)
struct AttributeTraits<std::shared_ptr<T>> : GenericSmartPtrTraits<std::shared_ptr<T>> {};

template<typename T>
    requires std::is_base_of_v<SourceObject, T>
struct AttributeTraits<std::shared_ptr<T>> {
    static AttributeValue to_value(const std::shared_ptr<T>& value, const Anchor&) {
        return AttributeValue(ObjectRef(value));
    }
};

// Declared structs become object references
template<typename T>
    requires HasAttributeMap<T>::value || HasAttributeBases<T>::value
struct AttributeTraits<T> {
    static AttributeValue to_value(const T& value, const Anchor& anchor) {
        return AttributeValue(make_object(value, anchor));
    }
};

}

// Attribute registration - declares name/member pairs in the public section of a struct.
// Members may be data members or const accessors taking no arguments.
#define DECLARE_FIELDMAP_ATTRIBUTES(...) \
static constexpr auto _attribute_map() { \
        return std::make_tuple(__VA_ARGS__); \
} \
    \
    template<typename FriendT> \
    friend class fieldmap::BoundObject;

// Macro to declare base classes whose attributes are inherited
#define INHERIT_FIELDMAP_ATTRIBUTES(...) \
using _attribute_base_types = std::tuple<__VA_ARGS__>; \
    template<typename FriendT> \
    friend class fieldmap::BoundObject;

// Name reported in missing attribute errors
#define FIELDMAP_TYPE_NAME(Name) \
static std::string _attribute_type_name() { \
        return Name; \
}
