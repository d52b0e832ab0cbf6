//
//  attribute.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fieldmap {

using Date = std::chrono::year_month_day;
using DateTime = std::chrono::sys_time<std::chrono::microseconds>;

class SourceObject;
using ObjectRef = std::shared_ptr<const SourceObject>;

// A value read from a source object, before any field coercion
class AttributeValue {
public:
    struct Entry;
    using List = std::vector<AttributeValue>;
    using Map = std::vector<Entry>;  // Insertion ordered, looked up linearly

    enum class Type {
        NONE,
        BOOL,
        INT,
        DOUBLE,
        STRING,
        DATE,
        DATETIME,
        OBJECT,
        LIST,
        MAP
    };

    AttributeValue() = default;
    AttributeValue(std::nullptr_t) {}
    AttributeValue(bool value) : storage_(value) {}

    template<typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
    AttributeValue(T value) : storage_(static_cast<std::int64_t>(value)) {}

    AttributeValue(float value) : storage_(static_cast<double>(value)) {}
    AttributeValue(double value) : storage_(value) {}
    AttributeValue(const char* value) : storage_(std::string(value)) {}
    AttributeValue(std::string_view value) : storage_(std::string(value)) {}
    AttributeValue(std::string value) : storage_(std::move(value)) {}
    AttributeValue(Date value) : storage_(value) {}
    AttributeValue(DateTime value) : storage_(value) {}
    AttributeValue(ObjectRef value);
    AttributeValue(List value);
    AttributeValue(Map value);

    static AttributeValue list(std::initializer_list<AttributeValue> items);
    static AttributeValue map(std::initializer_list<Entry> entries);

    Type type() const {
        return static_cast<Type>(storage_.index());
    }

    bool is_null() const { return type() == Type::NONE; }

    template<typename T>
    const T* get_if() const {
        return std::get_if<T>(&storage_);
    }

    // Name used in error messages, e.g. "'int' object has no attribute 'email'"
    std::string type_name() const;

    bool operator==(const AttributeValue& other) const;

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 Date,
                 DateTime,
                 ObjectRef,
                 List,
                 Map> storage_;
};

struct AttributeValue::Entry {
    std::string name;
    AttributeValue value;

    bool operator==(const Entry& other) const = default;
};

inline AttributeValue::AttributeValue(ObjectRef value) {
    if (value) {
        storage_.emplace<ObjectRef>(std::move(value));
    }
}

inline AttributeValue::AttributeValue(List value) : storage_(std::in_place_type<List>, std::move(value)) {}

inline AttributeValue::AttributeValue(Map value) : storage_(std::in_place_type<Map>, std::move(value)) {}

inline AttributeValue AttributeValue::list(std::initializer_list<AttributeValue> items) {
    return AttributeValue(List(items));
}

inline AttributeValue AttributeValue::map(std::initializer_list<Entry> entries) {
    return AttributeValue(Map(entries));
}

// Attribute access capability required from anything being serialized
class SourceObject {
public:
    virtual ~SourceObject() = default;

    // std::nullopt when the object has no attribute with this name
    virtual std::optional<AttributeValue> get_attribute(std::string_view name) const = 0;

    virtual std::string type_name() const {
        return "object";
    }
};

// Reads one attribute from an object or a map value.
// Objects report an absent attribute as std::nullopt; maps report an absent key as null.
std::optional<AttributeValue> get_attribute(const AttributeValue& target, std::string_view name);

// Follows a dotted path such as "author.profile.name". Null along the way counts as missing.
std::optional<AttributeValue> get_attribute_path(const AttributeValue& target, std::string_view path);

}
