//
//  attribute.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "attribute.hpp"

namespace fieldmap {

std::string AttributeValue::type_name() const {
    switch (type()) {
    case Type::NONE:
        return "null";
    case Type::BOOL:
        return "bool";
    case Type::INT:
        return "int";
    case Type::DOUBLE:
        return "float";
    case Type::STRING:
        return "str";
    case Type::DATE:
        return "date";
    case Type::DATETIME:
        return "datetime";
    case Type::OBJECT:
        return (*get_if<ObjectRef>())->type_name();
    case Type::LIST:
        return "list";
    case Type::MAP:
        return "dict";
    }
    return "unknown";
}

bool AttributeValue::operator==(const AttributeValue& other) const {
    return storage_ == other.storage_;
}

std::optional<AttributeValue> get_attribute(const AttributeValue& target, std::string_view name) {
    if (const auto* object = target.get_if<ObjectRef>()) {
        return (*object)->get_attribute(name);
    }
    if (const auto* map = target.get_if<AttributeValue::Map>()) {
        for (const auto& entry : *map) {
            if (entry.name == name) {
                return entry.value;
            }
        }
        // Maps behave like dict.get(): an absent key reads as null
        return AttributeValue();
    }
    return std::nullopt;
}

std::optional<AttributeValue> get_attribute_path(const AttributeValue& target, std::string_view path) {
    std::optional<AttributeValue> current;
    const AttributeValue* cursor = &target;

    std::size_t start = 0;
    while (true) {
        std::size_t dot = path.find('.', start);
        std::string_view component = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (component.empty() || cursor->is_null()) {
            return std::nullopt;
        }

        auto next = get_attribute(*cursor, component);
        if (!next || dot == std::string_view::npos) {
            return next;
        }
        current = std::move(next);

        cursor = &*current;
        start = dot + 1;
    }
}

}
