//
//  field.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "field.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>

#include "datetime_format.hpp"
#include "schema.hpp"
#include "serializer.hpp"

namespace fieldmap {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

SerializeError coercion_error(const AttributeValue& value, const std::string& target) {
    return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                      "cannot coerce " + value.type_name() + " to " + target);
}

void set_string(rapidjson::Value& out, const std::string& value, rapidjson::Document::AllocatorType& allocator) {
    out.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), allocator);
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string double_to_string(double value) {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, end);
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    std::int64_t result = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> parse_double(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    double result = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> parse_bool(std::string_view text) {
    std::string lowered(trim(text));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "0") {
        return false;
    }
    return std::nullopt;
}

SerializeError coerce_char(const AttributeValue& value, rapidjson::Value& out,
                           rapidjson::Document::AllocatorType& allocator) {
    switch (value.type()) {
    case AttributeValue::Type::STRING:
        set_string(out, *value.get_if<std::string>(), allocator);
        return {};
    case AttributeValue::Type::BOOL:
        set_string(out, *value.get_if<bool>() ? "true" : "false", allocator);
        return {};
    case AttributeValue::Type::INT:
        set_string(out, std::to_string(*value.get_if<std::int64_t>()), allocator);
        return {};
    case AttributeValue::Type::DOUBLE:
        set_string(out, double_to_string(*value.get_if<double>()), allocator);
        return {};
    case AttributeValue::Type::DATE: {
        auto [text, error] = format_date(*value.get_if<Date>());
        if (error.has_error()) {
            return error;
        }
        set_string(out, text, allocator);
        return {};
    }
    case AttributeValue::Type::DATETIME: {
        auto [text, error] = format_datetime(*value.get_if<DateTime>());
        if (error.has_error()) {
            return error;
        }
        set_string(out, text, allocator);
        return {};
    }
    default:
        return coercion_error(value, "string");
    }
}

SerializeError coerce_integer(const AttributeValue& value, rapidjson::Value& out) {
    switch (value.type()) {
    case AttributeValue::Type::INT:
        out.SetInt64(*value.get_if<std::int64_t>());
        return {};
    case AttributeValue::Type::BOOL:
        out.SetInt64(*value.get_if<bool>() ? 1 : 0);
        return {};
    case AttributeValue::Type::DOUBLE: {
        double number = std::trunc(*value.get_if<double>());
        // 2^63 is exactly representable; anything at or beyond it does not fit
        if (!std::isfinite(number) || number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
            return coercion_error(value, "integer");
        }
        out.SetInt64(static_cast<std::int64_t>(number));
        return {};
    }
    case AttributeValue::Type::STRING: {
        auto parsed = parse_integer(*value.get_if<std::string>());
        if (!parsed) {
            return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                              "invalid literal for integer: '" + *value.get_if<std::string>() + "'");
        }
        out.SetInt64(*parsed);
        return {};
    }
    default:
        return coercion_error(value, "integer");
    }
}

SerializeError coerce_float(const AttributeValue& value, rapidjson::Value& out) {
    std::optional<double> number;
    switch (value.type()) {
    case AttributeValue::Type::DOUBLE:
        number = *value.get_if<double>();
        break;
    case AttributeValue::Type::INT:
        number = static_cast<double>(*value.get_if<std::int64_t>());
        break;
    case AttributeValue::Type::BOOL:
        number = *value.get_if<bool>() ? 1.0 : 0.0;
        break;
    case AttributeValue::Type::STRING:
        number = parse_double(*value.get_if<std::string>());
        if (!number) {
            return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                              "could not convert string to float: '" + *value.get_if<std::string>() + "'");
        }
        break;
    default:
        return coercion_error(value, "float");
    }
    if (!std::isfinite(*number)) {
        return make_error(SerializeError::ErrorCode::COERCION_ERROR, "non-finite float cannot be serialized");
    }
    out.SetDouble(*number);
    return {};
}

SerializeError coerce_boolean(const AttributeValue& value, rapidjson::Value& out) {
    switch (value.type()) {
    case AttributeValue::Type::BOOL:
        out.SetBool(*value.get_if<bool>());
        return {};
    case AttributeValue::Type::INT:
        out.SetBool(*value.get_if<std::int64_t>() != 0);
        return {};
    case AttributeValue::Type::DOUBLE:
        out.SetBool(*value.get_if<double>() != 0.0);
        return {};
    case AttributeValue::Type::STRING: {
        auto parsed = parse_bool(*value.get_if<std::string>());
        if (!parsed) {
            return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                              "invalid literal for boolean: '" + *value.get_if<std::string>() + "'");
        }
        out.SetBool(*parsed);
        return {};
    }
    default:
        return coercion_error(value, "boolean");
    }
}

SerializeError coerce_date(const AttributeValue& value, const DateField& field, rapidjson::Value& out,
                           rapidjson::Document::AllocatorType& allocator) {
    std::pair<std::string, SerializeError> formatted;
    if (const auto* date = value.get_if<Date>()) {
        formatted = format_date(*date, field.format);
    } else if (const auto* datetime = value.get_if<DateTime>()) {
        formatted = format_date(Date{std::chrono::floor<std::chrono::days>(*datetime)}, field.format);
    } else {
        return coercion_error(value, "date");
    }
    if (formatted.second.has_error()) {
        return formatted.second;
    }
    set_string(out, formatted.first, allocator);
    return {};
}

SerializeError coerce_datetime(const AttributeValue& value, const DateTimeField& field, rapidjson::Value& out,
                               rapidjson::Document::AllocatorType& allocator) {
    std::pair<std::string, SerializeError> formatted;
    if (const auto* datetime = value.get_if<DateTime>()) {
        formatted = format_datetime(*datetime, field.format);
    } else if (const auto* date = value.get_if<Date>()) {
        if (!date->ok()) {
            return format_date(*date).second;
        }
        formatted = format_datetime(DateTime{std::chrono::sys_days{*date}}, field.format);
    } else {
        return coercion_error(value, "datetime");
    }
    if (formatted.second.has_error()) {
        return formatted.second;
    }
    set_string(out, formatted.first, allocator);
    return {};
}

// Accepts 8-4-4-4-12 or 32 bare hex digits and emits the lowercase 8-4-4-4-12 form
std::optional<std::string> canonical_uuid(std::string_view text) {
    text = trim(text);
    std::string digits;
    digits.reserve(32);
    if (text.size() == 36) {
        for (std::size_t i = 0; i < text.size(); ++i) {
            bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
            if (dash_position) {
                if (text[i] != '-') {
                    return std::nullopt;
                }
                continue;
            }
            digits += text[i];
        }
    } else if (text.size() == 32) {
        digits.assign(text);
    } else {
        return std::nullopt;
    }

    std::string result;
    result.reserve(36);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(digits[i]);
        if (!std::isxdigit(c)) {
            return std::nullopt;
        }
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            result += '-';
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

SerializeError coerce_uuid(const AttributeValue& value, rapidjson::Value& out,
                           rapidjson::Document::AllocatorType& allocator) {
    const auto* text = value.get_if<std::string>();
    if (text == nullptr) {
        return coercion_error(value, "uuid");
    }
    auto canonical = canonical_uuid(*text);
    if (!canonical) {
        return make_error(SerializeError::ErrorCode::COERCION_ERROR, "badly formed uuid: '" + *text + "'");
    }
    set_string(out, *canonical, allocator);
    return {};
}

// Integers stay integers; everything else becomes a finite double
SerializeError coerce_number(const AttributeValue& value, rapidjson::Value& out) {
    switch (value.type()) {
    case AttributeValue::Type::INT:
        out.SetInt64(*value.get_if<std::int64_t>());
        return {};
    case AttributeValue::Type::BOOL:
        out.SetInt64(*value.get_if<bool>() ? 1 : 0);
        return {};
    case AttributeValue::Type::DOUBLE:
        return coerce_float(value, out);
    case AttributeValue::Type::STRING: {
        if (auto integer = parse_integer(*value.get_if<std::string>())) {
            out.SetInt64(*integer);
            return {};
        }
        return coerce_float(value, out);
    }
    default:
        return coercion_error(value, "number");
    }
}

SerializeError coerce_decimal(const AttributeValue& value, const DecimalField& field, rapidjson::Value& out,
                              rapidjson::Document::AllocatorType& allocator) {
    std::optional<double> number;
    std::string text;
    switch (value.type()) {
    case AttributeValue::Type::INT:
        number = static_cast<double>(*value.get_if<std::int64_t>());
        text = std::to_string(*value.get_if<std::int64_t>());
        break;
    case AttributeValue::Type::DOUBLE:
        number = *value.get_if<double>();
        text = double_to_string(*number);
        break;
    case AttributeValue::Type::STRING:
        number = parse_double(*value.get_if<std::string>());
        if (!number) {
            return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                              "invalid literal for decimal: '" + *value.get_if<std::string>() + "'");
        }
        // Strings keep their digits exactly as written
        text = std::string(trim(*value.get_if<std::string>()));
        if (text.front() == '+') {
            text.erase(0, 1);
        }
        break;
    default:
        return coercion_error(value, "decimal");
    }
    if (!std::isfinite(*number)) {
        return make_error(SerializeError::ErrorCode::COERCION_ERROR, "non-finite decimal cannot be serialized");
    }
    if (field.places >= 0) {
        char buffer[400];
        int length = std::snprintf(buffer, sizeof(buffer), "%.*f", std::min(field.places, 60), *number);
        if (length < 0 || static_cast<std::size_t>(length) >= sizeof(buffer)) {
            return coercion_error(value, "decimal");
        }
        text.assign(buffer, static_cast<std::size_t>(length));
    }
    set_string(out, text, allocator);
    return {};
}

SerializeError coerce_dict(const AttributeValue& value, rapidjson::Value& out,
                           rapidjson::Document::AllocatorType& allocator) {
    if (value.type() != AttributeValue::Type::MAP) {
        return coercion_error(value, "dict");
    }
    return coerce_primitive(value, out, allocator);
}

SerializeError resolve_nested(const NestedField& field, const AttributeValue& value, const ResolveContext& context,
                              rapidjson::Value& out, rapidjson::Document::AllocatorType& allocator) {
    const SerializerDef* schema = field.self ? context.current : field.schema.get();
    if (schema == nullptr) {
        return make_error(SerializeError::ErrorCode::INVALID_DEFINITION,
                          field.self ? "self field used outside a definition" : "nested field has no definition");
    }

    ResolveContext nested{schema, context.depth + 1, context.max_depth};
    if (nested.depth > nested.max_depth) {
        return make_error(SerializeError::ErrorCode::RECURSION_DEPTH_EXCEEDED,
                          "nesting deeper than " + std::to_string(context.max_depth) + " levels");
    }

    if (!field.many || value.is_null()) {
        return detail::serialize_instance(*schema, value, nested, out, allocator);
    }

    const auto* items = value.get_if<AttributeValue::List>();
    if (items == nullptr) {
        return coercion_error(value, "list of " + schema->name());
    }
    return detail::serialize_list(*schema, *items, nested, out, allocator);
}

}

std::string FieldSpec::type_label() const {
    return std::visit(overloaded{
        [](const CharField&) -> std::string { return "string"; },
        [](const IntegerField&) -> std::string { return "integer"; },
        [](const FloatField&) -> std::string { return "float"; },
        [](const BooleanField&) -> std::string { return "boolean"; },
        [](const DateField&) -> std::string { return "date"; },
        [](const DateTimeField&) -> std::string { return "datetime"; },
        [](const UuidField&) -> std::string { return "string"; },
        [](const NumberField&) -> std::string { return "number"; },
        [](const DecimalField&) -> std::string { return "decimal"; },
        [](const RawField&) -> std::string { return "raw"; },
        [](const DictField&) -> std::string { return "dict"; },
        [](const MethodField&) -> std::string { return "method"; },
        [](const NestedField& nested) -> std::string { return nested.many ? "list" : "object"; },
    }, variant_);
}

std::string FieldSpec::type_name() const {
    return std::visit(overloaded{
        [](const CharField&) -> std::string { return "CharField"; },
        [](const IntegerField&) -> std::string { return "IntegerField"; },
        [](const FloatField&) -> std::string { return "FloatField"; },
        [](const BooleanField&) -> std::string { return "BooleanField"; },
        [](const DateField&) -> std::string { return "DateField"; },
        [](const DateTimeField&) -> std::string { return "DateTimeField"; },
        [](const UuidField&) -> std::string { return "UUIDField"; },
        [](const NumberField&) -> std::string { return "NumberField"; },
        [](const DecimalField&) -> std::string { return "DecimalField"; },
        [](const RawField&) -> std::string { return "RawField"; },
        [](const DictField&) -> std::string { return "DictField"; },
        [](const MethodField&) -> std::string { return "MethodField"; },
        [](const NestedField& nested) -> std::string {
            if (nested.self) {
                return "self";
            }
            return nested.schema ? nested.schema->name() : std::string("NestedField");
        },
    }, variant_);
}

FieldSpec char_field(FieldOptions options) {
    return FieldSpec(CharField{}, std::move(options));
}

FieldSpec integer_field(FieldOptions options) {
    return FieldSpec(IntegerField{}, std::move(options));
}

FieldSpec float_field(FieldOptions options) {
    return FieldSpec(FloatField{}, std::move(options));
}

FieldSpec boolean_field(FieldOptions options) {
    return FieldSpec(BooleanField{}, std::move(options));
}

FieldSpec date_field(std::string format, FieldOptions options) {
    return FieldSpec(DateField{std::move(format)}, std::move(options));
}

FieldSpec datetime_field(std::string format, FieldOptions options) {
    return FieldSpec(DateTimeField{std::move(format)}, std::move(options));
}

FieldSpec uuid_field(FieldOptions options) {
    return FieldSpec(UuidField{}, std::move(options));
}

FieldSpec number_field(FieldOptions options) {
    return FieldSpec(NumberField{}, std::move(options));
}

FieldSpec decimal_field(int places, FieldOptions options) {
    return FieldSpec(DecimalField{places}, std::move(options));
}

FieldSpec raw_field(FieldOptions options) {
    return FieldSpec(RawField{}, std::move(options));
}

FieldSpec dict_field(FieldOptions options) {
    return FieldSpec(DictField{}, std::move(options));
}

FieldSpec method_field(MethodFunction function, FieldOptions options) {
    return FieldSpec(MethodField{std::move(function)}, std::move(options));
}

FieldSpec nested_field(SchemaPtr schema, FieldOptions options) {
    return FieldSpec(NestedField{std::move(schema), false, false}, std::move(options));
}

FieldSpec nested_many_field(SchemaPtr schema, FieldOptions options) {
    return FieldSpec(NestedField{std::move(schema), true, false}, std::move(options));
}

FieldSpec self_field(bool many, FieldOptions options) {
    return FieldSpec(NestedField{nullptr, many, true}, std::move(options));
}

SerializeError coerce_primitive(const AttributeValue& value,
                                rapidjson::Value& out,
                                rapidjson::Document::AllocatorType& allocator) {
    switch (value.type()) {
    case AttributeValue::Type::NONE:
        out.SetNull();
        return {};
    case AttributeValue::Type::BOOL:
        out.SetBool(*value.get_if<bool>());
        return {};
    case AttributeValue::Type::INT:
        out.SetInt64(*value.get_if<std::int64_t>());
        return {};
    case AttributeValue::Type::DOUBLE:
        return coerce_float(value, out);
    case AttributeValue::Type::STRING:
        set_string(out, *value.get_if<std::string>(), allocator);
        return {};
    case AttributeValue::Type::LIST: {
        const auto& items = *value.get_if<AttributeValue::List>();
        rapidjson::Value array(rapidjson::kArrayType);
        array.Reserve(static_cast<rapidjson::SizeType>(items.size()), allocator);
        for (std::size_t i = 0; i < items.size(); ++i) {
            rapidjson::Value item;
            SerializeError error = coerce_primitive(items[i], item, allocator);
            if (error.has_error()) {
                error.prepend_path("[" + std::to_string(i) + "]");
                return error;
            }
            array.PushBack(item, allocator);
        }
        out = std::move(array);
        return {};
    }
    case AttributeValue::Type::MAP: {
        rapidjson::Value object(rapidjson::kObjectType);
        for (const auto& entry : *value.get_if<AttributeValue::Map>()) {
            rapidjson::Value item;
            SerializeError error = coerce_primitive(entry.value, item, allocator);
            if (error.has_error()) {
                error.prepend_path(entry.name);
                return error;
            }
            object.AddMember(rapidjson::Value(entry.name.c_str(), allocator).Move(), item, allocator);
        }
        out = std::move(object);
        return {};
    }
    default:
        return coercion_error(value, "a primitive value");
    }
}

SerializeError resolve_field(const FieldSpec& field,
                             const std::string& name,
                             const AttributeValue& instance,
                             const ResolveContext& context,
                             rapidjson::Value& out,
                             rapidjson::Document::AllocatorType& allocator) {
    SerializeError error;

    if (const auto* method = std::get_if<MethodField>(&field.variant())) {
        if (!method->function) {
            error = make_error(SerializeError::ErrorCode::MISSING_ATTRIBUTE, "method field has no callable");
        } else {
            error = coerce_primitive(method->function(instance), out, allocator);
        }
        if (error.has_error()) {
            error.prepend_path(name);
        }
        return error;
    }

    const std::string& source = field.source_for(name);
    std::optional<AttributeValue> value = get_attribute_path(instance, source);
    if (!value) {
        if (!field.options().required) {
            out.SetNull();
            return {};
        }
        error = make_error(SerializeError::ErrorCode::MISSING_ATTRIBUTE,
                           "'" + instance.type_name() + "' object has no attribute '" + source + "'", name);
        return error;
    }

    if (value->is_null()) {
        out.SetNull();
        return {};
    }

    error = std::visit(overloaded{
        [&](const CharField&) { return coerce_char(*value, out, allocator); },
        [&](const IntegerField&) { return coerce_integer(*value, out); },
        [&](const FloatField&) { return coerce_float(*value, out); },
        [&](const BooleanField&) { return coerce_boolean(*value, out); },
        [&](const DateField& date) { return coerce_date(*value, date, out, allocator); },
        [&](const DateTimeField& datetime) { return coerce_datetime(*value, datetime, out, allocator); },
        [&](const UuidField&) { return coerce_uuid(*value, out, allocator); },
        [&](const NumberField&) { return coerce_number(*value, out); },
        [&](const DecimalField& decimal) { return coerce_decimal(*value, decimal, out, allocator); },
        [&](const RawField&) { return coerce_primitive(*value, out, allocator); },
        [&](const DictField&) { return coerce_dict(*value, out, allocator); },
        [&](const MethodField&) { return SerializeError{}; },
        [&](const NestedField& nested) { return resolve_nested(nested, *value, context, out, allocator); },
    }, field.variant());

    if (error.has_error()) {
        error.prepend_path(name);
    }
    return error;
}

}
