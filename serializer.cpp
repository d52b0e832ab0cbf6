//
//  serializer.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "serializer.hpp"

#include "encoder.hpp"
#include "rtc_base/logging.h"

namespace fieldmap {

namespace detail {

SerializeError serialize_instance(const SerializerDef& schema,
                                  const AttributeValue& instance,
                                  const ResolveContext& context,
                                  rapidjson::Value& out,
                                  rapidjson::Document::AllocatorType& allocator) {
    if (instance.is_null()) {
        out.SetNull();
        return {};
    }

    rapidjson::Value mapping(rapidjson::kObjectType);
    for (const auto& field : schema.effective_fields()) {
        rapidjson::Value value;
        SerializeError error = resolve_field(field.spec, field.name, instance, context, value, allocator);
        if (error.has_error()) {
            return error;
        }
        mapping.AddMember(rapidjson::Value(field.name.c_str(), allocator).Move(), value, allocator);
    }
    out = std::move(mapping);
    return {};
}

SerializeError serialize_list(const SerializerDef& schema,
                              const AttributeValue::List& instances,
                              const ResolveContext& context,
                              rapidjson::Value& out,
                              rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value items(rapidjson::kArrayType);
    items.Reserve(static_cast<rapidjson::SizeType>(instances.size()), allocator);
    for (std::size_t i = 0; i < instances.size(); ++i) {
        rapidjson::Value item;
        SerializeError error = serialize_instance(schema, instances[i], context, item, allocator);
        if (error.has_error()) {
            error.prepend_path("[" + std::to_string(i) + "]");
            return error;
        }
        items.PushBack(item, allocator);
    }
    out = std::move(items);
    return {};
}

}

Serializer::Serializer(SchemaPtr schema, AttributeValue source, bool many, SerializeOptions options)
    : schema_(std::move(schema)), source_(std::move(source)), many_(many), options_(options) {}

std::pair<const rapidjson::Value*, SerializeError> Serializer::data() {
    if (!evaluated_) {
        evaluate();
        evaluated_ = true;
    }
    if (error_.has_error()) {
        return {nullptr, error_};
    }
    return {&document_, SerializeError{}};
}

std::pair<std::string, SerializeError> Serializer::to_json() {
    auto [value, error] = data();
    if (error.has_error()) {
        return {std::string(), error};
    }
    return encode(*value, options_);
}

void Serializer::evaluate() {
    if (!schema_) {
        error_ = make_error(SerializeError::ErrorCode::INVALID_DEFINITION, "serializer has no definition", "$");
        RTC_LOG(LS_WARNING) << "Serialization failed: " << format_error(error_);
        return;
    }

    auto& allocator = document_.GetAllocator();
    ResolveContext context{schema_.get(), 0, options_.max_depth};

    // Built aside and attached only on success
    rapidjson::Value result;
    SerializeError error;
    if (!many_) {
        error = detail::serialize_instance(*schema_, source_, context, result, allocator);
    } else if (const auto* items = source_.get_if<AttributeValue::List>()) {
        error = detail::serialize_list(*schema_, *items, context, result, allocator);
    } else {
        error = make_error(SerializeError::ErrorCode::COERCION_ERROR,
                           "many=true expects a list, got " + source_.type_name());
    }

    if (error.has_error()) {
        error.prepend_path("$");
        error.add_context("serializer " + schema_->name());
        error_ = error;
        RTC_LOG(LS_WARNING) << "Serialization failed: " << format_error(error_);
        return;
    }

    static_cast<rapidjson::Value&>(document_) = std::move(result);
}

}
