//
//  schema.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "schema.hpp"

#include <algorithm>

#include "rtc_base/logging.h"

namespace fieldmap {

namespace {

void upsert_field(FieldList& fields, const DeclaredField& field) {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const DeclaredField& existing) { return existing.name == field.name; });
    if (it != fields.end()) {
        it->spec = field.spec;
    } else {
        fields.push_back(field);
    }
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

SerializeError check_names(const FieldList& declared, const std::vector<std::string>& names, const char* option) {
    for (const auto& name : names) {
        bool known = std::any_of(declared.begin(), declared.end(),
                                 [&](const DeclaredField& field) { return field.name == name; });
        if (!known) {
            SerializeError error = make_error(SerializeError::ErrorCode::UNKNOWN_FIELD,
                                              "field '" + name + "' named in meta." + option + " is not declared");
            error.add_context(std::string("meta.") + option);
            return error;
        }
    }
    return {};
}

SerializeError check_declarations(const FieldList& fields) {
    for (const auto& field : fields) {
        if (field.name.empty()) {
            return make_error(SerializeError::ErrorCode::INVALID_DEFINITION, "field name must not be empty");
        }
        if (const auto* method = std::get_if<MethodField>(&field.spec.variant())) {
            if (!method->function) {
                return make_error(SerializeError::ErrorCode::INVALID_DEFINITION,
                                  "method field has no callable", field.name);
            }
        }
        if (const auto* nested = std::get_if<NestedField>(&field.spec.variant())) {
            if (!nested->self && !nested->schema) {
                return make_error(SerializeError::ErrorCode::INVALID_DEFINITION,
                                  "nested field has no definition", field.name);
            }
        }
    }
    return {};
}

}

const DeclaredField* SerializerDef::find_field(const std::string& name) const {
    for (const auto& field : declared_fields_) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

SchemaBuilder::SchemaBuilder(std::string name) : name_(std::move(name)) {}

SchemaBuilder& SchemaBuilder::extends(SchemaPtr base) {
    bases_.push_back(std::move(base));
    return *this;
}

SchemaBuilder& SchemaBuilder::field(std::string name, FieldSpec spec) {
    upsert_field(fields_, DeclaredField{std::move(name), std::move(spec)});
    return *this;
}

SchemaBuilder& SchemaBuilder::meta(MetaPolicy policy) {
    meta_ = std::move(policy);
    return *this;
}

std::pair<SchemaPtr, SerializeError> SchemaBuilder::build() const {
    for (const auto& base : bases_) {
        if (!base) {
            SerializeError error = make_error(SerializeError::ErrorCode::INVALID_DEFINITION, "null base definition");
            error.add_context("definition " + name_);
            RTC_LOG(LS_ERROR) << "Rejected definition " << name_ << ": " << format_error(error);
            return {nullptr, error};
        }
    }

    FieldList declared = collect_fields(bases_, fields_);

    SerializeError error = check_declarations(declared);
    if (!error.has_error()) {
        auto [effective, meta_error] = resolve_meta(declared, meta_);
        if (!meta_error.has_error()) {
            auto schema = std::make_shared<SerializerDef>(SerializerDef::Token{});
            schema->name_ = name_;
            schema->declared_fields_ = std::move(declared);
            schema->effective_fields_ = std::move(effective);
            schema->meta_ = meta_;
            RTC_LOG(LS_VERBOSE) << "Built definition " << name_ << " with "
                                << schema->effective_fields_.size() << " of "
                                << schema->declared_fields_.size() << " fields";
            return {schema, SerializeError{}};
        }
        error = meta_error;
    }

    error.add_context("definition " + name_);
    RTC_LOG(LS_ERROR) << "Rejected definition " << name_ << ": " << format_error(error);
    return {nullptr, error};
}

FieldList collect_fields(const std::vector<SchemaPtr>& bases, const FieldList& own) {
    FieldList result;
    for (const auto& base : bases) {
        if (!base) {
            continue;
        }
        for (const auto& field : base->declared_fields()) {
            upsert_field(result, field);
        }
    }
    for (const auto& field : own) {
        upsert_field(result, field);
    }
    return result;
}

std::pair<FieldList, SerializeError> resolve_meta(const FieldList& declared, const std::optional<MetaPolicy>& meta) {
    if (!meta || (meta->fields.empty() && meta->exclude.empty())) {
        return {declared, SerializeError{}};
    }

    if (!meta->fields.empty() && !meta->exclude.empty()) {
        return {FieldList{}, make_error(SerializeError::ErrorCode::CONFLICTING_META,
                                        "meta.fields and meta.exclude cannot both be set")};
    }

    const bool allow = !meta->fields.empty();
    const auto& names = allow ? meta->fields : meta->exclude;

    SerializeError error = check_names(declared, names, allow ? "fields" : "exclude");
    if (error.has_error()) {
        return {FieldList{}, error};
    }

    FieldList result;
    for (const auto& field : declared) {
        if (contains(names, field.name) == allow) {
            result.push_back(field);
        }
    }
    return {result, SerializeError{}};
}

void describe_schema(const SerializerDef& schema, rapidjson::Value& out, rapidjson::Document::AllocatorType& allocator) {
    out.SetObject();
    for (const auto& field : schema.effective_fields()) {
        const FieldOptions& options = field.spec.options();

        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("type", rapidjson::Value(field.spec.type_label().c_str(), allocator).Move(), allocator);
        entry.AddMember("type_name", rapidjson::Value(field.spec.type_name().c_str(), allocator).Move(), allocator);
        entry.AddMember("required", options.required, allocator);
        if (!options.label.empty()) {
            entry.AddMember("label", rapidjson::Value(options.label.c_str(), allocator).Move(), allocator);
        }
        if (!options.help_text.empty()) {
            entry.AddMember("help_text", rapidjson::Value(options.help_text.c_str(), allocator).Move(), allocator);
        }

        out.AddMember(rapidjson::Value(field.name.c_str(), allocator).Move(), entry, allocator);
    }
}

}
