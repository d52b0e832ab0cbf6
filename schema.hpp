//
//  schema.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rapidjson/document.h"

#include "error.hpp"
#include "field.hpp"

namespace fieldmap {

// Field selection for one definition. At most one of the two lists may be non-empty.
struct MetaPolicy {
    std::vector<std::string> fields;   // Allow-list
    std::vector<std::string> exclude;  // Deny-list
};

struct DeclaredField {
    std::string name;
    FieldSpec spec;
};

using FieldList = std::vector<DeclaredField>;

/**
 * @brief Immutable, shareable serializer definition.
 *
 * Produced by SchemaBuilder::build(). The effective field list is computed once
 * at build time and never changes afterwards.
 */
class SerializerDef {
    // Only SchemaBuilder can name this, so only it can construct a definition
    struct Token {
        explicit Token() = default;
    };

public:
    explicit SerializerDef(Token) {}

    const std::string& name() const { return name_; }

    // Every field after inheritance, in declaration order
    const FieldList& declared_fields() const { return declared_fields_; }

    // The fields that are serialized, after the meta policy
    const FieldList& effective_fields() const { return effective_fields_; }

    const std::optional<MetaPolicy>& meta() const { return meta_; }

    const DeclaredField* find_field(const std::string& name) const;

private:
    friend class SchemaBuilder;

    std::string name_;
    FieldList declared_fields_;
    FieldList effective_fields_;
    std::optional<MetaPolicy> meta_;
};

/**
 * @brief Collects fields into a new SerializerDef.
 *
 * @code
 * auto [user, error] = SchemaBuilder("UserSerializer")
 *     .field("email", char_field())
 *     .field("username", char_field())
 *     .build();
 * @endcode
 */
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string name);

    // Inherit the declared fields of |base|. Bases fold in the order they are added.
    SchemaBuilder& extends(SchemaPtr base);

    // Declaring an existing name replaces that field in its original position
    SchemaBuilder& field(std::string name, FieldSpec spec);

    SchemaBuilder& meta(MetaPolicy policy);

    std::pair<SchemaPtr, SerializeError> build() const;

private:
    std::string name_;
    std::vector<SchemaPtr> bases_;
    FieldList fields_;
    std::optional<MetaPolicy> meta_;
};

// Folds base declarations then |own| with stable override. Cannot fail.
FieldList collect_fields(const std::vector<SchemaPtr>& bases, const FieldList& own);

// Applies the allow or deny list. Output keeps declaration order.
std::pair<FieldList, SerializeError> resolve_meta(const FieldList& declared, const std::optional<MetaPolicy>& meta);

/**
 * @brief Writes field metadata for every effective field of |schema| into |out|.
 *
 * Each member is named after the field and holds "type", "type_name" and "required",
 * plus "label" and "help_text" when they are set.
 */
void describe_schema(const SerializerDef& schema, rapidjson::Value& out, rapidjson::Document::AllocatorType& allocator);

}
