//
//  field.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "rapidjson/document.h"

#include "attribute.hpp"
#include "error.hpp"

namespace fieldmap {

class SerializerDef;
using SchemaPtr = std::shared_ptr<const SerializerDef>;

enum class FieldKind {
    CHAR,
    INTEGER,
    FLOAT,
    BOOLEAN,
    DATE,
    DATETIME,
    UUID,
    NUMBER,
    DECIMAL,
    RAW,
    DICT,
    METHOD,
    NESTED
};

struct FieldOptions {
    std::string source;       // Attribute path such as "author.name"; empty reads the field name
    bool required = true;     // When false a missing attribute serializes as null
    std::string label;
    std::string help_text;
};

// Computes a derived value from the instance being serialized
using MethodFunction = std::function<AttributeValue(const AttributeValue& instance)>;

struct CharField {};
struct IntegerField {};
struct FloatField {};
struct BooleanField {};
struct DateField {
    std::string format;  // strftime pattern, empty or "iso-8601" for YYYY-MM-DD
};
struct DateTimeField {
    std::string format;  // strftime pattern, empty or "iso-8601" for YYYY-MM-DDTHH:MM:SSZ
};
struct UuidField {};
struct NumberField {};
struct DecimalField {
    int places = -1;     // Digits after the point; negative keeps the shortest text
};
struct RawField {};
struct DictField {};
struct MethodField {
    MethodFunction function;
};
struct NestedField {
    SchemaPtr schema;
    bool many = false;
    bool self = false;   // Serialized with the definition that owns the field; |schema| is unused
};

// One declared field: what to read and how to coerce it. Immutable once placed in a definition.
class FieldSpec {
public:
    using Variant = std::variant<CharField,
                                 IntegerField,
                                 FloatField,
                                 BooleanField,
                                 DateField,
                                 DateTimeField,
                                 UuidField,
                                 NumberField,
                                 DecimalField,
                                 RawField,
                                 DictField,
                                 MethodField,
                                 NestedField>;

    FieldSpec(Variant variant, FieldOptions options = {})
        : variant_(std::move(variant)), options_(std::move(options)) {}

    FieldKind kind() const {
        return static_cast<FieldKind>(variant_.index());
    }

    const Variant& variant() const { return variant_; }
    const FieldOptions& options() const { return options_; }

    const std::string& source_for(const std::string& name) const {
        return options_.source.empty() ? name : options_.source;
    }

    // "string", "integer", ... as reported by describe_schema
    std::string type_label() const;

    // "CharField", "IntegerField", ... or the nested definition's name
    std::string type_name() const;

private:
    Variant variant_;
    FieldOptions options_;
};

FieldSpec char_field(FieldOptions options = {});
FieldSpec integer_field(FieldOptions options = {});
FieldSpec float_field(FieldOptions options = {});
FieldSpec boolean_field(FieldOptions options = {});
FieldSpec date_field(std::string format = {}, FieldOptions options = {});
FieldSpec datetime_field(std::string format = {}, FieldOptions options = {});
FieldSpec uuid_field(FieldOptions options = {});
FieldSpec number_field(FieldOptions options = {});
FieldSpec decimal_field(int places = -1, FieldOptions options = {});
FieldSpec raw_field(FieldOptions options = {});
// Like raw_field, but the value must be a map
FieldSpec dict_field(FieldOptions options = {});
FieldSpec method_field(MethodFunction function, FieldOptions options = {});
FieldSpec nested_field(SchemaPtr schema, FieldOptions options = {});
FieldSpec nested_many_field(SchemaPtr schema, FieldOptions options = {});

// Nested field serialized with the enclosing definition, for recursive shapes
FieldSpec self_field(bool many = false, FieldOptions options = {});

struct ResolveContext {
    const SerializerDef* current = nullptr;  // Definition that owns the field
    std::size_t depth = 0;                   // Nesting level of |current|, 0 at the top
    std::size_t max_depth = 32;
};

// Reads |field| from |instance| and writes the coerced value into |out|.
// Errors carry the field name as path; callers prepend their own segments.
SerializeError resolve_field(const FieldSpec& field,
                             const std::string& name,
                             const AttributeValue& instance,
                             const ResolveContext& context,
                             rapidjson::Value& out,
                             rapidjson::Document::AllocatorType& allocator);

// Generic coercion used by raw and method fields: primitives, lists and maps of primitives
SerializeError coerce_primitive(const AttributeValue& value,
                                rapidjson::Value& out,
                                rapidjson::Document::AllocatorType& allocator);

}
