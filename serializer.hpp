//
//  serializer.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "rapidjson/document.h"

#include "attribute.hpp"
#include "error.hpp"
#include "field.hpp"
#include "schema.hpp"

namespace fieldmap {

// Serialization options
struct SerializeOptions {
    bool pretty_print = false;
    size_t buffer_reserve_size = 1024;  // Buffer pre-allocation size
    size_t max_depth = 32;              // Deepest nested definition before RECURSION_DEPTH_EXCEEDED
};

/**
 * @brief Turns one source object, or a list of them, into an output tree.
 *
 * The tree is built on the first call to data() and cached together with any error,
 * so later calls neither read attributes nor call method fields again. A failing
 * field aborts the whole evaluation; no partial output is kept.
 *
 * Not thread-safe. The schema may be shared freely.
 */
class Serializer {
public:
    Serializer(SchemaPtr schema, AttributeValue source, bool many = false, SerializeOptions options = {});

    Serializer(const Serializer&) = delete;
    Serializer& operator=(const Serializer&) = delete;

    // nullptr on error; the pointer stays valid for the lifetime of the serializer
    std::pair<const rapidjson::Value*, SerializeError> data();

    std::pair<std::string, SerializeError> to_json();

    bool many() const { return many_; }
    const SerializeOptions& options() const { return options_; }

private:
    void evaluate();

    SchemaPtr schema_;
    AttributeValue source_;
    bool many_;
    SerializeOptions options_;

    rapidjson::Document document_;
    bool evaluated_ = false;
    SerializeError error_;
};

namespace detail {

// Writes the mapping for one instance into |out|; a null instance gives null
SerializeError serialize_instance(const SerializerDef& schema,
                                  const AttributeValue& instance,
                                  const ResolveContext& context,
                                  rapidjson::Value& out,
                                  rapidjson::Document::AllocatorType& allocator);

// One mapping per element, error paths prefixed with the element index
SerializeError serialize_list(const SerializerDef& schema,
                              const AttributeValue::List& instances,
                              const ResolveContext& context,
                              rapidjson::Value& out,
                              rapidjson::Document::AllocatorType& allocator);

}

}
