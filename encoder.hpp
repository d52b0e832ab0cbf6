//
//  encoder.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <string>
#include <utility>

#include "rapidjson/document.h"

#include "error.hpp"
#include "serializer.hpp"

namespace fieldmap {

// JSON text for |value|, compact or indented according to |options|
std::pair<std::string, SerializeError> encode(const rapidjson::Value& value, const SerializeOptions& options = {});

}
