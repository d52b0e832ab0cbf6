//
//  fieldmap.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include "attribute.hpp"
#include "attribute_traits.hpp"
#include "datetime_format.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "field.hpp"
#include "schema.hpp"
#include "serializer.hpp"
