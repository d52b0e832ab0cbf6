//
//  datetime_format.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <string>
#include <utility>

#include "attribute.hpp"
#include "error.hpp"

namespace fieldmap {

// Format name selecting the canonical representation (case-insensitive)
inline constexpr const char* kIso8601 = "iso-8601";

bool is_iso_format(const std::string& format);

// "2015-01-01", or strftime(|format|) when it is not ISO
std::pair<std::string, SerializeError> format_date(const Date& value, const std::string& format = {});

// "2015-01-01T10:30:00Z", with ".ffffff" before the Z when there are microseconds.
// Non-ISO formats go through strftime; "%f" expands to the six digit microsecond count.
std::pair<std::string, SerializeError> format_datetime(const DateTime& value, const std::string& format = {});

}
