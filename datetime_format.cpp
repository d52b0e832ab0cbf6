//
//  datetime_format.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "datetime_format.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <vector>

namespace fieldmap {

using namespace std::chrono;

namespace {

std::tm to_tm(const Date& date, const hh_mm_ss<microseconds>& time) {
    const sys_days day_point{date};
    const year_month_day first_of_year{date.year(), January, day{1}};

    std::tm tm{};
    tm.tm_year = static_cast<int>(date.year()) - 1900;
    tm.tm_mon = static_cast<int>(static_cast<unsigned>(date.month())) - 1;
    tm.tm_mday = static_cast<int>(static_cast<unsigned>(date.day()));
    tm.tm_hour = static_cast<int>(time.hours().count());
    tm.tm_min = static_cast<int>(time.minutes().count());
    tm.tm_sec = static_cast<int>(time.seconds().count());
    tm.tm_wday = static_cast<int>(weekday{day_point}.c_encoding());
    tm.tm_yday = static_cast<int>((day_point - sys_days{first_of_year}).count());
    tm.tm_isdst = 0;
    return tm;
}

// strftime has no microsecond directive; substitute "%f" before handing the pattern over
std::string expand_microseconds(const std::string& format, long long micros) {
    char digits[8];
    std::snprintf(digits, sizeof(digits), "%06lld", micros);

    std::string result;
    result.reserve(format.size());
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size()) {
            if (format[i + 1] == 'f') {
                result += digits;
            } else {
                result += format[i];
                result += format[i + 1];
            }
            ++i;
        } else {
            result += format[i];
        }
    }
    return result;
}

std::pair<std::string, SerializeError> strftime_format(const std::tm& tm, const std::string& format) {
    // strftime returns 0 both for an empty result and a short buffer, so grow a few times
    std::vector<char> buffer(std::max<std::size_t>(64, format.size() * 4));
    for (int attempt = 0; attempt < 4; ++attempt) {
        std::size_t written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &tm);
        if (written > 0) {
            return {std::string(buffer.data(), written), SerializeError{}};
        }
        buffer.resize(buffer.size() * 4);
    }
    return {std::string(), make_error(SerializeError::ErrorCode::COERCION_ERROR,
                                      "format '" + format + "' produced no output")};
}

SerializeError invalid_date_error(const Date& value) {
    return make_error(SerializeError::ErrorCode::COERCION_ERROR,
                      "invalid calendar date " + std::to_string(static_cast<int>(value.year())) + "-" +
                          std::to_string(static_cast<unsigned>(value.month())) + "-" +
                          std::to_string(static_cast<unsigned>(value.day())));
}

}

bool is_iso_format(const std::string& format) {
    if (format.empty()) {
        return true;
    }
    std::string lowered(format);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == kIso8601;
}

std::pair<std::string, SerializeError> format_date(const Date& value, const std::string& format) {
    if (!value.ok()) {
        return {std::string(), invalid_date_error(value)};
    }

    if (is_iso_format(format)) {
        char text[32];
        std::snprintf(text, sizeof(text), "%04d-%02u-%02u",
                      static_cast<int>(value.year()),
                      static_cast<unsigned>(value.month()),
                      static_cast<unsigned>(value.day()));
        return {std::string(text), SerializeError{}};
    }

    return strftime_format(to_tm(value, hh_mm_ss<microseconds>{microseconds{0}}), expand_microseconds(format, 0));
}

std::pair<std::string, SerializeError> format_datetime(const DateTime& value, const std::string& format) {
    const auto day_point = std::chrono::floor<days>(value);
    const Date date{day_point};
    if (!date.ok()) {
        return {std::string(), invalid_date_error(date)};
    }
    const hh_mm_ss<microseconds> time{value - day_point};
    const long long micros = time.subseconds().count();

    if (is_iso_format(format)) {
        char text[48];
        int length = std::snprintf(text, sizeof(text), "%04d-%02u-%02uT%02d:%02d:%02d",
                                   static_cast<int>(date.year()),
                                   static_cast<unsigned>(date.month()),
                                   static_cast<unsigned>(date.day()),
                                   static_cast<int>(time.hours().count()),
                                   static_cast<int>(time.minutes().count()),
                                   static_cast<int>(time.seconds().count()));
        std::string result(text, static_cast<std::size_t>(length));
        if (micros != 0) {
            std::snprintf(text, sizeof(text), ".%06lld", micros);
            result += text;
        }
        result += 'Z';
        return {result, SerializeError{}};
    }

    return strftime_format(to_tm(date, time), expand_microseconds(format, micros));
}

}
