//
//  encoder.cpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#include "encoder.hpp"

#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "rtc_base/logging.h"

namespace fieldmap {

std::pair<std::string, SerializeError> encode(const rapidjson::Value& value, const SerializeOptions& options) {
    rapidjson::StringBuffer buffer;
    buffer.Reserve(options.buffer_reserve_size);

    bool ok = false;
    if (options.pretty_print) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        ok = value.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        ok = value.Accept(writer);
    }

    if (!ok) {
        // Writer rejects NaN and infinity unless kWriteNanAndInfFlag is set
        SerializeError error = make_error(SerializeError::ErrorCode::ENCODE_ERROR, "JSON writer rejected the value");
        RTC_LOG(LS_ERROR) << "Encoding failed: " << format_error(error);
        return {std::string(), error};
    }

    return {std::string(buffer.GetString(), buffer.GetSize()), SerializeError{}};
}

}
