//
//  error.hpp
//  FieldMap
//
//  Created by FieldMap contributors on 2026/10/18.
//

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace fieldmap {

struct SerializeError;

inline std::string format_error(const SerializeError& error);

// Error value carried through definition and serialization, with a path to the failing field
struct SerializeError {
    enum class ErrorCode {
        NONE,
        // Definition time
        CONFLICTING_META,
        UNKNOWN_FIELD,
        INVALID_DEFINITION,
        // Call time
        MISSING_ATTRIBUTE,
        COERCION_ERROR,
        RECURSION_DEPTH_EXCEEDED,
        // Wire encoding
        ENCODE_ERROR
    };

    ErrorCode code = ErrorCode::NONE;
    std::string message;
    std::string path;
    std::vector<std::string> context;  // Additional context information

    inline bool has_error() const {
        return code != ErrorCode::NONE;
    }

    // Index segments ("[3]") attach without a separating dot
    static inline std::string build_path(const std::string& parent, const std::string& child) {
        if (parent.empty()) {
            return child;
        }
        if (child.empty()) {
            return parent;
        }
        if (child.front() == '[') {
            return parent + child;
        }
        return parent + "." + child;
    }

    inline void append_path(const std::string& part) {
        path = build_path(path, part);
    }

    // Used while the error unwinds out of nested serializers
    inline void prepend_path(const std::string& part) {
        path = build_path(part, path);
    }

    inline void add_context(const std::string& info) {
        context.push_back(info);
    }

    inline std::string get_full_description() const {
        std::string result = format_error(*this);
        if (!context.empty()) {
            result += "\nContext:";
            for (const auto& ctx : context) {
                result += "\n  " + ctx;
            }
        }
        return result;
    }
};

inline SerializeError make_error(SerializeError::ErrorCode code, std::string message, std::string path = {}) {
    SerializeError error;
    error.code = code;
    error.message = std::move(message);
    error.path = std::move(path);
    return error;
}

inline std::string get_error_type_string(SerializeError::ErrorCode code) {
    switch (code) {
    case SerializeError::ErrorCode::CONFLICTING_META:
        return "Conflicting meta";
    case SerializeError::ErrorCode::UNKNOWN_FIELD:
        return "Unknown field";
    case SerializeError::ErrorCode::INVALID_DEFINITION:
        return "Invalid definition";
    case SerializeError::ErrorCode::MISSING_ATTRIBUTE:
        return "Missing attribute";
    case SerializeError::ErrorCode::COERCION_ERROR:
        return "Coercion error";
    case SerializeError::ErrorCode::RECURSION_DEPTH_EXCEEDED:
        return "Recursion depth exceeded";
    case SerializeError::ErrorCode::ENCODE_ERROR:
        return "Encode error";
    default:
        return "Unknown error";
    }
}

inline std::string format_error(const SerializeError& error) {
    if (!error.has_error()) {
        return "No error";
    }

    std::string result = "Error: " + get_error_type_string(error.code);

    if (!error.message.empty()) {
        result += " - " + error.message;
    }

    if (!error.path.empty()) {
        result += " (at " + error.path + ")";
    }

    return result;
}

}
