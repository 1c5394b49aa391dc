#pragma once

#include <string_view>
namespace YamlFusion {


enum class ParseError {
    NO_ERROR,

    FIXED_SIZE_CONTAINER_OVERFLOW,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NON_CHAR_IN_CHAR_VALUE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    NULL_IN_NON_OPTIONAL,
    NON_NULL_IN_UNIT_VALUE,

    EXCESS_FIELD,
    MISSING_FIELD,
    DUPLICATE_KEY_IN_MAP,
    TUPLE_LENGTH_MISMATCH,

    UNKNOWN_VARIANT,
    SHAPE_MISMATCH,
    UNSUPPORTED_CONSTRUCT,

    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE"; break;
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE"; break;
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case ParseError::NON_CHAR_IN_CHAR_VALUE: return "NON_CHAR_IN_CHAR_VALUE"; break;
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case ParseError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE"; break;
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case ParseError::NON_NULL_IN_UNIT_VALUE: return "NON_NULL_IN_UNIT_VALUE"; break;
    case ParseError::EXCESS_FIELD: return "EXCESS_FIELD"; break;
    case ParseError::MISSING_FIELD: return "MISSING_FIELD"; break;
    case ParseError::DUPLICATE_KEY_IN_MAP: return "DUPLICATE_KEY_IN_MAP"; break;
    case ParseError::TUPLE_LENGTH_MISMATCH: return "TUPLE_LENGTH_MISMATCH"; break;
    case ParseError::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT"; break;
    case ParseError::SHAPE_MISMATCH: return "SHAPE_MISMATCH"; break;
    case ParseError::UNSUPPORTED_CONSTRUCT: return "UNSUPPORTED_CONSTRUCT"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}

enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR,
    IO_ERROR,
    UTF8_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    case SerializeError::IO_ERROR: return "IO_ERROR"; break;
    case SerializeError::UTF8_ERROR: return "UTF8_ERROR"; break;
    }
    return "N/A";
}

// Errors raised by the encoder itself, on top of the event sink it drives
enum class EncodeError {
    NO_ERROR,
    NESTED_ENUM_TAG,
    UNSUPPORTED_CONSTRUCT,
    INVALID_STATE,
    EMITTER_ERROR
};

constexpr std::string_view error_to_string(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR: return "NO_ERROR"; break;
    case EncodeError::NESTED_ENUM_TAG: return "NESTED_ENUM_TAG"; break;
    case EncodeError::UNSUPPORTED_CONSTRUCT: return "UNSUPPORTED_CONSTRUCT"; break;
    case EncodeError::INVALID_STATE: return "INVALID_STATE"; break;
    case EncodeError::EMITTER_ERROR: return "EMITTER_ERROR"; break;
    }
    return "N/A";
}

enum class NumberParseError {
    NO_ERROR,
    FAILED_TO_PARSE_NUMBER,
    FAILED_TO_PARSE_FLOAT
};

constexpr std::string_view error_to_string(NumberParseError e) {
    switch(e) {
    case NumberParseError::NO_ERROR: return "NO_ERROR"; break;
    case NumberParseError::FAILED_TO_PARSE_NUMBER: return "FAILED_TO_PARSE_NUMBER"; break;
    case NumberParseError::FAILED_TO_PARSE_FLOAT: return "FAILED_TO_PARSE_FLOAT"; break;
    }
    return "N/A";
}

} // namespace YamlFusion
