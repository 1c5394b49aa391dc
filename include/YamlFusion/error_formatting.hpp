#pragma once

#include <format>
#include <string>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "parse_result.hpp"
#include "serializer.hpp"

namespace YamlFusion {

namespace error_formatting_detail {

constexpr std::string_view describe(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR: return "no error";
    case EncodeError::NESTED_ENUM_TAG: return "serializing nested enums in YAML is not supported";
    case EncodeError::UNSUPPORTED_CONSTRUCT: return "value has no YAML representation";
    case EncodeError::INVALID_STATE: return "encoder finished with unclosed values";
    case EncodeError::EMITTER_ERROR: return "emitter rejected an event";
    }
    return "N/A";
}

// Reader and writer error enums all provide error_to_string in their own namespace
template<class E>
std::string_view detail_string(E e) {
    if constexpr (std::is_enum_v<E>) {
        return error_to_string(e);
    } else {
        return "N/A";
    }
}

}

template <class ReaderError>
std::string ParseResultToString(const ParseResult<ReaderError> & res) {
    if(res) {
        return "ok";
    }
    std::string msg = std::format("When parsing {}, parsing error '{}'",
                                  res.errorPath().to_string(), error_to_string(res.error()));
    if(res.error() == ParseError::READER_ERROR) {
        msg += std::format(" (reader: {})", error_formatting_detail::detail_string(res.readerError()));
    }
    return msg;
}

template <class WriterError>
std::string SerializeResultToString(const SerializeResult<WriterError> & res) {
    if(res) {
        return "ok";
    }
    std::string msg = std::format("Serialization error '{}'", error_to_string(res.error()));
    if(res.error() == SerializeError::WRITER_ERROR) {
        if constexpr (std::is_same_v<WriterError, EncodeError>) {
            msg += std::format(": {}", error_formatting_detail::describe(res.writerError()));
        } else {
            msg += std::format(" (writer: {})", error_formatting_detail::detail_string(res.writerError()));
        }
    }
    return msg;
}

}
