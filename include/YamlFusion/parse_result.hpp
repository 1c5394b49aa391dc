#pragma once

#include <utility>

#include "path.hpp"
#include "errors.hpp"

namespace YamlFusion {


template <class ReaderError>
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    ReaderError m_readerError{};

    path::Path currentPath;

public:
    constexpr ParseResult(ParseError err, ReaderError rerr, path::Path errorPath):
        m_error(err), m_readerError(rerr), currentPath(std::move(errorPath))
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }

    constexpr ParseError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
    // Where the error happened; empty on success
    constexpr const path::Path & errorPath() const {
        return currentPath;
    }
};

} // namespace YamlFusion
