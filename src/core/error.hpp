/**
 * @file error.hpp
 * @brief Error types raised by the geobim conversion engine
 * @author GeoBIM Team
 * @version 0.1.0
 * @date 2026
 *
 * Record-level errors (InvalidGeometry, UnsupportedRecordKind) are caught
 * by the feature converter and turned into warnings. Load-time and API
 * misuse errors (InvalidStyleRule, InvalidState) abort the run.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace geobim {

/**
 * @brief Classification of engine errors
 */
enum class ErrorKind {
    InvalidGeometry,        ///< Malformed or degenerate geometric input
    InvalidStyleRule,       ///< Malformed style table entry (fatal)
    InvalidState,           ///< API misuse, e.g. mutating after finalize (fatal)
    UnsupportedRecordKind   ///< Record kind outside point/line/polygon
};

/**
 * @brief Convert ErrorKind to human-readable string
 */
[[nodiscard]] inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidGeometry:       return "InvalidGeometry";
        case ErrorKind::InvalidStyleRule:      return "InvalidStyleRule";
        case ErrorKind::InvalidState:          return "InvalidState";
        case ErrorKind::UnsupportedRecordKind: return "UnsupportedRecordKind";
    }
    return "Unknown";
}

/**
 * @brief Base class of all engine errors
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    [[nodiscard]] ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class InvalidGeometry : public Error {
public:
    explicit InvalidGeometry(const std::string& message)
        : Error(ErrorKind::InvalidGeometry, message) {}
};

class InvalidStyleRule : public Error {
public:
    explicit InvalidStyleRule(const std::string& message)
        : Error(ErrorKind::InvalidStyleRule, message) {}
};

class InvalidState : public Error {
public:
    explicit InvalidState(const std::string& message)
        : Error(ErrorKind::InvalidState, message) {}
};

class UnsupportedRecordKind : public Error {
public:
    explicit UnsupportedRecordKind(const std::string& message)
        : Error(ErrorKind::UnsupportedRecordKind, message) {}
};

} // namespace geobim
