#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace relsync {

/**
 * @brief Error categories for the data-access core
 */
enum class ErrorKind {
    CONNECTION,
    MALFORMED_RULE,
    UNSUPPORTED_OPERATOR,
    ARITY_MISMATCH,
    UNDEFINED_TABLE,
    UNDEFINED_COLUMN,
    FOREIGN_KEY_VIOLATION,
    UNRESOLVABLE_FOREIGN_KEY,
    SCHEMA_DEFINITION,
    SOURCE,
    DATABASE
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION:               return "CONNECTION";
        case ErrorKind::MALFORMED_RULE:           return "MALFORMED_RULE";
        case ErrorKind::UNSUPPORTED_OPERATOR:     return "UNSUPPORTED_OPERATOR";
        case ErrorKind::ARITY_MISMATCH:           return "ARITY_MISMATCH";
        case ErrorKind::UNDEFINED_TABLE:          return "UNDEFINED_TABLE";
        case ErrorKind::UNDEFINED_COLUMN:         return "UNDEFINED_COLUMN";
        case ErrorKind::FOREIGN_KEY_VIOLATION:    return "FOREIGN_KEY_VIOLATION";
        case ErrorKind::UNRESOLVABLE_FOREIGN_KEY: return "UNRESOLVABLE_FOREIGN_KEY";
        case ErrorKind::SCHEMA_DEFINITION:        return "SCHEMA_DEFINITION";
        case ErrorKind::SOURCE:                   return "SOURCE";
        case ErrorKind::DATABASE:                 return "DATABASE";
        default:                                  return "UNKNOWN";
    }
}

/**
 * @brief Base of every error raised by the core
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Transport-level failure (connect refused, connection lost). Never retried here.
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message)
        : Error(ErrorKind::CONNECTION, message) {}
};

class MalformedRuleError : public Error {
public:
    explicit MalformedRuleError(const std::string& message)
        : Error(ErrorKind::MALFORMED_RULE, message) {}
};

class UnsupportedOperatorError : public Error {
public:
    explicit UnsupportedOperatorError(const std::string& op)
        : Error(ErrorKind::UNSUPPORTED_OPERATOR, "Unsupported operator: " + op),
          op_(op) {}

    [[nodiscard]] const std::string& op() const noexcept { return op_; }

private:
    std::string op_;
};

class ArityMismatchError : public Error {
public:
    explicit ArityMismatchError(const std::string& message)
        : Error(ErrorKind::ARITY_MISMATCH, message) {}
};

class SchemaDefinitionError : public Error {
public:
    explicit SchemaDefinitionError(const std::string& message)
        : Error(ErrorKind::SCHEMA_DEFINITION, message) {}
};

/**
 * @brief Any statement failure that carries a SQLSTATE
 */
class DatabaseError : public Error {
public:
    DatabaseError(const std::string& message, std::string sqlstate)
        : Error(ErrorKind::DATABASE, message), sqlstate_(std::move(sqlstate)) {}

    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }

protected:
    DatabaseError(ErrorKind kind, const std::string& message, std::string sqlstate)
        : Error(kind, message), sqlstate_(std::move(sqlstate)) {}

private:
    std::string sqlstate_;
};

// Schema drift: recovered by the schema evolution helper, then retried once.
class UndefinedTableError : public DatabaseError {
public:
    UndefinedTableError(const std::string& message, std::string sqlstate)
        : DatabaseError(ErrorKind::UNDEFINED_TABLE, message, std::move(sqlstate)) {}
};

class UndefinedColumnError : public DatabaseError {
public:
    UndefinedColumnError(const std::string& message, std::string sqlstate)
        : DatabaseError(ErrorKind::UNDEFINED_COLUMN, message, std::move(sqlstate)) {}
};

/**
 * @brief Insert referenced a key absent from its parent table
 *
 * key_value is parsed from the server detail line
 * `Key (col)=(value) is not present in table "t".`; empty when the detail
 * could not be parsed.
 */
class ForeignKeyViolationError : public DatabaseError {
public:
    ForeignKeyViolationError(const std::string& message,
                             std::string key_column,
                             std::string key_value,
                             std::string referenced_table)
        : DatabaseError(ErrorKind::FOREIGN_KEY_VIOLATION, message, "23503"),
          key_column_(std::move(key_column)),
          key_value_(std::move(key_value)),
          referenced_table_(std::move(referenced_table)) {}

    [[nodiscard]] const std::string& key_column() const noexcept { return key_column_; }
    [[nodiscard]] const std::string& key_value() const noexcept { return key_value_; }
    [[nodiscard]] const std::string& referenced_table() const noexcept { return referenced_table_; }

private:
    std::string key_column_;
    std::string key_value_;
    std::string referenced_table_;
};

// The source of truth could not supply the missing referent.
class UnresolvableForeignKeyError : public Error {
public:
    UnresolvableForeignKeyError(const std::string& message, std::string key_value)
        : Error(ErrorKind::UNRESOLVABLE_FOREIGN_KEY, message),
          key_value_(std::move(key_value)) {}

    [[nodiscard]] const std::string& key_value() const noexcept { return key_value_; }

private:
    std::string key_value_;
};

class SourceError : public Error {
public:
    explicit SourceError(const std::string& message)
        : Error(ErrorKind::SOURCE, message) {}
};

} // namespace relsync
