#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace accord {

// Base of every error raised by accord
class accord_error : public std::runtime_error {
public:
    explicit accord_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A value failed the type, nullability or length check of its field.
/// Raised at assignment time, independent of any transaction scope.
class validation_error : public accord_error {
public:
    explicit validation_error(const std::string& msg) : accord_error(msg) {}
};

/// A name that is not part of the record, query or transaction definition.
class schema_violation_error : public accord_error {
public:
    explicit schema_violation_error(const std::string& msg) : accord_error(msg) {}
};

/// Structural problem with a definition: missing or duplicate primary key,
/// constraint on an unknown column, relation without a name.
class schema_error : public accord_error {
public:
    explicit schema_error(const std::string& msg) : accord_error(msg) {}
};

/// A hook or the verify step rejected the transaction.
class verification_error : public accord_error {
public:
    explicit verification_error(const std::string& msg) : accord_error(msg) {}
};

/// context_select found no context value to restrict a SELECT with.
class unbound_query_error : public accord_error {
public:
    explicit unbound_query_error(const std::string& msg) : accord_error(msg) {}
};

/// A query placeholder does not name one of the query's parameter fields.
class query_parameter_error : public accord_error {
public:
    explicit query_parameter_error(const std::string& msg) : accord_error(msg) {}
};

/// An external value generator (sequence, clock) failed during update().
class generation_error : public accord_error {
public:
    explicit generation_error(const std::string& msg) : accord_error(msg) {}
};

/// Failure reported by the underlying database driver.
class db_error : public accord_error {
public:
    explicit db_error(const std::string& msg) : accord_error(msg) {}
};

} // namespace accord

#endif // __cplusplus
