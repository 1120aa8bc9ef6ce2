#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>

namespace accord {

// How bind markers are written into statement text
enum class binding_style {
    positional,  ///< "?" for every occurrence; one value per occurrence
    numbered,    ///< "$1", "$2"; a repeated parameter reuses its number
    named        ///< ":name"; a repeated parameter reuses its name
};

// ============================================================================
// dialect - backend-specific SQL rules. Passed explicitly to every call that
// generates SQL or converts values; nothing reads a global default.
// ============================================================================

class dialect {
public:
    virtual ~dialect() = default;

    virtual std::string name() const = 0;

    virtual binding_style binding() const = 0;

    /// Marker for the parameter at 1-based position `index`. `parameter` is
    /// the parameter's name, used by named binding only.
    virtual std::string marker(size_t index, const std::string& parameter = {}) const = 0;

    virtual std::string quote_identifier(const std::string& identifier) const;

    /// Whether the backend has real schemas (namespaces). Without them a
    /// schema-qualified object "s.t" is written "s_t".
    virtual bool schema_support() const = 0;

    virtual bool native_booleans() const = 0;

    /// Whether enum_field columns use a named enum type
    virtual bool enum_support() const = 0;

    /// Column type for a semantic type; `length` applies to varchar/fixed_char.
    virtual std::string column_type(value_type type, size_t length = 0) const;

    /// Stored value -> backend representation.
    virtual column_value_t to_backend(const value_t& value) const;

    /// Backend representation -> stored value of the given semantic type.
    /// Throws validation_error when the column cannot represent that type.
    virtual value_t from_backend(const column_value_t& value, value_type type) const;

    // Sequence statement templates. Placeholders: {name}, {start},
    // {interval}, {index_type}. The last nextval statement returns the value.
    virtual std::vector<std::string> create_sequence_sql() const = 0;
    virtual std::vector<std::string> nextval_sequence_sql() const = 0;
    virtual std::vector<std::string> reset_sequence_sql() const = 0;

    // Helpers built on the rules above

    /// "schema.object" or "schema_object", each part quoted.
    std::string qualify(const std::string& schema, const std::string& object) const;

    /// Unquoted form of qualify(), used when rewriting hand-written SQL text.
    std::string qualify_raw(const std::string& schema, const std::string& object) const;

    /// "m1, m2, ..." for `count` markers starting at position `start`.
    std::string parameter_list(size_t count, size_t start = 1) const;

    /// "c1 = m1<joiner>c2 = m2..." for the given (unquoted) column names.
    std::string parameter_values(const std::vector<std::string>& columns,
                                 size_t start = 1,
                                 const std::string& joiner = ", ") const;
};

// Bundled default: the embedded sqlite3 engine
class sqlite_dialect : public dialect {
public:
    std::string name() const override { return "sqlite"; }
    binding_style binding() const override { return binding_style::positional; }
    std::string marker(size_t index, const std::string& parameter = {}) const override;
    bool schema_support() const override { return false; }
    bool native_booleans() const override { return false; }
    bool enum_support() const override { return false; }
    std::string column_type(value_type type, size_t length = 0) const override;
    std::vector<std::string> create_sequence_sql() const override;
    std::vector<std::string> nextval_sequence_sql() const override;
    std::vector<std::string> reset_sequence_sql() const override;
};

// Numbered markers and real schemas, as used by libpq
class postgresql_dialect : public dialect {
public:
    std::string name() const override { return "postgresql"; }
    binding_style binding() const override { return binding_style::numbered; }
    std::string marker(size_t index, const std::string& parameter = {}) const override;
    bool schema_support() const override { return true; }
    bool native_booleans() const override { return true; }
    bool enum_support() const override { return true; }
    std::string column_type(value_type type, size_t length = 0) const override;
    std::vector<std::string> create_sequence_sql() const override;
    std::vector<std::string> nextval_sequence_sql() const override;
    std::vector<std::string> reset_sequence_sql() const override;
};

} // namespace accord

#endif // __cplusplus
