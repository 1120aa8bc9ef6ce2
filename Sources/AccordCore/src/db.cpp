#include "accord/db.hpp"
#include "accord/log.hpp"
#include <utility>

namespace accord {

sqlite_database::sqlite_database(const configuration& config) : config_(config) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (config_.read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(config_.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    if (config_.foreign_keys) {
        exec_simple("PRAGMA foreign_keys = ON");
    }

    if (config_.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(db_, config_.busy_timeout_ms);
    }

    LOG_DEBUG("db", "Opened %s", config_.path.c_str());
}

sqlite_database::~sqlite_database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

sqlite_database::sqlite_database(sqlite_database&& other) noexcept
    : db_(other.db_), config_(std::move(other.config_)) {
    other.db_ = nullptr;
}

sqlite_database& sqlite_database::operator=(sqlite_database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        config_ = std::move(other.config_);
        other.db_ = nullptr;
    }
    return *this;
}

void sqlite_database::exec_simple(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql);
        throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
    }
}

std::vector<row_t> sqlite_database::execute(const std::string& sql,
                                            const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }

    int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Statement expects %d parameters, %zu supplied (SQL: %s)",
                  expected, params.size(), sql.c_str());
        throw db_error("Statement expects " + std::to_string(expected) + " parameters, " +
                       std::to_string(params.size()) + " supplied (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        row.reserve(static_cast<size_t>(col_count));
        for (int i = 0; i < col_count; ++i) {
            row.push_back(extract_column(stmt, i));
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error + " (SQL: " + sql + ")");
    }

    return results;
}

void sqlite_database::begin(isolation_level level) {
    // SQLite transactions are always serializable. EXCLUSIVE also blocks
    // readers on other connections; IMMEDIATE only takes the write lock.
    switch (level) {
        case isolation_level::manual:
            return;
        case isolation_level::serializable:
            exec_simple("BEGIN EXCLUSIVE");
            break;
        default:
            exec_simple("BEGIN IMMEDIATE");
            break;
    }
}

void sqlite_database::commit() {
    exec_simple("COMMIT");
}

void sqlite_database::rollback() {
    exec_simple("ROLLBACK");
}

bool sqlite_database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

bool sqlite_database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void sqlite_database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, bool>) {
            sqlite3_bind_int64(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t sqlite_database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return blob_t(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // namespace accord
