#include "accord/cursor.hpp"
#include "accord/log.hpp"
#include <exception>

namespace accord {

transaction_scope::transaction_scope(cursor& cur, isolation_level level)
    : cursor_(cur), managed_(level != isolation_level::manual) {
    if (managed_) {
        cursor_.begin(level);
    }
}

transaction_scope::~transaction_scope() {
    if (managed_ && !completed_) {
        try {
            cursor_.rollback();
        } catch (const std::exception& e) {
            // never throws
            LOG_ERROR("scope", "Rollback failed: %s", e.what());
        }
    }
}

void transaction_scope::commit() {
    if (managed_) {
        cursor_.commit();
    }
    completed_ = true;
}

void transaction_scope::rollback() {
    if (managed_) {
        cursor_.rollback();
    }
    completed_ = true;
}

} // namespace accord
