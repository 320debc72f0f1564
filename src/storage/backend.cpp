#include <novelforge/storage/backend.hpp>
#include <novelforge/core/logger.hpp>

namespace novelforge {

TransactionGuard::TransactionGuard(StorageBackend& backend)
    : backend_(backend)
    , active_(false)
{
    begin_status_ = backend_.begin();
    active_ = begin_status_.ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        Status s = backend_.rollback();
        if (!s.ok()) {
            LOG_ERROR("[Storage] Rollback of abandoned transaction failed: %s",
                      s.to_string().c_str());
        }
    }
}

Status TransactionGuard::commit() {
    if (!active_) {
        return Status::fail(ErrorCode::STORAGE, "no active transaction");
    }
    active_ = false;
    return backend_.commit();
}

Status TransactionGuard::rollback() {
    if (!active_) return Status::ok_status();
    active_ = false;
    return backend_.rollback();
}

} // namespace novelforge
