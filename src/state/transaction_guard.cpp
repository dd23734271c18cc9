#include "state/transaction_guard.hpp"

#include <utility>

#include "state/state_store.hpp"

namespace projstate {

TransactionGuard::TransactionGuard(StateStore& store, std::string operation_name)
    : store_(store)
    , id_(store.begin_transaction(std::move(operation_name)))
{
}

TransactionGuard::~TransactionGuard() {
    if (armed_) {
        rollback("transaction scope exited without commit");
    }
}

void TransactionGuard::commit() {
    store_.commit_transaction(id_);
    armed_ = false;
}

void TransactionGuard::rollback(std::string reason) noexcept {
    if (!armed_) {
        return;
    }
    armed_ = false;
    store_.abandon_transaction(id_, std::move(reason));
}

} // namespace projstate
