#include "state/snapshot.hpp"

namespace projstate {

std::string_view to_string(TransactionStatus status) noexcept {
    switch (status) {
        case TransactionStatus::Active:     return "active";
        case TransactionStatus::Committed:  return "committed";
        case TransactionStatus::RolledBack: return "rolled_back";
    }
    return "unknown";
}

} // namespace projstate
