#include "proxykeeper/repository/ProxyRecordStore.hpp"

namespace proxykeeper::repository {

const char* toString(AssignOutcome outcome) noexcept {
    switch (outcome) {
    case AssignOutcome::assigned: return "assigned";
    case AssignOutcome::conflict: return "conflict";
    case AssignOutcome::notFound: return "not_found";
    }
    return "unknown";
}

} // namespace proxykeeper::repository
