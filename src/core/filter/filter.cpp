#include "filter.hpp"

#include "../../utils/utils.hpp"

namespace core::filter {
bool Matches(const AccessRecord &record, const config::FilterConfig &filters) {
    if (!filters.statuses.empty() &&
        (!record.status || !utils::contains(filters.statuses, *record.status))) {
        return false;
    }
    if (!filters.methods.empty() &&
        !utils::contains(filters.methods, record.method)) {
        return false;
    }
    if (!filters.path_contains.empty() &&
        record.path.find(filters.path_contains) == std::string::npos) {
        return false;
    }
    if (!filters.ips.empty() &&
        !utils::contains(filters.ips, record.remote_addr)) {
        return false;
    }
    if (filters.since && record.time < *filters.since) {
        return false;
    }
    if (filters.until && record.time > *filters.until) {
        return false;
    }
    return true;
}

bool IsEmpty(const config::FilterConfig &filters) {
    return filters.statuses.empty() && filters.methods.empty() &&
           filters.path_contains.empty() && filters.ips.empty() &&
           !filters.since && !filters.until;
}
}  // namespace core::filter
