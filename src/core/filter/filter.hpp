#ifndef CORE_FILTER_HPP
#define CORE_FILTER_HPP

#include "../../config/config.hpp"
#include "../record.hpp"

namespace core::filter {
// True when `record` passes every filter set in `filters`. Unset filters
// always pass, time bounds are inclusive.
bool Matches(const AccessRecord &record, const config::FilterConfig &filters);

bool IsEmpty(const config::FilterConfig &filters);
}  // namespace core::filter

#endif
