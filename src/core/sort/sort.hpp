#ifndef CORE_SORT_HPP
#define CORE_SORT_HPP

#include <optional>
#include <vector>

#include "../../config/config.hpp"
#include "../record.hpp"

namespace core::sort {
// Stable sort by `key`. Missing numeric values order as -1, equal keys keep
// their input order in both directions.
void SortRecords(std::vector<AccessRecord> &records, config::SortKey key,
                 bool descending);

// Keeps the first `limit` records. A negative limit drops that many records
// from the end instead.
void ApplyLimit(std::vector<AccessRecord> &records, std::optional<i64> limit);
}  // namespace core::sort

#endif
