#include "sort.hpp"

#include <algorithm>
#include <cmath>

namespace core::sort {
namespace {
f64 FloatKey(const std::optional<f64> &value) {
    if (!value || std::isnan(*value)) return -1.0;
    return *value;
}

i64 IntKey(const std::optional<i64> &value) { return value.value_or(-1); }

template <typename KeyFunc>
void StableSortBy(std::vector<AccessRecord> &records, bool descending,
                  KeyFunc key) {
    if (descending) {
        std::stable_sort(records.begin(), records.end(),
                         [&](const AccessRecord &a, const AccessRecord &b) {
                             return key(b) < key(a);
                         });
    } else {
        std::stable_sort(records.begin(), records.end(),
                         [&](const AccessRecord &a, const AccessRecord &b) {
                             return key(a) < key(b);
                         });
    }
}
}  // namespace

void SortRecords(std::vector<AccessRecord> &records, config::SortKey key,
                 bool descending) {
    switch (key) {
        case config::SortKey::TimeUtc:
            StableSortBy(records, descending,
                         [](const AccessRecord &r) { return r.time; });
            break;
        case config::SortKey::Status:
            StableSortBy(records, descending, [](const AccessRecord &r) {
                return IntKey(r.status);
            });
            break;
        case config::SortKey::RequestTime:
            StableSortBy(records, descending, [](const AccessRecord &r) {
                return FloatKey(r.request_time);
            });
            break;
        case config::SortKey::BodyBytesSent:
            StableSortBy(records, descending, [](const AccessRecord &r) {
                return IntKey(r.body_bytes_sent);
            });
            break;
        case config::SortKey::UpstreamResponseTime:
            StableSortBy(records, descending, [](const AccessRecord &r) {
                return FloatKey(r.upstream_response_time);
            });
            break;
    }
}

void ApplyLimit(std::vector<AccessRecord> &records, std::optional<i64> limit) {
    if (!limit) return;

    auto size = static_cast<i64>(records.size());
    i64 keep = *limit >= 0 ? std::min(*limit, size)
                           : std::max<i64>(size + *limit, 0);
    records.resize(static_cast<usize>(keep));
}
}  // namespace core::sort
