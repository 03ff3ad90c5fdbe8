#pragma once

#include "core/shared/store_result.h"

#include <QString>

#include <cstddef>
#include <vector>

namespace cdir {

// A paginated, filterable source of entries. PathIndex and ShortcutRegistry
// implement it; WindowedResultCache consumes it.
template <typename T>
class ListSource {
public:
    virtual ~ListSource() = default;

    // Entries [offset, offset + limit) of the listing selected by `filter`
    // (substring match, or subsequence match when `fuzzy` is set).
    virtual StoreResult<std::vector<T>> list(std::size_t offset, std::size_t limit,
                                             const QString& filter, bool fuzzy) = 0;
};

} // namespace cdir
