#pragma once

#include "core/query/list_source.h"
#include "core/query/result_cache_notifier.h"
#include "core/shared/logging.h"

#include <QString>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cdir {

// Scroll window over a ListSource.
//
// Keeps the last fetched slice [first, first + length) in memory. Moving the
// window inside that slice is served locally; anything else goes to the
// source. A short result that would only shrink the window onto data it
// already shows (scrolling past the end) is dropped, so the view does not
// jump. Every content change is published through notifier().
//
// Not thread-safe.
template <typename T>
class WindowedResultCache {
public:
    WindowedResultCache(ListSource<T>& source, const QString& objectsType, bool fuzzyMatch = false)
        : m_source(source)
        , m_notifier(objectsType)
        , m_fuzzyMatch(fuzzyMatch)
    {
    }

    WindowedResultCache(const WindowedResultCache&) = delete;
    WindowedResultCache& operator=(const WindowedResultCache&) = delete;

    // True if [offset, offset + length) lies inside the cached window.
    bool isSubsetOf(std::size_t offset, std::size_t length) const
    {
        return m_entries.has_value()
            && offset >= m_first
            && offset + length <= m_first + m_length;
    }

    // Moves the window to [offset, offset + length). Returns true if the
    // cache was refilled from the source.
    bool update(std::size_t offset, std::size_t length, bool force)
    {
        LOG_DEBUG(cdirCache, "update first=%zu length=%zu force=%d", offset, length, force ? 1 : 0);
        if (!force && !m_fuzzyMatch && updateIntoSubset(offset, length)) {
            return false;
        }

        StoreResult<std::vector<T>> fetched = m_source.list(offset, length, m_filter, m_fuzzyMatch);
        if (fetched.isError()) {
            LOG_ERROR(cdirCache, "%s listing failed: %s",
                      qUtf8Printable(m_notifier.objectsType()),
                      qUtf8Printable(fetched.error().toString()));
            return false;
        }

        const std::size_t fetchedLength = fetched->size();
        if (!force && fetchedLength != length && isSubsetOf(offset, fetchedLength)) {
            // Scrolled out of the data
            LOG_DEBUG(cdirCache, "Short result is a subset of the window, keeping it");
            return false;
        }

        if (fetchedLength == 0) {
            if (!force) {
                return false;
            }
            clear();
            m_notifier.publish(true);
            return true;
        }

        m_entries = std::move(fetched.value());
        m_first = offset;
        m_length = fetchedLength;
        m_notifier.publish(false);
        return true;
    }

    // Moves the window by `relativeOffset` rows, clamped at zero.
    bool updateToOffset(int64_t relativeOffset, std::size_t length)
    {
        const int64_t target = static_cast<int64_t>(m_first) + relativeOffset;
        return update(target < 0 ? 0 : static_cast<std::size_t>(target), length, false);
    }

    // New filter: refetch from the top.
    bool updateFilter(std::size_t length, const QString& filter, bool fuzzyMatch)
    {
        m_filter = filter;
        m_fuzzyMatch = fuzzyMatch;
        return update(0, length, true);
    }

    void setFuzzyMatch(bool fuzzyMatch)
    {
        if (m_fuzzyMatch == fuzzyMatch) {
            return;
        }
        LOG_DEBUG(cdirCache, "fuzzyMatch=%d", fuzzyMatch ? 1 : 0);
        m_fuzzyMatch = fuzzyMatch;
        update(m_first, m_length, true);
    }

    // Refetches the current window, e.g. after a row was deleted.
    void reload()
    {
        StoreResult<std::vector<T>> fetched = m_source.list(m_first, m_length, m_filter, m_fuzzyMatch);
        if (fetched.isError()) {
            LOG_ERROR(cdirCache, "%s reload failed: %s",
                      qUtf8Printable(m_notifier.objectsType()),
                      qUtf8Printable(fetched.error().toString()));
            return;
        }

        if (fetched->empty()) {
            m_entries.reset();
            m_length = 0;
            m_notifier.publish(true);
            return;
        }
        m_length = fetched->size();
        m_entries = std::move(fetched.value());
        m_notifier.publish(false);
    }

    const std::optional<std::vector<T>>& entries() const { return m_entries; }
    std::size_t first() const { return m_first; }
    std::size_t length() const { return m_length; }
    const QString& filter() const { return m_filter; }
    bool isFuzzyMatch() const { return m_fuzzyMatch; }

    ResultCacheNotifier& notifier() { return m_notifier; }

private:
    bool updateIntoSubset(std::size_t offset, std::size_t length)
    {
        if (!isSubsetOf(offset, length)) {
            return false;
        }
        const std::vector<T>& cached = *m_entries;
        const auto begin = cached.begin() + static_cast<std::ptrdiff_t>(offset - m_first);
        m_entries = std::vector<T>(begin, begin + static_cast<std::ptrdiff_t>(length));
        m_first = offset;
        m_length = length;
        LOG_DEBUG(cdirCache, "Window served from cache first=%zu length=%zu", m_first, m_length);
        m_notifier.publish(m_length == 0);
        return true;
    }

    void clear()
    {
        m_entries.reset();
        m_first = 0;
        m_length = 0;
    }

    ListSource<T>& m_source;
    ResultCacheNotifier m_notifier;
    std::optional<std::vector<T>> m_entries;
    std::size_t m_first = 0;
    std::size_t m_length = 0;
    QString m_filter;
    bool m_fuzzyMatch = false;
};

} // namespace cdir
