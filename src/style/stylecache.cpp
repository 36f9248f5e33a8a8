/*
 * stylecache.cpp — Generated style sheet cache with LRU eviction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stylecache.h"

StyleSheetArtifact StyleCache::artifact(const Key &key) const
{
    auto it = m_cache.constFind(key);
    if (it == m_cache.constEnd()) {
        ++m_misses;
        return {};
    }
    ++m_hits;
    it->lastAccess = ++m_accessCounter;
    return it->artifact;
}

void StyleCache::insert(const Key &key, const StyleSheetArtifact &artifact)
{
    CacheEntry entry;
    entry.artifact = artifact;
    entry.lastAccess = ++m_accessCounter;
    m_cache.insert(key, entry);

    evictIfNeeded();
}

int StyleCache::invalidateWindow(quintptr window)
{
    int dropped = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it.key().window == window) {
            it = m_cache.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

int StyleCache::invalidateWidget(quintptr widget)
{
    int dropped = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it.key().widget == widget) {
            it = m_cache.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void StyleCache::clear()
{
    m_cache.clear();
}

void StyleCache::setCapacity(int entries)
{
    m_capacity = qMax(1, entries);
    evictIfNeeded();
}

void StyleCache::evictIfNeeded()
{
    while (m_cache.size() > m_capacity && !m_cache.isEmpty()) {
        // Stale theme versions go first, then least recently used
        auto victim = m_cache.begin();
        for (auto it = m_cache.begin(); it != m_cache.end(); ++it) {
            const bool itStale = it.key().themeVersion != m_themeVersion;
            const bool victimStale = victim.key().themeVersion != m_themeVersion;
            if (itStale != victimStale) {
                if (itStale)
                    victim = it;
                continue;
            }
            if (it->lastAccess < victim->lastAccess)
                victim = it;
        }
        m_cache.erase(victim);
    }
}
