/*
 * stylecache.h — Generated style sheet cache with LRU eviction
 *
 * Entries are keyed by (widget, window, breakpoint, theme version, prop
 * fingerprint).  A theme change only bumps the version: older entries can
 * no longer be hit and are the first to go when the cache is full.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_STYLECACHE_H
#define POLYSTYLE_STYLECACHE_H

#include <QByteArray>
#include <QHash>
#include <QHashFunctions>
#include <QString>

#include "stylesheetgenerator.h"

class StyleCache
{
public:
    struct Key {
        quintptr widget = 0;
        quintptr window = 0;
        QString breakpoint;
        quint64 themeVersion = 0;
        QByteArray fingerprint;

        bool operator==(const Key &o) const {
            return widget == o.widget && window == o.window
                && breakpoint == o.breakpoint && themeVersion == o.themeVersion
                && fingerprint == o.fingerprint;
        }
    };
    friend size_t qHash(const Key &k, size_t seed) {
        return qHashMulti(seed, k.widget, k.window, k.breakpoint, k.themeVersion,
                          k.fingerprint);
    }

    StyleCache() = default;

    bool contains(const Key &key) const { return m_cache.contains(key); }
    /// Cached artifact, or a null artifact on a miss.  Counts hits/misses.
    StyleSheetArtifact artifact(const Key &key) const;
    void insert(const Key &key, const StyleSheetArtifact &artifact);

    /// Entries keyed under an older version become stale.
    void setThemeVersion(quint64 version) { m_themeVersion = version; }
    quint64 themeVersion() const { return m_themeVersion; }

    /// Drop every entry of one window (breakpoint crossing).  Returns the
    /// number of dropped entries.
    int invalidateWindow(quintptr window);
    int invalidateWidget(quintptr widget);
    void clear();

    int size() const { return static_cast<int>(m_cache.size()); }
    int capacity() const { return m_capacity; }
    void setCapacity(int entries);

    int hits() const { return m_hits; }
    int misses() const { return m_misses; }

private:
    struct CacheEntry {
        StyleSheetArtifact artifact;
        mutable qint64 lastAccess = 0;
    };

    void evictIfNeeded();

    QHash<Key, CacheEntry> m_cache;
    quint64 m_themeVersion = 0;
    int m_capacity = 512;
    mutable qint64 m_accessCounter = 0;
    mutable int m_hits = 0;
    mutable int m_misses = 0;
};

#endif // POLYSTYLE_STYLECACHE_H
