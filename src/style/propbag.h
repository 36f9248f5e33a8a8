/*
 * propbag.h — Style props declared for one widget instance
 *
 * A flat list of typed entries.  Each entry names a short-hand prop (or,
 * for escape-hatch entries, a literal QSS property), a raw value, the
 * pseudo-state it applies to and the inner element it targets.
 *
 * JSON form:
 *   { "m": "md", "c": "blue.6", "w": { "base": 100, "lg": 300 },
 *     ":hover": { "bg": "gray.1" },
 *     "styles": { "label": { "c": "dimmed" } },
 *     "style":  { "qproperty-alignment": "AlignCenter" } }
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_PROPBAG_H
#define POLYSTYLE_PROPBAG_H

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "styledeclaration.h"
#include "styleerror.h"
#include "stylevalue.h"

class PropBag
{
public:
    struct Entry {
        QString name;
        StyleValue value;
        PseudoState state = PseudoState::None;
        QString target;
        bool raw = false;   // escape hatch: name is a literal property

        bool operator==(const Entry &other) const {
            return name == other.name && value == other.value && state == other.state
                && target == other.target && raw == other.raw;
        }
    };

    PropBag() = default;

    /// Set (or replace) a short-hand prop.
    PropBag &set(const QString &name, const StyleValue &value,
                 PseudoState state = PseudoState::None,
                 const QString &target = QString());
    /// Set (or replace) an escape-hatch property written verbatim.
    PropBag &setRaw(const QString &property, const StyleValue &value,
                    PseudoState state = PseudoState::None,
                    const QString &target = QString());

    StyleValue value(const QString &name, PseudoState state = PseudoState::None,
                     const QString &target = QString()) const;
    bool contains(const QString &name, PseudoState state = PseudoState::None,
                  const QString &target = QString()) const;

    const QList<Entry> &entries() const { return m_entries; }
    bool isEmpty() const { return m_entries.isEmpty(); }
    bool isResponsive() const;

    /// Entries of @p other replace matching entries here, others are appended.
    void merge(const PropBag &other);

    /// SHA-1 over a canonical, order-independent rendering of the entries.
    QByteArray fingerprint() const;

    /// Malformed input yields an empty bag, a warning and a Validation
    /// error in @p error.
    static PropBag fromJson(const QJsonObject &obj, StyleError *error = nullptr);
    QJsonObject toJson() const;

    bool operator==(const PropBag &other) const;
    bool operator!=(const PropBag &other) const { return !(*this == other); }

private:
    void insertEntry(const Entry &entry);
    bool readJsonLevel(const QJsonObject &obj, PseudoState state, const QString &target,
                       StyleError *error);

    QList<Entry> m_entries;
};

#endif // POLYSTYLE_PROPBAG_H
