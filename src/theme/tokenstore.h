/*
 * tokenstore.h — Design token tables (colors, spacing, radius, type, breakpoints)
 *
 * Color families hold exactly ShadeCount shades, lightest first.
 * Numeric tables are keyed by name (xs, sm, md, ...).  All tables are
 * ordered maps so iteration and serialization are deterministic.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_TOKENSTORE_H
#define POLYSTYLE_TOKENSTORE_H

#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>

#include "styleerror.h"

// Breakpoint name -> minimum width, ascending by width.  "base" is implicit.
using BreakpointTable = QList<QPair<QString, int>>;

class TokenStore
{
public:
    enum NumericKind {
        Spacing,
        Radius,
        FontSize,
        LineHeight,
        FontWeight,
        Breakpoint,
    };
    static constexpr int NumericKindCount = Breakpoint + 1;
    static constexpr int ShadeCount = 10;

    TokenStore() = default;

    // --- Colors ---

    /// Register (or replace) a whole color family.
    bool registerColor(const QString &family, const QStringList &shades,
                       StyleError *error = nullptr);
    /// Shade @p index of @p family as a color name, empty on failure.
    QString color(const QString &family, int index, StyleError *error = nullptr) const;
    bool hasColor(const QString &family) const { return m_colors.contains(family); }
    QStringList colorFamilies() const { return m_colors.keys(); }
    QStringList shades(const QString &family) const { return m_colors.value(family); }

    // --- Numeric tokens ---

    bool setNumeric(NumericKind kind, const QString &key, qreal value,
                    StyleError *error = nullptr);
    bool hasNumeric(NumericKind kind, const QString &key) const;
    qreal numeric(NumericKind kind, const QString &key, StyleError *error = nullptr) const;
    QMap<QString, qreal> numericTable(NumericKind kind) const { return m_tables[kind]; }

    // --- Shadows ---

    bool setShadow(const QString &key, const QString &value, StyleError *error = nullptr);
    bool hasShadow(const QString &key) const { return m_shadows.contains(key); }
    QString shadow(const QString &key, StyleError *error = nullptr) const;
    QMap<QString, QString> shadows() const { return m_shadows; }

    BreakpointTable breakpoints() const;

    /// Global factor applied to bare numeric lengths.
    qreal scale() const { return m_scale; }
    bool setScale(qreal scale, StyleError *error = nullptr);

    // --- Validation / serialization ---

    bool validate(StyleError *error = nullptr) const;

    /// Merge a partial token description.  Color families replace the whole
    /// shade array; every other table merges key by key.  On failure the
    /// store is left unchanged.
    bool merge(const QJsonObject &obj, StyleError *error = nullptr);
    QJsonObject toJson() const;

    static QString numericKindName(NumericKind kind);

    bool operator==(const TokenStore &other) const;
    bool operator!=(const TokenStore &other) const { return !(*this == other); }

private:
    bool mergeNumericTable(NumericKind kind, const QJsonObject &obj, StyleError *error);

    QMap<QString, QStringList> m_colors;        // family -> 10 shades
    QMap<QString, qreal> m_tables[NumericKindCount];
    QMap<QString, QString> m_shadows;
    qreal m_scale = 1.0;
};

#endif // POLYSTYLE_TOKENSTORE_H
