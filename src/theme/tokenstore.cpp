/*
 * tokenstore.cpp — Design token tables
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tokenstore.h"

#include <QColor>
#include <QJsonArray>
#include <QRegularExpression>

#include <algorithm>
#include <cmath>
#include <limits>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool isValidFamilyName(const QString &family)
{
    static const QRegularExpression re(QStringLiteral("^[a-z][a-z0-9]*$"));
    // "primary" is an alias for the theme's primary family
    return re.match(family).hasMatch() && family != QLatin1String("primary");
}

static QString normalizedColorName(const QColor &c)
{
    return c.alpha() == 255 ? c.name() : c.name(QColor::HexArgb);
}

QString TokenStore::numericKindName(NumericKind kind)
{
    switch (kind) {
    case Spacing:    return QStringLiteral("spacing");
    case Radius:     return QStringLiteral("radius");
    case FontSize:   return QStringLiteral("fontSizes");
    case LineHeight: return QStringLiteral("lineHeights");
    case FontWeight: return QStringLiteral("fontWeights");
    case Breakpoint: return QStringLiteral("breakpoints");
    }
    return {};
}

// ---------------------------------------------------------------------------
// Colors
// ---------------------------------------------------------------------------

bool TokenStore::registerColor(const QString &family, const QStringList &shades,
                               StyleError *error)
{
    if (!isValidFamilyName(family)) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("invalid color family name '%1'").arg(family));
    }
    if (shades.size() != ShadeCount) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("color family '%1' must have exactly %2 shades, got %3")
                .arg(family).arg(ShadeCount).arg(shades.size()));
    }

    QStringList normalized;
    normalized.reserve(ShadeCount);
    for (int i = 0; i < shades.size(); ++i) {
        QColor c(shades.at(i).trimmed());
        if (!c.isValid()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("invalid shade %1 for color family '%2': %3")
                    .arg(i).arg(family, shades.at(i)));
        }
        normalized.append(normalizedColorName(c));
    }

    // Whole-array replacement, never element-wise
    m_colors.insert(family, normalized);
    return true;
}

QString TokenStore::color(const QString &family, int index, StyleError *error) const
{
    auto it = m_colors.constFind(family);
    if (it == m_colors.constEnd()) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("unknown color family '%1'").arg(family));
        return {};
    }
    if (index < 0 || index >= ShadeCount) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("shade index %1 of '%2' is outside [0, %3]")
                .arg(index).arg(family).arg(ShadeCount - 1));
        return {};
    }
    return it.value().at(index);
}

// ---------------------------------------------------------------------------
// Numeric tokens
// ---------------------------------------------------------------------------

bool TokenStore::setNumeric(NumericKind kind, const QString &key, qreal value,
                            StyleError *error)
{
    const QString table = numericKindName(kind);
    if (key.isEmpty()) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("empty key in %1 table").arg(table));
    }
    if (!std::isfinite(value)) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("%1 '%2' is not a finite number").arg(table, key));
    }

    switch (kind) {
    case Breakpoint:
        if (key == QLatin1String("base")) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("breakpoint name 'base' is reserved"));
        }
        if (value <= 0 || std::floor(value) != value
            || value > std::numeric_limits<int>::max()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("breakpoint '%1' must be a positive integer no larger than %2: %3")
                    .arg(key).arg(std::numeric_limits<int>::max()).arg(value));
        }
        break;
    case Radius:
        if (value < 0) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("radius '%1' must be non-negative: %2").arg(key).arg(value));
        }
        break;
    case Spacing:
        break;
    case FontSize:
    case LineHeight:
    case FontWeight:
        if (value <= 0) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("%1 '%2' must be positive: %3").arg(table, key).arg(value));
        }
        break;
    }

    m_tables[kind].insert(key, value);
    return true;
}

bool TokenStore::hasNumeric(NumericKind kind, const QString &key) const
{
    return m_tables[kind].contains(key);
}

qreal TokenStore::numeric(NumericKind kind, const QString &key, StyleError *error) const
{
    auto it = m_tables[kind].constFind(key);
    if (it == m_tables[kind].constEnd()) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("unknown %1 token '%2'").arg(numericKindName(kind), key));
        return 0;
    }
    return it.value();
}

BreakpointTable TokenStore::breakpoints() const
{
    BreakpointTable table;
    const QMap<QString, qreal> &bps = m_tables[Breakpoint];
    for (auto it = bps.constBegin(); it != bps.constEnd(); ++it)
        table.append({it.key(), static_cast<int>(it.value())});

    // Ties broken by name so the order is total
    std::stable_sort(table.begin(), table.end(),
                     [](const QPair<QString, int> &a, const QPair<QString, int> &b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    });
    return table;
}

bool TokenStore::setScale(qreal scale, StyleError *error)
{
    if (!std::isfinite(scale) || scale <= 0) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("scale must be a positive number: %1").arg(scale));
    }
    m_scale = scale;
    return true;
}

// ---------------------------------------------------------------------------
// Shadows
// ---------------------------------------------------------------------------

bool TokenStore::setShadow(const QString &key, const QString &value, StyleError *error)
{
    if (key.isEmpty() || value.trimmed().isEmpty()) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("shadow '%1' must have a non-empty value").arg(key));
    }
    m_shadows.insert(key, value.trimmed());
    return true;
}

QString TokenStore::shadow(const QString &key, StyleError *error) const
{
    auto it = m_shadows.constFind(key);
    if (it == m_shadows.constEnd()) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("unknown shadow token '%1'").arg(key));
        return {};
    }
    return it.value();
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

bool TokenStore::validate(StyleError *error) const
{
    for (auto it = m_colors.constBegin(); it != m_colors.constEnd(); ++it) {
        // Re-register into a scratch store to reuse the same checks
        TokenStore scratch;
        if (!scratch.registerColor(it.key(), it.value(), error))
            return false;
    }

    for (int k = 0; k < NumericKindCount; ++k) {
        const auto kind = static_cast<NumericKind>(k);
        const QMap<QString, qreal> &table = m_tables[k];
        for (auto it = table.constBegin(); it != table.constEnd(); ++it) {
            TokenStore scratch;
            if (!scratch.setNumeric(kind, it.key(), it.value(), error))
                return false;
        }
    }

    for (auto it = m_shadows.constBegin(); it != m_shadows.constEnd(); ++it) {
        if (it.value().isEmpty()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("shadow '%1' is empty").arg(it.key()));
        }
    }

    if (m_scale <= 0) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("scale must be positive"));
    }
    return true;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

bool TokenStore::mergeNumericTable(NumericKind kind, const QJsonObject &obj,
                                   StyleError *error)
{
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().isDouble()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("%1 '%2' must be a number")
                    .arg(numericKindName(kind), it.key()));
        }
        if (!setNumeric(kind, it.key(), it.value().toDouble(), error))
            return false;
    }
    return true;
}

bool TokenStore::merge(const QJsonObject &obj, StyleError *error)
{
    TokenStore merged = *this;

    const QJsonValue colorsVal = obj.value(QLatin1String("colors"));
    if (!colorsVal.isUndefined()) {
        if (!colorsVal.isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'colors' must be an object"));
        }
        const QJsonObject colorsObj = colorsVal.toObject();
        for (auto it = colorsObj.begin(); it != colorsObj.end(); ++it) {
            if (!it.value().isArray()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("color family '%1' must be an array of shades")
                        .arg(it.key()));
            }
            QStringList shades;
            const QJsonArray arr = it.value().toArray();
            for (const QJsonValue &v : arr) {
                if (!v.isString()) {
                    return StyleError::report(error, StyleError::Validation,
                        QStringLiteral("color family '%1' has a non-string shade")
                            .arg(it.key()));
                }
                shades.append(v.toString());
            }
            if (!merged.registerColor(it.key(), shades, error))
                return false;
        }
    }

    for (int k = 0; k < NumericKindCount; ++k) {
        const auto kind = static_cast<NumericKind>(k);
        const QJsonValue v = obj.value(numericKindName(kind));
        if (v.isUndefined())
            continue;
        if (!v.isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'%1' must be an object").arg(numericKindName(kind)));
        }
        if (!merged.mergeNumericTable(kind, v.toObject(), error))
            return false;
    }

    const QJsonValue shadowsVal = obj.value(QLatin1String("shadows"));
    if (!shadowsVal.isUndefined()) {
        if (!shadowsVal.isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'shadows' must be an object"));
        }
        const QJsonObject shadowsObj = shadowsVal.toObject();
        for (auto it = shadowsObj.begin(); it != shadowsObj.end(); ++it) {
            if (!merged.setShadow(it.key(), it.value().toString(), error))
                return false;
        }
    }

    const QJsonValue scaleVal = obj.value(QLatin1String("scale"));
    if (!scaleVal.isUndefined()) {
        if (!scaleVal.isDouble()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'scale' must be a number"));
        }
        if (!merged.setScale(scaleVal.toDouble(), error))
            return false;
    }

    *this = merged;
    return true;
}

QJsonObject TokenStore::toJson() const
{
    QJsonObject obj;

    QJsonObject colorsObj;
    for (auto it = m_colors.constBegin(); it != m_colors.constEnd(); ++it)
        colorsObj[it.key()] = QJsonArray::fromStringList(it.value());
    obj[QLatin1String("colors")] = colorsObj;

    for (int k = 0; k < NumericKindCount; ++k) {
        QJsonObject tableObj;
        const QMap<QString, qreal> &table = m_tables[k];
        for (auto it = table.constBegin(); it != table.constEnd(); ++it)
            tableObj[it.key()] = it.value();
        obj[numericKindName(static_cast<NumericKind>(k))] = tableObj;
    }

    QJsonObject shadowsObj;
    for (auto it = m_shadows.constBegin(); it != m_shadows.constEnd(); ++it)
        shadowsObj[it.key()] = it.value();
    obj[QLatin1String("shadows")] = shadowsObj;

    obj[QLatin1String("scale")] = m_scale;
    return obj;
}

bool TokenStore::operator==(const TokenStore &other) const
{
    if (m_colors != other.m_colors || m_shadows != other.m_shadows
        || m_scale != other.m_scale)
        return false;
    for (int k = 0; k < NumericKindCount; ++k) {
        if (m_tables[k] != other.m_tables[k])
            return false;
    }
    return true;
}
