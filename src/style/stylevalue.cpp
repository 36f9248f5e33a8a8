/*
 * stylevalue.cpp — Raw prop values
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stylevalue.h"

#include <QJsonObject>

static QJsonValue scalarToJson(const ScalarValue &value)
{
    if (const qreal *n = std::get_if<qreal>(&value))
        return *n;
    return std::get<QString>(value);
}

// ---------------------------------------------------------------------------
// ResponsiveValue
// ---------------------------------------------------------------------------

ResponsiveValue::ResponsiveValue(std::initializer_list<Entry> entries)
{
    for (const Entry &e : entries)
        m_entries.insert(e.breakpoint, e.value);
}

void ResponsiveValue::insert(const QString &breakpoint, const ScalarValue &value)
{
    m_entries.insert(breakpoint, value);
}

// ---------------------------------------------------------------------------
// StyleValue
// ---------------------------------------------------------------------------

StyleValue::StyleValue(const ScalarValue &scalar)
{
    if (const qreal *n = std::get_if<qreal>(&scalar))
        m_data = *n;
    else
        m_data = std::get<QString>(scalar);
}

qreal StyleValue::toNumber() const
{
    if (const qreal *n = std::get_if<qreal>(&m_data))
        return *n;
    if (const QString *s = std::get_if<QString>(&m_data))
        return s->toDouble();
    return 0;
}

QString StyleValue::toString() const
{
    if (const qreal *n = std::get_if<qreal>(&m_data))
        return QString::number(*n, 'g', 12);
    if (const QString *s = std::get_if<QString>(&m_data))
        return *s;
    return {};
}

ResponsiveValue StyleValue::toResponsive() const
{
    if (const ResponsiveValue *r = std::get_if<ResponsiveValue>(&m_data))
        return *r;
    return {};
}

QString StyleValue::fingerprintText() const
{
    switch (type()) {
    case Null:
        return QStringLiteral("null");
    case Number:
        return QLatin1Char('#') + toString();
    case String:
        return QLatin1Char('"') + toString() + QLatin1Char('"');
    case Responsive: {
        // Breakpoint keys are iterated in map order, so this is canonical
        const ResponsiveValue r = toResponsive();
        QStringList parts;
        for (const QString &bp : r.breakpoints())
            parts.append(bp + QLatin1Char('=') + StyleValue(r.value(bp)).fingerprintText());
        return QLatin1Char('{') + parts.join(QLatin1Char(',')) + QLatin1Char('}');
    }
    }
    return {};
}

StyleValue StyleValue::fromJson(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::Double:
        return StyleValue(value.toDouble());
    case QJsonValue::String:
        return StyleValue(value.toString());
    case QJsonValue::Object: {
        ResponsiveValue r;
        const QJsonObject obj = value.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (it.value().isDouble())
                r.insert(it.key(), it.value().toDouble());
            else if (it.value().isString())
                r.insert(it.key(), it.value().toString());
        }
        return StyleValue(r);
    }
    default:
        break;
    }
    return {};
}

QJsonValue StyleValue::toJson() const
{
    switch (type()) {
    case Null:
        return QJsonValue();
    case Number:
        return toNumber();
    case String:
        return toString();
    case Responsive: {
        QJsonObject obj;
        const ResponsiveValue r = toResponsive();
        for (const QString &bp : r.breakpoints())
            obj[bp] = scalarToJson(r.value(bp));
        return obj;
    }
    }
    return QJsonValue();
}
