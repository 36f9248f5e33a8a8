/*
 * stylevalue.h — Raw prop values (literal, token reference, responsive map)
 *
 * A StyleValue is what application code writes into a prop bag: a number,
 * a string (literal or token reference) or a ResponsiveValue keyed by
 * breakpoint name.  Nothing here knows about the theme; resolution happens
 * in ValueResolver.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_STYLEVALUE_H
#define POLYSTYLE_STYLEVALUE_H

#include <QJsonValue>
#include <QMap>
#include <QString>
#include <QStringList>

#include <initializer_list>
#include <variant>

using ScalarValue = std::variant<qreal, QString>;

class ResponsiveValue
{
public:
    struct Entry {
        Entry(const QString &bp, qreal n) : breakpoint(bp), value(n) {}
        Entry(const QString &bp, int n) : breakpoint(bp), value(static_cast<qreal>(n)) {}
        Entry(const QString &bp, const QString &s) : breakpoint(bp), value(s) {}

        QString breakpoint;
        ScalarValue value;
    };

    ResponsiveValue() = default;
    ResponsiveValue(std::initializer_list<Entry> entries);

    void insert(const QString &breakpoint, const ScalarValue &value);
    bool contains(const QString &breakpoint) const { return m_entries.contains(breakpoint); }
    ScalarValue value(const QString &breakpoint) const { return m_entries.value(breakpoint); }
    QStringList breakpoints() const { return m_entries.keys(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    bool operator==(const ResponsiveValue &other) const { return m_entries == other.m_entries; }
    bool operator!=(const ResponsiveValue &other) const { return !(*this == other); }

private:
    QMap<QString, ScalarValue> m_entries;
};

class StyleValue
{
public:
    enum Type { Null, Number, String, Responsive };

    StyleValue() = default;
    StyleValue(qreal number) : m_data(number) {}
    StyleValue(int number) : m_data(static_cast<qreal>(number)) {}
    StyleValue(const QString &text) : m_data(text) {}
    StyleValue(const char *text) : m_data(QString::fromUtf8(text)) {}
    StyleValue(const ResponsiveValue &responsive) : m_data(responsive) {}
    StyleValue(const ScalarValue &scalar);

    Type type() const { return static_cast<Type>(m_data.index()); }
    bool isNull() const { return type() == Null; }
    bool isResponsive() const { return type() == Responsive; }

    qreal toNumber() const;
    QString toString() const;
    ResponsiveValue toResponsive() const;

    /// Canonical text used for prop-bag fingerprints.
    QString fingerprintText() const;

    static StyleValue fromJson(const QJsonValue &value);
    QJsonValue toJson() const;

    bool operator==(const StyleValue &other) const { return m_data == other.m_data; }
    bool operator!=(const StyleValue &other) const { return !(*this == other); }

private:
    std::variant<std::monostate, qreal, QString, ResponsiveValue> m_data;
};

#endif // POLYSTYLE_STYLEVALUE_H
