/*
 * valueresolver.h — Turns raw prop values into concrete style values
 *
 * Grammar, in order of precedence:
 *   - bare number (or numeric string)  -> scaled length / unitless number
 *   - "<n>px"                          -> already converted length
 *   - "[-]<family>.<index>"            -> color shade ("primary" = primary family)
 *   - "[-]<key>" of the kind's table   -> token value (spacing md, radius lg, ...)
 *   - semantic alias / family name     -> color (color kind only)
 *   - anything else                    -> passed through unchanged
 *
 * Responsive values pick the entry for the active breakpoint, falling back
 * through smaller breakpoints to "base".
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_VALUERESOLVER_H
#define POLYSTYLE_VALUERESOLVER_H

#include <QString>
#include <QStringList>

#include "styleerror.h"
#include "stylevalue.h"

class Theme;

enum class ValueKind {
    Spacing,
    Size,
    Radius,
    FontSize,
    LineHeight,
    FontWeight,
    Color,
    Shadow,
    Number,     // unitless (opacity)
    Text,       // free text, never a token
    Generic,    // unknown property: tokens allowed, bare numbers stay unitless
};

struct ResolveContext {
    QString activeBreakpoint = QStringLiteral("base");
    ValueKind kind = ValueKind::Generic;
};

class ResolvedValue
{
public:
    enum Type { Invalid, Length, Number, Color, Text };

    ResolvedValue() = default;
    static ResolvedValue length(qreal px) { return ResolvedValue(Length, px, QString()); }
    static ResolvedValue number(qreal n) { return ResolvedValue(Number, n, QString()); }
    static ResolvedValue color(const QString &c) { return ResolvedValue(Color, 0, c); }
    static ResolvedValue text(const QString &t) { return ResolvedValue(Text, 0, t); }

    Type type() const { return m_type; }
    bool isValid() const { return m_type != Invalid; }
    qreal numericValue() const { return m_number; }

    /// Breakpoint whose entry produced this value, empty for scalars.
    QString breakpoint() const { return m_breakpoint; }
    void setBreakpoint(const QString &bp) { m_breakpoint = bp; }

    /// QSS text: "16px", "1.55", "#2563eb", ...
    QString toString() const;

    static QString formatNumber(qreal n);

    bool operator==(const ResolvedValue &other) const {
        return m_type == other.m_type && toString() == other.toString();
    }
    bool operator!=(const ResolvedValue &other) const { return !(*this == other); }

private:
    ResolvedValue(Type type, qreal number, const QString &text)
        : m_type(type), m_number(number), m_text(text) {}

    Type m_type = Invalid;
    qreal m_number = 0;
    QString m_text;
    QString m_breakpoint;
};

class ValueResolver
{
public:
    explicit ValueResolver(const Theme &theme);

    ResolvedValue resolve(const StyleValue &value, const ResolveContext &context,
                          StyleError *error = nullptr) const;
    ResolvedValue resolveScalar(const ScalarValue &value, const ResolveContext &context,
                                StyleError *error = nullptr) const;

    /// Breakpoints to try for @p active: itself, then smaller ones, then "base".
    QStringList fallbackChain(const QString &active) const;

    /// Pick the responsive entry for the context's breakpoint.  Returns the
    /// breakpoint used through @p usedBreakpoint.
    bool selectResponsive(const ResponsiveValue &value, const QString &active,
                          ScalarValue *out, QString *usedBreakpoint,
                          StyleError *error = nullptr) const;

private:
    ResolvedValue resolveNumber(qreal n, ValueKind kind) const;
    ResolvedValue resolveString(const QString &s, ValueKind kind, StyleError *error) const;
    ResolvedValue resolveColorToken(const QString &family, int index, bool negated,
                                    ValueKind kind, StyleError *error) const;

    const Theme &m_theme;
};

#endif // POLYSTYLE_VALUERESOLVER_H
