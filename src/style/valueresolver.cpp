/*
 * valueresolver.cpp — Turns raw prop values into concrete style values
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "valueresolver.h"

#include "theme.h"

#include <QColor>
#include <QRegularExpression>

#include <cmath>

// ---------------------------------------------------------------------------
// ResolvedValue
// ---------------------------------------------------------------------------

QString ResolvedValue::formatNumber(qreal n)
{
    QString s = QString::number(n, 'f', 2);
    if (s.contains(QLatin1Char('.'))) {
        while (s.endsWith(QLatin1Char('0')))
            s.chop(1);
        if (s.endsWith(QLatin1Char('.')))
            s.chop(1);
    }
    if (s == QLatin1String("-0"))
        s = QStringLiteral("0");
    return s;
}

QString ResolvedValue::toString() const
{
    switch (m_type) {
    case Length: return formatNumber(m_number) + QLatin1String("px");
    case Number: return formatNumber(m_number);
    case Color:
    case Text:   return m_text;
    case Invalid: break;
    }
    return {};
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool isLengthKind(ValueKind kind)
{
    return kind == ValueKind::Spacing || kind == ValueKind::Size
        || kind == ValueKind::Radius || kind == ValueKind::FontSize
        || kind == ValueKind::Shadow;
}

static bool isNumericKind(ValueKind kind)
{
    return isLengthKind(kind) && kind != ValueKind::Shadow;
}

static bool tableFor(ValueKind kind, TokenStore::NumericKind *table)
{
    switch (kind) {
    case ValueKind::Spacing:
    case ValueKind::Size:       *table = TokenStore::Spacing; return true;
    case ValueKind::Radius:     *table = TokenStore::Radius; return true;
    case ValueKind::FontSize:   *table = TokenStore::FontSize; return true;
    case ValueKind::LineHeight: *table = TokenStore::LineHeight; return true;
    case ValueKind::FontWeight: *table = TokenStore::FontWeight; return true;
    default: break;
    }
    return false;
}

// ---------------------------------------------------------------------------
// ValueResolver
// ---------------------------------------------------------------------------

ValueResolver::ValueResolver(const Theme &theme)
    : m_theme(theme)
{
}

ResolvedValue ValueResolver::resolve(const StyleValue &value, const ResolveContext &context,
                                     StyleError *error) const
{
    switch (value.type()) {
    case StyleValue::Null:
        StyleError::report(error, StyleError::Config, QStringLiteral("value is empty"));
        return {};
    case StyleValue::Number:
        return resolveNumber(value.toNumber(), context.kind);
    case StyleValue::String:
        return resolveString(value.toString(), context.kind, error);
    case StyleValue::Responsive: {
        ScalarValue selected;
        QString used;
        if (!selectResponsive(value.toResponsive(), context.activeBreakpoint,
                              &selected, &used, error))
            return {};
        ResolvedValue resolved = resolveScalar(selected, context, error);
        if (resolved.isValid())
            resolved.setBreakpoint(used);
        return resolved;
    }
    }
    return {};
}

ResolvedValue ValueResolver::resolveScalar(const ScalarValue &value,
                                           const ResolveContext &context,
                                           StyleError *error) const
{
    if (const qreal *n = std::get_if<qreal>(&value))
        return resolveNumber(*n, context.kind);
    return resolveString(std::get<QString>(value), context.kind, error);
}

ResolvedValue ValueResolver::resolveNumber(qreal n, ValueKind kind) const
{
    if (isLengthKind(kind))
        return ResolvedValue::length(n * m_theme.tokens.scale());
    if (kind == ValueKind::Text || kind == ValueKind::Color)
        return ResolvedValue::text(ResolvedValue::formatNumber(n));
    return ResolvedValue::number(n);
}

ResolvedValue ValueResolver::resolveColorToken(const QString &family, int index, bool negated,
                                               ValueKind kind, StyleError *error) const
{
    const QString name = family + QLatin1Char('.') + QString::number(index);
    if (negated) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("color token '%1' cannot be negated").arg(name));
        return {};
    }
    if (isNumericKind(kind) || kind == ValueKind::LineHeight
        || kind == ValueKind::FontWeight || kind == ValueKind::Number) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("color token '%1' used for a numeric property").arg(name));
        return {};
    }

    const QString realFamily = family == QLatin1String("primary") ? m_theme.primaryColor
                                                                  : family;
    const QString c = m_theme.tokens.color(realFamily, index, error);
    if (c.isEmpty())
        return {};
    return ResolvedValue::color(c);
}

ResolvedValue ValueResolver::resolveString(const QString &raw, ValueKind kind,
                                           StyleError *error) const
{
    static const QRegularExpression pxRe(
        QStringLiteral("^(-?(?:\\d+\\.?\\d*|\\.\\d+))px$"));
    static const QRegularExpression colorTokenRe(
        QStringLiteral("^(-?)([a-z][a-z0-9]*)\\.(\\d+)$"));

    const QString s = raw.trimmed();
    if (s.isEmpty()) {
        StyleError::report(error, StyleError::Config, QStringLiteral("value is empty"));
        return {};
    }
    if (kind == ValueKind::Text)
        return ResolvedValue::text(s);

    bool isNumber = false;
    const qreal n = s.toDouble(&isNumber);
    if (isNumber && std::isfinite(n))
        return resolveNumber(n, kind);

    QRegularExpressionMatch m = pxRe.match(s);
    if (m.hasMatch())
        return ResolvedValue::length(m.captured(1).toDouble());

    m = colorTokenRe.match(s);
    if (m.hasMatch()) {
        return resolveColorToken(m.captured(2), m.captured(3).toInt(),
                                 !m.captured(1).isEmpty(), kind, error);
    }

    const bool negated = s.startsWith(QLatin1Char('-'));
    const QString key = negated ? s.mid(1) : s;

    TokenStore::NumericKind table;
    if (tableFor(kind, &table) && m_theme.tokens.hasNumeric(table, key)) {
        const qreal v = m_theme.tokens.numeric(table, key);
        if (isLengthKind(kind))
            return ResolvedValue::length((negated ? -v : v) * m_theme.tokens.scale());
        if (negated) {
            StyleError::report(error, StyleError::Lookup,
                QStringLiteral("token '%1' cannot be negated").arg(key));
            return {};
        }
        return ResolvedValue::number(v);
    }

    if (kind == ValueKind::Shadow && !negated && m_theme.tokens.hasShadow(key))
        return ResolvedValue::text(m_theme.tokens.shadow(key));

    if (kind == ValueKind::Color) {
        const bool alias = Theme::isSemanticAlias(key);
        const bool family = m_theme.tokens.hasColor(key);
        if (alias || family) {
            if (negated) {
                StyleError::report(error, StyleError::Lookup,
                    QStringLiteral("color '%1' cannot be negated").arg(key));
                return {};
            }
            const QString c = alias ? m_theme.semanticColor(key, error)
                                    : m_theme.tokens.color(key, m_theme.primaryShade(), error);
            if (c.isEmpty())
                return {};
            return ResolvedValue::color(c);
        }
        if (QColor(s).isValid())
            return ResolvedValue::color(s);
    }

    // Literal: "auto", "transparent", "rgba(...)", "1em", "bold", ...
    return ResolvedValue::text(s);
}

QStringList ValueResolver::fallbackChain(const QString &active) const
{
    QStringList chain;
    const BreakpointTable table = m_theme.tokens.breakpoints();
    int start = -1;
    for (int i = 0; i < table.size(); ++i) {
        if (table.at(i).first == active) {
            start = i;
            break;
        }
    }
    for (int i = start; i >= 0; --i)
        chain.append(table.at(i).first);
    chain.append(QStringLiteral("base"));
    return chain;
}

bool ValueResolver::selectResponsive(const ResponsiveValue &value, const QString &active,
                                     ScalarValue *out, QString *usedBreakpoint,
                                     StyleError *error) const
{
    const QLatin1String base("base");

    for (const QString &bp : value.breakpoints()) {
        if (bp != base && !m_theme.tokens.hasNumeric(TokenStore::Breakpoint, bp)) {
            return StyleError::report(error, StyleError::Lookup,
                QStringLiteral("unknown breakpoint '%1' in responsive value").arg(bp));
        }
    }
    if (active != base && !m_theme.tokens.hasNumeric(TokenStore::Breakpoint, active)) {
        return StyleError::report(error, StyleError::Lookup,
            QStringLiteral("unknown active breakpoint '%1'").arg(active));
    }

    const QStringList chain = fallbackChain(active);
    for (const QString &bp : chain) {
        if (value.contains(bp)) {
            *out = value.value(bp);
            if (usedBreakpoint)
                *usedBreakpoint = bp;
            return true;
        }
    }

    return StyleError::report(error, StyleError::Config,
        QStringLiteral("responsive value has no entry for '%1' or any smaller breakpoint")
            .arg(active));
}
