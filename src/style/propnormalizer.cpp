/*
 * propnormalizer.cpp — Short-hand props to canonical declarations
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "propnormalizer.h"

#include "stylesheetgenerator.h"
#include "theme.h"

#include <algorithm>
#include <tuple>

// ---------------------------------------------------------------------------
// Short-hand table
// ---------------------------------------------------------------------------

static QList<PropNormalizer::PropSpec> buildPropTable()
{
    using K = ValueKind;
    using Spec = PropNormalizer::PropSpec;
    const QString top = QStringLiteral("-top");
    const QString right = QStringLiteral("-right");
    const QString bottom = QStringLiteral("-bottom");
    const QString left = QStringLiteral("-left");

    QList<PropNormalizer::PropSpec> table;

    // Margin and padding share one pattern
    const QPair<QString, QString> boxProps[] = {
        {QStringLiteral("m"), QStringLiteral("margin")},
        {QStringLiteral("p"), QStringLiteral("padding")},
    };
    for (const auto &box : boxProps) {
        const QString &s = box.first;
        const QString &prop = box.second;
        table.append(Spec{s, {prop + top, prop + right, prop + bottom, prop + left}, K::Spacing});
        table.append(Spec{s + QLatin1Char('t'), {prop + top}, K::Spacing});
        table.append(Spec{s + QLatin1Char('r'), {prop + right}, K::Spacing});
        table.append(Spec{s + QLatin1Char('b'), {prop + bottom}, K::Spacing});
        table.append(Spec{s + QLatin1Char('l'), {prop + left}, K::Spacing});
        table.append(Spec{s + QLatin1Char('x'), {prop + left, prop + right}, K::Spacing});
        table.append(Spec{s + QLatin1Char('y'), {prop + top, prop + bottom}, K::Spacing});
    }

    table.append(Spec{QStringLiteral("w"),   {QStringLiteral("width")}, K::Size});
    table.append(Spec{QStringLiteral("h"),   {QStringLiteral("height")}, K::Size});
    table.append(Spec{QStringLiteral("miw"), {QStringLiteral("min-width")}, K::Size});
    table.append(Spec{QStringLiteral("mih"), {QStringLiteral("min-height")}, K::Size});
    table.append(Spec{QStringLiteral("maw"), {QStringLiteral("max-width")}, K::Size});
    table.append(Spec{QStringLiteral("mah"), {QStringLiteral("max-height")}, K::Size});

    table.append(Spec{QStringLiteral("c"),    {QStringLiteral("color")}, K::Color});
    table.append(Spec{QStringLiteral("bg"),   {QStringLiteral("background-color")}, K::Color});
    table.append(Spec{QStringLiteral("bdc"),  {QStringLiteral("border-color")}, K::Color});
    table.append(Spec{QStringLiteral("bd"),   {QStringLiteral("border")}, K::Text});
    table.append(Spec{QStringLiteral("bdrs"), {QStringLiteral("border-radius")}, K::Radius});

    table.append(Spec{QStringLiteral("ff"), {QStringLiteral("font-family")}, K::Text});
    table.append(Spec{QStringLiteral("fz"), {QStringLiteral("font-size")}, K::FontSize});
    table.append(Spec{QStringLiteral("fw"), {QStringLiteral("font-weight")}, K::FontWeight});
    table.append(Spec{QStringLiteral("lh"), {QStringLiteral("line-height")}, K::LineHeight});
    table.append(Spec{QStringLiteral("fs"), {QStringLiteral("font-style")}, K::Text});
    table.append(Spec{QStringLiteral("ta"), {QStringLiteral("text-align")}, K::Text});
    table.append(Spec{QStringLiteral("td"), {QStringLiteral("text-decoration")}, K::Text});
    table.append(Spec{QStringLiteral("tt"), {QStringLiteral("text-transform")}, K::Text});

    table.append(Spec{QStringLiteral("opacity"), {QStringLiteral("opacity")}, K::Number});
    table.append(Spec{QStringLiteral("shadow"),  {QStringLiteral("box-shadow")}, K::Shadow});

    return table;
}

QList<PropNormalizer::PropSpec> PropNormalizer::propTable()
{
    return buildPropTable();
}

const PropNormalizer::PropSpec *PropNormalizer::findProp(const QString &name)
{
    static const QList<PropSpec> table = buildPropTable();
    for (const PropSpec &spec : table) {
        if (spec.name == name)
            return &spec;
    }
    return nullptr;
}

QString PropNormalizer::toKebabCase(const QString &name)
{
    QString out;
    out.reserve(name.size() + 4);
    for (const QChar ch : name) {
        if (ch.isUpper()) {
            if (!out.isEmpty())
                out += QLatin1Char('-');
            out += ch.toLower();
        } else if (ch == QLatin1Char('_')) {
            out += QLatin1Char('-');
        } else {
            out += ch;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

PropNormalizer::PropNormalizer(const Theme &theme)
    : m_resolver(theme)
{
}

static void writeDeclaration(StyleDeclarationList &decls, const StyleDeclaration &decl)
{
    for (StyleDeclaration &d : decls) {
        if (d.target == decl.target && d.state == decl.state && d.property == decl.property) {
            d = decl;
            return;
        }
    }
    decls.append(decl);
}

// Broad shorthands (m, px) before the longhands they overlap (mt, pl)
static QList<PropBag::Entry> orderedEntries(const PropBag &bag, bool raw)
{
    QList<PropBag::Entry> entries;
    for (const PropBag::Entry &e : bag.entries()) {
        if (e.raw == raw)
            entries.append(e);
    }

    auto width = [](const PropBag::Entry &e) -> int {
        if (e.raw)
            return 1;
        const PropNormalizer::PropSpec *spec = PropNormalizer::findProp(e.name);
        return spec ? static_cast<int>(spec->properties.size()) : 1;
    };
    std::stable_sort(entries.begin(), entries.end(),
                     [&](const PropBag::Entry &a, const PropBag::Entry &b) {
        const int wa = width(a);
        const int wb = width(b);
        if (wa != wb)
            return wa > wb;
        return a.name < b.name;
    });
    return entries;
}

StyleDeclarationList PropNormalizer::normalize(const PropBag &bag, const QString &breakpoint,
                                               StyleError *error,
                                               QList<StyleError> *diagnostics) const
{
    return normalizeLayers({bag}, breakpoint, error, diagnostics);
}

StyleDeclarationList PropNormalizer::normalizeLayers(const QList<PropBag> &layers,
                                                     const QString &breakpoint,
                                                     StyleError *error,
                                                     QList<StyleError> *diagnostics) const
{
    StyleDeclarationList decls;

    // Pass order: base entries, pseudo-state entries, escape hatch
    enum Pass { BasePass, PseudoPass, RawPass };
    for (int pass = BasePass; pass <= RawPass; ++pass) {
        for (const PropBag &layer : layers) {
            const QList<PropBag::Entry> entries = orderedEntries(layer, pass == RawPass);
            for (const PropBag::Entry &entry : entries) {
                const bool pseudo = entry.state != PseudoState::None;
                if (pass == BasePass && pseudo)
                    continue;
                if (pass == PseudoPass && !pseudo)
                    continue;

                QStringList properties;
                ValueKind kind = ValueKind::Generic;
                if (entry.raw) {
                    properties.append(entry.name);
                } else if (const PropSpec *spec = findProp(entry.name)) {
                    properties = spec->properties;
                    kind = spec->kind;
                } else {
                    properties.append(toKebabCase(entry.name));
                }

                for (const QString &property : properties) {
                    if (!StyleSheetGenerator::isValidPropertyName(property)) {
                        StyleError::report(error, StyleError::Serialization,
                            QStringLiteral("invalid property name '%1'").arg(property));
                        return {};
                    }
                }

                StyleError resolveError;
                const ResolvedValue resolved =
                    m_resolver.resolve(entry.value, {breakpoint, kind}, &resolveError);
                if (!resolved.isValid()) {
                    if (resolveError.kind() == StyleError::Config) {
                        // Recoverable: whatever a lower layer set stays in place
                        if (diagnostics) {
                            diagnostics->append(StyleError(StyleError::Config,
                                QStringLiteral("'%1': %2")
                                    .arg(entry.name, resolveError.message())));
                        }
                        continue;
                    }
                    if (error) {
                        *error = StyleError(resolveError.kind(),
                            QStringLiteral("'%1': %2").arg(entry.name, resolveError.message()));
                    }
                    return {};
                }

                const QString text = resolved.toString();
                if (!StyleSheetGenerator::isSafeValue(text)) {
                    StyleError::report(error, StyleError::Serialization,
                        QStringLiteral("'%1': unsafe value '%2'").arg(entry.name, text));
                    return {};
                }

                for (const QString &property : properties) {
                    writeDeclaration(decls, {entry.target, entry.state, property, text,
                                             resolved.breakpoint()});
                }
            }
        }
    }

    std::sort(decls.begin(), decls.end(),
              [](const StyleDeclaration &a, const StyleDeclaration &b) {
        return std::make_tuple(a.target, static_cast<int>(a.state), a.property)
             < std::make_tuple(b.target, static_cast<int>(b.state), b.property);
    });
    return decls;
}
