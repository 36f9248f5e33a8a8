/*
 * propnormalizer.h — Short-hand props to canonical declarations
 *
 * Layers are applied lowest precedence first (component defaults, theme
 * component override, instance props).  Within that, pseudo-state entries
 * and escape-hatch properties go last, so the later write wins for each
 * (target, state, property).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_PROPNORMALIZER_H
#define POLYSTYLE_PROPNORMALIZER_H

#include <QList>
#include <QString>
#include <QStringList>

#include "propbag.h"
#include "styledeclaration.h"
#include "styleerror.h"
#include "valueresolver.h"

class Theme;

class PropNormalizer
{
public:
    struct PropSpec {
        QString name;
        QStringList properties;
        ValueKind kind;
    };

    explicit PropNormalizer(const Theme &theme);

    /// The fixed short-hand table, or nullptr for an unknown name.
    static const PropSpec *findProp(const QString &name);
    static QList<PropSpec> propTable();

    /// "borderTopWidth" -> "border-top-width"
    static QString toKebabCase(const QString &name);

    /// Fatal errors (Lookup, Serialization) return an empty list and set
    /// @p error.  Config errors drop the declaration, are appended to
    /// @p diagnostics and normalization continues.
    StyleDeclarationList normalize(const PropBag &bag, const QString &breakpoint,
                                   StyleError *error = nullptr,
                                   QList<StyleError> *diagnostics = nullptr) const;

    StyleDeclarationList normalizeLayers(const QList<PropBag> &layers,
                                         const QString &breakpoint,
                                         StyleError *error = nullptr,
                                         QList<StyleError> *diagnostics = nullptr) const;

private:
    ValueResolver m_resolver;
};

#endif // POLYSTYLE_PROPNORMALIZER_H
