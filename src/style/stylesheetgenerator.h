/*
 * stylesheetgenerator.h — Deterministic QSS serialization
 *
 * Declarations are grouped into one block per (selector, pseudo-state).
 * Blocks are ordered by selector and properties by name, so identical
 * input always produces byte-identical text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_STYLESHEETGENERATOR_H
#define POLYSTYLE_STYLESHEETGENERATOR_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

#include "styledeclaration.h"
#include "styleerror.h"

/// Where a widget's declarations land in the style sheet.
struct SelectorScope {
    QString root;                     // e.g. "#ps_3" or "QLabel#title"
    QHash<QString, QString> targets;  // inner element -> selector fragment

    /// Selector for an inner element, "#<target>" when undeclared.
    QString targetSelector(const QString &target) const;
};

struct StyleSheetArtifact {
    QString text;
    QByteArray hash;        // SHA-1 of text
    QStringList selectors;  // one per emitted block, in output order

    bool isNull() const { return hash.isEmpty(); }
    bool operator==(const StyleSheetArtifact &other) const {
        return hash == other.hash && text == other.text;
    }
};

class StyleSheetGenerator
{
public:
    static QString selectorFor(const StyleDeclaration &decl, const SelectorScope &scope);

    /// Returns an empty string and sets @p error when any declaration cannot
    /// be emitted safely.
    static QString serialize(const StyleDeclarationList &declarations,
                             const SelectorScope &scope, StyleError *error = nullptr);

    static StyleSheetArtifact generate(const StyleDeclarationList &declarations,
                                       const SelectorScope &scope,
                                       StyleError *error = nullptr);

    /// False for values with braces, semicolons, line breaks, comment
    /// markers, or unbalanced quotes or parentheses.
    static bool isSafeValue(const QString &value);
    static bool isValidPropertyName(const QString &name);
    static bool isSafeSelector(const QString &selector);
};

#endif // POLYSTYLE_STYLESHEETGENERATOR_H
