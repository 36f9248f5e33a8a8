/*
 * stylesheetgenerator.cpp — Deterministic QSS serialization
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stylesheetgenerator.h"

#include <QCryptographicHash>
#include <QMap>
#include <QRegularExpression>

QString SelectorScope::targetSelector(const QString &target) const
{
    auto it = targets.constFind(target);
    if (it != targets.constEnd() && !it.value().isEmpty())
        return it.value();
    return QLatin1Char('#') + target;
}

// ---------------------------------------------------------------------------
// Safety checks
// ---------------------------------------------------------------------------

bool StyleSheetGenerator::isSafeValue(const QString &value)
{
    if (value.trimmed().isEmpty())
        return false;
    if (value.contains(QLatin1String("/*")) || value.contains(QLatin1String("*/")))
        return false;

    int parens = 0;
    int doubleQuotes = 0;
    int singleQuotes = 0;
    for (const QChar ch : value) {
        switch (ch.unicode()) {
        case '{': case '}': case ';': case '\n': case '\r':
            return false;
        case '(':
            ++parens;
            break;
        case ')':
            if (--parens < 0)
                return false;
            break;
        case '"':
            ++doubleQuotes;
            break;
        case '\'':
            ++singleQuotes;
            break;
        default:
            break;
        }
    }
    return parens == 0 && doubleQuotes % 2 == 0 && singleQuotes % 2 == 0;
}

bool StyleSheetGenerator::isValidPropertyName(const QString &name)
{
    static const QRegularExpression re(QStringLiteral("^-?[a-z][a-z0-9-]*$"));
    return re.match(name).hasMatch();
}

bool StyleSheetGenerator::isSafeSelector(const QString &selector)
{
    return isSafeValue(selector) && !selector.contains(QLatin1Char(','));
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

QString StyleSheetGenerator::selectorFor(const StyleDeclaration &decl,
                                         const SelectorScope &scope)
{
    QString selector = scope.root;
    if (!decl.target.isEmpty())
        selector += QLatin1Char(' ') + scope.targetSelector(decl.target);
    return selector + pseudoStateSelector(decl.state);
}

static QMap<QString, QMap<QString, QString>> groupBlocks(
    const StyleDeclarationList &declarations, const SelectorScope &scope, StyleError *error,
    bool *ok)
{
    QMap<QString, QMap<QString, QString>> blocks;
    *ok = false;

    if (!StyleSheetGenerator::isSafeSelector(scope.root)) {
        StyleError::report(error, StyleError::Serialization,
            QStringLiteral("unsafe root selector '%1'").arg(scope.root));
        return {};
    }

    for (const StyleDeclaration &decl : declarations) {
        if (!StyleSheetGenerator::isValidPropertyName(decl.property)) {
            StyleError::report(error, StyleError::Serialization,
                QStringLiteral("invalid property name '%1'").arg(decl.property));
            return {};
        }
        if (!StyleSheetGenerator::isSafeValue(decl.value)) {
            StyleError::report(error, StyleError::Serialization,
                QStringLiteral("unsafe value for '%1': %2").arg(decl.property, decl.value));
            return {};
        }
        const QString selector = StyleSheetGenerator::selectorFor(decl, scope);
        if (!decl.target.isEmpty()
            && !StyleSheetGenerator::isSafeSelector(scope.targetSelector(decl.target))) {
            StyleError::report(error, StyleError::Serialization,
                QStringLiteral("unsafe selector '%1'").arg(selector));
            return {};
        }
        blocks[selector].insert(decl.property, decl.value);
    }

    *ok = true;
    return blocks;
}

QString StyleSheetGenerator::serialize(const StyleDeclarationList &declarations,
                                       const SelectorScope &scope, StyleError *error)
{
    return generate(declarations, scope, error).text;
}

StyleSheetArtifact StyleSheetGenerator::generate(const StyleDeclarationList &declarations,
                                                 const SelectorScope &scope,
                                                 StyleError *error)
{
    bool ok = false;
    const auto blocks = groupBlocks(declarations, scope, error, &ok);
    if (!ok)
        return {};

    StyleSheetArtifact artifact;
    QStringList out;
    for (auto it = blocks.constBegin(); it != blocks.constEnd(); ++it) {
        QString block = it.key() + QLatin1String(" {\n");
        const QMap<QString, QString> &props = it.value();
        for (auto p = props.constBegin(); p != props.constEnd(); ++p)
            block += QLatin1String("    ") + p.key() + QLatin1String(": ") + p.value()
                     + QLatin1String(";\n");
        block += QLatin1String("}\n");
        out.append(block);
        artifact.selectors.append(it.key());
    }

    artifact.text = out.join(QLatin1Char('\n'));
    artifact.hash = QCryptographicHash::hash(artifact.text.toUtf8(), QCryptographicHash::Sha1);
    return artifact;
}
