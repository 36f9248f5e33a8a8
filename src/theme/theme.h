/*
 * theme.h — The active design theme
 *
 * Token tables plus the scheme-level choices (light/dark, primary family,
 * primary shade per scheme, default font), per-component default prop
 * overrides and the named component variants.  A plain value: the ThemeProvider owns the live instance and
 * hands out const references.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_THEME_H
#define POLYSTYLE_THEME_H

#include <QHash>
#include <QJsonObject>
#include <QString>

#include "componentvariants.h"
#include "propbag.h"
#include "styleerror.h"
#include "tokenstore.h"

enum class ColorScheme {
    Light,
    Dark,
};

class Theme
{
public:
    Theme() = default;

    TokenStore tokens;
    ColorScheme colorScheme = ColorScheme::Light;
    QString primaryColor = QStringLiteral("blue");
    int primaryShadeLight = 6;
    int primaryShadeDark = 8;
    QString fontFamily;
    QHash<QString, PropBag> components;   // component name -> default override
    ComponentVariants variants;

    /// Primary shade index for the active scheme.
    int primaryShade() const;
    QString primaryColorValue(int index, StyleError *error = nullptr) const;

    /// Scheme-dependent semantic colors ("text", "body", "dimmed", ...).
    static bool isSemanticAlias(const QString &name);
    QString semanticColor(const QString &alias, StyleError *error = nullptr) const;

    bool validate(StyleError *error = nullptr) const;

    /// Deep-merge a partial theme description.  Leaves the theme unchanged
    /// and returns false if the result would not validate.
    bool merge(const QJsonObject &obj, StyleError *error = nullptr);

    static Theme fromJson(const QJsonObject &obj, StyleError *error = nullptr);
    QJsonObject toJson() const;

    /// Built-in defaults from :/themes/default.json.
    static Theme defaultTheme();

    static QString schemeName(ColorScheme scheme);
    static bool schemeFromName(const QString &name, ColorScheme *scheme);

    bool operator==(const Theme &other) const;
    bool operator!=(const Theme &other) const { return !(*this == other); }
};

#endif // POLYSTYLE_THEME_H
