/*
 * theme.cpp — The active design theme
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "theme.h"

#include <QFile>
#include <QJsonDocument>

// ---------------------------------------------------------------------------
// Semantic colors
// ---------------------------------------------------------------------------

namespace {

struct SemanticColor {
    const char *alias;
    const char *light;   // "#rrggbb", "family.index" or "primary.index"
    const char *dark;
};

const SemanticColor s_semanticColors[] = {
    {"text",            "#000000",  "dark.0"},
    {"body",            "#ffffff",  "dark.7"},
    {"dimmed",          "gray.6",   "dark.2"},
    {"bright",          "#000000",  "#ffffff"},
    {"error",           "red.6",    "red.8"},
    {"placeholder",     "gray.5",   "dark.3"},
    {"anchor",          "primary.6", "primary.4"},
    {"default",         "#ffffff",  "dark.6"},
    {"default-hover",   "gray.0",   "dark.5"},
    {"default-color",   "#000000",  "#ffffff"},
    {"default-border",  "gray.4",   "dark.4"},
    {"disabled",        "gray.1",   "dark.6"},
    {"disabled-color",  "gray.5",   "dark.3"},
    {"disabled-border", "gray.3",   "dark.4"},
    {"white",           "#ffffff",  "#ffffff"},
    {"black",           "#000000",  "#000000"},
};

const SemanticColor *findSemantic(const QString &alias)
{
    for (const SemanticColor &c : s_semanticColors) {
        if (alias == QLatin1String(c.alias))
            return &c;
    }
    return nullptr;
}

} // namespace

int Theme::primaryShade() const
{
    return colorScheme == ColorScheme::Dark ? primaryShadeDark : primaryShadeLight;
}

QString Theme::primaryColorValue(int index, StyleError *error) const
{
    return tokens.color(primaryColor, index, error);
}

bool Theme::isSemanticAlias(const QString &name)
{
    return name == QLatin1String("primary") || findSemantic(name) != nullptr;
}

QString Theme::semanticColor(const QString &alias, StyleError *error) const
{
    if (alias == QLatin1String("primary"))
        return primaryColorValue(primaryShade(), error);

    const SemanticColor *entry = findSemantic(alias);
    if (!entry) {
        StyleError::report(error, StyleError::Lookup,
            QStringLiteral("unknown color alias '%1'").arg(alias));
        return {};
    }

    const QString ref = QLatin1String(colorScheme == ColorScheme::Dark ? entry->dark
                                                                       : entry->light);
    if (ref.startsWith(QLatin1Char('#')))
        return ref;

    const int dot = ref.indexOf(QLatin1Char('.'));
    QString family = ref.left(dot);
    const int index = ref.mid(dot + 1).toInt();
    if (family == QLatin1String("primary"))
        family = primaryColor;
    return tokens.color(family, index, error);
}

// ---------------------------------------------------------------------------
// Validation / merge
// ---------------------------------------------------------------------------

bool Theme::validate(StyleError *error) const
{
    if (!tokens.validate(error))
        return false;

    if (!tokens.hasColor(primaryColor)) {
        return StyleError::report(error, StyleError::Lookup,
            QStringLiteral("primary color '%1' is not a registered color family")
                .arg(primaryColor));
    }
    if (primaryShadeLight < 0 || primaryShadeLight >= TokenStore::ShadeCount
        || primaryShadeDark < 0 || primaryShadeDark >= TokenStore::ShadeCount) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("primary shade must be within [0, %1]")
                .arg(TokenStore::ShadeCount - 1));
    }

    // Semantic aliases must point at existing families
    for (const SemanticColor &c : s_semanticColors) {
        for (const char *ref : {c.light, c.dark}) {
            const QString r = QLatin1String(ref);
            if (r.startsWith(QLatin1Char('#')))
                continue;
            const QString family = r.left(r.indexOf(QLatin1Char('.')));
            if (family != QLatin1String("primary") && !tokens.hasColor(family)) {
                return StyleError::report(error, StyleError::Lookup,
                    QStringLiteral("color alias '%1' needs color family '%2'")
                        .arg(QLatin1String(c.alias), family));
            }
        }
    }
    return true;
}

static bool readShade(const QJsonValue &v, int *out, StyleError *error)
{
    if (!v.isDouble() || v.toDouble() != v.toInt()) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("primary shade must be an integer"));
    }
    *out = v.toInt();
    return true;
}

bool Theme::merge(const QJsonObject &obj, StyleError *error)
{
    Theme merged = *this;

    if (!merged.tokens.merge(obj, error))
        return false;

    if (obj.contains(QLatin1String("colorScheme"))) {
        if (!schemeFromName(obj.value(QLatin1String("colorScheme")).toString(),
                            &merged.colorScheme)) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("unknown color scheme '%1'")
                    .arg(obj.value(QLatin1String("colorScheme")).toString()));
        }
    }

    if (obj.contains(QLatin1String("primaryColor"))) {
        const QJsonValue v = obj.value(QLatin1String("primaryColor"));
        if (!v.isString() || v.toString().isEmpty()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("primaryColor must be a color family name"));
        }
        merged.primaryColor = v.toString();
    }

    if (obj.contains(QLatin1String("primaryShade"))) {
        const QJsonValue v = obj.value(QLatin1String("primaryShade"));
        if (v.isObject()) {
            const QJsonObject shades = v.toObject();
            if (shades.contains(QLatin1String("light"))
                && !readShade(shades.value(QLatin1String("light")),
                              &merged.primaryShadeLight, error))
                return false;
            if (shades.contains(QLatin1String("dark"))
                && !readShade(shades.value(QLatin1String("dark")),
                              &merged.primaryShadeDark, error))
                return false;
        } else {
            int shade = 0;
            if (!readShade(v, &shade, error))
                return false;
            merged.primaryShadeLight = shade;
            merged.primaryShadeDark = shade;
        }
    }

    if (obj.contains(QLatin1String("fontFamily"))) {
        const QJsonValue v = obj.value(QLatin1String("fontFamily"));
        if (!v.isString()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("fontFamily must be a string"));
        }
        merged.fontFamily = v.toString();
    }

    const QJsonValue compsVal = obj.value(QLatin1String("components"));
    if (!compsVal.isUndefined()) {
        if (!compsVal.isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'components' must be an object"));
        }
        const QJsonObject comps = compsVal.toObject();
        for (auto it = comps.begin(); it != comps.end(); ++it) {
            if (!it.value().isObject()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("component override '%1' must be an object").arg(it.key()));
            }
            StyleError bagError;
            const PropBag props = PropBag::fromJson(it.value().toObject(), &bagError);
            if (bagError.isError()) {
                return StyleError::report(error, bagError.kind(),
                    QStringLiteral("component override '%1': %2")
                        .arg(it.key(), bagError.message()));
            }
            merged.components[it.key()].merge(props);
        }
    }

    const QJsonValue variantsVal = obj.value(QLatin1String("variants"));
    if (!variantsVal.isUndefined()) {
        if (!variantsVal.isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("'variants' must be an object"));
        }
        if (!merged.variants.merge(variantsVal.toObject(), error))
            return false;
    }

    if (!merged.validate(error))
        return false;

    *this = merged;
    return true;
}

Theme Theme::fromJson(const QJsonObject &obj, StyleError *error)
{
    Theme theme;
    if (!theme.merge(obj, error))
        return Theme();
    return theme;
}

QJsonObject Theme::toJson() const
{
    QJsonObject obj = tokens.toJson();
    obj[QLatin1String("colorScheme")] = schemeName(colorScheme);
    obj[QLatin1String("primaryColor")] = primaryColor;

    QJsonObject shades;
    shades[QLatin1String("light")] = primaryShadeLight;
    shades[QLatin1String("dark")] = primaryShadeDark;
    obj[QLatin1String("primaryShade")] = shades;

    if (!fontFamily.isEmpty())
        obj[QLatin1String("fontFamily")] = fontFamily;

    if (!components.isEmpty()) {
        QJsonObject comps;
        for (auto it = components.constBegin(); it != components.constEnd(); ++it)
            comps[it.key()] = it.value().toJson();
        obj[QLatin1String("components")] = comps;
    }
    if (!variants.isEmpty())
        obj[QLatin1String("variants")] = variants.toJson();
    return obj;
}

Theme Theme::defaultTheme()
{
    QFile file(QStringLiteral(":/themes/default.json"));
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning("Theme: cannot open built-in theme %s", qPrintable(file.fileName()));
        return Theme();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull()) {
        qWarning("Theme: built-in theme is not valid JSON: %s",
                 qPrintable(parseError.errorString()));
        return Theme();
    }

    StyleError error;
    Theme theme = fromJson(doc.object(), &error);
    if (error.isError())
        qWarning("Theme: built-in theme rejected: %s", qPrintable(error.toString()));
    return theme;
}

QString Theme::schemeName(ColorScheme scheme)
{
    return scheme == ColorScheme::Dark ? QStringLiteral("dark") : QStringLiteral("light");
}

bool Theme::schemeFromName(const QString &name, ColorScheme *scheme)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("light")) {
        *scheme = ColorScheme::Light;
        return true;
    }
    if (n == QLatin1String("dark")) {
        *scheme = ColorScheme::Dark;
        return true;
    }
    return false;
}

bool Theme::operator==(const Theme &other) const
{
    return tokens == other.tokens
        && colorScheme == other.colorScheme
        && primaryColor == other.primaryColor
        && primaryShadeLight == other.primaryShadeLight
        && primaryShadeDark == other.primaryShadeDark
        && fontFamily == other.fontFamily
        && components == other.components
        && variants == other.variants;
}
