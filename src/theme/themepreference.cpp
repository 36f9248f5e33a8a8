/*
 * themepreference.cpp — Stored theme choice (scheme + primary color)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "themepreference.h"

#include <KConfigGroup>
#include <KSharedConfig>

ThemePreference ThemePreference::load(const KConfigGroup &group)
{
    ThemePreference pref;

    const QString scheme = group.readEntry("ColorScheme", Theme::schemeName(pref.scheme));
    if (!Theme::schemeFromName(scheme, &pref.scheme))
        qWarning("ThemePreference: unknown color scheme '%s', using light", qPrintable(scheme));

    const QString primary = group.readEntry("PrimaryColor", pref.primaryColor).trimmed();
    if (!primary.isEmpty())
        pref.primaryColor = primary;

    return pref;
}

ThemePreference ThemePreference::load()
{
    KConfigGroup group(KSharedConfig::openConfig(), QStringLiteral("Theme"));
    return load(group);
}

QJsonObject ThemePreference::toThemeOverride() const
{
    QJsonObject obj;
    obj[QLatin1String("colorScheme")] = Theme::schemeName(scheme);
    obj[QLatin1String("primaryColor")] = primaryColor;
    return obj;
}
