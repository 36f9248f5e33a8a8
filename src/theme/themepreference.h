/*
 * themepreference.h — Stored theme choice (scheme + primary color)
 *
 * Read once at startup from the [Theme] group of the application config.
 * Writing the preference back is the application's business.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_THEMEPREFERENCE_H
#define POLYSTYLE_THEMEPREFERENCE_H

#include <QJsonObject>
#include <QString>

#include "theme.h"

class KConfigGroup;

struct ThemePreference {
    ColorScheme scheme = ColorScheme::Light;
    QString primaryColor = QStringLiteral("blue");

    /// Read "ColorScheme" and "PrimaryColor".  Unknown schemes fall back
    /// to light with a warning.
    static ThemePreference load(const KConfigGroup &group);
    /// Read from KSharedConfig::openConfig(), group "Theme".
    static ThemePreference load();

    /// Partial theme JSON suitable for ThemeProvider::update().
    QJsonObject toThemeOverride() const;

    bool operator==(const ThemePreference &other) const {
        return scheme == other.scheme && primaryColor == other.primaryColor;
    }
};

#endif // POLYSTYLE_THEMEPREFERENCE_H
