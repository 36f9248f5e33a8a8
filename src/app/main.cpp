#include <QApplication>
#include <QCommandLineParser>

#include <KAboutData>
#include <KLocalizedString>

#include "demowindow.h"
#include "themepreference.h"
#include "themeprovider.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("polystyle");

    KAboutData aboutData(
        QStringLiteral("polystyle-demo"),
        i18n("PolyStyle Demo"),
        QStringLiteral("0.1.0"),
        i18n("Responsive, token-based style sheets for Qt widgets"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"),
        QString(),
        QString()
    );
    aboutData.setOrganizationDomain("polystyle.org");
    aboutData.setDesktopFileName(QStringLiteral("org.polystyle.Demo"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    QCommandLineOption schemeOption(
        QStringLiteral("scheme"),
        i18n("Color scheme to start with (light or dark)."),
        QStringLiteral("scheme"));
    QCommandLineOption primaryOption(
        QStringLiteral("primary"),
        i18n("Primary color family (blue, teal, grape, ...)."),
        QStringLiteral("family"));
    parser.addOption(schemeOption);
    parser.addOption(primaryOption);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Stored preference first, command line overrides it
    ThemePreference preference = ThemePreference::load();
    if (parser.isSet(schemeOption)) {
        const QString scheme = parser.value(schemeOption);
        if (!Theme::schemeFromName(scheme, &preference.scheme)) {
            qCritical("polystyle-demo: unknown color scheme '%s'", qPrintable(scheme));
            return 1;
        }
    }
    if (parser.isSet(primaryOption))
        preference.primaryColor = parser.value(primaryOption);

    ThemeProvider provider;
    StyleError error;
    if (!provider.theme().validate(&error) || !provider.applyPreference(preference, &error)) {
        qCritical("polystyle-demo: invalid startup theme: %s", qPrintable(error.toString()));
        return 1;
    }

    DemoWindow window(&provider);
    window.show();
    return app.exec();
}
