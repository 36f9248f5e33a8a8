/*
 * themeprovider.h — Owner of the active theme and per-widget style sheets
 *
 * The provider is the only writer of the theme.  Every widget passed to
 * resolveAndApply() is remembered together with its props; a theme change
 * or a breakpoint crossing of its window regenerates its style sheet.
 * Everything runs synchronously on the GUI thread.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_THEMEPROVIDER_H
#define POLYSTYLE_THEMEPROVIDER_H

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QWidget>

#include <functional>

#include "componentvariants.h"
#include "propbag.h"
#include "stylecache.h"
#include "styleerror.h"
#include "stylesheetgenerator.h"
#include "theme.h"
#include "windowbreakpointwatcher.h"

class BreakpointContext;
struct ThemePreference;

class ThemeProvider : public QObject
{
    Q_OBJECT

public:
    using ThemeCallback = std::function<void(const Theme &)>;

    /// Starts with Theme::defaultTheme() at version 0.
    explicit ThemeProvider(QObject *parent = nullptr);
    ~ThemeProvider() override;

    const Theme &theme() const { return m_theme; }
    quint64 themeVersion() const { return m_version; }

    // --- Theme mutation ---

    /// Install @p theme.  Equal themes are a no-op; invalid ones are rejected
    /// and the current theme stays.
    bool apply(const Theme &theme, StyleError *error = nullptr);
    /// Deep-merge a partial theme description, then apply().
    bool update(const QJsonObject &partial, StyleError *error = nullptr);
    bool applyPreference(const ThemePreference &preference, StyleError *error = nullptr);
    bool toggleColorScheme(StyleError *error = nullptr);

    // --- Widgets ---

    void registerComponentDefaults(const QString &component, const PropBag &defaults);
    PropBag componentDefaults(const QString &component) const;

    /// Register a named variant.  The theme's own variant of the same name,
    /// if any, takes precedence entry by entry.
    void registerVariant(const QString &component, VariantType type, const QString &name,
                         const PropBag &props);
    /// Registered and theme variants of @p component, per type.
    QMap<VariantType, QStringList> variantNames(const QString &component) const;

    /// Selector fragments for inner elements of @p widget (name -> "#label").
    void declareTargets(QWidget *widget, const QHash<QString, QString> &targets);

    /// Register @p widget with @p props and assign its style sheet.
    /// @p component defaults to the widget's class name.
    bool resolveAndApply(QWidget *widget, const PropBag &props,
                         const QString &component = QString(),
                         StyleError *error = nullptr);
    /// As above, with @p variants layered between the component override
    /// and @p props.  An unknown variant name is a Lookup error.
    bool resolveAndApply(QWidget *widget, const PropBag &props,
                         const VariantSelection &variants,
                         const QString &component = QString(),
                         StyleError *error = nullptr);
    void unregisterWidget(QWidget *widget);
    bool isRegistered(const QWidget *widget) const { return m_widgets.contains(widget); }

    StyleSheetArtifact artifact(const QWidget *widget) const;
    QString activeBreakpoint(QWidget *widget);

    // --- Subscribers ---

    /// Call @p callback after every theme change, until @p subscriber is
    /// destroyed or unsubscribed.
    void subscribe(QObject *subscriber, const ThemeCallback &callback);
    void unsubscribe(QObject *subscriber);

    // --- Responsive ---

    /// Context of the top-level window @p window, created on first use.
    BreakpointContext *breakpointContext(QWidget *window);
    void setResizeDebounceInterval(int ms);
    int resizeDebounceInterval() const { return m_debounceMs; }

    // --- Introspection ---

    int regenerationCount() const { return m_regenerations; }
    const StyleCache &cache() const { return m_cache; }
    StyleCache &cache() { return m_cache; }

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

Q_SIGNALS:
    void themeChanged(quint64 version);
    void styleDiagnostic(QWidget *widget, const QString &message);

private:
    struct WidgetRecord {
        QPointer<QWidget> widget;
        QPointer<QWidget> window;
        QString component;
        PropBag props;
        VariantSelection variants;
        QHash<QString, QString> targets;
        StyleSheetArtifact artifact;
        QString breakpoint;
        bool resolved = false;   // resolveAndApply() has been called
        QMetaObject::Connection destroyedConnection;
    };

    struct Subscriber {
        QPointer<QObject> object;
        ThemeCallback callback;
    };

    bool regenerate(WidgetRecord &record, StyleError *error);
    QByteArray fingerprintFor(const WidgetRecord &record) const;
    bool variantLayer(const QString &component, VariantType type, const QString &name,
                      PropBag *out, StyleError *error) const;
    WindowBreakpointWatcher *watcherFor(QWidget *window);
    void onBreakpointChanged(QWidget *window);
    void reportDiagnostic(QWidget *widget, const QString &message);
    QHash<const QWidget *, WidgetRecord>::iterator recordFor(QWidget *widget);
    void forgetWindow(QObject *window);

    Theme m_theme;
    quint64 m_version = 0;
    StyleCache m_cache;
    QHash<QString, PropBag> m_componentDefaults;
    ComponentVariants m_variants;
    QHash<const QWidget *, WidgetRecord> m_widgets;
    QHash<const QObject *, QPointer<WindowBreakpointWatcher>> m_watchers;
    QList<Subscriber> m_subscribers;
    int m_regenerations = 0;
    int m_debounceMs = 100;
    int m_nameCounter = 0;
    bool m_applying = false;
};

#endif // POLYSTYLE_THEMEPROVIDER_H
