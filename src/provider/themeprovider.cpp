/*
 * themeprovider.cpp — Owner of the active theme and per-widget style sheets
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "themeprovider.h"

#include "breakpointcontext.h"
#include "propnormalizer.h"
#include "themepreference.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QEvent>
#include <QStringList>

#include <algorithm>
#include <utility>

static quintptr idOf(const QObject *object)
{
    return reinterpret_cast<quintptr>(object);
}

ThemeProvider::ThemeProvider(QObject *parent)
    : QObject(parent)
    , m_theme(Theme::defaultTheme())
{
    m_cache.setThemeVersion(m_version);
}

ThemeProvider::~ThemeProvider()
{
    // Watchers live on their windows; do not leave them behind
    for (const QPointer<WindowBreakpointWatcher> &watcher : std::as_const(m_watchers))
        delete watcher.data();
}

// ---------------------------------------------------------------------------
// Theme mutation
// ---------------------------------------------------------------------------

bool ThemeProvider::apply(const Theme &theme, StyleError *error)
{
    StyleError validationError;
    if (!theme.validate(&validationError)) {
        qWarning("ThemeProvider: rejected theme: %s",
                 qPrintable(validationError.toString()));
        if (error)
            *error = validationError;
        return false;
    }

    if (theme == m_theme)
        return true;

    m_theme = theme;
    ++m_version;
    m_cache.setThemeVersion(m_version);

    // New thresholds may move windows into another bucket.  Their cache
    // entries are dropped here; regeneration happens once, below.
    m_applying = true;
    const BreakpointTable thresholds = m_theme.tokens.breakpoints();
    for (const QPointer<WindowBreakpointWatcher> &watcher : std::as_const(m_watchers)) {
        if (watcher)
            watcher->context()->setThresholds(thresholds);
    }
    m_applying = false;

    const QList<const QWidget *> widgets = m_widgets.keys();
    for (const QWidget *w : widgets) {
        auto it = m_widgets.find(w);
        if (it != m_widgets.end() && it->resolved)
            regenerate(*it, nullptr);
    }

    const QList<Subscriber> subscribers = m_subscribers;
    for (const Subscriber &s : subscribers) {
        if (s.object && s.callback)
            s.callback(m_theme);
    }

    Q_EMIT themeChanged(m_version);
    return true;
}

bool ThemeProvider::update(const QJsonObject &partial, StyleError *error)
{
    Theme next = m_theme;
    StyleError mergeError;
    if (!next.merge(partial, &mergeError)) {
        qWarning("ThemeProvider: rejected theme update: %s",
                 qPrintable(mergeError.toString()));
        if (error)
            *error = mergeError;
        return false;
    }
    return apply(next, error);
}

bool ThemeProvider::applyPreference(const ThemePreference &preference, StyleError *error)
{
    return update(preference.toThemeOverride(), error);
}

bool ThemeProvider::toggleColorScheme(StyleError *error)
{
    const ColorScheme next = m_theme.colorScheme == ColorScheme::Dark ? ColorScheme::Light
                                                                      : ColorScheme::Dark;
    QJsonObject partial;
    partial[QLatin1String("colorScheme")] = Theme::schemeName(next);
    return update(partial, error);
}

// ---------------------------------------------------------------------------
// Widgets
// ---------------------------------------------------------------------------

void ThemeProvider::registerComponentDefaults(const QString &component, const PropBag &defaults)
{
    m_componentDefaults.insert(component, defaults);

    // Defaults are part of every affected widget's fingerprint
    for (auto it = m_widgets.begin(); it != m_widgets.end(); ++it) {
        if (it->resolved && it->component == component)
            regenerate(*it, nullptr);
    }
}

PropBag ThemeProvider::componentDefaults(const QString &component) const
{
    return m_componentDefaults.value(component);
}

void ThemeProvider::registerVariant(const QString &component, VariantType type,
                                    const QString &name, const PropBag &props)
{
    m_variants.registerVariant(component, type, name, props);

    for (auto it = m_widgets.begin(); it != m_widgets.end(); ++it) {
        if (it->resolved && it->component == component && it->variants.value(type) == name)
            regenerate(*it, nullptr);
    }
}

QMap<VariantType, QStringList> ThemeProvider::variantNames(const QString &component) const
{
    QMap<VariantType, QStringList> names = m_variants.variantNames(component);
    const QMap<VariantType, QStringList> themed = m_theme.variants.variantNames(component);
    for (auto it = themed.constBegin(); it != themed.constEnd(); ++it) {
        QStringList &list = names[it.key()];
        for (const QString &name : it.value()) {
            if (!list.contains(name))
                list.append(name);
        }
        list.sort();
    }
    return names;
}

bool ThemeProvider::variantLayer(const QString &component, VariantType type,
                                 const QString &name, PropBag *out, StyleError *error) const
{
    const bool registered = m_variants.contains(component, type, name);
    const bool themed = m_theme.variants.contains(component, type, name);
    if (!registered && !themed) {
        return StyleError::report(error, StyleError::Lookup,
            QStringLiteral("'%1' has no %2 variant '%3'")
                .arg(component, ComponentVariants::typeName(type), name));
    }
    *out = m_variants.variant(component, type, name);
    out->merge(m_theme.variants.variant(component, type, name));
    return true;
}

QHash<const QWidget *, ThemeProvider::WidgetRecord>::iterator
ThemeProvider::recordFor(QWidget *widget)
{
    auto it = m_widgets.find(widget);
    if (it != m_widgets.end())
        return it;

    it = m_widgets.insert(widget, WidgetRecord());
    it->widget = widget;
    widget->installEventFilter(this);
    it->destroyedConnection = connect(widget, &QObject::destroyed, this, [this, widget]() {
        m_widgets.remove(widget);
        m_cache.invalidateWidget(idOf(widget));
    });
    return it;
}

void ThemeProvider::declareTargets(QWidget *widget, const QHash<QString, QString> &targets)
{
    if (!widget)
        return;

    auto it = recordFor(widget);
    it->targets = targets;
    if (it->resolved)
        regenerate(*it, nullptr);
}

bool ThemeProvider::resolveAndApply(QWidget *widget, const PropBag &props,
                                    const QString &component, StyleError *error)
{
    return resolveAndApply(widget, props, VariantSelection(), component, error);
}

bool ThemeProvider::resolveAndApply(QWidget *widget, const PropBag &props,
                                    const VariantSelection &variants,
                                    const QString &component, StyleError *error)
{
    if (!widget) {
        return StyleError::report(error, StyleError::Config,
            QStringLiteral("resolveAndApply() called without a widget"));
    }

    auto it = recordFor(widget);

    if (widget->objectName().isEmpty())
        widget->setObjectName(QStringLiteral("ps_%1").arg(++m_nameCounter));

    it->component = component.isEmpty()
        ? QString::fromLatin1(widget->metaObject()->className())
        : component;
    it->props = props;
    it->variants = variants;
    it->resolved = true;
    return regenerate(*it, error);
}

void ThemeProvider::unregisterWidget(QWidget *widget)
{
    auto it = m_widgets.find(widget);
    if (it == m_widgets.end())
        return;
    disconnect(it->destroyedConnection);
    widget->removeEventFilter(this);
    m_widgets.erase(it);
    m_cache.invalidateWidget(idOf(widget));
}

StyleSheetArtifact ThemeProvider::artifact(const QWidget *widget) const
{
    auto it = m_widgets.constFind(widget);
    return it != m_widgets.constEnd() ? it->artifact : StyleSheetArtifact();
}

QString ThemeProvider::activeBreakpoint(QWidget *widget)
{
    if (!widget)
        return QStringLiteral("base");
    return breakpointContext(widget->window())->activeBreakpoint();
}

QByteArray ThemeProvider::fingerprintFor(const WidgetRecord &record) const
{
    QCryptographicHash hash(QCryptographicHash::Sha1);
    hash.addData(record.props.fingerprint());
    hash.addData(m_componentDefaults.value(record.component).fingerprint());
    hash.addData(record.component.toUtf8());
    hash.addData(record.widget->objectName().toUtf8());

    // Registered variants are not covered by the theme version
    for (auto it = record.variants.constBegin(); it != record.variants.constEnd(); ++it) {
        hash.addData(ComponentVariants::typeName(it.key()).toUtf8());
        hash.addData(it.value().toUtf8());
        hash.addData(m_variants.variant(record.component, it.key(), it.value()).fingerprint());
    }

    QStringList targets;
    for (auto it = record.targets.constBegin(); it != record.targets.constEnd(); ++it)
        targets.append(it.key() + QLatin1Char('=') + it.value());
    targets.sort();
    hash.addData(targets.join(QLatin1Char('\n')).toUtf8());

    return hash.result();
}

bool ThemeProvider::regenerate(WidgetRecord &record, StyleError *error)
{
    QWidget *widget = record.widget;
    if (!widget)
        return false;

    QWidget *window = widget->window();
    record.window = window;
    const QString breakpoint = watcherFor(window)->context()->activeBreakpoint();

    const StyleCache::Key key{idOf(widget), idOf(window), breakpoint, m_version,
                              fingerprintFor(record)};
    StyleSheetArtifact artifact = m_cache.artifact(key);

    if (artifact.isNull()) {
        PropNormalizer normalizer(m_theme);
        QList<StyleError> diagnostics;
        StyleError failure;

        QList<PropBag> layers = {
            m_componentDefaults.value(record.component),
            m_theme.components.value(record.component),
        };
        // VariantSelection iterates in VariantType order
        for (auto it = record.variants.constBegin(); it != record.variants.constEnd(); ++it) {
            PropBag layer;
            if (!variantLayer(record.component, it.key(), it.value(), &layer, &failure))
                break;
            layers.append(layer);
        }
        layers.append(record.props);

        StyleDeclarationList declarations;
        if (!failure.isError())
            declarations = normalizer.normalizeLayers(layers, breakpoint, &failure, &diagnostics);

        for (const StyleError &d : std::as_const(diagnostics))
            reportDiagnostic(widget, d.toString());

        if (!failure.isError()) {
            SelectorScope scope;
            scope.root = QLatin1Char('#') + widget->objectName();
            scope.targets = record.targets;
            artifact = StyleSheetGenerator::generate(declarations, scope, &failure);
        }

        if (failure.isError()) {
            // Keep whatever the widget had before
            reportDiagnostic(widget, failure.toString());
            if (error)
                *error = failure;
            return false;
        }

        ++m_regenerations;
        m_cache.insert(key, artifact);
    }

    record.breakpoint = breakpoint;
    if (artifact.hash != record.artifact.hash) {
        widget->setStyleSheet(artifact.text);
        record.artifact = artifact;
    }
    return true;
}

void ThemeProvider::reportDiagnostic(QWidget *widget, const QString &message)
{
    qWarning("ThemeProvider: %s: %s", qPrintable(widget->objectName()), qPrintable(message));
    Q_EMIT styleDiagnostic(widget, message);
}

// ---------------------------------------------------------------------------
// Subscribers
// ---------------------------------------------------------------------------

void ThemeProvider::subscribe(QObject *subscriber, const ThemeCallback &callback)
{
    if (!subscriber)
        return;

    for (Subscriber &s : m_subscribers) {
        if (s.object == subscriber) {
            s.callback = callback;
            return;
        }
    }

    m_subscribers.append(Subscriber{subscriber, callback});
    connect(subscriber, &QObject::destroyed, this, [this, subscriber]() {
        unsubscribe(subscriber);
    });
}

void ThemeProvider::unsubscribe(QObject *subscriber)
{
    m_subscribers.erase(std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                                       [subscriber](const Subscriber &s) {
        return s.object.isNull() || s.object == subscriber;
    }), m_subscribers.end());
}

// ---------------------------------------------------------------------------
// Responsive
// ---------------------------------------------------------------------------

BreakpointContext *ThemeProvider::breakpointContext(QWidget *window)
{
    return watcherFor(window)->context();
}

void ThemeProvider::setResizeDebounceInterval(int ms)
{
    m_debounceMs = qMax(0, ms);
    for (const QPointer<WindowBreakpointWatcher> &watcher : std::as_const(m_watchers)) {
        if (watcher)
            watcher->setDebounceInterval(m_debounceMs);
    }
}

WindowBreakpointWatcher *ThemeProvider::watcherFor(QWidget *window)
{
    auto it = m_watchers.constFind(window);
    if (it != m_watchers.constEnd() && it.value())
        return it.value();

    auto *watcher = new WindowBreakpointWatcher(window, m_theme.tokens.breakpoints(),
                                                m_debounceMs);
    m_watchers.insert(window, watcher);

    connect(watcher->context(), &BreakpointContext::breakpointChanged, this,
            [this, window]() { onBreakpointChanged(window); });
    connect(window, &QObject::destroyed, this, &ThemeProvider::forgetWindow);
    return watcher;
}

void ThemeProvider::onBreakpointChanged(QWidget *window)
{
    m_cache.invalidateWindow(idOf(window));
    if (m_applying)
        return;

    const QList<const QWidget *> widgets = m_widgets.keys();
    for (const QWidget *w : widgets) {
        auto it = m_widgets.find(w);
        // Compare the live window: the widget may have been reparented
        if (it != m_widgets.end() && it->resolved && it->widget
            && it->widget->window() == window)
            regenerate(*it, nullptr);
    }
}

bool ThemeProvider::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::ParentChange) {
        // A former top-level no longer needs its own breakpoint context
        auto *moved = qobject_cast<QWidget *>(watched);
        if (moved && !moved->isWindow()) {
            const QPointer<WindowBreakpointWatcher> watcher = m_watchers.take(moved);
            delete watcher.data();
            m_cache.invalidateWindow(idOf(moved));
        }

        // Descendants of the moved widget changed window too
        const QList<const QWidget *> widgets = m_widgets.keys();
        for (const QWidget *w : widgets) {
            auto it = m_widgets.find(w);
            if (it != m_widgets.end() && it->resolved && it->widget
                && it->widget->window() != it->window)
                regenerate(*it, nullptr);
        }
    }
    return QObject::eventFilter(watched, event);
}

void ThemeProvider::forgetWindow(QObject *window)
{
    m_watchers.remove(window);
    m_cache.invalidateWindow(idOf(window));
}
