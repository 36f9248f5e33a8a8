/*
 * windowbreakpointwatcher.h — Feeds a window's settled width to its context
 *
 * Installs itself as an event filter on the top-level window and coalesces
 * resize events with a single-shot timer.  A debounce interval of 0 feeds
 * every resize immediately.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_WINDOWBREAKPOINTWATCHER_H
#define POLYSTYLE_WINDOWBREAKPOINTWATCHER_H

#include <QObject>
#include <QPointer>
#include <QTimer>

#include "tokenstore.h"

class BreakpointContext;
class QWidget;

class WindowBreakpointWatcher : public QObject
{
    Q_OBJECT

public:
    /// Parented to @p window, so it is destroyed with it.
    WindowBreakpointWatcher(QWidget *window, const BreakpointTable &thresholds,
                            int debounceMs = 100);

    QWidget *window() const { return m_window; }
    BreakpointContext *context() const { return m_context; }

    int debounceInterval() const { return m_debounce.interval(); }
    void setDebounceInterval(int ms);

    /// Apply a pending resize now instead of waiting for the timer.
    void flush();

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void applyWidth();

    QPointer<QWidget> m_window;
    BreakpointContext *m_context = nullptr;
    QTimer m_debounce;
};

#endif // POLYSTYLE_WINDOWBREAKPOINTWATCHER_H
