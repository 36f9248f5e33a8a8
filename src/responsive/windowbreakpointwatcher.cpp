/*
 * windowbreakpointwatcher.cpp — Feeds a window's settled width to its context
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "windowbreakpointwatcher.h"

#include "breakpointcontext.h"

#include <QEvent>
#include <QWidget>

WindowBreakpointWatcher::WindowBreakpointWatcher(QWidget *window,
                                                 const BreakpointTable &thresholds,
                                                 int debounceMs)
    : QObject(window)
    , m_window(window)
{
    m_context = new BreakpointContext(thresholds, window->width(), this);

    m_debounce.setSingleShot(true);
    m_debounce.setInterval(qMax(0, debounceMs));
    connect(&m_debounce, &QTimer::timeout, this, &WindowBreakpointWatcher::applyWidth);

    window->installEventFilter(this);
}

void WindowBreakpointWatcher::setDebounceInterval(int ms)
{
    m_debounce.setInterval(qMax(0, ms));
}

void WindowBreakpointWatcher::flush()
{
    if (m_debounce.isActive())
        m_debounce.stop();
    applyWidth();
}

bool WindowBreakpointWatcher::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == m_window && event->type() == QEvent::Resize) {
        if (m_debounce.interval() == 0)
            applyWidth();
        else
            m_debounce.start();   // restarts while resizing continues
    }
    return QObject::eventFilter(watched, event);
}

void WindowBreakpointWatcher::applyWidth()
{
    if (!m_window)
        return;
    m_context->updateWidth(m_window->width());
}
