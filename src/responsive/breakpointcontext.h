/*
 * breakpointcontext.h — Active breakpoint of one top-level window
 *
 * Classifies the window width against an ascending threshold table: the
 * active breakpoint is the largest threshold <= width, or "base".  Emits
 * breakpointChanged() only when the classification actually changes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_BREAKPOINTCONTEXT_H
#define POLYSTYLE_BREAKPOINTCONTEXT_H

#include <QObject>
#include <QString>

#include "tokenstore.h"

class BreakpointContext : public QObject
{
    Q_OBJECT

public:
    explicit BreakpointContext(const BreakpointTable &thresholds, int width,
                               QObject *parent = nullptr);

    static QString classify(int width, const BreakpointTable &thresholds);

    QString activeBreakpoint() const { return m_active; }
    int width() const { return m_width; }
    BreakpointTable thresholds() const { return m_thresholds; }

    /// Replace the table (theme change) and re-classify the current width.
    void setThresholds(const BreakpointTable &thresholds);

    /// Returns true if the new width moved the window into another bucket.
    bool updateWidth(int width);

    int transitionCount() const { return m_transitions; }

Q_SIGNALS:
    void breakpointChanged(const QString &current, const QString &previous);

private:
    bool reclassify();

    BreakpointTable m_thresholds;
    int m_width = 0;
    QString m_active;
    int m_transitions = 0;
};

#endif // POLYSTYLE_BREAKPOINTCONTEXT_H
