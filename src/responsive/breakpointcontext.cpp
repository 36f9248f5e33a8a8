/*
 * breakpointcontext.cpp — Active breakpoint of one top-level window
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "breakpointcontext.h"

#include <QDebug>

BreakpointContext::BreakpointContext(const BreakpointTable &thresholds, int width,
                                     QObject *parent)
    : QObject(parent)
    , m_thresholds(thresholds)
    , m_width(width)
    , m_active(classify(width, thresholds))
{
}

QString BreakpointContext::classify(int width, const BreakpointTable &thresholds)
{
    QString active = QStringLiteral("base");
    int best = -1;
    for (const auto &bp : thresholds) {
        if (bp.second <= width && bp.second > best) {
            best = bp.second;
            active = bp.first;
        }
    }
    return active;
}

void BreakpointContext::setThresholds(const BreakpointTable &thresholds)
{
    if (thresholds == m_thresholds)
        return;
    m_thresholds = thresholds;
    reclassify();
}

bool BreakpointContext::updateWidth(int width)
{
    m_width = width;
    return reclassify();
}

bool BreakpointContext::reclassify()
{
    const QString next = classify(m_width, m_thresholds);
    if (next == m_active)
        return false;

    const QString previous = m_active;
    m_active = next;
    ++m_transitions;
    qDebug() << "BreakpointContext:" << previous << "->" << next << "at width" << m_width;
    Q_EMIT breakpointChanged(next, previous);
    return true;
}
