/*
 * styledeclaration.cpp — Pseudo-state names
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "styledeclaration.h"

QString pseudoStateKey(PseudoState state)
{
    switch (state) {
    case PseudoState::None:     return {};
    case PseudoState::Hover:    return QStringLiteral(":hover");
    case PseudoState::Focus:    return QStringLiteral(":focus");
    case PseudoState::Active:   return QStringLiteral(":active");
    case PseudoState::Disabled: return QStringLiteral(":disabled");
    }
    return {};
}

bool pseudoStateFromKey(const QString &key, PseudoState *state)
{
    static const PseudoState all[] = {
        PseudoState::Hover, PseudoState::Focus,
        PseudoState::Active, PseudoState::Disabled,
    };
    for (PseudoState s : all) {
        if (key == pseudoStateKey(s)) {
            *state = s;
            return true;
        }
    }
    return false;
}

QString pseudoStateSelector(PseudoState state)
{
    // Qt calls the active (mouse-down) state "pressed"
    if (state == PseudoState::Active)
        return QStringLiteral(":pressed");
    return pseudoStateKey(state);
}
