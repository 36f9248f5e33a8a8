/*
 * styledeclaration.h — Canonical, fully resolved style declaration
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_STYLEDECLARATION_H
#define POLYSTYLE_STYLEDECLARATION_H

#include <QList>
#include <QString>

enum class PseudoState {
    None,
    Hover,
    Focus,
    Active,
    Disabled,
};

/// Name used in prop-bag JSON (":hover", ...), empty for None.
QString pseudoStateKey(PseudoState state);
/// Inverse of pseudoStateKey(); returns false for an unknown key.
bool pseudoStateFromKey(const QString &key, PseudoState *state);
/// Qt style sheet pseudo-state selector (":hover", ":focus", ":pressed", ...).
QString pseudoStateSelector(PseudoState state);

struct StyleDeclaration {
    QString target;      // inner element, empty for the widget root
    PseudoState state = PseudoState::None;
    QString property;    // kebab-case QSS property
    QString value;       // resolved, never a token reference
    QString breakpoint;  // bucket used when the source was responsive

    bool operator==(const StyleDeclaration &other) const {
        return target == other.target && state == other.state
            && property == other.property && value == other.value
            && breakpoint == other.breakpoint;
    }
    bool operator!=(const StyleDeclaration &other) const { return !(*this == other); }
};

using StyleDeclarationList = QList<StyleDeclaration>;

#endif // POLYSTYLE_STYLEDECLARATION_H
