/*
 * componentvariants.h — Named prop presets per component
 *
 * A component (QPushButton, QLineEdit, ...) can offer named variants
 * grouped by type: a "color" variant picks the palette, a "style" variant
 * the fill treatment, a "size" variant padding and type size.  Each
 * variant is a PropBag layered between the theme's component override and
 * the instance props.
 *
 * JSON form:
 *   { "QPushButton": { "style": { "outline": { "bg": "transparent" } },
 *                      "size":  { "sm": { "px": "md" } } } }
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_COMPONENTVARIANTS_H
#define POLYSTYLE_COMPONENTVARIANTS_H

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

#include "propbag.h"
#include "styleerror.h"

// Declaration order is layering order: later types win.
enum class VariantType {
    Color,
    Style,
    Size,
    State,
};

/// Chosen variant name per type for one widget.
using VariantSelection = QMap<VariantType, QString>;

class ComponentVariants
{
public:
    ComponentVariants() = default;

    /// Register (or replace) one variant.
    void registerVariant(const QString &component, VariantType type, const QString &name,
                         const PropBag &props);
    bool contains(const QString &component, VariantType type, const QString &name) const;
    PropBag variant(const QString &component, VariantType type, const QString &name) const;

    /// Variant names per type offered by @p component.
    QMap<VariantType, QStringList> variantNames(const QString &component) const;
    QStringList components() const { return m_variants.keys(); }
    bool isEmpty() const { return m_variants.isEmpty(); }

    /// Merge a partial description.  Variants named in @p obj replace
    /// existing ones whole.  On failure nothing changes.
    bool merge(const QJsonObject &obj, StyleError *error = nullptr);
    QJsonObject toJson() const;

    static QString typeName(VariantType type);
    static bool typeFromName(const QString &name, VariantType *type);

    bool operator==(const ComponentVariants &other) const { return m_variants == other.m_variants; }
    bool operator!=(const ComponentVariants &other) const { return !(*this == other); }

private:
    // component -> type -> name -> props
    QMap<QString, QMap<VariantType, QMap<QString, PropBag>>> m_variants;
};

#endif // POLYSTYLE_COMPONENTVARIANTS_H
