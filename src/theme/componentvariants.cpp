/*
 * componentvariants.cpp — Named prop presets per component
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "componentvariants.h"

void ComponentVariants::registerVariant(const QString &component, VariantType type,
                                        const QString &name, const PropBag &props)
{
    m_variants[component][type].insert(name, props);
}

bool ComponentVariants::contains(const QString &component, VariantType type,
                                 const QString &name) const
{
    auto comp = m_variants.constFind(component);
    if (comp == m_variants.constEnd())
        return false;
    auto names = comp->constFind(type);
    return names != comp->constEnd() && names->contains(name);
}

PropBag ComponentVariants::variant(const QString &component, VariantType type,
                                   const QString &name) const
{
    return m_variants.value(component).value(type).value(name);
}

QMap<VariantType, QStringList> ComponentVariants::variantNames(const QString &component) const
{
    QMap<VariantType, QStringList> out;
    const auto types = m_variants.value(component);
    for (auto it = types.constBegin(); it != types.constEnd(); ++it)
        out.insert(it.key(), it.value().keys());
    return out;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

bool ComponentVariants::merge(const QJsonObject &obj, StyleError *error)
{
    ComponentVariants merged = *this;

    for (auto comp = obj.begin(); comp != obj.end(); ++comp) {
        if (!comp.value().isObject()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("variants of '%1' must be an object").arg(comp.key()));
        }
        const QJsonObject types = comp.value().toObject();
        for (auto t = types.begin(); t != types.end(); ++t) {
            VariantType type;
            if (!typeFromName(t.key(), &type)) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("unknown variant type '%1' for '%2'")
                        .arg(t.key(), comp.key()));
            }
            if (!t.value().isObject()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("%1 variants of '%2' must be an object")
                        .arg(t.key(), comp.key()));
            }
            const QJsonObject names = t.value().toObject();
            for (auto n = names.begin(); n != names.end(); ++n) {
                if (!n.value().isObject()) {
                    return StyleError::report(error, StyleError::Validation,
                        QStringLiteral("variant '%1' of '%2' must be an object")
                            .arg(n.key(), comp.key()));
                }
                StyleError bagError;
                const PropBag props = PropBag::fromJson(n.value().toObject(), &bagError);
                if (bagError.isError()) {
                    return StyleError::report(error, bagError.kind(),
                        QStringLiteral("variant '%1' of '%2': %3")
                            .arg(n.key(), comp.key(), bagError.message()));
                }
                merged.registerVariant(comp.key(), type, n.key(), props);
            }
        }
    }

    *this = merged;
    return true;
}

QJsonObject ComponentVariants::toJson() const
{
    QJsonObject out;
    for (auto comp = m_variants.constBegin(); comp != m_variants.constEnd(); ++comp) {
        QJsonObject types;
        for (auto t = comp->constBegin(); t != comp->constEnd(); ++t) {
            QJsonObject names;
            for (auto n = t->constBegin(); n != t->constEnd(); ++n)
                names[n.key()] = n.value().toJson();
            types[typeName(t.key())] = names;
        }
        out[comp.key()] = types;
    }
    return out;
}

QString ComponentVariants::typeName(VariantType type)
{
    switch (type) {
    case VariantType::Color: return QStringLiteral("color");
    case VariantType::Style: return QStringLiteral("style");
    case VariantType::Size:  return QStringLiteral("size");
    case VariantType::State: return QStringLiteral("state");
    }
    return QString();
}

bool ComponentVariants::typeFromName(const QString &name, VariantType *type)
{
    static const VariantType all[] = {
        VariantType::Color, VariantType::Style, VariantType::Size, VariantType::State,
    };
    for (VariantType t : all) {
        if (name == typeName(t)) {
            *type = t;
            return true;
        }
    }
    return false;
}
