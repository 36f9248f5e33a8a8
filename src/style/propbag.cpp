/*
 * propbag.cpp — Style props declared for one widget instance
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "propbag.h"

#include <QCryptographicHash>
#include <QStringList>

#include <algorithm>

static const QLatin1String s_stylesKey("styles");
static const QLatin1String s_rawKey("style");

static bool sameSlot(const PropBag::Entry &a, const PropBag::Entry &b)
{
    return a.name == b.name && a.state == b.state && a.target == b.target && a.raw == b.raw;
}

// ---------------------------------------------------------------------------
// Mutation / lookup
// ---------------------------------------------------------------------------

void PropBag::insertEntry(const Entry &entry)
{
    for (Entry &e : m_entries) {
        if (sameSlot(e, entry)) {
            e.value = entry.value;
            return;
        }
    }
    m_entries.append(entry);
}

PropBag &PropBag::set(const QString &name, const StyleValue &value,
                      PseudoState state, const QString &target)
{
    insertEntry({name, value, state, target, false});
    return *this;
}

PropBag &PropBag::setRaw(const QString &property, const StyleValue &value,
                         PseudoState state, const QString &target)
{
    insertEntry({property, value, state, target, true});
    return *this;
}

StyleValue PropBag::value(const QString &name, PseudoState state, const QString &target) const
{
    for (const Entry &e : m_entries) {
        if (!e.raw && e.name == name && e.state == state && e.target == target)
            return e.value;
    }
    return {};
}

bool PropBag::contains(const QString &name, PseudoState state, const QString &target) const
{
    return std::any_of(m_entries.cbegin(), m_entries.cend(), [&](const Entry &e) {
        return !e.raw && e.name == name && e.state == state && e.target == target;
    });
}

bool PropBag::isResponsive() const
{
    return std::any_of(m_entries.cbegin(), m_entries.cend(),
                       [](const Entry &e) { return e.value.isResponsive(); });
}

void PropBag::merge(const PropBag &other)
{
    for (const Entry &e : other.m_entries)
        insertEntry(e);
}

// ---------------------------------------------------------------------------
// Fingerprint
// ---------------------------------------------------------------------------

QByteArray PropBag::fingerprint() const
{
    QStringList lines;
    lines.reserve(m_entries.size());
    for (const Entry &e : m_entries) {
        lines.append(e.target + QLatin1Char('|')
                     + QString::number(static_cast<int>(e.state)) + QLatin1Char('|')
                     + (e.raw ? QStringLiteral("!") : QStringLiteral(" ")) + e.name
                     + QLatin1Char('=') + e.value.fingerprintText());
    }
    lines.sort();

    return QCryptographicHash::hash(lines.join(QLatin1Char('\n')).toUtf8(),
                                    QCryptographicHash::Sha1);
}

bool PropBag::operator==(const PropBag &other) const
{
    if (m_entries.size() != other.m_entries.size())
        return false;
    return fingerprint() == other.fingerprint();
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

// Scalars, or a non-empty breakpoint map of scalars
static bool readJsonValue(const QJsonValue &val, const QString &name, StyleValue *out,
                          StyleError *error)
{
    if (val.isObject()) {
        const QJsonObject obj = val.toObject();
        if (obj.isEmpty()) {
            return StyleError::report(error, StyleError::Validation,
                QStringLiteral("prop '%1' has an empty breakpoint map").arg(name));
        }
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (!it.value().isDouble() && !it.value().isString()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("prop '%1' at breakpoint '%2' must be a number or a string")
                        .arg(name, it.key()));
            }
        }
    } else if (!val.isDouble() && !val.isString()) {
        return StyleError::report(error, StyleError::Validation,
            QStringLiteral("prop '%1' must be a number, a string or a breakpoint map")
                .arg(name));
    }
    *out = StyleValue::fromJson(val);
    return true;
}

bool PropBag::readJsonLevel(const QJsonObject &obj, PseudoState state, const QString &target,
                            StyleError *error)
{
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const QString key = it.key();
        const QJsonValue val = it.value();

        PseudoState nested;
        if (key.startsWith(QLatin1Char(':'))) {
            if (!pseudoStateFromKey(key, &nested)) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("unknown pseudo-state '%1'").arg(key));
            }
            if (state != PseudoState::None || !val.isObject()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("'%1' must be an object at the top of a prop bag").arg(key));
            }
            if (!readJsonLevel(val.toObject(), nested, target, error))
                return false;
            continue;
        }
        if (key == s_stylesKey) {
            if (!target.isEmpty() || state != PseudoState::None || !val.isObject()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("'styles' must be an object at the top of a prop bag"));
            }
            const QJsonObject targets = val.toObject();
            for (auto t = targets.begin(); t != targets.end(); ++t) {
                if (!t.value().isObject()) {
                    return StyleError::report(error, StyleError::Validation,
                        QStringLiteral("styles of '%1' must be an object").arg(t.key()));
                }
                if (!readJsonLevel(t.value().toObject(), state, t.key(), error))
                    return false;
            }
            continue;
        }
        if (key == s_rawKey) {
            if (!val.isObject()) {
                return StyleError::report(error, StyleError::Validation,
                    QStringLiteral("'style' must be an object"));
            }
            const QJsonObject rawObj = val.toObject();
            for (auto r = rawObj.begin(); r != rawObj.end(); ++r) {
                StyleValue v;
                if (!readJsonValue(r.value(), r.key(), &v, error))
                    return false;
                setRaw(r.key(), v, state, target);
            }
            continue;
        }

        StyleValue v;
        if (!readJsonValue(val, key, &v, error))
            return false;
        set(key, v, state, target);
    }
    return true;
}

PropBag PropBag::fromJson(const QJsonObject &obj, StyleError *error)
{
    PropBag bag;
    StyleError readError;
    if (!bag.readJsonLevel(obj, PseudoState::None, QString(), &readError)) {
        qWarning("PropBag: %s", qPrintable(readError.toString()));
        if (error)
            *error = readError;
        return PropBag();
    }
    return bag;
}

QJsonObject PropBag::toJson() const
{
    // target -> state -> level object
    QMap<QString, QMap<int, QJsonObject>> levels;
    for (const Entry &e : m_entries) {
        QJsonObject &level = levels[e.target][static_cast<int>(e.state)];
        if (e.raw) {
            QJsonObject rawObj = level.value(s_rawKey).toObject();
            rawObj[e.name] = e.value.toJson();
            level[s_rawKey] = rawObj;
        } else {
            level[e.name] = e.value.toJson();
        }
    }

    auto foldTarget = [](const QMap<int, QJsonObject> &states) {
        QJsonObject out = states.value(static_cast<int>(PseudoState::None));
        for (auto it = states.constBegin(); it != states.constEnd(); ++it) {
            const auto state = static_cast<PseudoState>(it.key());
            if (state != PseudoState::None)
                out[pseudoStateKey(state)] = it.value();
        }
        return out;
    };

    QJsonObject root = foldTarget(levels.value(QString()));
    QJsonObject styles;
    for (auto it = levels.constBegin(); it != levels.constEnd(); ++it) {
        if (!it.key().isEmpty())
            styles[it.key()] = foldTarget(it.value());
    }
    if (!styles.isEmpty())
        root[s_stylesKey] = styles;
    return root;
}
