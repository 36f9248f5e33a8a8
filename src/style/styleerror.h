/*
 * styleerror.h — Error value shared by the style pipeline
 *
 * Failing operations return false (or an invalid value) and fill an
 * optional StyleError out-parameter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_STYLEERROR_H
#define POLYSTYLE_STYLEERROR_H

#include <QString>

class StyleError
{
public:
    enum Kind {
        None,
        Validation,    // malformed token registration
        Lookup,        // unknown family, index, breakpoint or alias
        Config,        // responsive value with no usable entry
        Serialization, // value cannot be emitted as style sheet text
    };

    StyleError() = default;
    StyleError(Kind kind, const QString &message)
        : m_kind(kind), m_message(message) {}

    Kind kind() const { return m_kind; }
    QString message() const { return m_message; }
    bool isError() const { return m_kind != None; }

    static QString kindName(Kind kind)
    {
        switch (kind) {
        case Validation:    return QStringLiteral("ValidationError");
        case Lookup:        return QStringLiteral("LookupError");
        case Config:        return QStringLiteral("ConfigError");
        case Serialization: return QStringLiteral("SerializationError");
        case None:          break;
        }
        return QStringLiteral("NoError");
    }

    QString toString() const
    {
        return kindName(m_kind) + QLatin1String(": ") + m_message;
    }

    /// Fill @p out (when non-null) and return false.
    static bool report(StyleError *out, Kind kind, const QString &message)
    {
        if (out)
            *out = StyleError(kind, message);
        return false;
    }

private:
    Kind m_kind = None;
    QString m_message;
};

#endif // POLYSTYLE_STYLEERROR_H
