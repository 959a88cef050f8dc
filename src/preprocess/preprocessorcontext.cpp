/*
 * preprocessorcontext.cpp — Run context passed in by mdBook
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "preprocessorcontext.h"

#include <QStringList>

PreprocessorContext PreprocessorContext::fromJson(const QJsonObject &obj)
{
    PreprocessorContext ctx;
    ctx.root          = obj.value(QLatin1String("root")).toString();
    ctx.config        = obj.value(QLatin1String("config")).toObject();
    ctx.renderer      = obj.value(QLatin1String("renderer")).toString();
    ctx.mdbookVersion = obj.value(QLatin1String("mdbook_version")).toString();
    return ctx;
}

QJsonValue PreprocessorContext::configValue(const QString &key,
                                            const QJsonValue &defaultValue) const
{
    const QStringList parts = key.split(QLatin1Char('.'));
    QJsonObject table = config;

    for (int i = 0; i < parts.size(); ++i) {
        if (!table.contains(parts[i]))
            return defaultValue;
        const QJsonValue value = table.value(parts[i]);
        if (i == parts.size() - 1)
            return value;
        if (!value.isObject())
            return defaultValue;
        table = value.toObject();
    }

    return defaultValue;
}
