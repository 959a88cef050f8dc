/*
 * preprocessorcontext.h — Run context passed in by mdBook
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_PREPROCESSORCONTEXT_H
#define FOOTNOTER_PREPROCESSORCONTEXT_H

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

struct PreprocessorContext {
    QString root;           // book root directory
    QJsonObject config;     // book.toml, as JSON
    QString renderer;       // renderer this run feeds, e.g. "html"
    QString mdbookVersion;

    static PreprocessorContext fromJson(const QJsonObject &obj);

    // Look up a dotted key such as "preprocessor.footnote.markdown" in the
    // nested config tables. Returns defaultValue if any part is missing.
    QJsonValue configValue(const QString &key,
                           const QJsonValue &defaultValue = {}) const;
};

#endif // FOOTNOTER_PREPROCESSORCONTEXT_H
