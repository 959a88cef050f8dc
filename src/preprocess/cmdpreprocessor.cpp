/*
 * cmdpreprocessor.cpp — mdBook preprocessor protocol over stdin/stdout
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "cmdpreprocessor.h"
#include "bookserializer.h"

#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QObject>
#include <QVersionNumber>

namespace CmdPreprocessor {

Input parseInput(const QByteArray &data)
{
    Input input;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        input.valid = false;
        input.errorMessage = QObject::tr("Unable to parse the input: %1 at offset %2")
                                 .arg(parseError.errorString())
                                 .arg(parseError.offset);
        return input;
    }

    const QJsonArray array = doc.array();
    if (!doc.isArray() || array.size() != 2
        || !array.at(0).isObject() || !array.at(1).isObject()) {
        input.valid = false;
        input.errorMessage =
            QObject::tr("Unable to parse the input: expected [context, book]");
        return input;
    }

    input.context = PreprocessorContext::fromJson(array.at(0).toObject());

    BookSerializer::Result book = BookSerializer::fromJson(array.at(1).toObject());
    if (!book.valid) {
        input.valid = false;
        input.errorMessage = book.errorMessage;
        return input;
    }
    input.book = std::move(book.book);

    return input;
}

Input parseInput(QIODevice &device)
{
    return parseInput(device.readAll());
}

bool writeOutput(QIODevice &device, const BookModel::Book &book, QString *errorMessage)
{
    const QByteArray json =
        QJsonDocument(BookSerializer::toJson(book)).toJson(QJsonDocument::Compact);

    if (device.write(json) != json.size()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Unable to write the book: %1")
                                .arg(device.errorString());
        return false;
    }
    return true;
}

bool isCompatibleVersion(const QString &hostVersion)
{
    const QVersionNumber host = QVersionNumber::fromString(hostVersion);
    const QVersionNumber ours = QVersionNumber::fromString(QLatin1String(kMdBookVersion));
    if (host.segmentCount() < 2)
        return false;
    return host.majorVersion() == ours.majorVersion()
        && host.minorVersion() == ours.minorVersion();
}

} // namespace CmdPreprocessor
