/*
 * cmdpreprocessor.h — mdBook preprocessor protocol over stdin/stdout
 *
 * mdBook writes a JSON array [context, book] to the preprocessor's stdin
 * and reads the modified book back from its stdout.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_CMDPREPROCESSOR_H
#define FOOTNOTER_CMDPREPROCESSOR_H

#include <QByteArray>
#include <QString>

#include "bookmodel.h"
#include "preprocessorcontext.h"

class QIODevice;

namespace CmdPreprocessor {

// mdBook release the protocol handling was written against
inline constexpr char kMdBookVersion[] = "0.4.40";

struct Input {
    PreprocessorContext context;
    BookModel::Book book;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

Input parseInput(const QByteArray &data);
Input parseInput(QIODevice &device);

// Serialize the book as compact JSON. Returns false and sets errorMessage
// if the device rejects the write.
bool writeOutput(QIODevice &device, const BookModel::Book &book,
                 QString *errorMessage = nullptr);

// True if hostVersion has the same major and minor version as
// kMdBookVersion. Unparseable versions are treated as incompatible.
bool isCompatibleVersion(const QString &hostVersion);

} // namespace CmdPreprocessor

#endif // FOOTNOTER_CMDPREPROCESSOR_H
