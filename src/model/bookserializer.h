/*
 * bookserializer.h — Convert BookModel::Book to and from mdBook JSON
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_BOOKSERIALIZER_H
#define FOOTNOTER_BOOKSERIALIZER_H

#include <QJsonObject>
#include <QString>

#include <functional>

#include "bookmodel.h"

namespace BookSerializer {

struct Result {
    BookModel::Book book;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

// Parse {"sections": [...]} as produced by mdBook.
Result fromJson(const QJsonObject &obj);

QJsonObject toJson(const BookModel::Book &book);

// Visit every chapter, depth-first, parents before their sub-items.
void forEachChapter(BookModel::Book &book,
                    const std::function<void(BookModel::Chapter &)> &visit);

int chapterCount(const BookModel::Book &book);

} // namespace BookSerializer

#endif // FOOTNOTER_BOOKSERIALIZER_H
