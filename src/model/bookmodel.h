/*
 * bookmodel.h — Book tree types (header-only, std::variant)
 *
 * Mirrors the book structure handed to preprocessors by mdBook:
 * a list of items, where chapters may nest further items.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_BOOKMODEL_H
#define FOOTNOTER_BOOKMODEL_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

namespace BookModel {

struct Separator {};

struct PartTitle {
    QString title;
};

// Forward-declare Chapter for the recursive item type
struct Chapter;
using BookItem = std::variant<
    struct Chapter,
    Separator,
    PartTitle
>;

struct Chapter {
    QString name;
    QString content;                    // markdown body
    std::optional<QList<int>> number;   // e.g. {1, 2} for "1.2."; unset for drafts
    QList<BookItem> subItems;
    QString path;                       // null = no path (draft chapter)
    QString sourcePath;                 // null = no source path
    QStringList parentNames;
    QJsonObject extra;                  // keys we do not model, written back as-is
};

struct Book {
    QList<BookItem> sections;
};

} // namespace BookModel

#endif // FOOTNOTER_BOOKMODEL_H
