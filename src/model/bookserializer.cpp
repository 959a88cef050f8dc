/*
 * bookserializer.cpp — Convert BookModel::Book to and from mdBook JSON
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "bookserializer.h"

#include <QJsonArray>
#include <QJsonValue>
#include <QObject>

using namespace BookModel;

namespace BookSerializer {

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

static bool itemFromJson(const QJsonValue &value, BookItem &item, QString &error);

static bool itemsFromJson(const QJsonValue &value, QList<BookItem> &items,
                          QString &error)
{
    if (!value.isArray()) {
        error = QObject::tr("Expected an array of book items");
        return false;
    }

    const QJsonArray array = value.toArray();
    items.reserve(array.size());
    for (const QJsonValue &entry : array) {
        BookItem item;
        if (!itemFromJson(entry, item, error))
            return false;
        items.append(std::move(item));
    }
    return true;
}

// JSON null maps to a null QString, so the distinction survives a round trip
static bool optionalStringFromJson(const QJsonValue &value, QString &out)
{
    if (value.isNull() || value.isUndefined()) {
        out = QString();
        return true;
    }
    if (!value.isString())
        return false;
    out = value.toString();
    if (out.isNull())
        out = QStringLiteral("");
    return true;
}

static bool chapterFromJson(const QJsonObject &obj, Chapter &chapter, QString &error)
{
    const QJsonValue name = obj.value(QLatin1String("name"));
    const QJsonValue content = obj.value(QLatin1String("content"));
    if (!name.isString() || !content.isString()) {
        error = QObject::tr("Chapter is missing \"name\" or \"content\"");
        return false;
    }
    chapter.name = name.toString();
    chapter.content = content.toString();

    const QJsonValue number = obj.value(QLatin1String("number"));
    if (number.isArray()) {
        QList<int> parts;
        for (const QJsonValue &part : number.toArray()) {
            if (!part.isDouble()) {
                error = QObject::tr("Invalid section number in chapter \"%1\"")
                            .arg(chapter.name);
                return false;
            }
            parts.append(part.toInt());
        }
        chapter.number = parts;
    } else if (!number.isNull() && !number.isUndefined()) {
        error = QObject::tr("Invalid section number in chapter \"%1\"").arg(chapter.name);
        return false;
    }

    const QJsonValue subItems = obj.value(QLatin1String("sub_items"));
    if (!subItems.isUndefined() && !itemsFromJson(subItems, chapter.subItems, error))
        return false;

    if (!optionalStringFromJson(obj.value(QLatin1String("path")), chapter.path)
        || !optionalStringFromJson(obj.value(QLatin1String("source_path")),
                                   chapter.sourcePath)) {
        error = QObject::tr("Invalid path in chapter \"%1\"").arg(chapter.name);
        return false;
    }

    const QJsonValue parents = obj.value(QLatin1String("parent_names"));
    if (parents.isArray()) {
        for (const QJsonValue &parent : parents.toArray())
            chapter.parentNames.append(parent.toString());
    }

    static const QStringList knownKeys = {
        QStringLiteral("name"),
        QStringLiteral("content"),
        QStringLiteral("number"),
        QStringLiteral("sub_items"),
        QStringLiteral("path"),
        QStringLiteral("source_path"),
        QStringLiteral("parent_names"),
    };
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!knownKeys.contains(it.key()))
            chapter.extra.insert(it.key(), it.value());
    }

    return true;
}

static bool itemFromJson(const QJsonValue &value, BookItem &item, QString &error)
{
    // Unit variants are serialized as a bare string
    if (value.isString()) {
        if (value.toString() == QLatin1String("Separator")) {
            item = Separator{};
            return true;
        }
        error = QObject::tr("Unknown book item \"%1\"").arg(value.toString());
        return false;
    }

    const QJsonObject obj = value.toObject();
    if (!value.isObject() || obj.size() != 1) {
        error = QObject::tr("Malformed book item");
        return false;
    }

    const QString kind = obj.begin().key();
    const QJsonValue payload = obj.begin().value();

    if (kind == QLatin1String("Chapter")) {
        if (!payload.isObject()) {
            error = QObject::tr("Malformed chapter");
            return false;
        }
        Chapter chapter;
        if (!chapterFromJson(payload.toObject(), chapter, error))
            return false;
        item = std::move(chapter);
        return true;
    }

    if (kind == QLatin1String("PartTitle")) {
        if (!payload.isString()) {
            error = QObject::tr("Malformed part title");
            return false;
        }
        item = PartTitle{payload.toString()};
        return true;
    }

    error = QObject::tr("Unknown book item \"%1\"").arg(kind);
    return false;
}

Result fromJson(const QJsonObject &obj)
{
    Result result;
    QString error;
    if (!itemsFromJson(obj.value(QLatin1String("sections")), result.book.sections, error)) {
        result.valid = false;
        result.errorMessage = QObject::tr("Invalid book: %1").arg(error);
        result.book = {};
    }
    return result;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

static QJsonValue optionalStringToJson(const QString &value)
{
    if (value.isNull())
        return QJsonValue(QJsonValue::Null);
    return value;
}

static QJsonValue itemToJson(const BookItem &item);

static QJsonArray itemsToJson(const QList<BookItem> &items)
{
    QJsonArray array;
    for (const BookItem &item : items)
        array.append(itemToJson(item));
    return array;
}

static QJsonObject chapterToJson(const Chapter &chapter)
{
    QJsonObject obj = chapter.extra;
    obj[QLatin1String("name")]    = chapter.name;
    obj[QLatin1String("content")] = chapter.content;

    if (chapter.number) {
        QJsonArray number;
        for (int part : *chapter.number)
            number.append(part);
        obj[QLatin1String("number")] = number;
    } else {
        obj[QLatin1String("number")] = QJsonValue(QJsonValue::Null);
    }

    obj[QLatin1String("sub_items")]    = itemsToJson(chapter.subItems);
    obj[QLatin1String("path")]         = optionalStringToJson(chapter.path);
    obj[QLatin1String("source_path")]  = optionalStringToJson(chapter.sourcePath);
    obj[QLatin1String("parent_names")] = QJsonArray::fromStringList(chapter.parentNames);
    return obj;
}

static QJsonValue itemToJson(const BookItem &item)
{
    if (const auto *chapter = std::get_if<Chapter>(&item)) {
        QJsonObject obj;
        obj[QLatin1String("Chapter")] = chapterToJson(*chapter);
        return obj;
    }
    if (const auto *part = std::get_if<PartTitle>(&item)) {
        QJsonObject obj;
        obj[QLatin1String("PartTitle")] = part->title;
        return obj;
    }
    return QStringLiteral("Separator");
}

QJsonObject toJson(const Book &book)
{
    QJsonObject obj;
    obj[QLatin1String("sections")] = itemsToJson(book.sections);
    obj[QLatin1String("__non_exhaustive")] = QJsonValue(QJsonValue::Null);
    return obj;
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

static void visitItems(QList<BookItem> &items,
                       const std::function<void(Chapter &)> &visit)
{
    for (BookItem &item : items) {
        if (auto *chapter = std::get_if<Chapter>(&item)) {
            visit(*chapter);
            visitItems(chapter->subItems, visit);
        }
    }
}

void forEachChapter(Book &book, const std::function<void(Chapter &)> &visit)
{
    visitItems(book.sections, visit);
}

static int countItems(const QList<BookItem> &items)
{
    int count = 0;
    for (const BookItem &item : items) {
        if (const auto *chapter = std::get_if<Chapter>(&item))
            count += 1 + countItems(chapter->subItems);
    }
    return count;
}

int chapterCount(const Book &book)
{
    return countItems(book.sections);
}

} // namespace BookSerializer
