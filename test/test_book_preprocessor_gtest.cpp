/*
 * Book tree and preprocessor tests (GTest)
 *
 * Covers the mdBook JSON book format, recursive traversal, per-chapter
 * numbering, configuration lookup, and the renderer predicate.
 */

#include "bookserializer.h"
#include "footnoteconfig.h"
#include "footnotepreprocessor.h"
#include "preprocessorcontext.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <gtest/gtest.h>

using namespace BookModel;

// ========================================================================
// Helpers
// ========================================================================

static Chapter makeChapter(const QString &name, const QString &content)
{
    Chapter chapter;
    chapter.name = name;
    chapter.content = content;
    chapter.path = name + QStringLiteral(".md");
    chapter.sourcePath = chapter.path;
    return chapter;
}

static const Chapter &chapterAt(const QList<BookItem> &items, int index)
{
    return std::get<Chapter>(items.at(index));
}

static QJsonObject parseObject(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static const char *kSampleBook = R"({
    "sections": [
        {"Chapter": {
            "name": "Intro",
            "content": "Hello{{footnote: first}}",
            "number": [1],
            "sub_items": [
                {"Chapter": {
                    "name": "Nested",
                    "content": "Deep{{footnote: nested}} text",
                    "number": [1, 1],
                    "sub_items": [],
                    "path": "intro/nested.md",
                    "source_path": "intro/nested.md",
                    "parent_names": ["Intro"]
                }}
            ],
            "path": "intro.md",
            "source_path": "intro.md",
            "parent_names": []
        }},
        "Separator",
        {"PartTitle": "Part Two"},
        {"Chapter": {
            "name": "Draft",
            "content": "Not written yet",
            "number": null,
            "sub_items": [],
            "path": null,
            "source_path": null,
            "parent_names": []
        }}
    ],
    "__non_exhaustive": null
})";

// ========================================================================
// Book JSON
// ========================================================================

TEST(BookSerializerTest, ParsesAllItemKinds) {
    const BookSerializer::Result result = BookSerializer::fromJson(parseObject(kSampleBook));
    ASSERT_TRUE(result.valid) << qPrintable(result.errorMessage);

    const QList<BookItem> &sections = result.book.sections;
    ASSERT_EQ(sections.size(), 4);
    EXPECT_TRUE(std::holds_alternative<Chapter>(sections[0]));
    EXPECT_TRUE(std::holds_alternative<Separator>(sections[1]));
    ASSERT_TRUE(std::holds_alternative<PartTitle>(sections[2]));
    EXPECT_EQ(std::get<PartTitle>(sections[2]).title, QStringLiteral("Part Two"));

    const Chapter &intro = chapterAt(sections, 0);
    EXPECT_EQ(intro.name, QStringLiteral("Intro"));
    ASSERT_TRUE(intro.number.has_value());
    EXPECT_EQ(*intro.number, QList<int>({1}));
    ASSERT_EQ(intro.subItems.size(), 1);
    EXPECT_EQ(chapterAt(intro.subItems, 0).parentNames, QStringList{QStringLiteral("Intro")});

    const Chapter &draft = chapterAt(sections, 3);
    EXPECT_FALSE(draft.number.has_value());
    EXPECT_TRUE(draft.path.isNull());
    EXPECT_TRUE(draft.sourcePath.isNull());

    EXPECT_EQ(BookSerializer::chapterCount(result.book), 3);
}

TEST(BookSerializerTest, RoundTripPreservesStructure) {
    const QJsonObject input = parseObject(kSampleBook);
    const BookSerializer::Result result = BookSerializer::fromJson(input);
    ASSERT_TRUE(result.valid);

    EXPECT_EQ(BookSerializer::toJson(result.book), input);
}

TEST(BookSerializerTest, UnknownChapterKeysPreserved) {
    const QJsonObject input = parseObject(R"({"sections": [
        {"Chapter": {"name": "A", "content": "", "number": null, "sub_items": [],
                     "path": "a.md", "source_path": "a.md", "parent_names": [],
                     "future_field": {"x": 1}}}
    ], "__non_exhaustive": null})");

    const BookSerializer::Result result = BookSerializer::fromJson(input);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(BookSerializer::toJson(result.book), input);
}

TEST(BookSerializerTest, RejectsMalformedItems) {
    EXPECT_FALSE(BookSerializer::fromJson(parseObject(R"({"sections": ["Spacer"]})")).valid);
    EXPECT_FALSE(BookSerializer::fromJson(parseObject(R"({"sections": [{"Chapter": {"name": "x"}}]})")).valid);
    EXPECT_FALSE(BookSerializer::fromJson(parseObject(R"({"sections": [{"PartTitle": 3}]})")).valid);
    EXPECT_FALSE(BookSerializer::fromJson(parseObject(R"({"chapters": []})")).valid);

    const BookSerializer::Result result =
        BookSerializer::fromJson(parseObject(R"({"sections": [{"Appendix": {}}]})"));
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errorMessage.isEmpty());
}

TEST(BookSerializerTest, ForEachChapterVisitsParentsFirst) {
    Book book;
    Chapter parent = makeChapter(QStringLiteral("parent"), QString());
    Chapter child = makeChapter(QStringLiteral("child"), QString());
    child.subItems.append(makeChapter(QStringLiteral("grandchild"), QString()));
    parent.subItems.append(child);
    book.sections.append(parent);
    book.sections.append(Separator{});
    book.sections.append(makeChapter(QStringLiteral("sibling"), QString()));

    QStringList visited;
    BookSerializer::forEachChapter(book, [&visited](Chapter &chapter) {
        visited.append(chapter.name);
    });

    EXPECT_EQ(visited, QStringList({QStringLiteral("parent"), QStringLiteral("child"),
                                    QStringLiteral("grandchild"), QStringLiteral("sibling")}));
}

// ========================================================================
// Configuration
// ========================================================================

TEST(FootnoteConfigTest, DefaultsToHyperlink) {
    PreprocessorContext ctx;
    EXPECT_FALSE(FootnoteConfig::fromContext(ctx).markdown);
    EXPECT_EQ(FootnoteConfig().style().format, FootnoteStyle::Hyperlink);
}

TEST(FootnoteConfigTest, ReadsMarkdownFlag) {
    PreprocessorContext ctx;
    ctx.config = parseObject(R"({"preprocessor": {"footnote": {"markdown": true}}})");

    const FootnoteConfig config = FootnoteConfig::fromContext(ctx);
    EXPECT_TRUE(config.markdown);
    EXPECT_EQ(config.style().format, FootnoteStyle::Markdown);
}

TEST(FootnoteConfigTest, WrongTypeFallsBackToDefault) {
    PreprocessorContext ctx;

    ctx.config = parseObject(R"({"preprocessor": {"footnote": {"markdown": "yes"}}})");
    EXPECT_FALSE(FootnoteConfig::fromContext(ctx).markdown);

    ctx.config = parseObject(R"({"preprocessor": {"footnote": {"markdown": 1}}})");
    EXPECT_FALSE(FootnoteConfig::fromContext(ctx).markdown);

    ctx.config = parseObject(R"({"preprocessor": {"footnote": true}})");
    EXPECT_FALSE(FootnoteConfig::fromContext(ctx).markdown);

    ctx.config = parseObject(R"({"preprocessor": "footnote"})");
    EXPECT_FALSE(FootnoteConfig::fromContext(ctx).markdown);
}

TEST(PreprocessorContextTest, DottedLookup) {
    PreprocessorContext ctx = PreprocessorContext::fromJson(parseObject(R"({
        "root": "/books/demo",
        "config": {"book": {"title": "Demo"}, "output": {"html": {}}},
        "renderer": "html",
        "mdbook_version": "0.4.40"
    })"));

    EXPECT_EQ(ctx.root, QStringLiteral("/books/demo"));
    EXPECT_EQ(ctx.renderer, QStringLiteral("html"));
    EXPECT_EQ(ctx.mdbookVersion, QStringLiteral("0.4.40"));
    EXPECT_EQ(ctx.configValue(QStringLiteral("book.title")).toString(), QStringLiteral("Demo"));
    EXPECT_TRUE(ctx.configValue(QStringLiteral("book.authors")).isUndefined());
    EXPECT_EQ(ctx.configValue(QStringLiteral("book.title.x"), 7).toInt(), 7);
}

// ========================================================================
// Preprocessor
// ========================================================================

TEST(FootnotePreprocessorTest, Name) {
    EXPECT_EQ(FootnotePreprocessor().name(), QStringLiteral("footnote-preprocessor"));
}

TEST(FootnotePreprocessorTest, SupportsEveryRendererButSentinel) {
    const FootnotePreprocessor preprocessor;
    EXPECT_FALSE(preprocessor.supportsRenderer(QStringLiteral("not-supported")));
    EXPECT_TRUE(preprocessor.supportsRenderer(QStringLiteral("html")));
    EXPECT_TRUE(preprocessor.supportsRenderer(QStringLiteral("markdown")));
    EXPECT_TRUE(preprocessor.supportsRenderer(QStringLiteral("some-novel-renderer")));
    EXPECT_TRUE(preprocessor.supportsRenderer(QString()));
}

TEST(FootnotePreprocessorTest, KnownHtmlRenderers) {
    EXPECT_TRUE(FootnotePreprocessor::isHtmlRenderer(QStringLiteral("html")));
    EXPECT_TRUE(FootnotePreprocessor::isHtmlRenderer(QStringLiteral("epub")));
    EXPECT_FALSE(FootnotePreprocessor::isHtmlRenderer(QStringLiteral("markdown")));
}

TEST(FootnotePreprocessorTest, RewritesNestedChaptersWithFreshNumbering) {
    const BookSerializer::Result parsed = BookSerializer::fromJson(parseObject(kSampleBook));
    ASSERT_TRUE(parsed.valid);

    PreprocessorContext ctx;
    ctx.renderer = QStringLiteral("html");

    FootnoteConfig config;
    config.markdown = true;
    const Book book = FootnotePreprocessor(config).run(ctx, parsed.book);

    const Chapter &intro = chapterAt(book.sections, 0);
    EXPECT_EQ(intro.content, QStringLiteral("Hello[^1]<p><hr/>\n\n\n[^1]: first"));

    const Chapter &nested = chapterAt(intro.subItems, 0);
    EXPECT_EQ(nested.content, QStringLiteral("Deep[^1] text<p><hr/>\n\n\n[^1]: nested"));
    EXPECT_EQ(nested.path, QStringLiteral("intro/nested.md"));

    EXPECT_EQ(chapterAt(book.sections, 3).content, QStringLiteral("Not written yet"));
    EXPECT_TRUE(std::holds_alternative<Separator>(book.sections[1]));
}

TEST(FootnotePreprocessorTest, OnlyContentChanges) {
    const QJsonObject input = parseObject(kSampleBook);
    const BookSerializer::Result parsed = BookSerializer::fromJson(input);
    ASSERT_TRUE(parsed.valid);

    PreprocessorContext ctx;
    ctx.renderer = QStringLiteral("markdown");  // triggers the advisory warning only
    const QJsonObject output =
        BookSerializer::toJson(FootnotePreprocessor().run(ctx, parsed.book));

    // Drop content from both sides and compare what is left
    const auto stripContent = [](QJsonObject book) {
        Book stripped = BookSerializer::fromJson(book).book;
        BookSerializer::forEachChapter(stripped, [](Chapter &chapter) {
            chapter.content.clear();
        });
        return BookSerializer::toJson(stripped);
    };
    EXPECT_EQ(stripContent(output), stripContent(input));
    EXPECT_NE(output, input);
}
