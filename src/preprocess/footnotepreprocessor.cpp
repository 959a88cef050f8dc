/*
 * footnotepreprocessor.cpp — Expand {{footnote: ...}} markers across a book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnotepreprocessor.h"
#include "bookserializer.h"
#include "footnoteexpander.h"
#include "preprocessorcontext.h"

#include <QDebug>
#include <QStringList>

FootnotePreprocessor::FootnotePreprocessor(const FootnoteConfig &config)
    : m_config(config)
{
}

QString FootnotePreprocessor::name() const
{
    return QStringLiteral("footnote-preprocessor");
}

BookModel::Book FootnotePreprocessor::run(const PreprocessorContext &ctx,
                                          BookModel::Book book) const
{
    if (!m_config.markdown && !isHtmlRenderer(ctx.renderer)) {
        qWarning().noquote() << name() + QLatin1String(":")
                             << "HTML footnotes selected for renderer" << ctx.renderer
                             << "which may not display HTML;"
                             << "set preprocessor.footnote.markdown = true to emit markdown footnotes";
    }

    const FootnoteStyle style = m_config.style();
    BookSerializer::forEachChapter(book, [&style](BookModel::Chapter &chapter) {
        chapter.content = FootnoteExpander::process(chapter.content, style);
    });

    return book;
}

bool FootnotePreprocessor::supportsRenderer(const QString &renderer) const
{
    return renderer != QLatin1String("not-supported");
}

bool FootnotePreprocessor::isHtmlRenderer(const QString &renderer)
{
    static const QStringList htmlRenderers = {
        QStringLiteral("html"),
        QStringLiteral("epub"),
    };
    return htmlRenderers.contains(renderer);
}
