/*
 * footnotepreprocessor.h — Expand {{footnote: ...}} markers across a book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTEPREPROCESSOR_H
#define FOOTNOTER_FOOTNOTEPREPROCESSOR_H

#include <QString>

#include "bookmodel.h"
#include "footnoteconfig.h"

struct PreprocessorContext;

class FootnotePreprocessor
{
public:
    explicit FootnotePreprocessor(const FootnoteConfig &config = {});

    QString name() const;

    const FootnoteConfig &config() const { return m_config; }
    void setConfig(const FootnoteConfig &config) { m_config = config; }

    // Rewrite the content of every chapter, nested chapters included.
    // Numbering restarts at 1 in each chapter.
    BookModel::Book run(const PreprocessorContext &ctx, BookModel::Book book) const;

    // Output is plain markdown/HTML, so every renderer is accepted except
    // mdBook's test sentinel "not-supported".
    bool supportsRenderer(const QString &renderer) const;

    // Renderers known to pass inline HTML through to the reader.
    static bool isHtmlRenderer(const QString &renderer);

private:
    FootnoteConfig m_config;
};

#endif // FOOTNOTER_FOOTNOTEPREPROCESSOR_H
