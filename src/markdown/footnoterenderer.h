/*
 * footnoterenderer.h — Number footnotes and render the trailing note list
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTERENDERER_H
#define FOOTNOTER_FOOTNOTERENDERER_H

#include <QString>
#include <QStringList>

#include "footnotestyle.h"

// Collects the footnotes of one chapter. Numbering starts at 1 and follows
// the order in which addFootnote() is called; use a fresh renderer (or
// reset()) for every chapter.
class FootnoteRenderer
{
public:
    explicit FootnoteRenderer(const FootnoteStyle &style = {});

    // Record a note and return the reference token for its position.
    QString addFootnote(const QString &content);

    // Separator plus one entry per note, or an empty string if no notes
    // were added.
    QString footnoteBlock() const;

    const QStringList &footnotes() const { return m_footnotes; }
    int count() const { return int(m_footnotes.size()); }
    bool isEmpty() const { return m_footnotes.isEmpty(); }

    const FootnoteStyle &style() const { return m_style; }

    void reset();

private:
    FootnoteStyle m_style;
    QStringList m_footnotes;  // index i holds note number i + 1
};

#endif // FOOTNOTER_FOOTNOTERENDERER_H
