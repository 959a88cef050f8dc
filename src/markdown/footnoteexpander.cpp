/*
 * footnoteexpander.cpp — Rewrite a chapter body with numbered footnotes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnoteexpander.h"
#include "footnoterenderer.h"
#include "footnotescanner.h"

namespace FootnoteExpander {

QString process(const QString &text, const FootnoteStyle &style)
{
    const QList<FootnoteScanner::Marker> markers = FootnoteScanner::scan(text);
    if (markers.isEmpty())
        return text;

    FootnoteRenderer renderer(style);

    QString result;
    result.reserve(text.size());

    // Copy the text between markers, substituting each marker in place
    qsizetype pos = 0;
    for (const auto &marker : markers) {
        result += text.mid(pos, marker.start - pos);
        result += renderer.addFootnote(marker.content);
        pos = marker.start + marker.length;
    }
    result += text.mid(pos);

    result += renderer.footnoteBlock();
    return result;
}

} // namespace FootnoteExpander
