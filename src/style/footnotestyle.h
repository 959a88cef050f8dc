/*
 * footnotestyle.h — Output style for expanded footnotes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTESTYLE_H
#define FOOTNOTER_FOOTNOTESTYLE_H

#include <QString>

struct FootnoteStyle
{
    // Hyperlink: <sup> anchors pointing at a "---" separated note list.
    // Markdown:  [^n] references with a [^n]: definition list.
    enum Format { Hyperlink, Markdown };

    Format format = Hyperlink;

    static FootnoteStyle hyperlink() { return {}; }
    static FootnoteStyle markdown()
    {
        FootnoteStyle style;
        style.format = Markdown;
        return style;
    }

    // Token substituted at the marker position. Depends only on the number.
    QString referenceToken(int n) const;

    // Text placed between the body and the first note entry.
    QString separator() const;

    // One entry of the trailing note list, including its leading blank line.
    QString noteEntry(int n, const QString &content) const;
};

#endif // FOOTNOTER_FOOTNOTESTYLE_H
