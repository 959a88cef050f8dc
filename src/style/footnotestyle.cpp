/*
 * footnotestyle.cpp — Output style for expanded footnotes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnotestyle.h"

QString FootnoteStyle::referenceToken(int n) const
{
    const QString num = QString::number(n);
    switch (format) {
    case Markdown:
        return QStringLiteral("[^%1]").arg(num);
    case Hyperlink:
        break;
    }
    return QStringLiteral("<sup><a name=\"to-footnote-%1\">[%1](#footnote-%1)</a></sup>")
        .arg(num);
}

QString FootnoteStyle::separator() const
{
    if (format == Markdown)
        return QStringLiteral("<p><hr/>\n");
    return QStringLiteral("\n---\n");
}

QString FootnoteStyle::noteEntry(int n, const QString &content) const
{
    const QString num = QString::number(n);

    // Note text may itself contain "%1"; append it, never arg() it
    QString entry;
    if (format == Markdown) {
        entry = QStringLiteral("\n\n[^%1]: ").arg(num);
    } else {
        entry = QStringLiteral("\n\n<a name=\"footnote-%1\">[%1](#to-footnote-%1)</a>: ")
                    .arg(num);
    }
    entry += content;
    return entry;
}
