/*
 * footnotescanner.h — Locate {{footnote: ...}} markers in chapter text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTESCANNER_H
#define FOOTNOTER_FOOTNOTESCANNER_H

#include <QList>
#include <QRegularExpression>
#include <QString>

// Marker syntax:
//   Normal text{{footnote: Or is it?}} in body.
//
// Whitespace after the colon is dropped, everything else up to the first
// following "}}" is the note content (newlines included). There is no
// escape for "}}" inside a note.

namespace FootnoteScanner {

struct Marker {
    qsizetype start = 0;    // offset of "{{" in the scanned text
    qsizetype length = 0;   // through the closing "}}"
    QString content;        // raw note text, may be empty
};

// The compiled marker pattern. Built on first use and shared.
const QRegularExpression &markerPattern();

// All markers in left-to-right order. Unterminated markers are not matched.
QList<Marker> scan(const QString &text);

// True if text contains at least one complete marker.
bool containsMarker(const QString &text);

} // namespace FootnoteScanner

#endif // FOOTNOTER_FOOTNOTESCANNER_H
