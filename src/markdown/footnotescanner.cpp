/*
 * footnotescanner.cpp — Locate {{footnote: ...}} markers in chapter text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnotescanner.h"

namespace FootnoteScanner {

const QRegularExpression &markerPattern()
{
    static const QRegularExpression markerRx(
        QStringLiteral(R"(\{\{footnote:\s*(?<content>.*?)\}\})"),
        QRegularExpression::DotMatchesEverythingOption
            | QRegularExpression::UseUnicodePropertiesOption);
    return markerRx;
}

QList<Marker> scan(const QString &text)
{
    QList<Marker> markers;

    auto it = markerPattern().globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        Marker marker;
        marker.start = match.capturedStart();
        marker.length = match.capturedLength();
        marker.content = match.captured(QStringLiteral("content"));
        markers.append(marker);
    }

    return markers;
}

bool containsMarker(const QString &text)
{
    return markerPattern().match(text).hasMatch();
}

} // namespace FootnoteScanner
