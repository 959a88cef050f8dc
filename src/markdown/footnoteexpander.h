/*
 * footnoteexpander.h — Rewrite a chapter body with numbered footnotes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTEEXPANDER_H
#define FOOTNOTER_FOOTNOTEEXPANDER_H

#include <QString>

#include "footnotestyle.h"

namespace FootnoteExpander {

// Replace every {{footnote: ...}} marker in text with a numbered reference
// and append the note list. Text without markers is returned unchanged.
QString process(const QString &text, const FootnoteStyle &style);

} // namespace FootnoteExpander

#endif // FOOTNOTER_FOOTNOTEEXPANDER_H
