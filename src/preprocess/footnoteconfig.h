/*
 * footnoteconfig.h — [preprocessor.footnote] settings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOOTNOTER_FOOTNOTECONFIG_H
#define FOOTNOTER_FOOTNOTECONFIG_H

#include "footnotestyle.h"

struct PreprocessorContext;

struct FootnoteConfig {
    bool markdown = false;  // emit [^n] markdown footnotes instead of HTML anchors

    FootnoteStyle style() const
    {
        return markdown ? FootnoteStyle::markdown() : FootnoteStyle::hyperlink();
    }

    // Missing keys and values of the wrong type leave the defaults in place.
    static FootnoteConfig fromContext(const PreprocessorContext &ctx);
};

#endif // FOOTNOTER_FOOTNOTECONFIG_H
