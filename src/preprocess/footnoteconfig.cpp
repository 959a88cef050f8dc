/*
 * footnoteconfig.cpp — [preprocessor.footnote] settings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnoteconfig.h"
#include "preprocessorcontext.h"

FootnoteConfig FootnoteConfig::fromContext(const PreprocessorContext &ctx)
{
    FootnoteConfig config;

    const QJsonValue markdown =
        ctx.configValue(QStringLiteral("preprocessor.footnote.markdown"));
    if (markdown.isBool())
        config.markdown = markdown.toBool();

    return config;
}
