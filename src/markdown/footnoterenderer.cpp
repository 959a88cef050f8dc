/*
 * footnoterenderer.cpp — Number footnotes and render the trailing note list
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnoterenderer.h"

FootnoteRenderer::FootnoteRenderer(const FootnoteStyle &style)
    : m_style(style)
{
}

QString FootnoteRenderer::addFootnote(const QString &content)
{
    m_footnotes.append(content);
    return m_style.referenceToken(count());
}

QString FootnoteRenderer::footnoteBlock() const
{
    if (m_footnotes.isEmpty())
        return {};

    QString block = m_style.separator();
    for (int i = 0; i < m_footnotes.size(); ++i)
        block += m_style.noteEntry(i + 1, m_footnotes[i]);
    return block;
}

void FootnoteRenderer::reset()
{
    m_footnotes.clear();
}
