/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKETERMINALRENDERER_H
#define FAKETERMINALRENDERER_H

#include <QByteArray>
#include <QList>
#include <QSize>

#include "view/TerminalRenderer.h"

namespace Trellis
{

class FakeTerminalRenderer : public TerminalRenderer
{
public:
    void write(const QByteArray &data) override
    {
        writes.append(data);
    }

    void reset() override
    {
        ++resetCount;
        screenStart = writes.size();
    }

    QSize proposeSize() const override
    {
        return proposed;
    }

    void resize(const QSize &size) override
    {
        current = size;
    }

    QSize size() const override
    {
        return current;
    }

    QByteArray written() const
    {
        QByteArray all;
        for (const QByteArray &chunk : writes) {
            all.append(chunk);
        }
        return all;
    }

    // Everything written since the last reset()
    QByteArray screen() const
    {
        QByteArray all;
        for (qsizetype i = screenStart; i < writes.size(); ++i) {
            all.append(writes.at(i));
        }
        return all;
    }

    QList<QByteArray> writes;
    qsizetype screenStart = 0;
    int resetCount = 0;
    QSize proposed = QSize(80, 24);
    QSize current = QSize(80, 24);
};

} // namespace Trellis

#endif // FAKETERMINALRENDERER_H
