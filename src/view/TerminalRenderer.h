/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALRENDERER_H
#define TERMINALRENDERER_H

#include <QByteArray>
#include <QSize>

namespace Trellis
{

/**
 * The terminal emulator a view renders into. Escape sequences are
 * interpreted by the implementation; sizes are in character cells
 * (width = columns, height = rows).
 */
class TerminalRenderer
{
public:
    virtual ~TerminalRenderer() = default;

    virtual void write(const QByteArray &data) = 0;

    /** Clears screen and scrollback before a replay. */
    virtual void reset() = 0;

    /** Grid size that fits the current container, or an invalid size if it has no area yet. */
    virtual QSize proposeSize() const = 0;

    virtual void resize(const QSize &size) = 0;
    virtual QSize size() const = 0;
};

} // namespace Trellis

#endif // TERMINALRENDERER_H
