/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCROLLBACKBUFFER_H
#define SCROLLBACKBUFFER_H

#include <QByteArray>

#include "trellisprivate_export.h"

namespace Trellis
{

/**
 * Append-only terminal output bounded by a line count and a byte count.
 * The oldest output is dropped first; a trim never starts inside a
 * UTF-8 sequence.
 */
class TRELLISPRIVATE_EXPORT ScrollbackBuffer
{
public:
    static const int DefaultMaxLines = 10000;
    static const int DefaultMaxBytes = 1024 * 1024;

    explicit ScrollbackBuffer(int maxLines = DefaultMaxLines, int maxBytes = DefaultMaxBytes);

    void append(const QByteArray &data);
    void clear();

    const QByteArray &data() const
    {
        return _data;
    }

    int lineCount() const
    {
        return _lineCount;
    }

    int maxLines() const
    {
        return _maxLines;
    }

    int maxBytes() const
    {
        return _maxBytes;
    }

private:
    void trim();

    QByteArray _data;
    int _lineCount = 0;
    int _maxLines;
    int _maxBytes;
};

} // namespace Trellis

#endif // SCROLLBACKBUFFER_H
