/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ScrollbackBuffer.h"

#include <algorithm>

namespace Trellis
{

ScrollbackBuffer::ScrollbackBuffer(int maxLines, int maxBytes)
    : _maxLines(qMax(1, maxLines))
    , _maxBytes(qMax(1, maxBytes))
{
}

void ScrollbackBuffer::append(const QByteArray &data)
{
    if (data.isEmpty()) {
        return;
    }
    _data.append(data);
    _lineCount += static_cast<int>(std::count(data.cbegin(), data.cend(), '\n'));
    trim();
}

void ScrollbackBuffer::clear()
{
    _data.clear();
    _lineCount = 0;
}

void ScrollbackBuffer::trim()
{
    int cut = 0;

    if (_lineCount > _maxLines) {
        int excess = _lineCount - _maxLines;
        int pos = -1;
        while (excess-- > 0) {
            pos = _data.indexOf('\n', pos + 1);
        }
        cut = pos + 1;
    }

    const int size = static_cast<int>(_data.size());
    if (size - cut > _maxBytes) {
        cut = size - _maxBytes;
        while (cut < size && (static_cast<uchar>(_data.at(cut)) & 0xC0) == 0x80) {
            ++cut;
        }
    }

    if (cut <= 0) {
        return;
    }
    _lineCount -= static_cast<int>(std::count(_data.cbegin(), _data.cbegin() + cut, '\n'));
    _data.remove(0, cut);
}

} // namespace Trellis
