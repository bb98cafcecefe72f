/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalSnapshot.h"

namespace Trellis
{

QByteArray TerminalSnapshot::rehydrateSequences() const
{
    QByteArray seq;

    if (!modes.cursorVisible) {
        seq.append("\033[?25l");
    }

    if (modes.insertMode) {
        seq.append("\033[4h");
    }

    if (modes.appCursorKeys) {
        seq.append("\033[?1h");
    }

    if (modes.appKeypad) {
        seq.append("\033=");
    }

    if (!modes.autoWrap) {
        seq.append("\033[?7l");
    }

    if (modes.mouseStandard) {
        seq.append("\033[?1000h");
    }
    if (modes.mouseButton) {
        seq.append("\033[?1002h");
    }
    if (modes.mouseAny) {
        seq.append("\033[?1003h");
    }
    if (modes.mouseSGR) {
        seq.append("\033[?1006h");
    }

    if (modes.focusReporting) {
        seq.append("\033[?1004h");
    }
    if (modes.bracketedPaste) {
        seq.append("\033[?2004h");
    }

    return seq;
}

QJsonObject TerminalSnapshot::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("screenAnsi"), QString::fromLatin1(screenAnsi.toBase64()));
    object.insert(QStringLiteral("rehydrateSequences"), QString::fromLatin1(rehydrateSequences().toBase64()));
    object.insert(QStringLiteral("cwd"), cwd);
    object.insert(QStringLiteral("modes"), modes.toJson());
    object.insert(QStringLiteral("cols"), cols);
    object.insert(QStringLiteral("rows"), rows);
    return object;
}

TerminalSnapshot TerminalSnapshot::fromJson(const QJsonObject &object)
{
    TerminalSnapshot snapshot;
    snapshot.screenAnsi = QByteArray::fromBase64(object.value(QStringLiteral("screenAnsi")).toString().toLatin1());
    snapshot.cwd = object.value(QStringLiteral("cwd")).toString();
    snapshot.modes = TerminalModes::fromJson(object.value(QStringLiteral("modes")).toObject());
    snapshot.cols = object.value(QStringLiteral("cols")).toInt(80);
    snapshot.rows = object.value(QStringLiteral("rows")).toInt(24);
    return snapshot;
}

bool TerminalSnapshot::operator==(const TerminalSnapshot &other) const
{
    return screenAnsi == other.screenAnsi && cwd == other.cwd && modes == other.modes && cols == other.cols && rows == other.rows;
}

} // namespace Trellis
