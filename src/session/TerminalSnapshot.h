/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSNAPSHOT_H
#define TERMINALSNAPSHOT_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "TerminalModeScanner.h"
#include "trellisprivate_export.h"

namespace Trellis
{

/**
 * Best-effort picture of a terminal whose process is gone: the tail of
 * its recorded output plus the modes and size it had when recording
 * stopped.
 */
struct TRELLISPRIVATE_EXPORT TerminalSnapshot {
    QByteArray screenAnsi;
    QString cwd;
    TerminalModes modes;
    int cols = 80;
    int rows = 24;

    /**
     * Escape sequences re-establishing the tracked input and display
     * modes. Written before screenAnsi. The alternate screen is not
     * re-entered here.
     */
    QByteArray rehydrateSequences() const;

    QJsonObject toJson() const;
    static TerminalSnapshot fromJson(const QJsonObject &object);

    bool operator==(const TerminalSnapshot &other) const;
};

} // namespace Trellis

#endif // TERMINALSNAPSHOT_H
