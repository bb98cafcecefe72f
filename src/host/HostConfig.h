/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTCONFIG_H
#define HOSTCONFIG_H

#include <QString>

#include "session/TerminalSessionManager.h"
#include "trellisprivate_export.h"

namespace Trellis
{

/**
 * Settings of the trellis-host daemon, read from an INI file:
 *
 * [host]     socketName, stateDirectory
 * [terminal] shell, defaultCols, defaultRows, scrollbackLines,
 *            scrollbackBytes, initialCommandDelay
 * [history]  replayBytesToRead, replayScrollbackBytes
 */
struct TRELLISPRIVATE_EXPORT HostConfig {
    QString socketName = QStringLiteral("trellis-host");
    QString stateDirectory;
    QString shell;
    int defaultCols = 80;
    int defaultRows = 24;
    int scrollbackLines = 10000;
    int scrollbackBytes = 1024 * 1024;
    qint64 replayBytesToRead = 500000;
    int replayScrollbackBytes = 100000;
    int initialCommandDelay = 500;

    static HostConfig defaults();
    static HostConfig load(const QString &path);
    static QString defaultConfigPath();

    bool save(const QString &path) const;

    QString historyRoot() const;
    QString workspaceStatePath() const;
    SessionManagerSettings sessionManagerSettings() const;
};

} // namespace Trellis

#endif // HOSTCONFIG_H
