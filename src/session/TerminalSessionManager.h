/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSESSIONMANAGER_H
#define TERMINALSESSIONMANAGER_H

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QStringList>

#include <map>
#include <memory>
#include <optional>

#include "TerminalSnapshot.h"
#include "trellisprivate_export.h"

namespace Trellis
{

class TerminalSession;

struct SessionManagerSettings {
    // <stateDir>/terminal-history; empty disables recording and cold restore
    QString historyRoot;
    // Empty picks $SHELL, then /bin/bash, /bin/zsh, /bin/sh
    QString shell;
    int defaultCols = 80;
    int defaultRows = 24;
    int scrollbackLines = 10000;
    int scrollbackBytes = 1024 * 1024;
    qint64 replayBytesToRead = 500000;
    int replayScrollbackBytes = 100000;
    int initialCommandDelay = 500;
};

struct CreateOrAttachRequest {
    QString id;
    QString workspaceId;
    QString cwd;
    int cols = 0;
    int rows = 0;
    QStringList initialCommands;
};

struct CreateOrAttachResult {
    bool success = false;
    QString error;
    bool isNew = false;
    bool wasRecovered = false;
    QByteArray scrollback;
    // Sequence of the last output chunk contained in scrollback
    quint64 outputSequence = 0;
    bool isColdRestore = false;
    std::optional<TerminalSnapshot> snapshot;
    QString previousCwd;
    bool isExited = false;
    std::optional<int> exitCode;
    int cols = 0;
    int rows = 0;
};

struct SessionInfo {
    bool isAlive = false;
    QString cwd;
    int cols = 0;
    int rows = 0;
    QDateTime lastActive;
    std::optional<int> exitCode;
    qint64 pid = -1;
};

/**
 * Registry of every terminal session of the host, keyed by terminal id.
 *
 * At most one session exists per id. Sessions outlive views and are
 * destroyed only by kill(). A terminal whose recording was cut short by
 * a host crash is reported as a cold restore instead of being respawned
 * until ackColdRestore() is called.
 */
class TRELLISPRIVATE_EXPORT TerminalSessionManager : public QObject
{
    Q_OBJECT
public:
    explicit TerminalSessionManager(const SessionManagerSettings &settings, QObject *parent = nullptr);
    ~TerminalSessionManager() override;

    CreateOrAttachResult createOrAttach(const CreateOrAttachRequest &request);

    void write(const QString &id, const QByteArray &data);
    void resize(const QString &id, int cols, int rows);
    void signal(const QString &id, const QString &signalName = QStringLiteral("SIGTERM"));
    void detach(const QString &id);

    /** Terminates and forgets the session. No exit event is emitted. */
    void kill(const QString &id, bool deleteHistory);

    std::optional<QByteArray> getHistory(const QString &id) const;
    std::optional<SessionInfo> sessionInfo(const QString &id) const;

    /** Drops the cold-restore state of @p id and its stale recording. */
    void ackColdRestore(const QString &id);

    /** Closes every recording cleanly and terminates all sessions. */
    void shutdown();

    bool hasSession(const QString &id) const;
    QStringList sessionIds() const;

    const SessionManagerSettings &settings() const
    {
        return _settings;
    }

    static QString defaultShell();
    static QStringList shellArguments(const QString &shell);
    static int signalFromName(const QString &name);

Q_SIGNALS:
    void terminalOutput(const QString &id, const QByteArray &data, quint64 sequence);
    void terminalExited(const QString &id, int exitCode, int signal);
    void terminalCwdChanged(const QString &id, const QString &cwd);

private:
    struct ColdRestoreInfo {
        QString workspaceId;
        TerminalSnapshot snapshot;
    };

    TerminalSession *findSession(const QString &id) const;
    QString historyDirectory(const QString &workspaceId, const QString &id) const;
    std::optional<ColdRestoreInfo> loadColdRestore(const QString &workspaceId, const QString &id) const;
    CreateOrAttachResult reattach(TerminalSession *session, const CreateOrAttachRequest &request);
    CreateOrAttachResult coldRestoreResult(const ColdRestoreInfo &info) const;
    CreateOrAttachResult spawn(const CreateOrAttachRequest &request);
    QStringList environmentFor(const CreateOrAttachRequest &request, const QString &shell) const;
    void scheduleInitialCommands(const QString &id, const QStringList &commands);

    SessionManagerSettings _settings;
    std::map<QString, std::unique_ptr<TerminalSession>> _sessions;
    QHash<QString, ColdRestoreInfo> _coldRestores;
    bool _shuttingDown = false;
};

} // namespace Trellis

#endif // TERMINALSESSIONMANAGER_H
