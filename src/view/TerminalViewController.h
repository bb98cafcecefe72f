/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALVIEWCONTROLLER_H
#define TERMINALVIEWCONTROLLER_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QStringList>

#include <optional>
#include <utility>

#include "TerminalResizeCoordinator.h"
#include "trellisprivate_export.h"

namespace Trellis
{

class HostBackend;
struct CreateOrAttachResult;
class TerminalRenderer;

enum class TerminalViewState { Detached, Attaching, Live, Resizing, Exited, ColdRestored };

/**
 * Connects one rendered terminal view to its host session.
 *
 *   Detached -> Attaching -> Live <-> Resizing
 *                         -> ColdRestored -> (ack) -> Attaching
 *   Live/Resizing/Attaching -> Exited
 *
 * Losing the host connection returns the view to Detached. Output that
 * arrives while Attaching is held until the scrollback is replayed, and
 * held chunks the scrollback already contains are dropped.
 */
class TRELLISPRIVATE_EXPORT TerminalViewController : public QObject
{
    Q_OBJECT
public:
    TerminalViewController(HostBackend *backend,
                           TerminalRenderer *renderer,
                           const QString &terminalId,
                           const ResizeTimings &timings = ResizeTimings(),
                           QObject *parent = nullptr);
    ~TerminalViewController() override;

    void attach(const QString &workspaceId = QString(), const QString &cwd = QString(), const QStringList &initialCommands = QStringList());
    void detach();

    void sendInput(const QByteArray &data);
    void containerResized();

    /** Discards the restored picture and starts a new shell in the restored cwd. */
    void startShellFromColdRestore();

    TerminalViewState state() const
    {
        return _state;
    }

    QString terminalId() const
    {
        return _terminalId;
    }

    std::optional<int> exitCode() const
    {
        return _exitCode;
    }

    QString previousCwd() const
    {
        return _previousCwd;
    }

    TerminalResizeCoordinator *resizeCoordinator()
    {
        return &_coordinator;
    }

    static QString stateName(TerminalViewState state);

Q_SIGNALS:
    void stateChanged(TerminalViewState state);
    void attachFailed(const QString &error);
    void coldRestored(const QString &previousCwd);
    void exited(int exitCode);

private:
    void setState(TerminalViewState state);
    void onAttached(const CreateOrAttachResult &result);
    void onOutput(const QString &terminalId, const QByteArray &data, quint64 sequence);
    void onExited(const QString &terminalId, int exitCode);
    void onHostDisconnected();
    bool isLive() const;

    HostBackend *_backend;
    TerminalRenderer *_renderer;
    QString _terminalId;
    QString _workspaceId;
    TerminalResizeCoordinator _coordinator;

    TerminalViewState _state = TerminalViewState::Detached;
    QList<std::pair<quint64, QByteArray>> _pendingOutput;
    std::optional<int> _exitCode;
    QString _previousCwd;
    // Bumped on every attach so a stale reply is ignored.
    quint64 _attachGeneration = 0;
};

} // namespace Trellis

#endif // TERMINALVIEWCONTROLLER_H
