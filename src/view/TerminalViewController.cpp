/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalViewController.h"

#include "TerminalRenderer.h"
#include "host/HostBackend.h"

#include <QLoggingCategory>
#include <QPointer>

#include <utility>

Q_LOGGING_CATEGORY(lcTrellisView, "trellis.view", QtInfoMsg)

namespace Trellis
{

TerminalViewController::TerminalViewController(HostBackend *backend,
                                               TerminalRenderer *renderer,
                                               const QString &terminalId,
                                               const ResizeTimings &timings,
                                               QObject *parent)
    : QObject(parent)
    , _backend(backend)
    , _renderer(renderer)
    , _terminalId(terminalId)
    , _coordinator(renderer, timings)
{
    connect(_backend, &HostBackend::terminalOutput, this, &TerminalViewController::onOutput);
    connect(_backend, &HostBackend::terminalExited, this, [this](const QString &id, int exitCode, int) {
        onExited(id, exitCode);
    });
    connect(_backend, &HostBackend::disconnected, this, &TerminalViewController::onHostDisconnected);

    connect(&_coordinator, &TerminalResizeCoordinator::resizeRequested, this, [this](int cols, int rows) {
        _backend->resize(_terminalId, cols, rows);
    });
    connect(&_coordinator, &TerminalResizeCoordinator::resizeStarted, this, [this]() {
        if (_state == TerminalViewState::Live) {
            setState(TerminalViewState::Resizing);
        }
    });
    connect(&_coordinator, &TerminalResizeCoordinator::resizeFinished, this, [this]() {
        if (_state == TerminalViewState::Resizing) {
            setState(TerminalViewState::Live);
        }
    });
}

TerminalViewController::~TerminalViewController()
{
    _coordinator.stop();
}

void TerminalViewController::attach(const QString &workspaceId, const QString &cwd, const QStringList &initialCommands)
{
    if (_state != TerminalViewState::Detached) {
        qCDebug(lcTrellisView) << _terminalId << "attach ignored in state" << stateName(_state);
        return;
    }

    _workspaceId = workspaceId;
    _pendingOutput.clear();
    _exitCode.reset();
    setState(TerminalViewState::Attaching);

    // The local auto-fit must not reach the host; the size travels with
    // the request instead.
    _coordinator.beginInitialSetup();
    const QSize size = _renderer->size();
    _coordinator.markSizeSent(size);

    CreateOrAttachRequest request;
    request.id = _terminalId;
    request.workspaceId = workspaceId;
    request.cwd = cwd;
    if (size.isValid() && !size.isEmpty()) {
        request.cols = size.width();
        request.rows = size.height();
    }
    request.initialCommands = initialCommands;

    const quint64 generation = ++_attachGeneration;
    QPointer<TerminalViewController> self(this);
    _backend->createOrAttach(request, [self, generation](const CreateOrAttachResult &result) {
        if (!self || self->_attachGeneration != generation || self->_state != TerminalViewState::Attaching) {
            return;
        }
        self->onAttached(result);
    });
}

void TerminalViewController::onAttached(const CreateOrAttachResult &result)
{
    if (!result.success) {
        qCWarning(lcTrellisView) << "Attaching" << _terminalId << "failed:" << result.error;
        _pendingOutput.clear();
        _coordinator.stop();
        setState(TerminalViewState::Detached);
        Q_EMIT attachFailed(result.error);
        return;
    }

    _renderer->reset();

    if (result.isColdRestore) {
        _previousCwd = result.previousCwd;
        if (result.snapshot.has_value()) {
            _renderer->write(result.snapshot->rehydrateSequences());
            _renderer->write(result.snapshot->screenAnsi);
        } else {
            _renderer->write(result.scrollback);
        }
        _pendingOutput.clear();
        _coordinator.finishInitialSetup();
        setState(TerminalViewState::ColdRestored);
        Q_EMIT coldRestored(_previousCwd);
        return;
    }

    qCDebug(lcTrellisView) << _terminalId << (result.isNew ? "new session" : "reattached") << "replaying" << result.scrollback.size() << "bytes";
    _renderer->write(result.scrollback);
    const QList<std::pair<quint64, QByteArray>> held = std::exchange(_pendingOutput, {});
    for (const auto &[sequence, chunk] : held) {
        // Sent before the host took the scrollback, so already replayed
        if (sequence <= result.outputSequence) {
            continue;
        }
        _renderer->write(chunk);
    }
    _coordinator.finishInitialSetup();

    if (result.isExited) {
        _exitCode = result.exitCode;
        setState(TerminalViewState::Exited);
        Q_EMIT exited(result.exitCode.value_or(0));
        return;
    }
    setState(TerminalViewState::Live);
}

void TerminalViewController::detach()
{
    if (_state == TerminalViewState::Detached) {
        return;
    }
    ++_attachGeneration;
    _coordinator.stop();
    _pendingOutput.clear();
    _backend->detach(_terminalId);
    setState(TerminalViewState::Detached);
}

void TerminalViewController::sendInput(const QByteArray &data)
{
    if (!isLive()) {
        qCDebug(lcTrellisView) << _terminalId << "dropping input in state" << stateName(_state);
        return;
    }
    _backend->write(_terminalId, data);
}

void TerminalViewController::containerResized()
{
    if (!isLive()) {
        return;
    }
    _coordinator.containerResized();
}

void TerminalViewController::startShellFromColdRestore()
{
    if (_state != TerminalViewState::ColdRestored) {
        return;
    }
    qCInfo(lcTrellisView) << "Starting a new shell for" << _terminalId << "in" << _previousCwd;
    _backend->ackColdRestore(_terminalId);
    _coordinator.stop();
    setState(TerminalViewState::Detached);
    attach(_workspaceId, _previousCwd);
}

void TerminalViewController::onOutput(const QString &terminalId, const QByteArray &data, quint64 sequence)
{
    if (terminalId != _terminalId) {
        return;
    }
    switch (_state) {
    case TerminalViewState::Attaching:
        _pendingOutput.append(std::make_pair(sequence, data));
        break;
    case TerminalViewState::Live:
    case TerminalViewState::Resizing:
    case TerminalViewState::Exited:
        _coordinator.writeOutput(data);
        break;
    case TerminalViewState::Detached:
    case TerminalViewState::ColdRestored:
        break;
    }
}

void TerminalViewController::onExited(const QString &terminalId, int exitCode)
{
    if (terminalId != _terminalId) {
        return;
    }
    if (!isLive() && _state != TerminalViewState::Attaching) {
        return;
    }
    qCDebug(lcTrellisView) << _terminalId << "exited with" << exitCode;
    _exitCode = exitCode;
    setState(TerminalViewState::Exited);
    Q_EMIT exited(exitCode);
}

void TerminalViewController::onHostDisconnected()
{
    if (_state == TerminalViewState::Detached) {
        return;
    }
    qCWarning(lcTrellisView) << _terminalId << "lost the host connection";
    ++_attachGeneration;
    _coordinator.stop();
    _pendingOutput.clear();
    setState(TerminalViewState::Detached);
}

bool TerminalViewController::isLive() const
{
    return _state == TerminalViewState::Live || _state == TerminalViewState::Resizing;
}

void TerminalViewController::setState(TerminalViewState state)
{
    if (_state == state) {
        return;
    }
    qCDebug(lcTrellisView) << _terminalId << stateName(_state) << "->" << stateName(state);
    _state = state;
    Q_EMIT stateChanged(state);
}

QString TerminalViewController::stateName(TerminalViewState state)
{
    switch (state) {
    case TerminalViewState::Detached:
        return QStringLiteral("Detached");
    case TerminalViewState::Attaching:
        return QStringLiteral("Attaching");
    case TerminalViewState::Live:
        return QStringLiteral("Live");
    case TerminalViewState::Resizing:
        return QStringLiteral("Resizing");
    case TerminalViewState::Exited:
        return QStringLiteral("Exited");
    case TerminalViewState::ColdRestored:
        return QStringLiteral("ColdRestored");
    }
    return QString();
}

} // namespace Trellis

#include "moc_TerminalViewController.cpp"
