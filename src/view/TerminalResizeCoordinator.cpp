/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalResizeCoordinator.h"

#include "TerminalRenderer.h"

#include <QLoggingCategory>

#include <utility>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisView)

namespace Trellis
{

TerminalResizeCoordinator::TerminalResizeCoordinator(TerminalRenderer *renderer, const ResizeTimings &timings, QObject *parent)
    : QObject(parent)
    , _renderer(renderer)
    , _timings(timings)
{
    _settleTimer.setSingleShot(true);
    _settleTimer.setInterval(_timings.settleMs);
    connect(&_settleTimer, &QTimer::timeout, this, &TerminalResizeCoordinator::onSettleTimeout);

    _graceTimer.setSingleShot(true);
    _graceTimer.setInterval(_timings.graceMs);
    connect(&_graceTimer, &QTimer::timeout, this, &TerminalResizeCoordinator::onGraceTimeout);

    _initialSetupTimer.setSingleShot(true);
    _initialSetupTimer.setInterval(_timings.initialSetupReleaseMs);
    connect(&_initialSetupTimer, &QTimer::timeout, this, &TerminalResizeCoordinator::onInitialSetupRelease);
}

void TerminalResizeCoordinator::writeOutput(const QByteArray &data)
{
    if (_isResizing) {
        _writeQueue.append(data);
        return;
    }
    _renderer->write(data);
}

void TerminalResizeCoordinator::containerResized()
{
    if (!_isResizing) {
        _isResizing = true;
        Q_EMIT resizeStarted();
    }
    // A newer size supersedes the pending one.
    _graceTimer.stop();
    _settleTimer.start();
}

void TerminalResizeCoordinator::beginInitialSetup()
{
    _isInitialSetup = true;
    _initialSetupTimer.stop();
    fit();
}

void TerminalResizeCoordinator::finishInitialSetup()
{
    if (!_isInitialSetup) {
        return;
    }
    _initialSetupTimer.start();
}

void TerminalResizeCoordinator::markSizeSent(const QSize &size)
{
    _lastSentSize = size;
}

void TerminalResizeCoordinator::stop()
{
    _settleTimer.stop();
    _graceTimer.stop();
    _initialSetupTimer.stop();
    _writeQueue.clear();
    _isInitialSetup = false;
    if (_isResizing) {
        _isResizing = false;
        Q_EMIT resizeFinished();
    }
}

void TerminalResizeCoordinator::fit()
{
    const QSize size = _renderer->proposeSize();
    if (!size.isValid() || size.isEmpty()) {
        return;
    }
    if (size != _renderer->size()) {
        _renderer->resize(size);
    }
    sendSizeIfChanged(size);
}

void TerminalResizeCoordinator::sendSizeIfChanged(const QSize &size)
{
    if (_isInitialSetup) {
        qCDebug(lcTrellisView) << "Initial setup, not sending" << size;
        return;
    }
    if (size == _lastSentSize) {
        return;
    }
    _lastSentSize = size;
    Q_EMIT resizeRequested(size.width(), size.height());
}

void TerminalResizeCoordinator::onSettleTimeout()
{
    fit();
    _graceTimer.start();
}

void TerminalResizeCoordinator::onGraceTimeout()
{
    _isResizing = false;
    flushWriteQueue();
    Q_EMIT resizeFinished();
}

void TerminalResizeCoordinator::onInitialSetupRelease()
{
    fit();
    _isInitialSetup = false;
    // The replay fit may have landed on a size the host has not seen.
    sendSizeIfChanged(_renderer->size());
}

void TerminalResizeCoordinator::flushWriteQueue()
{
    if (_isResizing || _writeQueue.isEmpty()) {
        return;
    }
    QByteArray data;
    for (const QByteArray &chunk : std::as_const(_writeQueue)) {
        data.append(chunk);
    }
    _writeQueue.clear();
    _renderer->write(data);
}

} // namespace Trellis

#include "moc_TerminalResizeCoordinator.cpp"
