/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalSession.h"

#include "Pty.h"
#include "TerminalHistory.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisSession)

namespace Trellis
{

static int clampDimension(int value)
{
    return qBound(1, value, TerminalSession::MaxDimension);
}

TerminalSession::TerminalSession(const TerminalSessionOptions &options, QObject *parent)
    : QObject(parent)
    , _options(options)
    , _pty(std::make_unique<Pty>())
    , _scrollback(options.scrollbackLines, options.scrollbackBytes)
    , _cwd(options.cwd)
    , _cols(clampDimension(options.cols))
    , _rows(clampDimension(options.rows))
    , _lastActive(QDateTime::currentDateTimeUtc())
{
    connect(_pty.get(), &Pty::receivedData, this, &TerminalSession::onPtyData);
    connect(_pty.get(), &Pty::finished, this, &TerminalSession::onPtyFinished);
}

TerminalSession::~TerminalSession() = default;

bool TerminalSession::start(QString *error)
{
    if (!_pty->start(_options.shell, _options.shellArguments, _options.cwd, _options.environment, _cols, _rows)) {
        *error = _pty->errorString();
        _state = State::Exited;
        return false;
    }

    if (!_options.historyDirectory.isEmpty()) {
        _history = std::make_unique<HistoryWriter>(_options.historyDirectory, _cwd, _cols, _rows);
        if (!_history->init()) {
            // Recording is best effort; the terminal itself still works.
            _history.reset();
        }
    }
    return true;
}

void TerminalSession::seedScrollback(const QByteArray &data)
{
    _scrollback.append(data);
}

void TerminalSession::write(const QByteArray &data)
{
    if (!isAlive()) {
        qCWarning(lcTrellisSession) << "Dropping write to exited terminal" << id();
        return;
    }
    _pty->sendData(data);
    touch();
}

void TerminalSession::resize(int cols, int rows)
{
    if (cols <= 0 || rows <= 0) {
        return;
    }
    if (!isAlive()) {
        qCWarning(lcTrellisSession) << "Dropping resize of exited terminal" << id();
        return;
    }

    _cols = clampDimension(cols);
    _rows = clampDimension(rows);
    _pty->setWindowSize(_cols, _rows);
    if (_history) {
        _history->updateMetadata(_cwd, _cols, _rows, _scanner.modes());
    }
    touch();
}

bool TerminalSession::sendSignal(int signal)
{
    touch();
    return _pty->sendSignal(signal);
}

void TerminalSession::terminate()
{
    _terminating = true;
    disconnect(_pty.get(), &Pty::receivedData, this, nullptr);
    finalizeHistory();
    _pty->terminate();
}

void TerminalSession::finalizeHistory()
{
    if (!_history) {
        return;
    }
    _history->updateMetadata(_cwd, _cols, _rows, _scanner.modes());
    _history->finalize(_exitCode);
}

void TerminalSession::touch()
{
    _lastActive = QDateTime::currentDateTimeUtc();
}

qint64 TerminalSession::pid() const
{
    return _pty->pid();
}

void TerminalSession::onPtyData(const QByteArray &data)
{
    if (auto cwd = _scanner.feed(data); cwd.has_value() && *cwd != _cwd) {
        _cwd = *cwd;
        if (_history) {
            _history->updateMetadata(_cwd, _cols, _rows, _scanner.modes());
        }
        Q_EMIT cwdChanged(_cwd);
    }

    _scrollback.append(data);
    if (_history) {
        _history->writeData(data);
    }
    Q_EMIT output(data, ++_outputSequence);
}

void TerminalSession::onPtyFinished(int exitCode, int signal)
{
    _state = State::Exited;
    _exitCode = exitCode;

    if (_history) {
        _history->updateMetadata(_cwd, _cols, _rows, _scanner.modes());
        _history->writeExit(exitCode, signal);
    }

    if (_terminating) {
        return;
    }
    qCDebug(lcTrellisSession) << "Terminal" << id() << "exited with" << exitCode;
    Q_EMIT exited(exitCode, signal);
}

} // namespace Trellis

#include "moc_TerminalSession.cpp"
