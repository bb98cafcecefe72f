/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSESSION_H
#define TERMINALSESSION_H

#include <QByteArray>
#include <QDateTime>
#include <QObject>
#include <QStringList>

#include <memory>
#include <optional>

#include "ScrollbackBuffer.h"
#include "TerminalModeScanner.h"
#include "trellisprivate_export.h"

namespace Trellis
{

class HistoryWriter;
class Pty;

struct TerminalSessionOptions {
    QString id;
    QString workspaceId;
    QString cwd;
    int cols = 80;
    int rows = 24;
    QString shell;
    QStringList shellArguments;
    QStringList environment;
    // Empty disables recording
    QString historyDirectory;
    int scrollbackLines = ScrollbackBuffer::DefaultMaxLines;
    int scrollbackBytes = ScrollbackBuffer::DefaultMaxBytes;
};

/**
 * One shell process on a pseudo-terminal together with its buffered
 * output, tracked modes and on-disk recording. Lives until the owning
 * tab is deleted, independent of any attached view.
 */
class TRELLISPRIVATE_EXPORT TerminalSession : public QObject
{
    Q_OBJECT
public:
    enum class State { Running, Exited };

    // Largest size a winsize can carry
    static constexpr int MaxDimension = 0xffff;

    explicit TerminalSession(const TerminalSessionOptions &options, QObject *parent = nullptr);
    ~TerminalSession() override;

    bool start(QString *error);

    /** Output of a previous run of this terminal, shown before live output. */
    void seedScrollback(const QByteArray &data);

    void write(const QByteArray &data);
    void resize(int cols, int rows);
    bool sendSignal(int signal);

    /**
     * Stops the process on behalf of the owner. The recording is closed
     * first and exited() is not emitted.
     */
    void terminate();

    /** Closes the recording as a clean end. */
    void finalizeHistory();

    void touch();

    const QString &id() const
    {
        return _options.id;
    }

    const QString &workspaceId() const
    {
        return _options.workspaceId;
    }

    QString cwd() const
    {
        return _cwd;
    }

    int cols() const
    {
        return _cols;
    }

    int rows() const
    {
        return _rows;
    }

    State state() const
    {
        return _state;
    }

    bool isAlive() const
    {
        return _state == State::Running;
    }

    std::optional<int> exitCode() const
    {
        return _exitCode;
    }

    QByteArray scrollback() const
    {
        return _scrollback.data();
    }

    /** Sequence number of the last chunk in scrollback(); 0 before any output. */
    quint64 outputSequence() const
    {
        return _outputSequence;
    }

    const TerminalModes &modes() const
    {
        return _scanner.modes();
    }

    QDateTime lastActive() const
    {
        return _lastActive;
    }

    qint64 pid() const;

Q_SIGNALS:
    void output(const QByteArray &data, quint64 sequence);
    void cwdChanged(const QString &cwd);
    void exited(int exitCode, int signal);

private:
    void onPtyData(const QByteArray &data);
    void onPtyFinished(int exitCode, int signal);

    TerminalSessionOptions _options;
    std::unique_ptr<Pty> _pty;
    std::unique_ptr<HistoryWriter> _history;
    ScrollbackBuffer _scrollback;
    TerminalModeScanner _scanner;

    QString _cwd;
    int _cols;
    int _rows;
    quint64 _outputSequence = 0;
    State _state = State::Running;
    bool _terminating = false;
    std::optional<int> _exitCode;
    QDateTime _lastActive;
};

} // namespace Trellis

#endif // TERMINALSESSION_H
