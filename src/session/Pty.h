/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTY_H
#define PTY_H

#include <QByteArray>
#include <QObject>
#include <QStringList>
#include <QTimer>

#include "trellisprivate_export.h"

class QSocketNotifier;

namespace Trellis
{

/**
 * A child process running on the slave side of a pseudo-terminal.
 *
 * Output is read from the master side through a QSocketNotifier and
 * delivered with receivedData(). Once the slave side hangs up the child
 * is reaped and finished() is emitted exactly once.
 */
class TRELLISPRIVATE_EXPORT Pty : public QObject
{
    Q_OBJECT
public:
    // Upper bound on the bytes delivered by one receivedData()
    static constexpr int MaxReadPerActivation = 64 * 1024;

    explicit Pty(QObject *parent = nullptr);
    ~Pty() override;

    bool start(const QString &program, const QStringList &arguments, const QString &workingDirectory, const QStringList &environment, int cols, int lines);

    QString errorString() const
    {
        return _errorString;
    }

    bool isRunning() const
    {
        return _pid > 0 && !_finished;
    }

    qint64 pid() const
    {
        return _pid;
    }

    void sendData(const QByteArray &data);
    void setWindowSize(int cols, int lines);
    bool sendSignal(int signal);

    /** Hangs up the terminal. finished() follows once the child is reaped. */
    void terminate();

Q_SIGNALS:
    void receivedData(const QByteArray &data);
    // exitCode is 128 + signal for a child killed by a signal
    void finished(int exitCode, int signal);

private:
    void readAvailable();
    void writePending();
    void hangUp();
    void reapChild();
    void closeMaster();

    int _masterFd = -1;
    qint64 _pid = -1;
    bool _finished = false;
    QString _errorString;
    QByteArray _pendingWrite;
    QSocketNotifier *_readNotifier = nullptr;
    QSocketNotifier *_writeNotifier = nullptr;
    QTimer _reapTimer;
};

} // namespace Trellis

#endif // PTY_H
