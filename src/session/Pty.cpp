/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Pty.h"

#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSocketNotifier>
#include <QStandardPaths>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __APPLE__
#include <util.h>
#else
#include <pty.h>
#endif

Q_DECLARE_LOGGING_CATEGORY(lcTrellisSession)

namespace Trellis
{

static const int ReapPollInterval = 20;

Pty::Pty(QObject *parent)
    : QObject(parent)
{
    _reapTimer.setInterval(ReapPollInterval);
    connect(&_reapTimer, &QTimer::timeout, this, &Pty::reapChild);
}

Pty::~Pty()
{
    if (_pid > 0 && !_finished) {
        ::kill(static_cast<pid_t>(_pid), SIGHUP);

        int status = 0;
        bool reaped = false;
        for (int i = 0; i < 10 && !reaped; ++i) {
            reaped = ::waitpid(static_cast<pid_t>(_pid), &status, WNOHANG) != 0;
            if (!reaped) {
                ::usleep(10000);
            }
        }
        if (!reaped) {
            ::kill(static_cast<pid_t>(_pid), SIGKILL);
            ::waitpid(static_cast<pid_t>(_pid), &status, 0);
        }
    }
    closeMaster();
}

bool Pty::start(const QString &program, const QStringList &arguments, const QString &workingDirectory, const QStringList &environment, int cols, int lines)
{
    if (_pid > 0) {
        _errorString = QStringLiteral("Process already started");
        return false;
    }

    QString executable = program;
    if (!program.contains(QLatin1Char('/'))) {
        executable = QStandardPaths::findExecutable(program);
    }
    const QFileInfo executableInfo(executable);
    if (executable.isEmpty() || !executableInfo.isFile() || !executableInfo.isExecutable()) {
        _errorString = QStringLiteral("Shell not found or not executable: %1").arg(program);
        return false;
    }

    if (!workingDirectory.isEmpty() && !QFileInfo(workingDirectory).isDir()) {
        _errorString = QStringLiteral("Working directory does not exist: %1").arg(workingDirectory);
        return false;
    }

    // Everything the child touches is prepared before fork.
    const QByteArray executablePath = QFile::encodeName(executableInfo.absoluteFilePath());
    const QByteArray directory = QFile::encodeName(workingDirectory);

    std::vector<QByteArray> argStorage;
    argStorage.push_back(QFile::encodeName(program));
    for (const QString &argument : arguments) {
        argStorage.push_back(argument.toLocal8Bit());
    }
    std::vector<char *> argv;
    for (auto &arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<QByteArray> envStorage;
    for (const QString &entry : environment) {
        envStorage.push_back(entry.toLocal8Bit());
    }
    std::vector<char *> envp;
    for (auto &entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(qMax(1, cols));
    ws.ws_row = static_cast<unsigned short>(qMax(1, lines));

    int masterFd = -1;
    const pid_t pid = ::forkpty(&masterFd, nullptr, nullptr, &ws);
    if (pid < 0) {
        _errorString = QStringLiteral("forkpty failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }

    if (pid == 0) {
        // Child. Only async-signal-safe calls from here on.
        for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGCHLD}) {
            ::signal(sig, SIG_DFL);
        }
        sigset_t mask;
        sigemptyset(&mask);
        ::sigprocmask(SIG_SETMASK, &mask, nullptr);

        if (!directory.isEmpty() && ::chdir(directory.constData()) != 0) {
            ::_exit(126);
        }
        ::execve(executablePath.constData(), argv.data(), envp.data());
        ::_exit(127);
    }

    _pid = pid;
    _masterFd = masterFd;
    _finished = false;

    const int flags = ::fcntl(_masterFd, F_GETFL);
    if (flags != -1) {
        ::fcntl(_masterFd, F_SETFL, flags | O_NONBLOCK);
    }
    ::fcntl(_masterFd, F_SETFD, FD_CLOEXEC);

    _readNotifier = new QSocketNotifier(_masterFd, QSocketNotifier::Read, this);
    connect(_readNotifier, &QSocketNotifier::activated, this, &Pty::readAvailable);

    _writeNotifier = new QSocketNotifier(_masterFd, QSocketNotifier::Write, this);
    _writeNotifier->setEnabled(false);
    connect(_writeNotifier, &QSocketNotifier::activated, this, &Pty::writePending);

    qCDebug(lcTrellisSession) << "Started" << executablePath << "pid" << _pid << "in" << workingDirectory;
    return true;
}

void Pty::readAvailable()
{
    QByteArray chunk;
    bool hungUp = false;
    char buffer[16384];

    // Whatever is left past the cap wakes the notifier again.
    while (_masterFd >= 0 && chunk.size() < MaxReadPerActivation) {
        const ssize_t n = ::read(_masterFd, buffer, qMin<qsizetype>(sizeof(buffer), MaxReadPerActivation - chunk.size()));
        if (n > 0) {
            chunk.append(buffer, static_cast<int>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        // EOF, or EIO once the slave side has no more openers
        hungUp = true;
        break;
    }

    if (!chunk.isEmpty()) {
        Q_EMIT receivedData(chunk);
    }
    if (hungUp) {
        hangUp();
    }
}

void Pty::sendData(const QByteArray &data)
{
    if (_masterFd < 0 || _finished) {
        return;
    }
    _pendingWrite.append(data);
    writePending();
}

void Pty::writePending()
{
    while (!_pendingWrite.isEmpty() && _masterFd >= 0) {
        const ssize_t n = ::write(_masterFd, _pendingWrite.constData(), _pendingWrite.size());
        if (n > 0) {
            _pendingWrite.remove(0, static_cast<int>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            _writeNotifier->setEnabled(true);
            return;
        }
        qCWarning(lcTrellisSession) << "Write to pid" << _pid << "failed:" << std::strerror(errno);
        _pendingWrite.clear();
    }
    if (_writeNotifier) {
        _writeNotifier->setEnabled(false);
    }
}

void Pty::setWindowSize(int cols, int lines)
{
    if (_masterFd < 0 || cols <= 0 || lines <= 0) {
        return;
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_row = static_cast<unsigned short>(lines);
    if (::ioctl(_masterFd, TIOCSWINSZ, &ws) != 0) {
        qCWarning(lcTrellisSession) << "TIOCSWINSZ failed for pid" << _pid << ":" << std::strerror(errno);
    }
}

bool Pty::sendSignal(int signal)
{
    if (!isRunning()) {
        return false;
    }
    return ::kill(static_cast<pid_t>(_pid), signal) == 0;
}

void Pty::terminate()
{
    if (!isRunning()) {
        return;
    }
    ::kill(static_cast<pid_t>(_pid), SIGHUP);
}

void Pty::hangUp()
{
    if (_readNotifier) {
        _readNotifier->setEnabled(false);
    }
    if (_writeNotifier) {
        _writeNotifier->setEnabled(false);
    }
    _pendingWrite.clear();

    reapChild();
    if (!_finished) {
        _reapTimer.start();
    }
}

void Pty::reapChild()
{
    if (_finished || _pid <= 0) {
        _reapTimer.stop();
        return;
    }

    int status = 0;
    const pid_t result = ::waitpid(static_cast<pid_t>(_pid), &status, WNOHANG);
    if (result == 0) {
        return;
    }

    int exitCode = -1;
    int signal = 0;
    if (result == static_cast<pid_t>(_pid)) {
        if (WIFEXITED(status)) {
            exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            signal = WTERMSIG(status);
            exitCode = 128 + signal;
        }
    } else {
        qCWarning(lcTrellisSession) << "waitpid for" << _pid << "failed:" << std::strerror(errno);
    }

    _finished = true;
    _reapTimer.stop();
    closeMaster();

    qCDebug(lcTrellisSession) << "pid" << _pid << "exited with" << exitCode << "signal" << signal;
    Q_EMIT finished(exitCode, signal);
}

void Pty::closeMaster()
{
    delete _readNotifier;
    _readNotifier = nullptr;
    delete _writeNotifier;
    _writeNotifier = nullptr;

    if (_masterFd >= 0) {
        ::close(_masterFd);
        _masterFd = -1;
    }
}

} // namespace Trellis

#include "moc_Pty.cpp"
