/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalSessionManager.h"

#include "TerminalHistory.h"
#include "TerminalSession.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QTimer>

#include <csignal>

Q_LOGGING_CATEGORY(lcTrellisSession, "trellis.session")

namespace Trellis
{

static const QString DefaultWorkspaceId = QStringLiteral("default");

static QString effectiveWorkspaceId(const QString &workspaceId)
{
    return workspaceId.isEmpty() ? DefaultWorkspaceId : workspaceId;
}

TerminalSessionManager::TerminalSessionManager(const SessionManagerSettings &settings, QObject *parent)
    : QObject(parent)
    , _settings(settings)
{
}

TerminalSessionManager::~TerminalSessionManager()
{
    if (!_shuttingDown) {
        shutdown();
    }
}

TerminalSession *TerminalSessionManager::findSession(const QString &id) const
{
    auto it = _sessions.find(id);
    return it != _sessions.end() ? it->second.get() : nullptr;
}

bool TerminalSessionManager::hasSession(const QString &id) const
{
    return findSession(id) != nullptr;
}

QStringList TerminalSessionManager::sessionIds() const
{
    QStringList ids;
    for (const auto &entry : _sessions) {
        ids.append(entry.first);
    }
    return ids;
}

QString TerminalSessionManager::historyDirectory(const QString &workspaceId, const QString &id) const
{
    if (_settings.historyRoot.isEmpty()) {
        return QString();
    }
    return TerminalHistory::directory(_settings.historyRoot, effectiveWorkspaceId(workspaceId), id);
}

CreateOrAttachResult TerminalSessionManager::createOrAttach(const CreateOrAttachRequest &request)
{
    if (request.id.isEmpty()) {
        CreateOrAttachResult result;
        result.error = QStringLiteral("Terminal id is required");
        return result;
    }
    if (!TerminalHistory::isValidPathComponent(request.id)
        || (!request.workspaceId.isEmpty() && !TerminalHistory::isValidPathComponent(request.workspaceId))) {
        qCWarning(lcTrellisSession) << "createOrAttach: terminal" << request.id << "in workspace" << request.workspaceId << "not found";
        CreateOrAttachResult result;
        result.error = QStringLiteral("Terminal not found: %1").arg(request.id);
        return result;
    }

    if (TerminalSession *session = findSession(request.id)) {
        return reattach(session, request);
    }

    auto sticky = _coldRestores.constFind(request.id);
    if (sticky != _coldRestores.constEnd()) {
        return coldRestoreResult(sticky.value());
    }

    if (auto info = loadColdRestore(request.workspaceId, request.id)) {
        qCInfo(lcTrellisSession) << "Terminal" << request.id << "was not shut down cleanly, offering cold restore";
        _coldRestores.insert(request.id, *info);
        return coldRestoreResult(*info);
    }

    return spawn(request);
}

CreateOrAttachResult TerminalSessionManager::reattach(TerminalSession *session, const CreateOrAttachRequest &request)
{
    session->touch();
    if (session->isAlive() && request.cols > 0 && request.rows > 0 && (request.cols != session->cols() || request.rows != session->rows())) {
        session->resize(request.cols, request.rows);
    }

    qCDebug(lcTrellisSession) << "Reattached to terminal" << session->id();

    CreateOrAttachResult result;
    result.success = true;
    result.isNew = false;
    result.wasRecovered = true;
    result.scrollback = session->scrollback();
    result.outputSequence = session->outputSequence();
    result.isExited = !session->isAlive();
    result.exitCode = session->exitCode();
    result.cols = session->cols();
    result.rows = session->rows();
    return result;
}

std::optional<TerminalSessionManager::ColdRestoreInfo> TerminalSessionManager::loadColdRestore(const QString &workspaceId, const QString &id) const
{
    const QString directory = historyDirectory(workspaceId, id);
    if (directory.isEmpty()) {
        return std::nullopt;
    }

    const HistoryRecord record = HistoryReader(directory).readLatest(_settings.replayBytesToRead, _settings.replayScrollbackBytes);
    if (!record.exists || !record.metadata.has_value() || record.metadata->endedCleanly() || record.scrollback.isEmpty()) {
        return std::nullopt;
    }

    // Modes toggled inside the replayed tail win over the last recorded ones.
    TerminalModeScanner scanner;
    scanner.setModes(record.metadata->modes);
    const auto reportedCwd = scanner.feed(record.scrollback);

    ColdRestoreInfo info;
    info.workspaceId = effectiveWorkspaceId(workspaceId);
    info.snapshot.screenAnsi = record.scrollback;
    info.snapshot.cwd = record.metadata->cwd.isEmpty() ? reportedCwd.value_or(QString()) : record.metadata->cwd;
    info.snapshot.modes = scanner.modes();
    info.snapshot.cols = record.metadata->cols;
    info.snapshot.rows = record.metadata->rows;
    return info;
}

CreateOrAttachResult TerminalSessionManager::coldRestoreResult(const ColdRestoreInfo &info) const
{
    CreateOrAttachResult result;
    result.success = true;
    result.isNew = false;
    result.wasRecovered = true;
    result.isColdRestore = true;
    result.scrollback = info.snapshot.screenAnsi;
    result.snapshot = info.snapshot;
    result.previousCwd = info.snapshot.cwd;
    result.cols = info.snapshot.cols;
    result.rows = info.snapshot.rows;
    return result;
}

CreateOrAttachResult TerminalSessionManager::spawn(const CreateOrAttachRequest &request)
{
    CreateOrAttachResult result;

    TerminalSessionOptions options;
    options.id = request.id;
    options.workspaceId = effectiveWorkspaceId(request.workspaceId);
    options.cwd = request.cwd.isEmpty() ? QDir::homePath() : request.cwd;
    options.cols = request.cols > 0 ? request.cols : _settings.defaultCols;
    options.rows = request.rows > 0 ? request.rows : _settings.defaultRows;
    options.shell = _settings.shell.isEmpty() ? defaultShell() : _settings.shell;
    options.shellArguments = shellArguments(options.shell);
    options.environment = environmentFor(request, options.shell);
    options.historyDirectory = historyDirectory(request.workspaceId, request.id);
    options.scrollbackLines = _settings.scrollbackLines;
    options.scrollbackBytes = _settings.scrollbackBytes;

    // Output of an earlier, cleanly ended run of this terminal
    QByteArray previousOutput;
    if (!options.historyDirectory.isEmpty()) {
        previousOutput = HistoryReader(options.historyDirectory).readLatest(_settings.replayBytesToRead, _settings.replayScrollbackBytes).scrollback;
    }

    auto session = std::make_unique<TerminalSession>(options);
    QString error;
    if (!session->start(&error)) {
        qCCritical(lcTrellisSession) << "Failed to spawn terminal" << request.id << ":" << error;
        result.error = error;
        return result;
    }

    const bool wasRecovered = !previousOutput.isEmpty();
    if (wasRecovered) {
        session->seedScrollback(previousOutput);
    }

    const QString id = request.id;
    connect(session.get(), &TerminalSession::output, this, [this, id](const QByteArray &data, quint64 sequence) {
        Q_EMIT terminalOutput(id, data, sequence);
    });
    connect(session.get(), &TerminalSession::cwdChanged, this, [this, id](const QString &cwd) {
        Q_EMIT terminalCwdChanged(id, cwd);
    });
    connect(session.get(), &TerminalSession::exited, this, [this, id](int exitCode, int signal) {
        Q_EMIT terminalExited(id, exitCode, signal);
    });

    result.success = true;
    result.isNew = true;
    result.wasRecovered = wasRecovered;
    result.scrollback = session->scrollback();
    result.outputSequence = session->outputSequence();
    result.cols = session->cols();
    result.rows = session->rows();

    qCDebug(lcTrellisSession) << "Spawned terminal" << id << "pid" << session->pid() << "recovered" << wasRecovered;
    _sessions[id] = std::move(session);

    if (!wasRecovered && !request.initialCommands.isEmpty()) {
        scheduleInitialCommands(id, request.initialCommands);
    }
    return result;
}

QStringList TerminalSessionManager::environmentFor(const CreateOrAttachRequest &request, const QString &shell) const
{
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("TERM"), QStringLiteral("xterm-256color"));
    environment.insert(QStringLiteral("COLORTERM"), QStringLiteral("truecolor"));
    environment.insert(QStringLiteral("SHELL"), shell);
    environment.insert(QStringLiteral("TRELLIS_TERMINAL_ID"), request.id);
    environment.insert(QStringLiteral("TRELLIS_WORKSPACE_ID"), effectiveWorkspaceId(request.workspaceId));
    return environment.toStringList();
}

void TerminalSessionManager::scheduleInitialCommands(const QString &id, const QStringList &commands)
{
    QTimer::singleShot(_settings.initialCommandDelay, this, [this, id, commands]() {
        TerminalSession *session = findSession(id);
        if (!session || !session->isAlive()) {
            return;
        }
        session->write((commands.join(QLatin1Char('\n')) + QLatin1Char('\n')).toUtf8());
    });
}

void TerminalSessionManager::write(const QString &id, const QByteArray &data)
{
    TerminalSession *session = findSession(id);
    if (!session) {
        qCWarning(lcTrellisSession) << "write: terminal" << id << "not found";
        return;
    }
    session->write(data);
}

void TerminalSessionManager::resize(const QString &id, int cols, int rows)
{
    TerminalSession *session = findSession(id);
    if (!session) {
        qCWarning(lcTrellisSession) << "resize: terminal" << id << "not found";
        return;
    }
    session->resize(cols, rows);
}

void TerminalSessionManager::signal(const QString &id, const QString &signalName)
{
    TerminalSession *session = findSession(id);
    if (!session || !session->isAlive()) {
        qCWarning(lcTrellisSession) << "signal: terminal" << id << "not found or not alive";
        return;
    }
    const int sig = signalFromName(signalName);
    if (sig <= 0) {
        qCWarning(lcTrellisSession) << "signal: unknown signal" << signalName;
        return;
    }
    session->sendSignal(sig);
}

void TerminalSessionManager::detach(const QString &id)
{
    if (TerminalSession *session = findSession(id)) {
        session->touch();
        qCDebug(lcTrellisSession) << "View detached from terminal" << id;
    }
}

void TerminalSessionManager::kill(const QString &id, bool deleteHistory)
{
    if (!TerminalHistory::isValidPathComponent(id)) {
        qCWarning(lcTrellisSession) << "kill: terminal" << id << "not found";
        return;
    }

    QString workspaceId;

    auto it = _sessions.find(id);
    if (it != _sessions.end()) {
        TerminalSession *session = it->second.release();
        _sessions.erase(it);
        workspaceId = session->workspaceId();
        session->disconnect(this);
        session->terminate();
        session->deleteLater();
        qCDebug(lcTrellisSession) << "Killed terminal" << id;
    }

    auto restore = _coldRestores.find(id);
    if (restore != _coldRestores.end()) {
        workspaceId = restore->workspaceId;
        _coldRestores.erase(restore);
    }

    if (!deleteHistory || _settings.historyRoot.isEmpty()) {
        return;
    }

    if (!workspaceId.isEmpty()) {
        const QString directory = historyDirectory(workspaceId, id);
        if (!directory.isEmpty()) {
            HistoryReader(directory).cleanup();
        }
        return;
    }

    // Unknown owner: the recording may sit under any workspace.
    const QDir root(_settings.historyRoot);
    for (const QString &workspace : root.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        const QString directory = historyDirectory(workspace, id);
        if (!directory.isEmpty() && QFileInfo(directory).isDir()) {
            HistoryReader(directory).cleanup();
        }
    }
}

std::optional<QByteArray> TerminalSessionManager::getHistory(const QString &id) const
{
    if (TerminalSession *session = findSession(id)) {
        return session->scrollback();
    }
    auto restore = _coldRestores.constFind(id);
    if (restore != _coldRestores.constEnd()) {
        return restore->snapshot.screenAnsi;
    }
    return std::nullopt;
}

std::optional<SessionInfo> TerminalSessionManager::sessionInfo(const QString &id) const
{
    TerminalSession *session = findSession(id);
    if (!session) {
        return std::nullopt;
    }

    SessionInfo info;
    info.isAlive = session->isAlive();
    info.cwd = session->cwd();
    info.cols = session->cols();
    info.rows = session->rows();
    info.lastActive = session->lastActive();
    info.exitCode = session->exitCode();
    info.pid = session->pid();
    return info;
}

void TerminalSessionManager::ackColdRestore(const QString &id)
{
    auto restore = _coldRestores.find(id);
    if (restore == _coldRestores.end()) {
        return;
    }
    const QString directory = historyDirectory(restore->workspaceId, id);
    _coldRestores.erase(restore);

    // The view already shows the restored output; the next createOrAttach
    // starts from an empty recording.
    if (!directory.isEmpty()) {
        HistoryReader(directory).cleanup();
    }
    qCDebug(lcTrellisSession) << "Cold restore of" << id << "acknowledged";
}

void TerminalSessionManager::shutdown()
{
    _shuttingDown = true;
    qCInfo(lcTrellisSession) << "Shutting down" << _sessions.size() << "terminals";

    for (auto &entry : _sessions) {
        entry.second->disconnect(this);
        entry.second->terminate();
    }
    _sessions.clear();
}

QString TerminalSessionManager::defaultShell()
{
    const QString fromEnvironment = QProcessEnvironment::systemEnvironment().value(QStringLiteral("SHELL"));
    if (!fromEnvironment.isEmpty() && QFileInfo(fromEnvironment).isExecutable()) {
        return fromEnvironment;
    }
    for (const char *candidate : {"/bin/bash", "/bin/zsh", "/bin/sh"}) {
        const QString path = QString::fromLatin1(candidate);
        if (QFileInfo(path).isExecutable()) {
            return path;
        }
    }
    return QStringLiteral("/bin/sh");
}

QStringList TerminalSessionManager::shellArguments(const QString &shell)
{
    const QString name = QFileInfo(shell).fileName();
    if (name == QLatin1String("bash") || name == QLatin1String("zsh") || name == QLatin1String("fish")) {
        return {QStringLiteral("-l")};
    }
    return {};
}

int TerminalSessionManager::signalFromName(const QString &name)
{
    bool isNumber = false;
    const int number = name.toInt(&isNumber);
    if (isNumber) {
        return number;
    }

    QString upper = name.toUpper();
    if (!upper.startsWith(QLatin1String("SIG"))) {
        upper.prepend(QLatin1String("SIG"));
    }

    static const QHash<QString, int> knownSignals = {
        {QStringLiteral("SIGHUP"), SIGHUP},
        {QStringLiteral("SIGINT"), SIGINT},
        {QStringLiteral("SIGQUIT"), SIGQUIT},
        {QStringLiteral("SIGKILL"), SIGKILL},
        {QStringLiteral("SIGUSR1"), SIGUSR1},
        {QStringLiteral("SIGUSR2"), SIGUSR2},
        {QStringLiteral("SIGTERM"), SIGTERM},
        {QStringLiteral("SIGCONT"), SIGCONT},
        {QStringLiteral("SIGSTOP"), SIGSTOP},
        {QStringLiteral("SIGTSTP"), SIGTSTP},
        {QStringLiteral("SIGWINCH"), SIGWINCH},
    };
    return knownSignals.value(upper, 0);
}

} // namespace Trellis

#include "moc_TerminalSessionManager.cpp"
