/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "host/HostConfig.h"
#include "host/HostServer.h"
#include "host/LocalHostBackend.h"
#include "session/TerminalSessionManager.h"
#include "workspace/WorkspaceStore.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>
#include <QSocketNotifier>

#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisHost)

using namespace Trellis;

namespace
{
int quitSignalFds[2] = {-1, -1};

void quitSignalHandler(int)
{
    char byte = 1;
    // Only async-signal-safe calls here; the event loop does the rest.
    if (::write(quitSignalFds[0], &byte, sizeof(byte)) < 0) {
        return;
    }
}

bool installQuitSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, quitSignalFds) != 0) {
        return false;
    }

    struct sigaction action = {};
    action.sa_handler = quitSignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGTERM, &action, nullptr) != 0 || ::sigaction(SIGINT, &action, nullptr) != 0) {
        return false;
    }

    // Writes to a vanished client must not kill the host.
    ::signal(SIGPIPE, SIG_IGN);
    return true;
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("trellis-host"));
    QCoreApplication::setOrganizationName(QStringLiteral("trellis"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Keeps terminal sessions and workspace layouts alive across client restarts."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Read settings from <file>."), QStringLiteral("file"));
    const QCommandLineOption socketOption(QStringLiteral("socket"), QStringLiteral("Listen on the local socket <name>."), QStringLiteral("name"));
    const QCommandLineOption stateDirOption(QStringLiteral("state-dir"), QStringLiteral("Keep workspaces and terminal history in <dir>."), QStringLiteral("dir"));
    const QCommandLineOption shellOption(QStringLiteral("shell"), QStringLiteral("Start terminals with <program>."), QStringLiteral("program"));
    parser.addOptions({configOption, socketOption, stateDirOption, shellOption});
    parser.process(app);

    const QString configPath = parser.isSet(configOption) ? parser.value(configOption) : HostConfig::defaultConfigPath();
    HostConfig config = HostConfig::load(configPath);
    if (parser.isSet(socketOption)) {
        config.socketName = parser.value(socketOption);
    }
    if (parser.isSet(stateDirOption)) {
        config.stateDirectory = parser.value(stateDirOption);
    }
    if (parser.isSet(shellOption)) {
        config.shell = parser.value(shellOption);
    }

    if (!QDir().mkpath(config.stateDirectory)) {
        qCCritical(lcTrellisHost) << "Cannot create state directory" << config.stateDirectory;
        return 1;
    }

    if (!installQuitSignalHandlers()) {
        qCCritical(lcTrellisHost) << "Cannot install signal handlers";
        return 1;
    }
    QSocketNotifier quitNotifier(quitSignalFds[1], QSocketNotifier::Read);
    QObject::connect(&quitNotifier, &QSocketNotifier::activated, &app, []() {
        char byte;
        if (::read(quitSignalFds[1], &byte, sizeof(byte)) > 0) {
            qCInfo(lcTrellisHost) << "Shutting down";
        }
        QCoreApplication::quit();
    });

    WorkspaceStore store(config.workspaceStatePath());
    if (!store.load()) {
        qCCritical(lcTrellisHost) << "Cannot read workspace state from" << store.filePath();
        return 1;
    }

    TerminalSessionManager sessionManager(config.sessionManagerSettings());
    LocalHostBackend backend(&sessionManager, &store);
    HostServer server(&backend);

    QString error;
    if (!server.listen(config.socketName, &error)) {
        return 1;
    }

    // Recordings must be closed cleanly or the next start offers them
    // as cold restores.
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&server, &sessionManager]() {
        server.close();
        sessionManager.shutdown();
    });

    return app.exec();
}
