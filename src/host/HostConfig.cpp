/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostConfig.h"

#include <QDir>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisHost)

namespace Trellis
{

HostConfig HostConfig::defaults()
{
    HostConfig config;
    config.stateDirectory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return config;
}

QString HostConfig::defaultConfigPath()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)).filePath(QStringLiteral("trellis-host.conf"));
}

HostConfig HostConfig::load(const QString &path)
{
    HostConfig config = defaults();

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcTrellisHost) << "Cannot read config" << path << ", using defaults";
        return config;
    }

    settings.beginGroup(QStringLiteral("host"));
    config.socketName = settings.value(QStringLiteral("socketName"), config.socketName).toString();
    config.stateDirectory = settings.value(QStringLiteral("stateDirectory"), config.stateDirectory).toString();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("terminal"));
    config.shell = settings.value(QStringLiteral("shell"), config.shell).toString();
    config.defaultCols = qMax(1, settings.value(QStringLiteral("defaultCols"), config.defaultCols).toInt());
    config.defaultRows = qMax(1, settings.value(QStringLiteral("defaultRows"), config.defaultRows).toInt());
    config.scrollbackLines = qMax(1, settings.value(QStringLiteral("scrollbackLines"), config.scrollbackLines).toInt());
    config.scrollbackBytes = qMax(1, settings.value(QStringLiteral("scrollbackBytes"), config.scrollbackBytes).toInt());
    config.initialCommandDelay = qMax(0, settings.value(QStringLiteral("initialCommandDelay"), config.initialCommandDelay).toInt());
    settings.endGroup();

    settings.beginGroup(QStringLiteral("history"));
    config.replayBytesToRead = qMax<qint64>(1, settings.value(QStringLiteral("replayBytesToRead"), config.replayBytesToRead).toLongLong());
    config.replayScrollbackBytes = qMax(1, settings.value(QStringLiteral("replayScrollbackBytes"), config.replayScrollbackBytes).toInt());
    settings.endGroup();

    return config;
}

bool HostConfig::save(const QString &path) const
{
    QSettings settings(path, QSettings::IniFormat);

    settings.beginGroup(QStringLiteral("host"));
    settings.setValue(QStringLiteral("socketName"), socketName);
    settings.setValue(QStringLiteral("stateDirectory"), stateDirectory);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("terminal"));
    settings.setValue(QStringLiteral("shell"), shell);
    settings.setValue(QStringLiteral("defaultCols"), defaultCols);
    settings.setValue(QStringLiteral("defaultRows"), defaultRows);
    settings.setValue(QStringLiteral("scrollbackLines"), scrollbackLines);
    settings.setValue(QStringLiteral("scrollbackBytes"), scrollbackBytes);
    settings.setValue(QStringLiteral("initialCommandDelay"), initialCommandDelay);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("history"));
    settings.setValue(QStringLiteral("replayBytesToRead"), replayBytesToRead);
    settings.setValue(QStringLiteral("replayScrollbackBytes"), replayScrollbackBytes);
    settings.endGroup();

    settings.sync();
    return settings.status() == QSettings::NoError;
}

QString HostConfig::historyRoot() const
{
    return QDir(stateDirectory).filePath(QStringLiteral("terminal-history"));
}

QString HostConfig::workspaceStatePath() const
{
    return QDir(stateDirectory).filePath(QStringLiteral("workspaces.json"));
}

SessionManagerSettings HostConfig::sessionManagerSettings() const
{
    SessionManagerSettings settings;
    settings.historyRoot = historyRoot();
    settings.shell = shell;
    settings.defaultCols = defaultCols;
    settings.defaultRows = defaultRows;
    settings.scrollbackLines = scrollbackLines;
    settings.scrollbackBytes = scrollbackBytes;
    settings.replayBytesToRead = replayBytesToRead;
    settings.replayScrollbackBytes = replayScrollbackBytes;
    settings.initialCommandDelay = initialCommandDelay;
    return settings;
}

} // namespace Trellis
