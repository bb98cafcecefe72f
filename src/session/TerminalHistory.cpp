/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalHistory.h"

#include <QDir>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>

Q_LOGGING_CATEGORY(lcTrellisHistory, "trellis.history")

namespace Trellis
{

static QByteArray tailOf(const QByteArray &data, int maxBytes)
{
    if (data.size() <= maxBytes) {
        return data;
    }
    int cut = static_cast<int>(data.size()) - maxBytes;
    while (cut < data.size() && (static_cast<uchar>(data.at(cut)) & 0xC0) == 0x80) {
        ++cut;
    }
    return data.mid(cut);
}

QJsonObject HistoryMetadata::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("cwd"), cwd);
    object.insert(QStringLiteral("cols"), cols);
    object.insert(QStringLiteral("rows"), rows);
    object.insert(QStringLiteral("startedAt"), startedAt.toUTC().toString(Qt::ISODateWithMs));
    if (endedAt.has_value()) {
        object.insert(QStringLiteral("endedAt"), endedAt->toUTC().toString(Qt::ISODateWithMs));
    }
    if (exitCode.has_value()) {
        object.insert(QStringLiteral("exitCode"), *exitCode);
    }
    object.insert(QStringLiteral("byteLength"), byteLength);
    object.insert(QStringLiteral("modes"), modes.toJson());
    return object;
}

HistoryMetadata HistoryMetadata::fromJson(const QJsonObject &object)
{
    HistoryMetadata metadata;
    metadata.cwd = object.value(QStringLiteral("cwd")).toString();
    metadata.cols = object.value(QStringLiteral("cols")).toInt(80);
    metadata.rows = object.value(QStringLiteral("rows")).toInt(24);
    metadata.startedAt = QDateTime::fromString(object.value(QStringLiteral("startedAt")).toString(), Qt::ISODateWithMs);

    const QJsonValue endedAt = object.value(QStringLiteral("endedAt"));
    if (endedAt.isString()) {
        metadata.endedAt = QDateTime::fromString(endedAt.toString(), Qt::ISODateWithMs);
    }
    const QJsonValue exitCode = object.value(QStringLiteral("exitCode"));
    if (exitCode.isDouble()) {
        metadata.exitCode = exitCode.toInt();
    }
    metadata.byteLength = static_cast<qint64>(object.value(QStringLiteral("byteLength")).toDouble());
    metadata.modes = TerminalModes::fromJson(object.value(QStringLiteral("modes")).toObject());
    return metadata;
}

bool TerminalHistory::isValidPathComponent(const QString &id)
{
    return !id.isEmpty() && id != QLatin1String(".") && id != QLatin1String("..") && !id.contains(QLatin1Char('/')) && !id.contains(QChar(0));
}

QString TerminalHistory::directory(const QString &root, const QString &workspaceId, const QString &terminalId)
{
    if (!isValidPathComponent(workspaceId) || !isValidPathComponent(terminalId)) {
        qCWarning(lcTrellisHistory) << "Refusing history path for workspace" << workspaceId << "terminal" << terminalId;
        return QString();
    }
    return QDir(root).filePath(workspaceId + QLatin1Char('/') + terminalId);
}

QString TerminalHistory::historyFilePath(const QString &directory)
{
    return QDir(directory).filePath(QStringLiteral("history.ndjson"));
}

QString TerminalHistory::metadataFilePath(const QString &directory)
{
    return QDir(directory).filePath(QStringLiteral("meta.json"));
}

static bool writeMetadataFile(const QString &directory, const HistoryMetadata &metadata)
{
    QSaveFile file(TerminalHistory::metadataFilePath(directory));
    if (!file.open(QIODevice::WriteOnly)) {
        qCCritical(lcTrellisHistory) << "Cannot write" << file.fileName() << file.errorString();
        return false;
    }
    file.write(QJsonDocument(metadata.toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCCritical(lcTrellisHistory) << "Failed to commit" << file.fileName() << file.errorString();
        return false;
    }
    return true;
}

HistoryWriter::HistoryWriter(const QString &directory, const QString &cwd, int cols, int rows)
    : _directory(directory)
    , _file(TerminalHistory::historyFilePath(directory))
{
    _metadata.cwd = cwd;
    _metadata.cols = cols;
    _metadata.rows = rows;
    _metadata.startedAt = QDateTime::currentDateTimeUtc();
}

HistoryWriter::~HistoryWriter()
{
    // Without an explicit finalize() the recording stays restorable.
    _file.close();
}

bool HistoryWriter::init()
{
    if (!QDir().mkpath(_directory)) {
        qCCritical(lcTrellisHistory) << "Cannot create history directory" << _directory;
        return false;
    }
    if (!_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qCCritical(lcTrellisHistory) << "Cannot open" << _file.fileName() << _file.errorString();
        return false;
    }

    _metadata.byteLength = _file.size();
    _finalized = false;
    writeMetadata();
    return true;
}

void HistoryWriter::appendLine(const QJsonObject &event)
{
    if (!isOpen()) {
        qCWarning(lcTrellisHistory) << "History writer for" << _directory << "is not open";
        return;
    }

    QByteArray line = QJsonDocument(event).toJson(QJsonDocument::Compact);
    line.append('\n');
    const qint64 written = _file.write(line);
    if (written != line.size()) {
        qCWarning(lcTrellisHistory) << "Short write to" << _file.fileName() << _file.errorString();
    }
    _file.flush();
    _metadata.byteLength += qMax<qint64>(0, written);
}

void HistoryWriter::writeData(const QByteArray &data)
{
    QJsonObject event;
    event.insert(QStringLiteral("t"), QDateTime::currentMSecsSinceEpoch());
    event.insert(QStringLiteral("type"), QStringLiteral("data"));
    event.insert(QStringLiteral("data"), QString::fromLatin1(data.toBase64()));
    appendLine(event);
}

void HistoryWriter::updateMetadata(const QString &cwd, int cols, int rows, const TerminalModes &modes)
{
    if (_finalized) {
        return;
    }
    _metadata.cwd = cwd;
    _metadata.cols = cols;
    _metadata.rows = rows;
    _metadata.modes = modes;
    writeMetadata();
}

void HistoryWriter::writeExit(int exitCode, int signal)
{
    if (_finalized) {
        return;
    }

    QJsonObject event;
    event.insert(QStringLiteral("t"), QDateTime::currentMSecsSinceEpoch());
    event.insert(QStringLiteral("type"), QStringLiteral("exit"));
    event.insert(QStringLiteral("exitCode"), exitCode);
    if (signal != 0) {
        event.insert(QStringLiteral("signal"), signal);
    }
    appendLine(event);
    finalize(exitCode);
}

void HistoryWriter::finalize(std::optional<int> exitCode)
{
    if (_finalized) {
        return;
    }
    _finalized = true;
    _file.close();

    if (!_metadata.endedAt.has_value()) {
        _metadata.endedAt = QDateTime::currentDateTimeUtc();
    }
    if (exitCode.has_value()) {
        _metadata.exitCode = exitCode;
    }
    writeMetadata();
}

void HistoryWriter::writeMetadata()
{
    writeMetadataFile(_directory, _metadata);
}

HistoryReader::HistoryReader(const QString &directory)
    : _directory(directory)
{
}

std::optional<HistoryMetadata> HistoryReader::readMetadata() const
{
    QFile file(TerminalHistory::metadataFilePath(_directory));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcTrellisHistory) << "Ignoring unreadable" << file.fileName() << error.errorString();
        return std::nullopt;
    }
    return HistoryMetadata::fromJson(document.object());
}

HistoryRecord HistoryReader::readLatest(qint64 maxBytesToRead, int maxScrollbackBytes) const
{
    HistoryRecord record;

    QFile file(TerminalHistory::historyFilePath(_directory));
    if (!file.exists()) {
        return record;
    }
    record.exists = true;
    record.metadata = readMetadata();

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcTrellisHistory) << "Cannot read" << file.fileName() << file.errorString();
        return record;
    }

    const qint64 startPos = qMax<qint64>(0, file.size() - maxBytesToRead);
    file.seek(startPos);
    if (startPos > 0) {
        // Started mid-file: the first line is partial.
        file.readLine();
    }

    QByteArray scrollback;
    int skipped = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const QJsonDocument document = QJsonDocument::fromJson(line);
        if (!document.isObject()) {
            ++skipped;
            continue;
        }
        const QJsonObject event = document.object();
        if (event.value(QStringLiteral("type")).toString() != QLatin1String("data")) {
            continue;
        }
        scrollback.append(QByteArray::fromBase64(event.value(QStringLiteral("data")).toString().toLatin1()));
        if (scrollback.size() > 2 * maxScrollbackBytes) {
            scrollback = tailOf(scrollback, maxScrollbackBytes);
        }
    }

    if (skipped > 0) {
        qCDebug(lcTrellisHistory) << "Skipped" << skipped << "malformed lines in" << file.fileName();
    }

    record.scrollback = tailOf(scrollback, maxScrollbackBytes);
    return record;
}

bool HistoryReader::markEnded() const
{
    auto metadata = readMetadata();
    if (!metadata.has_value() || metadata->endedCleanly()) {
        return true;
    }
    metadata->endedAt = QDateTime::currentDateTimeUtc();
    return writeMetadataFile(_directory, *metadata);
}

bool HistoryReader::cleanup() const
{
    if (_directory.isEmpty()) {
        return false;
    }
    QDir dir(_directory);
    if (!dir.exists()) {
        return true;
    }
    if (!dir.removeRecursively()) {
        qCWarning(lcTrellisHistory) << "Failed to remove history" << _directory;
        return false;
    }
    return true;
}

} // namespace Trellis
