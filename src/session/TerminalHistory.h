/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALHISTORY_H
#define TERMINALHISTORY_H

#include <QByteArray>
#include <QDateTime>
#include <QFile>
#include <QJsonObject>
#include <QString>

#include <optional>

#include "TerminalModeScanner.h"
#include "trellisprivate_export.h"

namespace Trellis
{

struct TRELLISPRIVATE_EXPORT HistoryMetadata {
    QString cwd;
    int cols = 80;
    int rows = 24;
    QDateTime startedAt;
    std::optional<QDateTime> endedAt;
    std::optional<int> exitCode;
    qint64 byteLength = 0;
    TerminalModes modes;

    // A recording without endedAt was cut short by a host crash
    bool endedCleanly() const
    {
        return endedAt.has_value();
    }

    QJsonObject toJson() const;
    static HistoryMetadata fromJson(const QJsonObject &object);
};

/**
 * On-disk layout of a terminal's recorded output:
 * <root>/<workspaceId>/<terminalId>/{history.ndjson,meta.json}
 */
class TRELLISPRIVATE_EXPORT TerminalHistory
{
public:
    /** True if @p id can name a single directory below the history root. */
    static bool isValidPathComponent(const QString &id);

    /** Empty if either id is not a valid path component. */
    static QString directory(const QString &root, const QString &workspaceId, const QString &terminalId);
    static QString historyFilePath(const QString &directory);
    static QString metadataFilePath(const QString &directory);
};

class TRELLISPRIVATE_EXPORT HistoryWriter
{
public:
    HistoryWriter(const QString &directory, const QString &cwd, int cols, int rows);
    ~HistoryWriter();

    HistoryWriter(const HistoryWriter &) = delete;
    HistoryWriter &operator=(const HistoryWriter &) = delete;

    bool init();
    void writeData(const QByteArray &data);

    /** Rewrites meta.json with the current size, cwd and modes. */
    void updateMetadata(const QString &cwd, int cols, int rows, const TerminalModes &modes);

    void writeExit(int exitCode, int signal);
    void finalize(std::optional<int> exitCode = std::nullopt);

    bool isOpen() const
    {
        return _file.isOpen() && !_finalized;
    }

    const HistoryMetadata &metadata() const
    {
        return _metadata;
    }

private:
    void appendLine(const QJsonObject &event);
    void writeMetadata();

    QString _directory;
    QFile _file;
    HistoryMetadata _metadata;
    bool _finalized = false;
};

struct HistoryRecord {
    bool exists = false;
    QByteArray scrollback;
    std::optional<HistoryMetadata> metadata;
};

class TRELLISPRIVATE_EXPORT HistoryReader
{
public:
    static const qint64 DefaultMaxBytesToRead = 500000;
    static const int DefaultMaxScrollbackBytes = 100000;

    explicit HistoryReader(const QString &directory);

    /**
     * Replays the tail of history.ndjson. Only the last @p maxBytesToRead
     * bytes of the file are decoded and the last @p maxScrollbackBytes of
     * output kept. Malformed lines are skipped.
     */
    HistoryRecord readLatest(qint64 maxBytesToRead = DefaultMaxBytesToRead, int maxScrollbackBytes = DefaultMaxScrollbackBytes) const;

    std::optional<HistoryMetadata> readMetadata() const;

    /** Marks an unfinished recording as ended so it is no longer restorable. */
    bool markEnded() const;

    bool cleanup() const;

private:
    QString _directory;
};

} // namespace Trellis

#endif // TERMINALHISTORY_H
