/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALRESIZECOORDINATOR_H
#define TERMINALRESIZECOORDINATOR_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QSize>
#include <QTimer>

#include "trellisprivate_export.h"

namespace Trellis
{

class TerminalRenderer;

struct ResizeTimings {
    int settleMs = 150;
    int graceMs = 50;
    int initialSetupReleaseMs = 100;
};

/**
 * Orders output against size changes for one terminal view.
 *
 * A container size change opens a resize window: output is queued,
 * the size is fitted once the settle timer fires, and the queue is
 * written as one chunk after the grace period. Outbound resizes are
 * suppressed during initial setup and when the size equals the last
 * one sent.
 */
class TRELLISPRIVATE_EXPORT TerminalResizeCoordinator : public QObject
{
    Q_OBJECT
public:
    explicit TerminalResizeCoordinator(TerminalRenderer *renderer, const ResizeTimings &timings = ResizeTimings(), QObject *parent = nullptr);

    void writeOutput(const QByteArray &data);
    void containerResized();

    /** Fits the renderer without telling the host. */
    void beginInitialSetup();
    /** Schedules the first real fit after a replay, then releases outbound resizes. */
    void finishInitialSetup();

    /** Records a size the host already knows, e.g. the one sent with createOrAttach. */
    void markSizeSent(const QSize &size);

    /** Cancels every timer and drops queued output. */
    void stop();

    bool isResizing() const
    {
        return _isResizing;
    }

    bool isInitialSetup() const
    {
        return _isInitialSetup;
    }

    QSize lastSentSize() const
    {
        return _lastSentSize;
    }

    int queuedChunkCount() const
    {
        return _writeQueue.size();
    }

Q_SIGNALS:
    void resizeRequested(int cols, int rows);
    void resizeStarted();
    void resizeFinished();

private:
    void fit();
    void sendSizeIfChanged(const QSize &size);
    void onSettleTimeout();
    void onGraceTimeout();
    void onInitialSetupRelease();
    void flushWriteQueue();

    TerminalRenderer *_renderer;
    ResizeTimings _timings;

    QTimer _settleTimer;
    QTimer _graceTimer;
    QTimer _initialSetupTimer;

    bool _isResizing = false;
    bool _isInitialSetup = false;
    QList<QByteArray> _writeQueue;
    QSize _lastSentSize;
};

} // namespace Trellis

#endif // TERMINALRESIZECOORDINATOR_H
