/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FakeHostBackend.h"

#include <QTimer>

namespace Trellis
{

static const QString Unsupported = QStringLiteral("Not supported by the fake backend");

FakeHostBackend::FakeHostBackend(QObject *parent)
    : HostBackend(parent)
{
}

void FakeHostBackend::createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback)
{
    attachRequests.append(request);
    _attachCallbacks.append(callback);
}

bool FakeHostBackend::replyAttach(const CreateOrAttachResult &result)
{
    if (_attachCallbacks.isEmpty()) {
        return false;
    }
    const CreateOrAttachCallback callback = _attachCallbacks.takeFirst();
    if (callback) {
        callback(result);
    }
    return true;
}

void FakeHostBackend::write(const QString &, const QByteArray &data)
{
    writes.append(data);
}

void FakeHostBackend::resize(const QString &, int cols, int rows)
{
    resizes.append(QSize(cols, rows));
}

void FakeHostBackend::signal(const QString &, const QString &signalName)
{
    signalNames.append(signalName);
}

void FakeHostBackend::detach(const QString &terminalId)
{
    detached.append(terminalId);
}

void FakeHostBackend::kill(const QString &terminalId, bool, ResultCallback callback)
{
    killed.append(terminalId);
    if (callback) {
        QTimer::singleShot(0, this, [callback]() {
            callback(OperationResult::ok());
        });
    }
}

void FakeHostBackend::getHistory(const QString &, HistoryCallback callback)
{
    if (callback) {
        QTimer::singleShot(0, this, [callback]() {
            HistoryResult result;
            result.error = Unsupported;
            callback(result);
        });
    }
}

void FakeHostBackend::ackColdRestore(const QString &terminalId)
{
    acknowledged.append(terminalId);
}

void FakeHostBackend::unsupported(const ResultCallback &callback)
{
    if (callback) {
        QTimer::singleShot(0, this, [callback]() {
            callback(OperationResult::failure(Unsupported));
        });
    }
}

void FakeHostBackend::getWorkspace(const QString &, WorkspaceCallback callback)
{
    if (!callback) {
        return;
    }
    unsupported([callback](const OperationResult &result) {
        WorkspaceResult workspace;
        workspace.error = result.error;
        callback(workspace);
    });
}

void FakeHostBackend::createWorkspace(const QString &, const QString &, WorkspaceCallback callback)
{
    getWorkspace(QString(), callback);
}

void FakeHostBackend::createWorktree(const QString &, const QString &, const QString &, const QString &, WorktreeCallback callback)
{
    if (!callback) {
        return;
    }
    unsupported([callback](const OperationResult &result) {
        WorktreeResult worktree;
        worktree.error = result.error;
        callback(worktree);
    });
}

void FakeHostBackend::setActiveSelection(const QString &, const QString &, const QString &, ResultCallback callback)
{
    unsupported(callback);
}

void FakeHostBackend::createTab(const CreateTabRequest &, TabCallback callback)
{
    if (!callback) {
        return;
    }
    unsupported([callback](const OperationResult &result) {
        TabResult tab;
        tab.error = result.error;
        callback(tab);
    });
}

void FakeHostBackend::moveTab(const MoveTabRequest &, ResultCallback callback)
{
    unsupported(callback);
}

void FakeHostBackend::updateLayoutTree(const QString &, const QString &, const QString &, const PaneLayoutTree::Tree &, ResultCallback callback)
{
    unsupported(callback);
}

void FakeHostBackend::reorderTabs(const QString &, const QString &, const QString &, const QStringList &, ResultCallback callback)
{
    unsupported(callback);
}

void FakeHostBackend::deleteTab(const QString &, const QString &, const QString &, ResultCallback callback)
{
    unsupported(callback);
}

void FakeHostBackend::renameTab(const QString &, const QString &, const QString &, const QString &, ResultCallback callback)
{
    unsupported(callback);
}

} // namespace Trellis

#include "moc_FakeHostBackend.cpp"
