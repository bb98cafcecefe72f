/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEHOSTBACKEND_H
#define FAKEHOSTBACKEND_H

#include <QList>
#include <QSize>

#include "host/HostBackend.h"

namespace Trellis
{

/**
 * Records terminal traffic and leaves createOrAttach unanswered until
 * the test calls replyAttach(). Workspace operations are unsupported.
 */
class FakeHostBackend : public HostBackend
{
    Q_OBJECT
public:
    explicit FakeHostBackend(QObject *parent = nullptr);

    void createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback) override;
    void write(const QString &terminalId, const QByteArray &data) override;
    void resize(const QString &terminalId, int cols, int rows) override;
    void signal(const QString &terminalId, const QString &signalName) override;
    void detach(const QString &terminalId) override;
    void kill(const QString &terminalId, bool deleteHistory, ResultCallback callback) override;
    void getHistory(const QString &terminalId, HistoryCallback callback) override;
    void ackColdRestore(const QString &terminalId) override;

    void getWorkspace(const QString &workspaceId, WorkspaceCallback callback) override;
    void createWorkspace(const QString &name, const QString &repoPath, WorkspaceCallback callback) override;
    void createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch, WorktreeCallback callback) override;
    void setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) override;

    void createTab(const CreateTabRequest &request, TabCallback callback) override;
    void moveTab(const MoveTabRequest &request, ResultCallback callback) override;
    void updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree, ResultCallback callback) override;
    void reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds, ResultCallback callback) override;
    void deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) override;
    void renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name, ResultCallback callback) override;

    /** Answers the oldest outstanding createOrAttach. Returns false if none is pending. */
    bool replyAttach(const CreateOrAttachResult &result);

    int pendingAttachCount() const
    {
        return _attachCallbacks.size();
    }

    QList<CreateOrAttachRequest> attachRequests;
    QList<QByteArray> writes;
    QList<QSize> resizes;
    QStringList signalNames;
    QStringList detached;
    QStringList killed;
    QStringList acknowledged;

private:
    void unsupported(const ResultCallback &callback);

    QList<CreateOrAttachCallback> _attachCallbacks;
};

} // namespace Trellis

#endif // FAKEHOSTBACKEND_H
