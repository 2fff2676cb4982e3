/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "disconnection_tracker.h"
#include "../logging_categories.h"

namespace LedgerSigner {
namespace Daemon {

DisconnectionTracker::DisconnectionTracker(QObject *parent)
    : QObject(parent)
{
}

DisconnectionTracker::~DisconnectionTracker()
{
    clear();
}

void DisconnectionTracker::recordDisconnection(const QString &devicePath, const QString &model, int graceWindowMs)
{
    if (cancel(devicePath)) {
        qCDebug(DisconnectionTrackerLog) << "Replacing pending disconnection for" << devicePath;
    }

    Entry entry;
    entry.info.devicePath = devicePath;
    entry.info.model = model;
    entry.info.deadline = QDateTime::currentDateTimeUtc().addMSecs(graceWindowMs);

    entry.timer = new QTimer(this);
    entry.timer->setSingleShot(true);
    QTimer *const timer = entry.timer;
    connect(timer, &QTimer::timeout, this, [this, timer]() {
        onTimeout(timer);
    });

    m_entries.append(entry);
    timer->start(graceWindowMs);

    qCDebug(DisconnectionTrackerLog) << "Recorded disconnection of" << devicePath << "model:" << model
                                     << "grace:" << graceWindowMs << "ms, pending:" << m_entries.size();
}

std::optional<PendingDisconnection> DisconnectionTracker::claim()
{
    if (m_entries.isEmpty()) {
        return std::nullopt;
    }

    PendingDisconnection claimed = takeAt(static_cast<int>(m_entries.size()) - 1);
    qCDebug(DisconnectionTrackerLog) << "Claimed most recent disconnection:" << claimed.devicePath;
    return claimed;
}

std::optional<PendingDisconnection> DisconnectionTracker::claimForModel(const QString &model)
{
    for (int i = static_cast<int>(m_entries.size()) - 1; i >= 0; --i) {
        if (m_entries.at(i).info.model == model) {
            PendingDisconnection claimed = takeAt(i);
            qCDebug(DisconnectionTrackerLog) << "Claimed disconnection of" << claimed.devicePath
                                             << "for model" << model;
            return claimed;
        }
    }
    return std::nullopt;
}

bool DisconnectionTracker::cancel(const QString &devicePath)
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).info.devicePath == devicePath) {
            takeAt(i);
            return true;
        }
    }
    return false;
}

void DisconnectionTracker::clear()
{
    while (!m_entries.isEmpty()) {
        takeAt(0);
    }
}

bool DisconnectionTracker::isPending(const QString &devicePath) const
{
    for (const Entry &entry : m_entries) {
        if (entry.info.devicePath == devicePath) {
            return true;
        }
    }
    return false;
}

int DisconnectionTracker::pendingCount() const
{
    return static_cast<int>(m_entries.size());
}

QList<PendingDisconnection> DisconnectionTracker::pending() const
{
    QList<PendingDisconnection> result;
    result.reserve(m_entries.size());
    for (const Entry &entry : m_entries) {
        result.append(entry.info);
    }
    return result;
}

void DisconnectionTracker::onTimeout(QTimer *timer)
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).timer == timer) {
            const PendingDisconnection expired = takeAt(i);
            qCInfo(DisconnectionTrackerLog) << "Grace window elapsed for" << expired.devicePath
                                            << "- removal is final";
            Q_EMIT disconnectionExpired(expired.devicePath);
            return;
        }
    }

    // Claimed or cancelled after the timeout was queued
    qCDebug(DisconnectionTrackerLog) << "Ignoring timeout of an entry that is no longer pending";
}

PendingDisconnection DisconnectionTracker::takeAt(int index)
{
    Entry entry = m_entries.takeAt(index);
    if (entry.timer) {
        entry.timer->stop();
        entry.timer->deleteLater();
    }
    return entry.info;
}

} // namespace Daemon
} // namespace LedgerSigner
