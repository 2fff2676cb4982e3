/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QString>
#include <QTimer>
#include <optional>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief A detach that may still turn out to be an app-switch reboot
 */
struct PendingDisconnection {
    QString devicePath;  ///< Path the signer had when it detached
    QString model;       ///< Stable model id of the detached signer
    QDateTime deadline;  ///< After this instant the removal is final
};

/**
 * @brief Ledger of recently detached signers awaiting reconnection
 *
 * Leaving the Ethereum app reboots a Ledger; it reappears on USB a few
 * seconds later, sometimes under a different path. Each detach is kept
 * here with a deadline timer. An attach that cannot be matched by path
 * claims the most recent entry; an entry nobody claims expires and
 * disconnectionExpired() reports the permanent removal.
 *
 * Claiming and expiry are mutually exclusive: claim() stops and deletes
 * the timer before returning, and the timeout slot ignores entries that
 * are already gone. Both run on the owner's event loop.
 *
 * LIFO correlation is a best-effort heuristic. Two devices of the same
 * model detaching within one window may be matched to each other's entry.
 *
 * Usage:
 * @code
 * DisconnectionTracker tracker;
 * connect(&tracker, &DisconnectionTracker::disconnectionExpired, ...);
 *
 * tracker.recordDisconnection(signer->devicePath(), signer->modelId(), 5000);
 * ...
 * if (auto pending = tracker.claim()) {
 *     resolvedPath = pending->devicePath;
 * }
 * @endcode
 */
class DisconnectionTracker : public QObject
{
    Q_OBJECT

public:
    /// Reference grace window spanning the device's app-switch reboot
    static constexpr int DEFAULT_GRACE_WINDOW_MS = 5000;

    explicit DisconnectionTracker(QObject *parent = nullptr);

    /**
     * @brief Destructor - cancels all pending timers without emitting
     */
    ~DisconnectionTracker() override;

    /**
     * @brief Starts the grace window for a detached signer
     * @param devicePath Path the signer had at detach
     * @param model Stable model id of the signer
     * @param graceWindowMs Window length in milliseconds
     *
     * An entry already pending for @p devicePath is replaced (its timer
     * is cancelled and the new entry becomes the most recent).
     */
    void recordDisconnection(const QString &devicePath, const QString &model, int graceWindowMs);

    /**
     * @brief Pops the most recently recorded entry and cancels its timer
     * @return Entry, or std::nullopt if nothing is pending
     */
    std::optional<PendingDisconnection> claim();

    /**
     * @brief Pops the most recent entry recorded for @p model
     * @return Entry, or std::nullopt if no entry of that model is pending
     */
    std::optional<PendingDisconnection> claimForModel(const QString &model);

    /**
     * @brief Drops the entry for @p devicePath without emitting expiry
     * @return true if an entry was pending
     */
    bool cancel(const QString &devicePath);

    /**
     * @brief Drops every entry without emitting expiry
     */
    void clear();

    [[nodiscard]] bool isPending(const QString &devicePath) const;
    [[nodiscard]] int pendingCount() const;

    /**
     * @brief Gets pending entries, oldest first
     */
    QList<PendingDisconnection> pending() const;

Q_SIGNALS:
    /**
     * @brief Emitted when a grace window elapses without a claim
     * @param devicePath Path recorded at detach
     *
     * The entry is already removed when this is emitted.
     */
    void disconnectionExpired(const QString &devicePath);

private:
    struct Entry {
        PendingDisconnection info;
        QTimer *timer = nullptr;
    };

    void onTimeout(QTimer *timer);
    PendingDisconnection takeAt(int index);

    QList<Entry> m_entries;  ///< Oldest first; claims pop from the back
};

} // namespace Daemon
} // namespace LedgerSigner
