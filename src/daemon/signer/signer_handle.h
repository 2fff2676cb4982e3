/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "signer_transport.h"
#include "common/result.h"
#include "types/connection_state.h"
#include "types/derivation.h"
#include "types/ledger_model.h"

#include <QFuture>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>

namespace LedgerSigner {
namespace Daemon {

class SignerRegistry;

/**
 * @brief Logical signer backed by one physical Ledger device
 *
 * Survives app-switch reconnections: the id never changes while the
 * device path may be re-keyed by SignerRegistry::updatePath().
 *
 * Device work is delegated to a SignerTransport. Asynchronous operations
 * are sequenced here; a newer sequence (disconnect, reconnect, close)
 * invalidates completions of older ones so a late open() result cannot
 * resurrect a detached signer.
 *
 * Signals:
 * - updated(): state or derived addresses changed
 * - errorOccurred(): transport failure, state is now Errored
 * - locked()/unlocked(): user locked or unlocked the device
 * - closed(): emitted exactly once, when close() runs
 */
class SignerHandle : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs handle
     * @param id Stable logical id (from SignerRegistry::allocateId())
     * @param devicePath Path the device was first seen at
     * @param model Model identified at first attach
     * @param transport Device capability, owned by the handle
     * @param parent Parent QObject
     */
    SignerHandle(const QString &id,
                 const QString &devicePath,
                 Shared::LedgerModel model,
                 std::unique_ptr<SignerTransport> transport,
                 QObject *parent = nullptr);
    ~SignerHandle() override;

    QString id() const;
    QString devicePath() const;
    Shared::LedgerModel model() const;

    /**
     * @brief Stable model identifier used to match detach events
     */
    QString modelId() const;

    Shared::DerivationConfig derivation() const;
    Shared::DerivationScheme derivationScheme() const;
    int accountLimit() const;

    Shared::ConnectionState state() const;

    /**
     * @brief Gets last transport error (only meaningful in Errored state)
     */
    QString lastError() const;

    [[nodiscard]] bool isClosed() const;

    /**
     * @brief Stores the effective form of @p config
     * @return true if the stored pair changed
     *
     * Does not derive; call deriveAddresses() afterwards when needed.
     */
    bool applyDerivation(const Shared::DerivationConfig &config);

    /**
     * @brief Opens the transport at the current path, then connects
     *
     * Moves to Opening immediately, to Connected on success and derives
     * addresses with the current configuration. Any failure moves to
     * Errored and is reported through errorOccurred().
     */
    void openAndConnect();

    /**
     * @brief Connects an already opened transport (used after unlock)
     */
    void connectDevice();

    /**
     * @brief Drops the device session without waiting for completion
     */
    void disconnectDevice();

    /**
     * @brief Runs disconnect → open → connect
     *
     * Used to recover from Errored without a hardware event. A failing
     * disconnect is logged and the cycle continues with open.
     */
    void reconnect();

    /**
     * @brief Releases the transport and emits closed()
     *
     * Idempotent; only the first call has an effect.
     */
    void close();

    /**
     * @brief Re-derives addresses with the stored configuration
     *
     * Only reaches the device when Connected; otherwise the stored
     * configuration is used by the next successful connect.
     */
    void deriveAddresses();

Q_SIGNALS:
    void updated();
    void errorOccurred(const QString &error);
    void locked();
    void unlocked();
    void closed();
    void stateChanged(Shared::ConnectionState state);

private:
    friend class SignerRegistry;

    /**
     * @brief Re-keys the device path (SignerRegistry keeps its index in sync)
     */
    void setDevicePath(const QString &devicePath);

    void setState(Shared::ConnectionState state);
    void setErrorState(const QString &error);

    /**
     * @brief Delivers @p future's result to @p onFinished on this thread
     *
     * The continuation is dropped if another sequence started meanwhile
     * or the handle was closed.
     */
    void watch(const QFuture<Shared::Result<void>> &future,
               const QString &operation,
               std::function<void(const Shared::Result<void> &)> onFinished);

    void startConnect();
    void onTransportError(const QString &error);
    void onTransportLocked();

    QString m_id;
    QString m_devicePath;
    Shared::LedgerModel m_model;
    std::unique_ptr<SignerTransport> m_transport;

    Shared::DerivationConfig m_derivation;
    Shared::ConnectionState m_state{Shared::ConnectionState::Disconnected};
    QString m_lastError;
    bool m_closed{false};
    quint64 m_sequence{0};  ///< Bumped by every operation sequence; stale completions are ignored
};

} // namespace Daemon
} // namespace LedgerSigner
