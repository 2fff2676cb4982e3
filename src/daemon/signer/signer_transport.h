/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/derivation.h"
#include "types/ledger_model.h"

#include <QFuture>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Device-side capability behind one SignerHandle
 *
 * Implemented by the embedding application on top of the Ledger wire
 * protocol. The signer subsystem never talks to the device directly; it
 * only sequences these operations and listens to the signals.
 *
 * open(), connectDevice() and disconnectDevice() may suspend. Their futures must be
 * finished with exactly one Result; failures are reported through the
 * Result, never by throwing.
 */
class SignerTransport : public QObject
{
    Q_OBJECT

public:
    explicit SignerTransport(QObject *parent = nullptr);
    ~SignerTransport() override;

    /**
     * @brief Opens the HID node at the current device path
     * @param devicePath Platform path (may differ from the previous open())
     */
    virtual QFuture<Shared::Result<void>> open(const QString &devicePath) = 0;

    /**
     * @brief Negotiates with the on-device application
     */
    virtual QFuture<Shared::Result<void>> connectDevice() = 0;

    /**
     * @brief Drops the device session, keeping the transport reusable
     */
    virtual QFuture<Shared::Result<void>> disconnectDevice() = 0;

    /**
     * @brief Releases every resource; the transport is not reused afterwards
     */
    virtual void close() = 0;

    /**
     * @brief Starts address derivation with the given configuration
     *
     * Completion is reported through updated().
     */
    virtual void deriveAddresses(const Shared::DerivationConfig &config) = 0;

Q_SIGNALS:
    /**
     * @brief Device status or derived addresses changed
     */
    void updated();

    /**
     * @brief The device reported a failure outside a pending operation
     */
    void errorOccurred(const QString &error);

    /**
     * @brief The device was locked by the user
     */
    void locked();

    /**
     * @brief The device was unlocked by the user
     */
    void unlocked();

    /**
     * @brief The device-side session ended for good
     */
    void closed();
};

/**
 * @brief Creates the transport for a newly attached signer
 * @param devicePath Path the signer was first seen at
 * @param model Model identified from the USB product id
 */
using SignerTransportFactory =
    std::function<std::unique_ptr<SignerTransport>(const QString &devicePath, Shared::LedgerModel model)>;

} // namespace Daemon
} // namespace LedgerSigner
