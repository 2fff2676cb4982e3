/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "../registry/signer_registry.h"
#include "../signer/signer_handle.h"
#include "../signer/signer_transport.h"
#include "types/ledger_model.h"
#include "types/usb_device_info.h"

#include <QList>
#include <QObject>
#include <QString>
#include <optional>

namespace LedgerSigner {
namespace Shared {
class ConfigurationProvider;
}

namespace Daemon {

class DeviceEnumerator;
class DisconnectionTracker;

/**
 * @brief How detaches are reconciled with later attaches
 */
struct ReconnectionPolicy {
    /// Keep detached signers pending for a grace window instead of removing them at once
    bool trackDisconnections = true;

    /// Grace window override in ms; <= 0 uses the configuration value
    int graceWindowMs = 0;

    /**
     * @brief Policy for the platform this was built for
     *
     * Windows reports unrelated paths after an app switch, so tracking
     * is disabled there and every detach is final.
     */
    static ReconnectionPolicy platformDefault();
};

/**
 * @brief Reconciles USB hot-plug events with logical signers
 *
 * Leaving or entering an app on a Ledger reboots it. The OS sees a
 * detach followed by an attach, possibly under another path. This
 * controller keeps the logical signer (its id and derivation state)
 * alive across that cycle:
 *
 * - handleAttach(): find the path that appeared, or claim the most
 *   recent pending disconnection; reuse or create the handle; open and
 *   connect it
 * - handleDetach(): find the signer whose path vanished; disconnect it
 *   and either keep it pending for the grace window or remove it
 *
 * All handling runs on the owner's event loop. Transport work is
 * asynchronous and reported through the handle's own signals.
 *
 * Outward notifications:
 * - signerAdded(): a new logical signer exists
 * - signerUpdated(): a signer changed state, errored or was locked
 * - signerRemoved(): a signer was closed, exactly once per signer
 * - attachUnresolved(): an attach could not be matched to any path
 */
class AttachDetachController : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs controller
     * @param enumerator Snapshot source of visible HID paths (not owned)
     * @param transportFactory Creates the transport of each new signer
     * @param config Global configuration (not owned, may be nullptr for defaults)
     * @param policy Reconnection policy
     * @param parent Parent QObject
     */
    AttachDetachController(DeviceEnumerator *enumerator,
                           SignerTransportFactory transportFactory,
                           Shared::ConfigurationProvider *config,
                           ReconnectionPolicy policy = ReconnectionPolicy::platformDefault(),
                           QObject *parent = nullptr);
    ~AttachDetachController() override;

    /**
     * @brief Reconciles an attach event
     * @param descriptor Event payload (vendor already checked by the caller)
     */
    void handleAttach(const Shared::UsbDeviceDescriptor &descriptor);

    /**
     * @brief Reconciles a detach event
     * @param descriptor Event payload (vendor already checked by the caller)
     */
    void handleDetach(const Shared::UsbDeviceDescriptor &descriptor);

    /**
     * @brief Cycles the transport of the signer at @p devicePath
     * @return false if no signer holds that path
     */
    bool reload(const QString &devicePath);

    /**
     * @brief Drops pending disconnections and closes every signer
     */
    void shutdown();

    /**
     * @brief Checks whether an event concerns a Ledger device
     */
    [[nodiscard]] static bool supportsDevice(const Shared::UsbDeviceDescriptor &descriptor);

    [[nodiscard]] QList<SignerHandle *> signers() const;

    SignerRegistry *registry();
    DisconnectionTracker *tracker() const;
    ReconnectionPolicy policy() const;

Q_SIGNALS:
    void signerAdded(LedgerSigner::Daemon::SignerHandle *signer);
    void signerUpdated(LedgerSigner::Daemon::SignerHandle *signer);
    void signerRemoved(const QString &signerId);
    void attachUnresolved(const LedgerSigner::Shared::UsbDeviceDescriptor &descriptor);

private:
    /**
     * @brief Picks the attaching path among unowned visible paths
     * @return Path, or std::nullopt if none is free
     */
    std::optional<QString> findNewPath(Shared::LedgerModel model) const;

    SignerHandle *findDetachedSigner(Shared::LedgerModel model) const;

    /**
     * @brief Creates, registers and wires a handle for @p devicePath
     * @return Handle, or nullptr on failure (already logged)
     */
    SignerHandle *createSigner(const QString &devicePath, Shared::LedgerModel model);

    void wireSigner(SignerHandle *signer);
    void removeSigner(SignerHandle *signer);
    void onSignerClosed(SignerHandle *signer);
    void onDisconnectionExpired(const QString &devicePath);

    Shared::DerivationConfig currentDerivation() const;
    int graceWindowMs() const;

    DeviceEnumerator *m_enumerator;
    SignerTransportFactory m_transportFactory;
    Shared::ConfigurationProvider *m_config;
    ReconnectionPolicy m_policy;

    SignerRegistry m_registry;
    DisconnectionTracker *m_tracker;
};

} // namespace Daemon
} // namespace LedgerSigner
