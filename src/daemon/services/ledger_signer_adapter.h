/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/usb_device_info.h"
#include "../controller/attach_detach_controller.h"
#include "../signer/signer_handle.h"
#include "../signer/signer_transport.h"

#include <QList>
#include <QObject>
#include <QString>
#include <memory>

namespace LedgerSigner {
namespace Shared {
class ConfigurationProvider;
}

namespace Daemon {

class ConfigObserver;
class DeviceEnumerator;
class HotplugMonitor;

/**
 * @brief Entry point of the Ledger signer subsystem
 *
 * Owns the hot-plug source, the controller and the configuration
 * observer. Raw USB events from any vendor arrive here; only those
 * passing AttachDetachController::supportsDevice() are forwarded.
 * Controller notifications are re-emitted unchanged.
 */
class LedgerSignerAdapter : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs adapter
     * @param enumerator Snapshot source of HID paths (owned)
     * @param monitor Hot-plug source (owned)
     * @param transportFactory Creates the transport of each new signer
     * @param config Global configuration (not owned, must outlive the adapter)
     * @param policy Reconnection policy passed to the controller
     * @param parent Parent QObject
     */
    LedgerSignerAdapter(std::unique_ptr<DeviceEnumerator> enumerator,
                        std::unique_ptr<HotplugMonitor> monitor,
                        SignerTransportFactory transportFactory,
                        Shared::ConfigurationProvider *config,
                        ReconnectionPolicy policy = ReconnectionPolicy::platformDefault(),
                        QObject *parent = nullptr);
    ~LedgerSignerAdapter() override;

    /**
     * @brief Creates an adapter on top of udev
     */
    static std::unique_ptr<LedgerSignerAdapter> createDefault(SignerTransportFactory transportFactory,
                                                              Shared::ConfigurationProvider *config,
                                                              QObject *parent = nullptr);

    /**
     * @brief Starts observing configuration and hot-plug events
     *
     * Devices already plugged in are attached right away, one attach
     * per visible HID node.
     *
     * @return Error if the hot-plug source cannot be started
     */
    Shared::Result<void> open();

    /**
     * @brief Stops all observation and closes every signer (idempotent)
     */
    void close();

    [[nodiscard]] bool isOpen() const;

    /**
     * @brief Cycles the transport of a signer
     * @param signerId Logical signer id
     * @return false if the id is unknown
     */
    bool reload(const QString &signerId);

    QList<SignerHandle *> signers() const;
    AttachDetachController *controller() const;

Q_SIGNALS:
    void signerAdded(LedgerSigner::Daemon::SignerHandle *signer);
    void signerUpdated(LedgerSigner::Daemon::SignerHandle *signer);
    void signerRemoved(const QString &signerId);
    void attachUnresolved(const LedgerSigner::Shared::UsbDeviceDescriptor &descriptor);

private Q_SLOTS:
    void onDeviceAttached(const Shared::UsbDeviceDescriptor &descriptor);
    void onDeviceDetached(const Shared::UsbDeviceDescriptor &descriptor);

private:
    void scanConnectedDevices();

    std::unique_ptr<DeviceEnumerator> m_enumerator;
    std::unique_ptr<HotplugMonitor> m_monitor;
    Shared::ConfigurationProvider *m_config;
    AttachDetachController *m_controller;
    ConfigObserver *m_observer;
    bool m_open = false;
};

} // namespace Daemon
} // namespace LedgerSigner
