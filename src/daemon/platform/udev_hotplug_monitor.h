/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "hotplug_monitor.h"

#include <optional>

class QSocketNotifier;

struct udev;
struct udev_device;
struct udev_monitor;

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Linux hot-plug source on the udev netlink socket
 *
 * Event-driven, no polling and no extra thread: a QSocketNotifier on the
 * monitor fd delivers events on the owner's event loop, so they are
 * serialized with timers and configuration changes.
 *
 * - attach: "add" of a hidraw node (the node exists once this arrives;
 *   the usb_device "add" comes before the HID driver is bound)
 * - detach: "remove" of the usb_device (sysfs is gone by then, ids come
 *   from the uevent PRODUCT property)
 */
class UdevHotplugMonitor : public HotplugMonitor
{
    Q_OBJECT

public:
    explicit UdevHotplugMonitor(QObject *parent = nullptr);
    ~UdevHotplugMonitor() override;

    Shared::Result<void> start() override;
    void stop() override;
    [[nodiscard]] bool isRunning() const override;

    /**
     * @brief Parses the uevent PRODUCT property ("2c97/4011/201")
     * @return Descriptor with vendor and product set, std::nullopt if malformed
     */
    static std::optional<Shared::UsbDeviceDescriptor> parseProductProperty(const QString &product);

private Q_SLOTS:
    void onMonitorReadable();

private:
    void handleDevice(udev_device *device);

    udev *m_udev = nullptr;
    udev_monitor *m_monitor = nullptr;
    QSocketNotifier *m_notifier = nullptr;
};

} // namespace Daemon
} // namespace LedgerSigner
