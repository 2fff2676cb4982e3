/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/usb_device_info.h"

#include <QObject>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Source of raw USB attach/detach notifications
 *
 * Signals are delivered on the thread that owns the monitor. No vendor
 * filtering happens here; LedgerSignerAdapter applies supportsDevice().
 */
class HotplugMonitor : public QObject
{
    Q_OBJECT

public:
    explicit HotplugMonitor(QObject *parent = nullptr);
    ~HotplugMonitor() override;

    /**
     * @brief Starts delivering events
     * @return Error if the platform source cannot be opened
     */
    virtual Shared::Result<void> start() = 0;

    /**
     * @brief Stops delivering events (no-op when not running)
     */
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;

Q_SIGNALS:
    void deviceAttached(const Shared::UsbDeviceDescriptor &descriptor);
    void deviceDetached(const Shared::UsbDeviceDescriptor &descriptor);
};

} // namespace Daemon
} // namespace LedgerSigner
