/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "types/usb_device_info.h"

#include <QList>

namespace LedgerSigner {
namespace Daemon {

/**
 * @brief Lists HID interfaces of connected Ledger devices
 *
 * Snapshot query used by the controller to find which path appeared or
 * disappeared; it never blocks on the devices themselves.
 */
class DeviceEnumerator
{
public:
    virtual ~DeviceEnumerator();

    /**
     * @brief Enumerates currently visible Ledger HID interfaces
     * @return One entry per HID node, vendor already filtered
     */
    virtual QList<Shared::HidDeviceInfo> listConnectedDevices() const = 0;
};

} // namespace Daemon
} // namespace LedgerSigner
